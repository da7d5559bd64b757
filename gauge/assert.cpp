// Copyright (c) 2010 - Mozy, Inc.

#include "assert.h"

#include <fcntl.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

namespace Gauge {

bool Assertion::throwOnAssertion;

bool isDebuggerAttached()
{
#if defined(LINUX)
    bool result = false;
    char buffer[1024];
    snprintf(buffer, sizeof(buffer), "/proc/%d/status", (int)getpid());
    int fd = open(buffer, O_RDONLY);
    if (fd >= 0) {
        ssize_t rc = read(fd, buffer, sizeof(buffer) - 1);
        if (rc > 0) {
            buffer[rc] = '\0';
            const char *tracerPidStr = strstr(buffer, "TracerPid:");
            if (tracerPidStr) {
                int tracingPid = atoi(tracerPidStr + 10);
                if (tracingPid != 0)
                    result = true;
            }
        }
        close(fd);
    }
    return result;
#else
    return false;
#endif
}

void debugBreak()
{
#if defined(GCC) && (defined(X86) || defined(X86_64))
    __asm__("int $3\n" : : );
#endif
}

}
