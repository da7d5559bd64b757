// Copyright (c) 2010 - Mozy, Inc.

#include "thread.h"

#ifdef LINUX
#include <syscall.h>
#include <unistd.h>
#endif

namespace Gauge {

tid_t gettid()
{
#if defined(LINUX)
    return syscall(__NR_gettid);
#else
    return pthread_self();
#endif
}

}
