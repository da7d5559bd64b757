#ifndef __GAUGE_THREAD_H__
#define __GAUGE_THREAD_H__
// Copyright (c) 2010 - Mozy, Inc.

#include "version.h"

#include <pthread.h>
#include <sys/types.h>

namespace Gauge {

#ifdef LINUX
typedef pid_t tid_t;
#else
typedef pthread_t tid_t;
#endif

/// @return The operating system's id for the calling thread
tid_t gettid();

}

#endif
