#ifndef __GAUGE_VERSION_H__
#define __GAUGE_VERSION_H__
// Copyright (c) 2009 - Mozy, Inc.

// OS
#ifdef _WIN32
#   error Gauge only supports POSIX platforms
#else
#   define POSIX
#endif

#if defined(linux) || defined(__linux__)
#   define LINUX
#endif

// Architecture
#ifdef __GNUC__
#   define GCC
#   ifdef __x86_64
#       define X86_64
#   elif defined(i386)
#       define X86
#   elif defined(__ppc__)
#       define PPC
#   elif defined(__arm__)
#       define ARM
#   endif
#endif

#endif
