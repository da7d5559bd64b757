#ifndef __GAUGE_MAIN_H__
#define __GAUGE_MAIN_H__
// Copyright (c) 2010 - Mozy, Inc.

#include "version.h"

/// Defines main for Gauge programs
/// @example
/// GAUGE_MAIN(int argc, char **argv)
/// {
///     return 0;
/// }
#define GAUGE_MAIN(argc, argv)                                                  \
int main(argc, argv)

#endif
