#ifndef __GAUGE_TRANSFER_STREAM_H__
#define __GAUGE_TRANSFER_STREAM_H__
// Copyright (c) 2009 - Mozy, Inc.

#include "stream.h"

namespace Gauge {

enum ExactLength
{
    /// EXACT when a length is given, UNTILEOF when it is ~0ull
    INFER,
    /// Running out of source before toTransfer bytes throws
    /// UnexpectedEofException
    EXACT,
    /// Stop quietly at EOF
    UNTILEOF
};

/// Read from src and write everything read to dst, in chunks of at most
/// 64 KiB, until toTransfer bytes have been copied or src hits EOF
/// @return How many bytes were copied
unsigned long long transferStream(Stream &src, Stream &dst,
    unsigned long long toTransfer = ~0ull, ExactLength exactLength = INFER);

inline unsigned long long transferStream(Stream::ptr src, Stream &dst,
    unsigned long long toTransfer = ~0ull, ExactLength exactLength = INFER)
{ return transferStream(*src, dst, toTransfer, exactLength); }
inline unsigned long long transferStream(Stream::ptr src, Stream::ptr dst,
    unsigned long long toTransfer = ~0ull, ExactLength exactLength = INFER)
{ return transferStream(*src, *dst, toTransfer, exactLength); }

}

#endif
