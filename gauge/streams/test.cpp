// Copyright (c) 2009 - Mozy, Inc.

#include "test.h"

#include <algorithm>

namespace Gauge {

size_t
TestStream::read(void *buffer, size_t length)
{
    size_t todo = std::min(m_maxReadSize, length);
    if (m_onRead) {
        if (m_onReadBytes == 0) {
            boost::function<void ()> dg = m_onRead;
            m_onRead.clear();
            dg();
        } else if ((unsigned long long)m_onReadBytes < todo) {
            todo = (size_t)m_onReadBytes;
        }
    }
    size_t result = parent()->read(buffer, todo);
    if (m_onRead)
        m_onReadBytes -= (long long)result;
    return result;
}

long long
TestStream::seek(long long offset, Anchor anchor)
{
    if (m_onSeek)
        m_onSeek();
    return parent()->seek(offset, anchor);
}

}
