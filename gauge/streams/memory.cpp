// Copyright (c) 2009 - Mozy, Inc.

#include "memory.h"

#include <string.h>

#include <algorithm>
#include <stdexcept>

#include "gauge/assert.h"

namespace Gauge {

MemoryStream::MemoryStream()
: m_offset(0)
{}

MemoryStream::MemoryStream(const std::string &data)
: m_data(data),
  m_offset(0)
{}

MemoryStream::MemoryStream(const void *data, size_t length)
: m_data((const char *)data, length),
  m_offset(0)
{}

size_t
MemoryStream::read(void *buffer, size_t length)
{
    if (m_offset >= m_data.size())
        return 0;
    size_t todo = std::min(length, m_data.size() - m_offset);
    memcpy(buffer, m_data.data() + m_offset, todo);
    m_offset += todo;
    return todo;
}

size_t
MemoryStream::write(const void *buffer, size_t length)
{
    // Writing beyond the end zero-fills the gap
    if (m_offset > m_data.size())
        m_data.resize(m_offset, '\0');
    size_t overlap = std::min(length, m_data.size() - m_offset);
    m_data.replace(m_offset, overlap, (const char *)buffer, length);
    m_offset += length;
    return length;
}

long long
MemoryStream::seek(long long offset, Anchor anchor)
{
    long long base;
    switch (anchor) {
        case BEGIN:
            base = 0;
            break;
        case CURRENT:
            base = (long long)m_offset;
            break;
        case END:
            base = (long long)m_data.size();
            break;
        default:
            GAUGE_NOTREACHED();
    }
    long long position = base + offset;
    if (position < 0)
        GAUGE_THROW_EXCEPTION(std::invalid_argument("resulting offset is negative"));
    if ((unsigned long long)position > (size_t)~0) {
        GAUGE_THROW_EXCEPTION(std::invalid_argument(
            "Memory stream position cannot exceed virtual address space."));
    }
    m_offset = (size_t)position;
    return position;
}

long long
MemoryStream::size()
{
    return (long long)m_data.size();
}

void
MemoryStream::truncate(long long size)
{
    GAUGE_ASSERT(size >= 0);
    if ((unsigned long long)size > (size_t)~0) {
        GAUGE_THROW_EXCEPTION(std::invalid_argument(
            "Memory stream size cannot exceed virtual address space."));
    }
    m_data.resize((size_t)size, '\0');
}

}
