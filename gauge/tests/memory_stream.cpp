// Copyright (c) 2009 - Mozy, Inc.

#include <string.h>

#include "gauge/streams/memory.h"
#include "gauge/test/test.h"

using namespace Gauge;
using namespace Gauge::Test;

GAUGE_UNITTEST(MemoryStream, basic)
{
    MemoryStream stream;
    char buffer[4];
    GAUGE_TEST_ASSERT_EQUAL(stream.size(), 0);
    GAUGE_TEST_ASSERT_EQUAL(stream.tell(), 0);
    GAUGE_TEST_ASSERT_EQUAL(stream.write("cody", 4), 4u);
    GAUGE_TEST_ASSERT_EQUAL(stream.size(), 4);
    GAUGE_TEST_ASSERT_EQUAL(stream.tell(), 4);
    GAUGE_TEST_ASSERT_EQUAL(stream.buffer(), "cody");
    GAUGE_TEST_ASSERT_EQUAL(stream.seek(0, Stream::BEGIN), 0);
    GAUGE_TEST_ASSERT_EQUAL(stream.read(buffer, 2), 2u);
    GAUGE_TEST_ASSERT(memcmp(buffer, "co", 2) == 0);
    GAUGE_TEST_ASSERT_EQUAL(stream.size(), 4);
    GAUGE_TEST_ASSERT_EQUAL(stream.tell(), 2);
    GAUGE_TEST_ASSERT_EQUAL(stream.read(buffer, 4), 2u);
    GAUGE_TEST_ASSERT(memcmp(buffer, "dy", 2) == 0);
    GAUGE_TEST_ASSERT_EQUAL(stream.read(buffer, 4), 0u);
}

GAUGE_UNITTEST(MemoryStream, construct)
{
    MemoryStream fromString(std::string("abc"));
    GAUGE_TEST_ASSERT_EQUAL(fromString.size(), 3);
    GAUGE_TEST_ASSERT_EQUAL(fromString.tell(), 0);
    MemoryStream fromBuffer("a\0b", 3);
    GAUGE_TEST_ASSERT_EQUAL(fromBuffer.size(), 3);
    GAUGE_TEST_ASSERT_EQUAL(fromBuffer.buffer(), std::string("a\0b", 3));
}

GAUGE_UNITTEST(MemoryStream, seek)
{
    MemoryStream stream("cody");
    GAUGE_TEST_ASSERT_EXCEPTION(stream.seek(-1, Stream::BEGIN),
        std::invalid_argument);
    GAUGE_TEST_ASSERT_EQUAL(stream.seek(2, Stream::BEGIN), 2);
    GAUGE_TEST_ASSERT_EQUAL(stream.seek(1, Stream::CURRENT), 3);
    GAUGE_TEST_ASSERT_EXCEPTION(stream.seek(-4, Stream::CURRENT),
        std::invalid_argument);
    // A failed seek doesn't move
    GAUGE_TEST_ASSERT_EQUAL(stream.tell(), 3);
    GAUGE_TEST_ASSERT_EQUAL(stream.seek(-1, Stream::END), 3);
    GAUGE_TEST_ASSERT_EQUAL(stream.seek(2, Stream::END), 6);
    char buffer[4];
    GAUGE_TEST_ASSERT_EQUAL(stream.read(buffer, 4), 0u);
    GAUGE_TEST_ASSERT_EQUAL(stream.size(), 4);
}

GAUGE_UNITTEST(MemoryStream, writeBeyondEnd)
{
    MemoryStream stream("cody");
    stream.seek(6);
    GAUGE_TEST_ASSERT_EQUAL(stream.write("x", 1), 1u);
    GAUGE_TEST_ASSERT_EQUAL(stream.size(), 7);
    GAUGE_TEST_ASSERT_EQUAL(stream.buffer(), std::string("cody\0\0x", 7));
}

GAUGE_UNITTEST(MemoryStream, overwrite)
{
    MemoryStream stream("hello world");
    stream.seek(6);
    GAUGE_TEST_ASSERT_EQUAL(stream.write("there, friend", 13), 13u);
    GAUGE_TEST_ASSERT_EQUAL(stream.buffer(), "hello there, friend");
    stream.seek(0);
    stream.write("J", 1);
    GAUGE_TEST_ASSERT_EQUAL(stream.buffer(), "Jello there, friend");
}

GAUGE_UNITTEST(MemoryStream, truncate)
{
    MemoryStream stream("cody");
    stream.truncate(2);
    GAUGE_TEST_ASSERT_EQUAL(stream.buffer(), "co");
    stream.truncate(4);
    GAUGE_TEST_ASSERT_EQUAL(stream.buffer(), std::string("co\0\0", 4));
    GAUGE_TEST_ASSERT_ASSERTED(stream.truncate(-1));
}
