// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <cstdint>
#include <cstring>
#include <string>
#include <utility>
#include <rosewire/io/InputStream.h>
#include <rosewire/io/IOException.h>
#include <rosewire/json/DecodeBuffer.h>

using namespace rosewire;

namespace {

// Hands out its content a few bytes at a time, and optionally
// fails once a given number of bytes has been read
class ChunkedStream : public InputStream
{
public:
    ChunkedStream(std::string data, size_t chunkSize, size_t failAt = SIZE_MAX) :
        data_(std::move(data)),
        chunkSize_(chunkSize),
        failAt_(failAt) {}

    size_t read(void* buf, size_t length) override
    {
        if (pos_ >= failAt_) throw IOException("connection reset");
        size_t n = std::min({ length, chunkSize_, data_.size() - pos_ });
        std::memcpy(buf, data_.data() + pos_, n);
        pos_ += n;
        return n;
    }

    void close() noexcept override { closeCount++; }

    int closeCount = 0;

private:
    std::string data_;
    size_t chunkSize_;
    size_t failAt_;
    size_t pos_ = 0;
};

std::string sampleDocument(size_t len)
{
    std::string s;
    while (s.size() < len)
    {
        s += "{\"index\":";
        s += std::to_string(s.size());
        s += "},";
    }
    s.resize(len);
    return s;
}

} // namespace

TEST_CASE("DecodeBuffer::resetFromBytes")
{
    DecodeBuffer buf;
    REQUIRE(buf.length() == 0);
    REQUIRE(buf.data()[0] == 0);
    REQUIRE(buf.capacity() == DecodeBuffer::INITIAL_CAPACITY);

    buf.resetFromBytes(R"({"hash":"0xabc"})");
    REQUIRE(buf.content() == R"({"hash":"0xabc"})");
    REQUIRE(buf.length() == 16);
    REQUIRE(buf.data()[16] == 0);
    REQUIRE(buf.cursor() == 0);

    std::string large = sampleDocument(5000);
    buf.resetFromBytes(large);
    REQUIRE(buf.content() == large);
    REQUIRE(buf.data()[5000] == 0);

    // Smaller documents reuse the storage
    size_t capacity = buf.capacity();
    buf.resetFromBytes("[]");
    REQUIRE(buf.content() == "[]");
    REQUIRE(buf.data()[2] == 0);
    REQUIRE(buf.capacity() == capacity);

    buf.resetFromBytes("");
    REQUIRE(buf.length() == 0);
    REQUIRE(buf.data()[0] == 0);
}

TEST_CASE("DecodeBuffer cursor and token")
{
    DecodeBuffer buf;
    buf.resetFromBytes(R"({"index":42})");
    buf.setCursor(9);
    buf.markStart();
    REQUIRE(buf.start() == 9);
    while (*buf.current() >= '0' && *buf.current() <= '9')
    {
        buf.setCursor(buf.cursor() + 1);
    }
    REQUIRE(buf.token() == "42");
    REQUIRE(*buf.current() == '}');

    buf.resetFromBytes("null");
    REQUIRE(buf.cursor() == 0);
    REQUIRE(buf.start() == 0);
}

TEST_CASE("DecodeBuffer::resetFromStream reads everything and closes")
{
    std::string doc = sampleDocument(10000);
    ChunkedStream in(doc, 7);
    DecodeBuffer buf;
    buf.resetFromStream(in);
    REQUIRE(in.closeCount == 1);
    REQUIRE(buf.content() == doc);
    REQUIRE(buf.data()[doc.size()] == 0);
    REQUIRE(buf.capacity() > doc.size());
}

TEST_CASE("DecodeBuffer::resetFromStream with exact capacity")
{
    // Content that would exactly fill the initial capacity must
    // still leave room for the terminator
    std::string doc = sampleDocument(DecodeBuffer::INITIAL_CAPACITY);
    ChunkedStream in(doc, 4096);
    DecodeBuffer buf;
    buf.resetFromStream(in);
    REQUIRE(buf.content() == doc);
    REQUIRE(buf.data()[doc.size()] == 0);
    REQUIRE(in.closeCount == 1);
}

TEST_CASE("DecodeBuffer::resetFromStream of an empty stream")
{
    ChunkedStream in("", 16);
    DecodeBuffer buf;
    buf.resetFromBytes("stale");
    buf.resetFromStream(in);
    REQUIRE(buf.length() == 0);
    REQUIRE(buf.data()[0] == 0);
    REQUIRE(in.closeCount == 1);
}

TEST_CASE("DecodeBuffer::resetFromStream closes the stream on error")
{
    std::string doc = sampleDocument(500);
    ChunkedStream in(doc, 10, 100);
    DecodeBuffer buf;
    REQUIRE_THROWS_AS(buf.resetFromStream(in), IOException);
    REQUIRE(in.closeCount == 1);
    REQUIRE(buf.length() == 100);
    REQUIRE(buf.content() == doc.substr(0, 100));
    REQUIRE(buf.data()[100] == 0);
}
