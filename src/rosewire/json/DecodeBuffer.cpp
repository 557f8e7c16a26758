// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#include <rosewire/json/DecodeBuffer.h>
#include <cstring>
#include <utility>
#include <rosewire/io/InputStream.h>

namespace rosewire {

DecodeBuffer::DecodeBuffer() :
    buf_(new char[INITIAL_CAPACITY]),
    size_(0),
    capacity_(INITIAL_CAPACITY),
    cursor_(0),
    start_(0)
{
    buf_[0] = 0;
}

// Discards the current content
void DecodeBuffer::reserve(size_t minCapacity)
{
    if (capacity_ >= minCapacity) return;
    size_t newCapacity = capacity_ * 2;
    if (newCapacity < minCapacity) newCapacity = minCapacity;
    buf_.reset(new char[newCapacity]);
    capacity_ = newCapacity;
}

void DecodeBuffer::resetFromBytes(std::string_view data)
{
    size_t len = data.size();
    reserve(len + 1);
    if (len) std::memcpy(buf_.get(), data.data(), len);
    size_ = len;
    terminate();
}

void DecodeBuffer::resetFromStream(InputStream& in)
{
    // Closes the stream and terminates whatever has been read,
    // on every exit path
    struct Guard
    {
        ~Guard()
        {
            buffer.terminate();
            stream.close();
        }

        DecodeBuffer& buffer;
        InputStream& stream;
    };

    size_ = 0;
    Guard guard { *this, in };

    // We never let the content fill the buffer completely, so
    // that there is always room for the terminator
    for (;;)
    {
        if (capacity_ - size_ < 2)
        {
            size_t newCapacity = capacity_ * 2;
            std::unique_ptr<char[]> newBuf(new char[newCapacity]);
            std::memcpy(newBuf.get(), buf_.get(), size_);
            buf_ = std::move(newBuf);
            capacity_ = newCapacity;
        }
        size_t n = in.read(buf_.get() + size_, capacity_ - size_ - 1);
        if (n == 0) break;
        size_ += n;
    }
}

} // namespace rosewire
