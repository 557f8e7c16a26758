// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once

#include <cassert>
#include <cstddef>
#include <memory>
#include <string_view>

namespace rosewire {

class InputStream;

/// @brief Holds a JSON document for decoding by field-level
/// decode functions.
///
/// To use, fill it with one of the reset...() methods, then pass
/// it to the decoder. The buffer is reused across documents: its
/// storage only ever grows.
///
/// The content is always followed by a NUL byte, which lets
/// decoders scan without checking for the end of the input.
///
class DecodeBuffer
{
public:
    static constexpr size_t INITIAL_CAPACITY = 1024;

    DecodeBuffer();
    DecodeBuffer(const DecodeBuffer&) = delete;
    DecodeBuffer& operator=(const DecodeBuffer&) = delete;

    /// Copies the given bytes into the buffer.
    void resetFromBytes(std::string_view data);

    /// Reads everything from the given stream into the buffer.
    /// The stream is closed when this method returns, whether it
    /// succeeds or not. Errors thrown by the stream propagate
    /// unchanged; reaching the end of the stream is not an error.
    void resetFromStream(InputStream& in);

    const char* data() const noexcept { return buf_.get(); }
    size_t length() const noexcept { return size_; }
    size_t capacity() const noexcept { return capacity_; }
    std::string_view content() const noexcept { return { buf_.get(), size_ }; }

    size_t cursor() const noexcept { return cursor_; }
    void setCursor(size_t pos) noexcept
    {
        assert(pos <= size_);
        cursor_ = pos;
    }
    const char* current() const noexcept { return buf_.get() + cursor_; }

    size_t start() const noexcept { return start_; }
    void markStart() noexcept { start_ = cursor_; }

    /// The bytes between the marked start and the cursor.
    std::string_view token() const noexcept
    {
        return { buf_.get() + start_, cursor_ - start_ };
    }

private:
    void reserve(size_t minCapacity);
    void terminate() noexcept
    {
        buf_[size_] = 0;
        cursor_ = 0;
        start_ = 0;
    }

    std::unique_ptr<char[]> buf_;
    size_t size_;           // excludes the NUL terminator
    size_t capacity_;
    size_t cursor_;
    size_t start_;
};

} // namespace rosewire
