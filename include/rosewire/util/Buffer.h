// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once
#include <cassert>
#include <cstddef>
#include <cstring>
#include <string>
#include <string_view>

namespace rosewire {

/// @brief A growable output buffer for encoded bytes.
///
/// A Buffer is owned by a single caller for the duration of an
/// encode call. Callers are expected to clear() and reuse a Buffer
/// across calls; clear() keeps the allocated capacity, so a
/// warmed-up Buffer performs no further allocations.
///
/// Unlike a flushing stream, a Buffer retains everything written
/// to it, which allows the last byte to be rewritten (see
/// Json::endObject).
///
class Buffer
{
public:
	Buffer() :
		buf_(nullptr),
		p_(nullptr),
		end_(nullptr) {}

	explicit Buffer(size_t initialCapacity);
	~Buffer() noexcept { delete[] buf_; }

	Buffer(Buffer&& other) noexcept :
		buf_(other.buf_),
		p_(other.p_),
		end_(other.end_)
	{
		other.buf_ = nullptr;
		other.p_ = nullptr;
		other.end_ = nullptr;
	}

	Buffer& operator=(Buffer&& other) noexcept
	{
		if (this != &other)
		{
			delete[] buf_;
			buf_ = other.buf_;
			p_ = other.p_;
			end_ = other.end_;
			other.buf_ = nullptr;
			other.p_ = nullptr;
			other.end_ = nullptr;
		}
		return *this;
	}

	Buffer(const Buffer&) = delete;
	Buffer& operator=(const Buffer&) = delete;

	const char* data() const { return buf_; }
	size_t length() const { return p_ - buf_; }
	size_t capacity() const { return end_ - buf_; }
	bool isEmpty() const { return p_ == buf_; }

	size_t capacityRemaining() const
	{
		return end_ - p_;
	}

	void write(const void* data, size_t len)
	{
		if (len == 0) return;
		ensureCapacity(len);
		std::memcpy(p_, data, len);
		p_ += len;
	}

	void write(std::string_view s)
	{
		write(s.data(), s.size());
	}

	void writeByte(int ch)
	{
		if (p_ == end_) grow(1);
		*p_++ = static_cast<char>(ch);
	}

	/// Returns the most recently written byte. The Buffer
	/// must not be empty.
	char lastByte() const
	{
		assert(!isEmpty());
		return p_[-1];
	}

	/// Overwrites the most recently written byte. The Buffer
	/// must not be empty.
	void replaceLastByte(char ch)
	{
		assert(!isEmpty());
		p_[-1] = ch;
	}

	/// Makes sure at least len bytes can be written without
	/// reallocating.
	void ensureCapacity(size_t len)
	{
		if (capacityRemaining() < len) grow(len);
	}

	/// Truncates to zero length, keeping the allocated capacity.
	void clear()
	{
		p_ = buf_;
	}

	operator std::string_view() const
	{
		return std::string_view(buf_, length());
	}

	std::string toString() const
	{
		return { buf_, length() };
	}

	// Low-level access for formatters that write in place; the
	// caller must have reserved room with ensureCapacity()

	void putStringUnsafe(const char* s, size_t len)
	{
		assert(capacityRemaining() >= len);
		std::memcpy(p_, s, len);
		p_ += len;
	}

	void putByteUnsafe(char ch)
	{
		assert(capacityRemaining() >= 1);
		*p_++ = ch;
	}

private:
	void grow(size_t minRemaining);

	char* buf_;
	char* p_;
	char* end_;
};

inline Buffer& operator<<(Buffer& buf, std::string_view s)
{
	buf.write(s);
	return buf;
}

inline Buffer& operator<<(Buffer& buf, char ch)
{
	buf.writeByte(ch);
	return buf;
}

} // namespace rosewire
