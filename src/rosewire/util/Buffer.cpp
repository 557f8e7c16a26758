// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#include <rosewire/util/Buffer.h>

namespace rosewire {

Buffer::Buffer(size_t initialCapacity)
{
	buf_ = new char[initialCapacity];
	p_ = buf_;
	end_ = buf_ + initialCapacity;
}

void Buffer::grow(size_t minRemaining)
{
	size_t len = length();
	size_t newCapacity = capacity() * 2;
	if (newCapacity < 256) newCapacity = 256;
	if (newCapacity - len < minRemaining) newCapacity = len + minRemaining;
	char* newBuf = new char[newCapacity];
	if (len) std::memcpy(newBuf, buf_, len);
	delete[] buf_;
	buf_ = newBuf;
	p_ = newBuf + len;
	end_ = newBuf + newCapacity;
}

} // namespace rosewire
