// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once

#include <bit>
#include <cstdint>
#include <cstring>

namespace rosewire::Format {

namespace detail {

// Two ASCII digits packed so that a native 16-bit store writes the
// tens digit first. Byte order is fixed at compile time.
constexpr uint16_t digitPair(unsigned n)
{
	uint16_t tens = static_cast<uint16_t>('0' + n / 10);
	uint16_t ones = static_cast<uint16_t>('0' + n % 10);
	if constexpr (std::endian::native == std::endian::little)
	{
		return static_cast<uint16_t>((ones << 8) | tens);
	}
	else
	{
		return static_cast<uint16_t>((tens << 8) | ones);
	}
}

struct DigitPairs
{
	constexpr DigitPairs() : pairs()
	{
		for (unsigned i = 0; i < 100; i++) pairs[i] = digitPair(i);
	}

	uint16_t pairs[100];
};

inline constexpr DigitPairs DIGIT_PAIRS {};

} // namespace detail

/// Writes the two decimal digits of n (which must be < 100) to p.
/// A leading zero is included.
inline void putDigitPair(char* p, unsigned n)
{
	std::memcpy(p, &detail::DIGIT_PAIRS.pairs[n], 2);
}

/// Formats d backwards, ending at end (exclusive), and returns
/// a pointer to the first character. Requires 20 bytes of room.
inline char* unsignedIntegerReverse(uint64_t d, char* end)
{
	char* p = end;
	while (d >= 100)
	{
		uint64_t q = d / 100;
		p -= 2;
		putDigitPair(p, static_cast<unsigned>(d - q * 100));
		d = q;
	}
	if (d < 10)
	{
		*(--p) = static_cast<char>('0' + d);
	}
	else
	{
		p -= 2;
		putDigitPair(p, static_cast<unsigned>(d));
	}
	return p;
}

/// Like unsignedIntegerReverse, with a leading '-' for negative
/// values. Requires 21 bytes of room.
inline char* integerReverse(int64_t d, char* end)
{
	// Negate in unsigned space so that INT64_MIN survives
	uint64_t magnitude = d < 0 ?
		0 - static_cast<uint64_t>(d) : static_cast<uint64_t>(d);
	char* p = unsignedIntegerReverse(magnitude, end);
	if (d < 0) *(--p) = '-';
	return p;
}

/// Writes a duration given in nanoseconds in its largest whole
/// unit (ns, us, ms or s), with up to three fractional digits,
/// e.g. "1.5ms" or "3s". Zero is written as "0s".
/// Requires 32 bytes of room; 0-terminates and returns a pointer
/// to the terminator.
char* duration(char* p, int64_t nanos);

} // namespace rosewire::Format
