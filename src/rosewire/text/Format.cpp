// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#include <rosewire/text/Format.h>

namespace rosewire::Format {

// Appends up to three fractional digits, skipping trailing zeroes
static char* fractional(char* p, uint64_t frac, uint64_t unit)
{
	if (frac == 0) return p;
	// scale the remainder to milli-units
	uint64_t milli = frac * 1000 / unit;
	if (milli == 0) return p;
	char digits[3];
	digits[0] = static_cast<char>('0' + milli / 100);
	digits[1] = static_cast<char>('0' + (milli / 10) % 10);
	digits[2] = static_cast<char>('0' + milli % 10);
	int n = 3;
	while (n > 0 && digits[n - 1] == '0') n--;
	*p++ = '.';
	std::memcpy(p, digits, n);
	return p + n;
}

char* duration(char* p, int64_t nanos)
{
	if (nanos == 0)
	{
		std::memcpy(p, "0s", 3);
		return p + 2;
	}
	uint64_t d;
	if (nanos < 0)
	{
		*p++ = '-';
		d = 0 - static_cast<uint64_t>(nanos);
	}
	else
	{
		d = static_cast<uint64_t>(nanos);
	}

	uint64_t unit;
	const char* suffix;
	if (d < 1'000)
	{
		unit = 1;
		suffix = "ns";
	}
	else if (d < 1'000'000)
	{
		unit = 1'000;
		suffix = "us";
	}
	else if (d < 1'000'000'000)
	{
		unit = 1'000'000;
		suffix = "ms";
	}
	else
	{
		unit = 1'000'000'000;
		suffix = "s";
	}

	char buf[24];
	char* end = buf + sizeof(buf);
	char* start = unsignedIntegerReverse(d / unit, end);
	std::memcpy(p, start, end - start);
	p += end - start;
	p = fractional(p, d % unit, unit);
	while (*suffix) *p++ = *suffix++;
	*p = '\0';
	return p;
}

} // namespace rosewire::Format
