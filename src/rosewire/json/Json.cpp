// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#include <rosewire/json/Json.h>
#include <charconv>
#include <cmath>
#include <rosewire/json/Escape.h>
#include <rosewire/util/Unicode.h>

namespace rosewire {

Buffer& Json::appendFloat(Buffer& buf, double v)
{
	if (!std::isfinite(v)) [[unlikely]] return appendNull(buf);

	double abs = std::fabs(v);
	std::chars_format fmt = std::chars_format::fixed;
	if (abs != 0 && (abs < 1e-6 || abs >= 1e21))
	{
		fmt = std::chars_format::scientific;
	}
	// Fixed notation below 1e21 needs at most 21 integer digits, or
	// 6 leading zeroes plus 17 significant digits for small values
	char tmp[64];
	std::to_chars_result res = std::to_chars(tmp, tmp + sizeof(tmp), v, fmt);
	buf.write(tmp, res.ptr - tmp);
	return buf;
}

// Writes \u00XX for the given byte
static inline void putUnicodeEscape(Buffer& buf, unsigned char ch)
{
	buf.ensureCapacity(6);
	buf.putStringUnsafe("\\u00", 4);
	buf.putByteUnsafe(Json::HEX_DIGITS[ch >> 4]);
	buf.putByteUnsafe(Json::HEX_DIGITS[ch & 0x0f]);
}

Buffer& Json::appendString(Buffer& buf, std::string_view s)
{
	size_t len = s.size();
	if (len == 0)
	{
		buf.write("\"\"", 2);
		return buf;
	}
	buf.writeByte('\"');

	size_t j = Escape::htmlIndex(s);
	if (j == Escape::NONE)
	{
		buf.write(s);
		buf.writeByte('\"');
		return buf;
	}

	const char* p = s.data();
	size_t i = 0;       // start of the pending verbatim run
	while (j < len)
	{
		unsigned char ch = static_cast<unsigned char>(p[j]);
		if (!Escape::needsHtmlEscape(ch))
		{
			// Most characters are printable ASCII
			j++;
			continue;
		}

		if (ch < 0x80)
		{
			buf.write(p + i, j - i);
			switch (ch)
			{
			case '\\':
			case '\"':
				buf.ensureCapacity(2);
				buf.putByteUnsafe('\\');
				buf.putByteUnsafe(static_cast<char>(ch));
				break;
			case '\n':
				buf.write("\\n", 2);
				break;
			case '\r':
				buf.write("\\r", 2);
				break;
			case '\t':
				buf.write("\\t", 2);
				break;
			default:
				// remaining control characters, and <, > and &
				putUnicodeEscape(buf, ch);
				break;
			}
			j++;
			i = j;
			continue;
		}

		int size;
		int code = Unicode::decode(p + j, p + len, size);
		if (code == Unicode::INVALID)
		{
			buf.write(p + i, j - i);
			buf.write("\\ufffd", 6);
			j += size;
			i = j;
			continue;
		}
		if (code == Unicode::LINE_SEPARATOR ||
			code == Unicode::PARAGRAPH_SEPARATOR)
		{
			// Valid JSON, but not valid inside JavaScript string
			// literals (JSONP), so always escape them
			buf.write(p + i, j - i);
			buf.write("\\u202", 5);
			buf.writeByte(HEX_DIGITS[code & 0x0f]);
			j += size;
			i = j;
			continue;
		}
		j += size;
	}
	buf.write(p + i, len - i);
	buf.writeByte('\"');
	return buf;
}

Buffer& Json::appendHexBytes(Buffer& buf, std::span<const uint8_t> bytes)
{
	buf.ensureCapacity(bytes.size() * 2 + 2);
	buf.putByteUnsafe('\"');
	for (uint8_t b : bytes)
	{
		buf.putByteUnsafe(HEX_DIGITS[b >> 4]);
		buf.putByteUnsafe(HEX_DIGITS[b & 0x0f]);
	}
	buf.putByteUnsafe('\"');
	return buf;
}

} // namespace rosewire
