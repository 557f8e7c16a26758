// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once

#include <cstdint>
#include <span>
#include <string_view>
#include <rosewire/text/Format.h>
#include <rosewire/util/Buffer.h>

namespace rosewire {

/// @brief Primitives that append JSON values to a Buffer.
///
/// None of these fail for any input (other than running out of
/// memory): malformed UTF-8 in strings is repaired by substituting
/// U+FFFD, and non-finite doubles are written as null.
///
/// Each returns the Buffer it was given, so calls can be chained.
///
class Json
{
public:
	static Buffer& appendBool(Buffer& buf, bool v)
	{
		if (v)
		{
			buf.write("true", 4);
		}
		else
		{
			buf.write("false", 5);
		}
		return buf;
	}

	static Buffer& appendNull(Buffer& buf)
	{
		buf.write("null", 4);
		return buf;
	}

	static Buffer& appendUint(Buffer& buf, uint64_t n)
	{
		if (n < 10)
		{
			buf.writeByte(static_cast<char>('0' + n));
			return buf;
		}
		if (n < 100)
		{
			char pair[2];
			Format::putDigitPair(pair, static_cast<unsigned>(n));
			buf.write(pair, 2);
			return buf;
		}
		char tmp[24];
		char* end = tmp + sizeof(tmp);
		char* start = Format::unsignedIntegerReverse(n, end);
		buf.write(start, end - start);
		return buf;
	}

	static Buffer& appendInt(Buffer& buf, int64_t n)
	{
		if (n >= 0) return appendUint(buf, static_cast<uint64_t>(n));
		char tmp[24];
		char* end = tmp + sizeof(tmp);
		char* start = Format::integerReverse(n, end);
		buf.write(start, end - start);
		return buf;
	}

	/// @brief Appends the shortest decimal representation of v
	/// that round-trips. Uses scientific notation if |v| < 1e-6
	/// or |v| >= 1e21 (v != 0), otherwise fixed notation.
	static Buffer& appendFloat(Buffer& buf, double v);

	/// @brief Appends s as a quoted JSON string.
	///
	/// Quotes and backslashes are backslash-escaped; \n, \r and
	/// \t use their two-character escapes; all other control
	/// characters as well as '<', '>' and '&' are written as
	/// \u00XX. Invalid UTF-8 bytes are replaced with \ufffd,
	/// and U+2028/U+2029 are written as \u2028/\u2029.
	static Buffer& appendString(Buffer& buf, std::string_view s);

	/// @brief Appends the bytes as a quoted lowercase hex string.
	static Buffer& appendHexBytes(Buffer& buf, std::span<const uint8_t> bytes);

	/// @brief Appends "key": -- the key must consist of printable
	/// ASCII characters that need no escaping.
	static Buffer& appendKey(Buffer& buf, std::string_view key)
	{
		buf.ensureCapacity(key.size() + 3);
		buf.putByteUnsafe('\"');
		buf.putStringUnsafe(key.data(), key.size());
		buf.putStringUnsafe("\":", 2);
		return buf;
	}

	/// @brief Closes an object whose fields were each written
	/// with a trailing comma.
	///
	/// If the last byte is that pending comma, it is turned into
	/// the closing brace. Otherwise no field was written (the last
	/// byte is the opening brace), and the brace is appended.
	static Buffer& endObject(Buffer& buf)
	{
		if (!buf.isEmpty() && buf.lastByte() == ',')
		{
			buf.replaceLastByte('}');
		}
		else
		{
			buf.writeByte('}');
		}
		return buf;
	}

	/// @brief Closes an array whose elements were each written
	/// with a trailing comma (same technique as endObject).
	static Buffer& endArray(Buffer& buf)
	{
		if (!buf.isEmpty() && buf.lastByte() == ',')
		{
			buf.replaceLastByte(']');
		}
		else
		{
			buf.writeByte(']');
		}
		return buf;
	}

	static constexpr char HEX_DIGITS[] = "0123456789abcdef";
};

} // namespace rosewire
