// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#include <catch2/catch_test_macros.hpp>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <rosewire/json/Json.h>

using namespace rosewire;

static std::string str(std::string_view s)
{
	Buffer buf;
	Json::appendString(buf, s);
	return buf.toString();
}

static std::string flt(double v)
{
	Buffer buf;
	Json::appendFloat(buf, v);
	return buf.toString();
}

static std::string integer(int64_t v)
{
	Buffer buf;
	Json::appendInt(buf, v);
	return buf.toString();
}

static std::string uinteger(uint64_t v)
{
	Buffer buf;
	Json::appendUint(buf, v);
	return buf.toString();
}

TEST_CASE("Json: constants")
{
	Buffer buf;
	Json::appendBool(buf, true);
	buf << ',';
	Json::appendBool(buf, false);
	buf << ',';
	Json::appendNull(buf);
	REQUIRE(buf.toString() == "true,false,null");
}

TEST_CASE("Json: integers")
{
	REQUIRE(integer(0) == "0");
	REQUIRE(integer(9) == "9");
	REQUIRE(integer(10) == "10");
	REQUIRE(integer(99) == "99");
	REQUIRE(integer(100) == "100");
	REQUIRE(integer(-7) == "-7");
	REQUIRE(integer(-50000000) == "-50000000");
	REQUIRE(integer(INT64_MAX) == "9223372036854775807");
	REQUIRE(integer(INT64_MIN) == "-9223372036854775808");
	REQUIRE(uinteger(0) == "0");
	REQUIRE(uinteger(42) == "42");
	REQUIRE(uinteger(UINT64_MAX) == "18446744073709551615");
}

TEST_CASE("Json: integers round-trip")
{
	std::vector<int64_t> values = { 0, 1, 9, 10, 11, 99, 100, 101, 999, 1000,
		12345, -1, -9, -10, -99, -100, -123456789, 1'600'000'000'000,
		INT64_MAX, INT64_MIN, INT64_MIN + 1 };
	for (int64_t v : values)
	{
		REQUIRE(nlohmann::json::parse(integer(v)).get<int64_t>() == v);
	}
	for (uint64_t v = 1; v < UINT64_MAX / 7; v *= 7)
	{
		REQUIRE(nlohmann::json::parse(uinteger(v)).get<uint64_t>() == v);
	}
	REQUIRE(nlohmann::json::parse(uinteger(UINT64_MAX)).get<uint64_t>() == UINT64_MAX);
}

TEST_CASE("Json: floats")
{
	REQUIRE(flt(0) == "0");
	REQUIRE(flt(1.5) == "1.5");
	REQUIRE(flt(-2.25) == "-2.25");
	REQUIRE(flt(0.1) == "0.1");
	REQUIRE(flt(123456789) == "123456789");
	REQUIRE(flt(0.000001) == "0.000001");
	REQUIRE(flt(1e20) == "100000000000000000000");
	REQUIRE(flt(1e21) == "1e+21");
	REQUIRE(flt(1e-7) == "1e-07");
	REQUIRE(flt(-1.5e-10) == "-1.5e-10");
	REQUIRE(flt(std::nan("")) == "null");
	REQUIRE(flt(std::numeric_limits<double>::infinity()) == "null");
}

TEST_CASE("Json: floats round-trip")
{
	std::vector<double> values = { 0.1, 0.2, 1.0 / 3, 2.0 / 3, 1e-6, 9.99e-7,
		1e21, 9.99e20, 123.456, -0.5, 5e-324,
		std::numeric_limits<double>::max(),
		std::numeric_limits<double>::min() };
	for (double v : values)
	{
		REQUIRE(nlohmann::json::parse(flt(v)).get<double>() == v);
	}
}

TEST_CASE("Json: plain strings")
{
	REQUIRE(str("") == "\"\"");
	REQUIRE(str("hello") == "\"hello\"");
	// valid multi-byte characters are copied verbatim
	REQUIRE(str("caf\xC3\xA9") == "\"caf\xC3\xA9\"");
	REQUIRE(str("\xEF\xBF\xBD") == "\"\xEF\xBF\xBD\"");
	REQUIRE(str("\xF0\x9F\x98\x80") == "\"\xF0\x9F\x98\x80\"");
}

TEST_CASE("Json: escaped strings")
{
	REQUIRE(str("a\"b\\c") == R"("a\"b\\c")");
	REQUIRE(str("\n\r\t") == R"("\n\r\t")");
	REQUIRE(str(std::string_view("\0", 1)) == R"("\u0000")");
	REQUIRE(str("\x01") == R"("\u0001")");
	REQUIRE(str("\x1f") == R"("\u001f")");
	REQUIRE(str("\b\f") == R"("\u0008\u000c")");
	REQUIRE(str("<a&b>") == R"("\u003ca\u0026b\u003e")");
	REQUIRE(str("0123456789abcdefghij\"") == R"("0123456789abcdefghij\"")");
}

TEST_CASE("Json: line and paragraph separators")
{
	REQUIRE(str("a\xE2\x80\xA8" "b") == R"("a\u2028b")");
	REQUIRE(str("\xE2\x80\xA9") == R"("\u2029")");
}

TEST_CASE("Json: invalid UTF-8 is replaced")
{
	REQUIRE(str("\xFF") == R"("\ufffd")");
	REQUIRE(str("a\xC3") == R"("a\ufffd")");
	// one replacement per invalid byte
	REQUIRE(str("\xE2\x82") == R"("\ufffd\ufffd")");
	REQUIRE(str("\xC0\xAF") == R"("\ufffd\ufffd")");
	REQUIRE(str("\xED\xA0\x80") == R"("\ufffd\ufffd\ufffd")");
	REQUIRE(str("ok\x80ok") == R"("ok\ufffdok")");
}

TEST_CASE("Json: strings round-trip")
{
	std::vector<std::string> values = {
		"", "simple", "with \"quotes\" and \\backslashes\\",
		"tabs\tand\nnewlines\r", "<script>alert('&')</script>",
		std::string("nul\0byte", 8), "caf\xC3\xA9 \xE2\x82\xAC",
		"\xE2\x80\xA8\xE2\x80\xA9", "\x7f\x01\x02\x1e" };
	for (const std::string& s : values)
	{
		REQUIRE(nlohmann::json::parse(str(s)).get<std::string>() == s);
	}
}

TEST_CASE("Json: hex bytes")
{
	Buffer buf;
	std::vector<uint8_t> bytes = { 0x00, 0x0f, 0xab, 0xff, 0x10 };
	Json::appendHexBytes(buf, bytes);
	REQUIRE(buf.toString() == "\"000fabff10\"");
	buf.clear();
	Json::appendHexBytes(buf, std::vector<uint8_t>());
	REQUIRE(buf.toString() == "\"\"");
}

TEST_CASE("Json: endObject")
{
	Buffer buf;
	buf << '{';
	Json::endObject(buf);
	REQUIRE(buf.toString() == "{}");

	buf.clear();
	buf << '{';
	Json::appendKey(buf, "x");
	Json::appendInt(buf, 1);
	buf << ',';
	Json::endObject(buf);
	REQUIRE(buf.toString() == R"({"x":1})");

	buf.clear();
	buf << '[';
	Json::endArray(buf);
	REQUIRE(buf.toString() == "[]");
}
