// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#include <catch2/catch_test_macros.hpp>
#include <cstdint>
#include <string>
#include <rosewire/text/Format.h>

using namespace rosewire;

static std::string formatInteger(int64_t d)
{
	char buf[24];
	char* end = buf + sizeof(buf);
	char* start = Format::integerReverse(d, end);
	return std::string(start, end);
}

static std::string formatDuration(int64_t nanos)
{
	char buf[32];
	Format::duration(buf, nanos);
	return std::string(buf);
}

TEST_CASE("Format::integerReverse")
{
	REQUIRE(formatInteger(0) == "0");
	REQUIRE(formatInteger(7) == "7");
	REQUIRE(formatInteger(10) == "10");
	REQUIRE(formatInteger(99) == "99");
	REQUIRE(formatInteger(100) == "100");
	REQUIRE(formatInteger(1005) == "1005");
	REQUIRE(formatInteger(-1) == "-1");
	REQUIRE(formatInteger(-50000000) == "-50000000");
	REQUIRE(formatInteger(INT64_MAX) == "9223372036854775807");
	REQUIRE(formatInteger(INT64_MIN) == "-9223372036854775808");
}

TEST_CASE("Format::unsignedIntegerReverse")
{
	char buf[24];
	char* end = buf + sizeof(buf);
	char* start = Format::unsignedIntegerReverse(UINT64_MAX, end);
	REQUIRE(std::string(start, end) == "18446744073709551615");
	start = Format::unsignedIntegerReverse(5, end);
	REQUIRE(std::string(start, end) == "5");
	start = Format::unsignedIntegerReverse(42, end);
	REQUIRE(std::string(start, end) == "42");
}

TEST_CASE("Format::putDigitPair")
{
	char buf[2];
	Format::putDigitPair(buf, 7);
	REQUIRE(std::string(buf, 2) == "07");
	Format::putDigitPair(buf, 93);
	REQUIRE(std::string(buf, 2) == "93");
}

TEST_CASE("Format::duration")
{
	REQUIRE(formatDuration(0) == "0s");
	REQUIRE(formatDuration(999) == "999ns");
	REQUIRE(formatDuration(1000) == "1us");
	REQUIRE(formatDuration(1'500'000) == "1.5ms");
	REQUIRE(formatDuration(2'250'000) == "2.25ms");
	REQUIRE(formatDuration(3'000'000) == "3ms");
	REQUIRE(formatDuration(1'234'567'890) == "1.234s");
	REQUIRE(formatDuration(60'000'000'000) == "60s");
	REQUIRE(formatDuration(-1'000'000) == "-1ms");
}
