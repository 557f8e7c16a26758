// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#include <catch2/catch_test_macros.hpp>
#include <string>
#include <rosewire/util/PropertiesParser.h>

using namespace rosewire;

TEST_CASE("PropertiesParser")
{
	PropertiesParser parser(
		"# comment\n"
		"\n"
		"first = one\r\n"
		"   no equals sign here\n"
		"second=  two words  \n"
		"  # indented comment\n"
		"third=");

	std::string_view key;
	std::string_view value;
	REQUIRE(parser.next(key, value));
	REQUIRE(key == "first");
	REQUIRE(value == "one");
	REQUIRE(parser.line() == 3);

	REQUIRE(parser.next(key, value));
	REQUIRE(key == "second");
	REQUIRE(value == "two words");
	REQUIRE(parser.line() == 5);

	REQUIRE(parser.next(key, value));
	REQUIRE(key == "third");
	REQUIRE(value.empty());
	REQUIRE(parser.line() == 7);

	REQUIRE_FALSE(parser.next(key, value));
}

TEST_CASE("PropertiesParser: empty input")
{
	PropertiesParser parser("");
	std::string_view key;
	std::string_view value;
	REQUIRE_FALSE(parser.next(key, value));
}
