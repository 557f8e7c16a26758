// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#include <catch2/catch_test_macros.hpp>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <nlohmann/json.hpp>
#include <rosewire/api/MapObject.h>
#include <rosewire/json/JsonException.h>

using namespace rosewire;
using namespace rosewire::api;

static const char* CONTRACT = "0200000000000000000000000000000000000000";

TEST_CASE("MapObject is deterministic")
{
	MapObject a = MapObject::from({ { "contract", CONTRACT } });
	MapObject b = MapObject::from({ { "contract", CONTRACT } });
	REQUIRE(a.bytes() == b.bytes());
	REQUIRE(a == b);
	REQUIRE(a.bytes() ==
		R"({"contract":"0200000000000000000000000000000000000000"})");
}

TEST_CASE("MapObject sorts keys at every level")
{
	MapObject a = MapObject::from({
		{ "zeta", 1 },
		{ "alpha", MapValue::Object{ { "y", true }, { "x", nullptr } } },
		{ "mid", MapValue::Array{ MapValue::Object{ { "b", 2 }, { "a", 1 } } } } });
	MapObject b = MapObject::from({
		{ "mid", MapValue::Array{ MapValue::Object{ { "a", 1 }, { "b", 2 } } } },
		{ "alpha", MapValue::Object{ { "x", nullptr }, { "y", true } } },
		{ "zeta", 1 } });
	REQUIRE(a == b);
	REQUIRE(a.bytes() ==
		R"({"alpha":{"x":null,"y":true},"mid":[{"a":1,"b":2}],"zeta":1})");
}

TEST_CASE("MapObject orders keys by byte value")
{
	MapObject m = MapObject::from({
		{ "b", 1 }, { "B", 2 }, { "a", 3 }, { "\xC3\xA9", 4 }, { "aa", 5 } });
	REQUIRE(m.bytes() == "{\"B\":2,\"a\":3,\"aa\":5,\"b\":1,\"\xC3\xA9\":4}");
}

TEST_CASE("MapObject encodes all value types")
{
	MapObject m = MapObject::from({
		{ "arr", MapValue::Array{ 1, -2, 1.5, true, nullptr, "x" } },
		{ "big", UINT64_MAX },
		{ "neg", INT64_MIN },
		{ "s", std::string("<tag>") } });
	REQUIRE(m.bytes() ==
		R"({"arr":[1,-2,1.5,true,null,"x"],"big":18446744073709551615,)"
		R"("neg":-9223372036854775808,"s":"\u003ctag\u003e"})");

	nlohmann::json j = nlohmann::json::parse(m.bytes());
	REQUIRE(j["big"].get<uint64_t>() == UINT64_MAX);
	REQUIRE(j["s"].get<std::string>() == "<tag>");
}

TEST_CASE("MapObject matches a reference encoder")
{
	MapObject m = MapObject::from({
		{ "contract", CONTRACT },
		{ "decimals", 9 },
		{ "nested", MapValue::Object{ { "q", "r" }, { "p", MapValue::Array{} } } } });
	nlohmann::json expected = {
		{ "contract", CONTRACT },
		{ "decimals", 9 },
		{ "nested", { { "p", nlohmann::json::array() }, { "q", "r" } } } };
	// nlohmann sorts object keys as well, so the bytes agree
	REQUIRE(m.bytes() == expected.dump());
}

TEST_CASE("Empty MapObject")
{
	MapObject m = MapObject::from({});
	REQUIRE(m.isEmpty());
	REQUIRE(m == MapObject());
	Buffer buf;
	m.appendTo(buf);
	REQUIRE(buf.toString() == "{}");

	MapObject full = MapObject::from({ { "a", 1 } });
	REQUIRE_FALSE(full.isEmpty());
	REQUIRE_FALSE(full == m);
	full.reset();
	REQUIRE(full.isEmpty());
	REQUIRE(full == m);
}

TEST_CASE("MapObject rejects unsupported values")
{
	try
	{
		MapObject::from({ { "nested", MapValue::Object{
			{ "bad", std::nan("") } } } });
		FAIL("Expected JsonException");
	}
	catch (const JsonException& ex)
	{
		REQUIRE(std::string(ex.what()) ==
			"api: failed to encode MapObject: json: unsupported value: NaN");
	}

	REQUIRE_THROWS_AS(MapObject::from({
		{ "inf", std::numeric_limits<double>::infinity() } }), JsonException);
	REQUIRE_THROWS_AS(MapObject::from({
		{ "dup", 1 }, { "other", 2 }, { "dup", 3 } }), JsonException);
}
