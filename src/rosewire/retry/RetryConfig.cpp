// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#include <rosewire/retry/RetryConfig.h>
#include <charconv>
#include <cstdint>
#include <string>
#include <rosewire/io/FileInputStream.h>
#include <rosewire/json/DecodeBuffer.h>
#include <rosewire/text/DurationParser.h>
#include <rosewire/util/ConfigException.h>
#include <rosewire/util/log.h>
#include <rosewire/util/PropertiesParser.h>

namespace rosewire {

static std::chrono::nanoseconds parseDuration(std::string_view value)
{
    return std::chrono::nanoseconds(DurationParser(value).parse());
}

static double parseFactor(std::string_view value)
{
    const char* end = value.data() + value.size();
    double factor;
    std::from_chars_result res = std::from_chars(value.data(), end, factor);
    if (res.ec != std::errc() || res.ptr != end)
    {
        throw ConfigException("Invalid number: \"" + std::string(value) + "\"");
    }
    return factor;
}

static unsigned parseCount(std::string_view value)
{
    const char* end = value.data() + value.size();
    unsigned count;
    std::from_chars_result res = std::from_chars(value.data(), end, count);
    if (res.ec != std::errc() || res.ptr != end)
    {
        throw ConfigException("Invalid count: \"" + std::string(value) + "\"");
    }
    return count;
}

static bool parseBool(std::string_view value)
{
    if (value == "true" || value == "1") return true;
    if (value == "false" || value == "0") return false;
    throw ConfigException("Expected true or false: \"" + std::string(value) + "\"");
}

static void setProperty(RetryPolicy& policy, std::string_view key, std::string_view value)
{
    if (key == "backoff_factor")
    {
        policy.backoffFactor = parseFactor(value);
    }
    else if (key == "disable_jitter")
    {
        policy.disableJitter = parseBool(value);
    }
    else if (key == "max_interval")
    {
        policy.maxInterval = parseDuration(value);
    }
    else if (key == "max_iterations")
    {
        policy.maxIterations = parseCount(value);
    }
    else if (key == "min_interval")
    {
        policy.minInterval = parseDuration(value);
    }
    else if (key == "total_limit")
    {
        policy.totalLimit = parseDuration(value);
    }
    else
    {
        throw ConfigException("Unknown key \"" + std::string(key) + "\"");
    }
}

RetryPolicy RetryConfig::parse(std::string_view properties)
{
    RetryPolicy policy;
    PropertiesParser parser(properties);
    std::string_view key;
    std::string_view value;
    while (parser.next(key, value))
    {
        try
        {
            setProperty(policy, key, value);
        }
        catch (const ConfigException& ex)
        {
            throw ConfigException(parser.line(), ex.what());
        }
    }
    return policy;
}

RetryPolicy RetryConfig::loadFile(const char* fileName)
{
    FileInputStream in(fileName);
    DecodeBuffer buf;
    buf.resetFromStream(in);
    LOG("Loading retry policy from %s (%zu bytes)", fileName, buf.length());
    return parse(buf.content());
}

} // namespace rosewire
