// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#include <rosewire/text/DurationParser.h>
#include <cstdint>
#include <string>
#include <rosewire/util/ConfigException.h>
#include <rosewire/util/Strings.h>

namespace rosewire {

void DurationParser::error(const char* msg) const
{
    throw ConfigException(std::string(msg) + ": \"" + std::string(text_) + "\"");
}

// Reads a run of decimal digits. Digits that would overflow are
// dropped, but still counted.
uint64_t DurationParser::digits(int& count)
{
    uint64_t n = 0;
    count = 0;
    bool overflow = false;
    while (p_ < end_ && *p_ >= '0' && *p_ <= '9')
    {
        if (!overflow)
        {
            uint64_t d = static_cast<uint64_t>(*p_ - '0');
            if (n > (UINT64_MAX - d) / 10)
            {
                overflow = true;
            }
            else
            {
                n = n * 10 + d;
            }
        }
        count++;
        p_++;
    }
    if (overflow) error("Duration out of range");
    return n;
}

uint64_t DurationParser::unit()
{
    std::string_view rest(p_, end_ - p_);
    p_ = end_;
    if (rest == "ns") return 1;
    if (rest == "us") return 1000;
    if (rest == "ms") return 1000000;
    if (rest == "s") return 1000000000ULL;
    if (rest == "m") return 60ULL * 1000000000ULL;
    if (rest == "h") return 3600ULL * 1000000000ULL;
    if (rest.empty()) error("Missing unit in duration");
    error("Invalid unit in duration");
}

int64_t DurationParser::parse()
{
    while (p_ < end_ && Strings::isWhitespace(*p_)) p_++;
    while (end_ > p_ && Strings::isWhitespace(end_[-1])) end_--;

    bool negative = false;
    if (p_ < end_ && (*p_ == '-' || *p_ == '+'))
    {
        negative = *p_ == '-';
        p_++;
    }
    if (std::string_view(p_, end_ - p_) == "0") return 0;

    int intCount;
    uint64_t whole = digits(intCount);
    uint64_t frac = 0;
    uint64_t scale = 1;
    int fracCount = 0;
    if (p_ < end_ && *p_ == '.')
    {
        p_++;
        // Digits beyond nanosecond precision of the largest unit
        // are ignored
        while (p_ < end_ && *p_ >= '0' && *p_ <= '9')
        {
            if (fracCount < 18)
            {
                frac = frac * 10 + static_cast<uint64_t>(*p_ - '0');
                scale *= 10;
            }
            fracCount++;
            p_++;
        }
    }
    if (intCount == 0 && fracCount == 0) error("Expected number");

    uint64_t u = unit();
    if (whole > static_cast<uint64_t>(INT64_MAX) / u)
    {
        error("Duration out of range");
    }
    uint64_t nanos = whole * u;
    if (frac)
    {
        nanos += static_cast<uint64_t>(
            static_cast<double>(frac) * (static_cast<double>(u) /
                static_cast<double>(scale)));
        if (nanos > static_cast<uint64_t>(INT64_MAX))
        {
            error("Duration out of range");
        }
    }
    return negative ? -static_cast<int64_t>(nanos) : static_cast<int64_t>(nanos);
}

} // namespace rosewire
