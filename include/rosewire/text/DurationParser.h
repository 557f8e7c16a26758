// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once
#include <cstdint>
#include <string_view>

namespace rosewire {

/// @brief Parses a duration such as "250ms", "1.5s" or "2m"
/// into nanoseconds.
///
/// Accepted units are ns, us, ms, s, m and h. A bare 0 needs no
/// unit. An optional sign is allowed (negative durations are
/// parsed, and left to the caller to reject).
///
/// Throws ConfigException if the text is malformed or the value
/// does not fit into 64 bits.
///
class DurationParser
{
public:
    explicit DurationParser(std::string_view s) :
        p_(s.data()), end_(s.data() + s.size()), text_(s) {}

    int64_t parse();

private:
    uint64_t digits(int& count);
    uint64_t unit();
    [[noreturn]] void error(const char* msg) const;

    const char* p_;
    const char* end_;
    std::string_view text_;
};

} // namespace rosewire
