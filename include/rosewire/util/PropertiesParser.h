// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once
#include <string_view>

namespace rosewire {

/// @brief Reads key = value pairs, one per line.
///
/// Lines that are empty, start with '#' or lack a '=' are
/// skipped. Keys and values are trimmed of whitespace.
///
class PropertiesParser
{
public:
    explicit PropertiesParser(std::string_view properties) :
        p_(properties.data()),
        end_(properties.data() + properties.size()),
        line_(0) {}

    bool next(std::string_view& key, std::string_view& value);

    /// The 1-based line number of the pair most recently
    /// returned by next().
    int line() const noexcept { return line_; }

private:
    const char* p_;
    const char* end_;
    int line_;
};

} // namespace rosewire
