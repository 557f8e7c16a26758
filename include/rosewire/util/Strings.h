// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once
#include <string_view>

namespace rosewire {

class Strings
{
public:
    static bool isWhitespace(char ch)
    {
        return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n';
    }

    static std::string_view trim(std::string_view s)
    {
        size_t start = 0;
        size_t end = s.size();
        while (start < end && isWhitespace(s[start])) start++;
        while (end > start && isWhitespace(s[end-1])) end--;
        return s.substr(start, end - start);
    }
};

} // namespace rosewire
