// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#include <rosewire/util/PropertiesParser.h>
#include <rosewire/util/Strings.h>

namespace rosewire {

bool PropertiesParser::next(std::string_view& key, std::string_view& value)
{
    while(p_ < end_)
    {
        const char* pNext = p_;
        while(pNext < end_)
        {
            if(*pNext++ == '\n') break;
        }
        std::string_view line = Strings::trim(std::string_view(p_, pNext - p_));
        p_ = pNext;
        line_++;
        if(line.empty() || line[0] == '#') continue;
        size_t pos = line.find('=');
        if(pos == std::string_view::npos) continue;
        key = Strings::trim(line.substr(0, pos));
        value = Strings::trim(line.substr(pos+1));
        return true;
    }
    return false;
}

} // namespace rosewire
