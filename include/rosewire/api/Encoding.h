// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once

#include <cstdint>
#include <string_view>
#include <vector>
#include <rosewire/api/MapObject.h>
#include <rosewire/json/Json.h>
#include <rosewire/util/Buffer.h>

// Helpers shared by the encodeJson() methods of the API entities.
//
// Every field is written with a trailing comma; the closing
// Json::endObject() turns the final comma into the brace. This
// keeps the per-field code free of "is this the first field"
// checks.

namespace rosewire::api {

template<typename T>
Buffer& appendEntityArray(Buffer& buf, const std::vector<T>& items)
{
    buf.writeByte('[');
    for (const T& item : items)
    {
        item.encodeJson(buf);
        buf.writeByte(',');
    }
    return Json::endArray(buf);
}

inline void appendStringField(Buffer& buf, std::string_view key, std::string_view value)
{
    Json::appendKey(buf, key);
    Json::appendString(buf, value);
    buf.writeByte(',');
}

inline void appendIntField(Buffer& buf, std::string_view key, int64_t value)
{
    Json::appendKey(buf, key);
    Json::appendInt(buf, value);
    buf.writeByte(',');
}

template<typename T>
void appendEntityField(Buffer& buf, std::string_view key, const T& value)
{
    Json::appendKey(buf, key);
    value.encodeJson(buf);
    buf.writeByte(',');
}

/// Writes an optional map field, skipping it if the map is empty.
inline void appendMetadataField(Buffer& buf, std::string_view key, const MapObject& map)
{
    if (map.isEmpty()) return;
    Json::appendKey(buf, key);
    map.appendTo(buf);
    buf.writeByte(',');
}

} // namespace rosewire::api
