// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#include <rosewire/api/MapObject.h>
#include <algorithm>
#include <cmath>
#include <rosewire/json/Json.h>
#include <rosewire/json/JsonException.h>

namespace rosewire::api {

void MapValue::appendObject(Buffer& buf, const Object& obj)
{
    // Sort references rather than the entries themselves, which
    // may be deeply nested
    std::vector<const Object::value_type*> entries;
    entries.reserve(obj.size());
    for (const Object::value_type& e : obj) entries.push_back(&e);
    std::sort(entries.begin(), entries.end(),
        [](const Object::value_type* a, const Object::value_type* b)
        {
            return a->first < b->first;
        });

    buf.writeByte('{');
    for (size_t i = 0; i < entries.size(); i++)
    {
        if (i > 0)
        {
            if (entries[i]->first == entries[i-1]->first)
            {
                throw JsonException("json: duplicate key \"" +
                    entries[i]->first + "\"");
            }
            buf.writeByte(',');
        }
        Json::appendString(buf, entries[i]->first);
        buf.writeByte(':');
        entries[i]->second.appendTo(buf);
    }
    buf.writeByte('}');
}

void MapValue::appendTo(Buffer& buf) const
{
    switch (value_.index())
    {
    case 0:
        Json::appendNull(buf);
        break;
    case 1:
        Json::appendBool(buf, std::get<bool>(value_));
        break;
    case 2:
        Json::appendInt(buf, std::get<int64_t>(value_));
        break;
    case 3:
        Json::appendUint(buf, std::get<uint64_t>(value_));
        break;
    case 4:
    {
        double v = std::get<double>(value_);
        if (std::isnan(v))
        {
            throw JsonException("json: unsupported value: NaN");
        }
        if (std::isinf(v))
        {
            throw JsonException(v > 0 ?
                "json: unsupported value: +Inf" :
                "json: unsupported value: -Inf");
        }
        Json::appendFloat(buf, v);
        break;
    }
    case 5:
        Json::appendString(buf, std::get<std::string>(value_));
        break;
    case 6:
    {
        const Array& arr = std::get<Array>(value_);
        buf.writeByte('[');
        for (size_t i = 0; i < arr.size(); i++)
        {
            if (i > 0) buf.writeByte(',');
            arr[i].appendTo(buf);
        }
        buf.writeByte(']');
        break;
    }
    default:
        appendObject(buf, std::get<Object>(value_));
        break;
    }
}

MapObject MapObject::from(const MapValue::Object& map)
{
    if (map.empty()) return MapObject();
    Buffer buf(256);
    try
    {
        MapValue::appendObject(buf, map);
    }
    catch (const JsonException& ex)
    {
        throw JsonException(
            std::string("api: failed to encode MapObject: ") + ex.what());
    }
    return MapObject(buf.toString());
}

} // namespace rosewire::api
