// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>
#include <rosewire/util/Buffer.h>

namespace rosewire::api {

class MapObject;

/// @brief A raw metadata value, as found in the free-form
/// "metadata" and "options" fields of the wire format.
///
/// Objects are key/value lists in no particular order; MapObject
/// puts them into canonical order when encoding.
///
class MapValue
{
public:
    using Array = std::vector<MapValue>;
    using Object = std::vector<std::pair<std::string, MapValue>>;

    MapValue() : value_(nullptr) {}
    MapValue(std::nullptr_t) : value_(nullptr) {}
    MapValue(bool v) : value_(std::in_place_type<bool>, v) {}

    template<std::signed_integral T> requires (!std::same_as<T, bool>)
    MapValue(T v) : value_(std::in_place_type<int64_t>, v) {}

    template<std::unsigned_integral T> requires (!std::same_as<T, bool>)
    MapValue(T v) : value_(std::in_place_type<uint64_t>, v) {}

    MapValue(double v) : value_(std::in_place_type<double>, v) {}
    MapValue(const char* s) : value_(std::string(s)) {}
    MapValue(std::string_view s) : value_(std::string(s)) {}
    MapValue(std::string s) : value_(std::move(s)) {}
    MapValue(Array a) : value_(std::move(a)) {}
    MapValue(Object o) : value_(std::move(o)) {}

    bool isNull() const noexcept
    {
        return std::holds_alternative<std::nullptr_t>(value_);
    }

    template<typename T>
    bool is() const noexcept { return std::holds_alternative<T>(value_); }

    template<typename T>
    const T& as() const { return std::get<T>(value_); }

    /// Appends the canonical encoding of this value. Throws
    /// JsonException for non-finite doubles and duplicate keys.
    void appendTo(Buffer& buf) const;


private:
    static void appendObject(Buffer& buf, const Object& obj);

    friend class MapObject;

    std::variant<std::nullptr_t, bool, int64_t, uint64_t, double,
        std::string, Array, Object> value_;
};

/// @brief The canonical encoding of a string-keyed map.
///
/// Keys are sorted by byte value at every nesting level and no
/// whitespace is emitted, so two MapObjects built from the same
/// logical map are byte-identical, and equality is a plain byte
/// comparison.
///
/// An empty MapObject stands for an absent (or empty) map; it is
/// written as {} when a required field needs a value.
///
class MapObject
{
public:
    MapObject() = default;

    /// @brief Encodes the given map.
    ///
    /// @throws JsonException if the map contains a non-finite
    ///   number or a duplicate key
    ///
    static MapObject from(const MapValue::Object& map);

    bool isEmpty() const noexcept { return bytes_.empty(); }
    std::string_view bytes() const noexcept { return bytes_; }
    void reset() noexcept { bytes_.clear(); }

    Buffer& appendTo(Buffer& buf) const
    {
        if (bytes_.empty())
        {
            buf.write("{}", 2);
        }
        else
        {
            buf.write(bytes_);
        }
        return buf;
    }

    bool operator==(const MapObject& other) const noexcept
    {
        return bytes_ == other.bytes_;
    }

private:
    explicit MapObject(std::string bytes) : bytes_(std::move(bytes)) {}

    std::string bytes_;
};

} // namespace rosewire::api
