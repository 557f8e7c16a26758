// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once

#include <cstdint>
#include <string>
#include <rosewire/api/MapObject.h>
#include <rosewire/util/Buffer.h>

namespace rosewire::api {

struct Currency
{
    int32_t decimals = 0;
    MapObject metadata;
    std::string symbol;

    Buffer& encodeJson(Buffer& buf) const;
    void reset();
    bool operator==(const Currency&) const = default;
};

/// @brief A value in atomic units of a Currency. The value is a
/// decimal string, which may be negative and exceed 64 bits.
struct Amount
{
    Currency currency;
    MapObject metadata;
    std::string value;

    Buffer& encodeJson(Buffer& buf) const;
    void reset();
    bool operator==(const Amount&) const = default;
};

} // namespace rosewire::api
