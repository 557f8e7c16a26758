// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once

#include <cstdint>
#include <string>
#include <rosewire/api/MapObject.h>
#include <rosewire/api/Optional.h>
#include <rosewire/util/Buffer.h>

namespace rosewire::api {

/// @brief An error reported by a Rosetta server.
///
/// If retriable is set, the same call may succeed later.
///
struct Error
{
    int32_t code = 0;
    Optional<std::string> description;
    MapObject details;
    std::string message;
    bool retriable = false;

    Buffer& encodeJson(Buffer& buf) const;
    void reset();
    bool operator==(const Error&) const = default;
};

} // namespace rosewire::api
