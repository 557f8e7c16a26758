// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once

#include <stdexcept>
#include <string>

namespace rosewire {

class JsonException : public std::runtime_error
{
public:
    explicit JsonException(const char* message)
        : std::runtime_error(message) {}

    explicit JsonException(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace rosewire
