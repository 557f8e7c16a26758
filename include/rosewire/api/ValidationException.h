// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once

#include <stdexcept>
#include <string>

namespace rosewire::api {

class ValidationException : public std::runtime_error
{
public:
    explicit ValidationException(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace rosewire::api
