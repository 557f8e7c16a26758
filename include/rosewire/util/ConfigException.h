// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once

#include <stdexcept>
#include <string>

namespace rosewire {

/// Thrown for malformed configuration text. If the error can be
/// tied to a line, the message starts with "Line <n>: ".
class ConfigException : public std::runtime_error
{
public:
    explicit ConfigException(const std::string& message)
        : std::runtime_error(message), line_(0) {}

    ConfigException(int line, const std::string& message)
        : std::runtime_error("Line " + std::to_string(line) + ": " + message),
          line_(line) {}

    int line() const noexcept { return line_; }

private:
    int line_;
};

} // namespace rosewire
