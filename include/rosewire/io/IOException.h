// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once

#include <stdexcept>
#include <string>

namespace rosewire {

class IOException : public std::runtime_error
{
public:
    /// Creates an IOException describing the current value
    /// of errno.
    IOException();

    explicit IOException(const char* message)
        : std::runtime_error(message) {}

    explicit IOException(const std::string& message)
        : std::runtime_error(message) {}

    static std::string errorMessage();
    static std::string errorMessage(const char* fileName);
};


class FileNotFoundException : public IOException
{
public:
    explicit FileNotFoundException(const char* filename)
        : IOException(std::string(filename) + ": File not found") {}
    explicit FileNotFoundException(const std::string& filename)
        : FileNotFoundException(filename.c_str()) {}
};

} // namespace rosewire
