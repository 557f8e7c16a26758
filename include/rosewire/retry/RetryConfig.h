// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once

#include <string_view>
#include <rosewire/retry/RetryPolicy.h>

namespace rosewire {

/// @brief Reads a RetryPolicy from properties text, e.g.
///
///     # back off exponentially, for at most a minute
///     backoff_factor = 2
///     min_interval = 100ms
///     max_interval = 10s
///     total_limit = 1m
///
/// Recognized keys are backoff_factor, disable_jitter,
/// max_interval, max_iterations, min_interval and total_limit.
/// Missing keys keep their defaults. The policy itself is not
/// validated here; that happens in RetryHandler::build().
///
class RetryConfig
{
public:
    /// @throws ConfigException for unknown keys or malformed values
    static RetryPolicy parse(std::string_view properties);

    /// @throws IOException if the file cannot be read
    /// @throws ConfigException for unknown keys or malformed values
    static RetryPolicy loadFile(const char* fileName);
};

} // namespace rosewire
