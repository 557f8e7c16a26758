// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once

#include <chrono>
#include <stdexcept>
#include <string>

namespace rosewire {

/// @brief The constraints from which a RetryHandler is built.
///
/// At least one of maxIterations and totalLimit must be set
/// (non-zero). Fields are in the order expected by designated
/// initializers, e.g. RetryPolicy{ .maxIterations = 5 }
///
struct RetryPolicy
{
    /// Multiplier applied to each interval to get the next one.
    /// Must be >= 1.0; 0 means 1.0 (constant spacing). Use 2.0
    /// for exponential backoff.
    double backoffFactor = 0;

    /// Accepted for compatibility; schedules carry no jitter.
    bool disableJitter = false;

    /// Upper bound for every interval; must be >= minInterval.
    std::chrono::nanoseconds maxInterval {0};

    /// Number of attempts (including the first one), or 0 for
    /// no limit.
    unsigned maxIterations = 0;

    /// The interval before the first retry; must be >= 0.
    std::chrono::nanoseconds minInterval {0};

    /// Upper bound for the sum of all intervals, or 0 for no
    /// limit.
    std::chrono::nanoseconds totalLimit {0};
};

class RetryPolicyException : public std::runtime_error
{
public:
    explicit RetryPolicyException(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace rosewire
