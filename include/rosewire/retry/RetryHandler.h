// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once

#include <chrono>
#include <cstddef>
#include <utility>
#include <vector>
#include <rosewire/retry/RetryPolicy.h>

namespace rosewire {

class RetryIterator;

/// @brief An immutable schedule of wait intervals, one per
/// attempt. The first interval is always zero, so the first
/// attempt is never delayed.
///
/// Build a handler once and obtain an independent RetryIterator
/// for each operation that needs retrying:
///
///     RetryIterator it = handler.iter();
///     while (it.next())
///     {
///         if (tryCall()) break;
///     }
///
class RetryHandler
{
public:
    /// @brief Validates the policy and computes its schedule.
    ///
    /// @throws RetryPolicyException if the policy is invalid
    ///
    static RetryHandler build(const RetryPolicy& policy);

    /// Up to 5 attempts, without delays.
    static const RetryHandler& defaultHandler();

    /// A single attempt.
    static const RetryHandler& never();

    /// The returned iterator must not outlive this handler.
    RetryIterator iter() const;

    size_t size() const noexcept { return intervals_.size(); }
    const std::vector<std::chrono::nanoseconds>& intervals() const noexcept
    {
        return intervals_;
    }

private:
    explicit RetryHandler(std::vector<std::chrono::nanoseconds>&& intervals) :
        intervals_(std::move(intervals)) {}

    std::vector<std::chrono::nanoseconds> intervals_;
};

class RetryIterator
{
public:
    /// @brief Consumes the next interval, sleeping for its duration
    /// (unless it is zero).
    ///
    /// @return true if an attempt may be made, or false once the
    ///   schedule is exhausted (and forever after)
    ///
    bool next();

    size_t remaining() const noexcept { return end_ - p_; }

private:
    RetryIterator(const std::chrono::nanoseconds* p,
        const std::chrono::nanoseconds* end) :
        p_(p), end_(end) {}

    const std::chrono::nanoseconds* p_;
    const std::chrono::nanoseconds* end_;

    friend class RetryHandler;
};

inline RetryIterator RetryHandler::iter() const
{
    const std::chrono::nanoseconds* p = intervals_.data();
    return RetryIterator(p, p + intervals_.size());
}

} // namespace rosewire
