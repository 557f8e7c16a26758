// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#include <rosewire/retry/RetryHandler.h>
#include <cstdint>
#include <cstdio>
#include <string>
#include <thread>
#include <rosewire/text/Format.h>
#include <rosewire/util/log.h>

namespace rosewire {

using std::chrono::nanoseconds;

static std::string formatDuration(nanoseconds d)
{
    char buf[32];
    Format::duration(buf, d.count());
    return buf;
}

static std::string formatFactor(double factor)
{
    char buf[32];
    snprintf(buf, sizeof(buf), "%g", factor);
    return buf;
}

static void validate(const RetryPolicy& p)
{
    if (p.maxIterations == 0 && p.totalLimit.count() == 0)
    {
        throw RetryPolicyException(
            "retry: cannot have both MaxIterations and TotalLimit unspecified");
    }
    // Written so that NaN is rejected as well
    if (p.backoffFactor != 0 && !(p.backoffFactor >= 1.0))
    {
        throw RetryPolicyException(
            "retry: BackoffFactor must be greater than or equal to 1.0, not " +
            formatFactor(p.backoffFactor));
    }
    if (p.maxInterval < p.minInterval)
    {
        throw RetryPolicyException("retry: MaxInterval (" +
            formatDuration(p.maxInterval) +
            ") must be greater than or equal to MinInterval (" +
            formatDuration(p.minInterval) + ")");
    }
    if (p.minInterval.count() < 0)
    {
        throw RetryPolicyException(
            "retry: MinInterval must be greater than or equal to zero: " +
            formatDuration(p.minInterval));
    }
    if (p.totalLimit.count() < 0)
    {
        throw RetryPolicyException("retry: TotalLimit cannot be negative: " +
            formatDuration(p.totalLimit));
    }
    if (p.maxIterations == 0 && p.minInterval.count() == 0)
    {
        // The total never grows, so the limit is never reached
        throw RetryPolicyException(
            "retry: MinInterval must be greater than zero if only "
            "TotalLimit is specified");
    }
}

RetryHandler RetryHandler::build(const RetryPolicy& policy)
{
    validate(policy);
    double factor = policy.backoffFactor == 0 ? 1.0 : policy.backoffFactor;
    int64_t maxInterval = policy.maxInterval.count();
    int64_t limit = policy.totalLimit.count();

    std::vector<nanoseconds> intervals;
    intervals.emplace_back(0);
    int64_t interval = policy.minInterval.count();
    int64_t total = 0;
    for (;;)
    {
        size_t count = intervals.size();
        if (policy.maxIterations > 0 && count == policy.maxIterations) break;
        if (count == 1)
        {
            total = interval;
        }
        else
        {
            double next = static_cast<double>(interval) * factor;
            interval = next >= static_cast<double>(maxInterval) ?
                maxInterval : static_cast<int64_t>(next);
            total = interval > INT64_MAX - total ? INT64_MAX : total + interval;
        }
        if (limit > 0 && total > limit) break;
        intervals.emplace_back(interval);
    }
    LOG("Built retry schedule with %zu intervals (total %s)",
        intervals.size(), formatDuration(nanoseconds(total)).c_str());
    return RetryHandler(std::move(intervals));
}

const RetryHandler& RetryHandler::defaultHandler()
{
    static const RetryHandler handler = build(RetryPolicy{ .maxIterations = 5 });
    return handler;
}

const RetryHandler& RetryHandler::never()
{
    static const RetryHandler handler = build(RetryPolicy{ .maxIterations = 1 });
    return handler;
}

bool RetryIterator::next()
{
    if (p_ == end_) return false;
    nanoseconds d = *p_++;
    if (d.count() == 0) return true;
    LOG("Retrying in %s", formatDuration(d).c_str());
    std::this_thread::sleep_for(d);
    return true;
}

} // namespace rosewire
