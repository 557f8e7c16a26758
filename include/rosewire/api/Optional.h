// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once
#include <utility>

namespace rosewire::api {

/// @brief A value that may be absent from the wire form.
///
/// Unlike std::optional, the value is always constructed:
/// reset() only clears the presence flag, so a string or vector
/// keeps its storage when the entity is reused.
///
template<typename T>
class Optional
{
public:
    Optional() : set_(false), value_() {}
    Optional(const T& v) : set_(true), value_(v) {}
    Optional(T&& v) : set_(true), value_(std::move(v)) {}

    bool isSet() const noexcept { return set_; }
    explicit operator bool() const noexcept { return set_; }

    const T& value() const noexcept { return value_; }
    T& value() noexcept { return value_; }

    /// Marks the value as present and returns it for assignment.
    T& set() noexcept
    {
        set_ = true;
        return value_;
    }

    void set(const T& v)
    {
        value_ = v;
        set_ = true;
    }

    void set(T&& v)
    {
        value_ = std::move(v);
        set_ = true;
    }

    void reset() noexcept { set_ = false; }

    bool operator==(const Optional& other) const
    {
        if (set_ != other.set_) return false;
        return !set_ || value_ == other.value_;
    }

private:
    bool set_;
    T value_;
};

} // namespace rosewire::api
