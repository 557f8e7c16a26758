// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once

#include <cstddef>

namespace rosewire {

/// @brief A source of bytes that must be released after use.
///
/// - read() may return fewer bytes than requested; it returns 0
///   only once the end of the stream has been reached, and
///   throws (typically IOException) if the read fails
/// - close() releases the underlying resource; it never throws
///   and may be called more than once
///
class InputStream
{
public:
    virtual ~InputStream() = default;

    virtual size_t read(void* buf, size_t length) = 0;
    virtual void close() noexcept = 0;
};

} // namespace rosewire
