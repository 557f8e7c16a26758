// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once
#include <cstddef>

namespace rosewire {

class Unicode
{
public:
    static constexpr int INVALID = -1;
    static constexpr int REPLACEMENT_CHAR = 0xFFFD;
    static constexpr int LINE_SEPARATOR = 0x2028;
    static constexpr int PARAGRAPH_SEPARATOR = 0x2029;

    /// @brief Decodes the UTF-8 sequence that starts at p.
    ///
    /// Overlong encodings, surrogate halves, code points above
    /// U+10FFFF and sequences truncated by end are rejected.
    ///
    /// @param p    start of the sequence (must be < end)
    /// @param end  end of the input
    /// @param size receives the number of bytes consumed; 1 if
    ///             the sequence is invalid
    /// @return the code point, or INVALID
    ///
    static int decode(const char* p, const char* end, int& size) noexcept;
};

} // namespace rosewire
