// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#include <rosewire/util/Unicode.h>

namespace rosewire {

static inline bool isContinuation(unsigned char ch)
{
    return (ch & 0xC0) == 0x80;
}

int Unicode::decode(const char* p, const char* end, int& size) noexcept
{
    const unsigned char* s = reinterpret_cast<const unsigned char*>(p);
    size_t avail = end - p;
    unsigned char b0 = s[0];
    size = 1;

    if (b0 < 0x80) return b0;
    if (b0 < 0xC2) return INVALID;      // continuation byte or overlong lead

    if (b0 < 0xE0)
    {
        // 2-byte sequence: 110xxxxx 10xxxxxx
        if (avail < 2 || !isContinuation(s[1])) return INVALID;
        size = 2;
        return ((b0 & 0x1F) << 6) | (s[1] & 0x3F);
    }

    if (b0 < 0xF0)
    {
        // 3-byte sequence: 1110xxxx 10xxxxxx 10xxxxxx
        if (avail < 3) return INVALID;
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;
        if (b0 == 0xE0) lo = 0xA0;          // overlong
        else if (b0 == 0xED) hi = 0x9F;     // surrogates
        if (s[1] < lo || s[1] > hi || !isContinuation(s[2])) return INVALID;
        size = 3;
        return ((b0 & 0x0F) << 12) | ((s[1] & 0x3F) << 6) | (s[2] & 0x3F);
    }

    if (b0 < 0xF5)
    {
        // 4-byte sequence: 11110xxx 10xxxxxx 10xxxxxx 10xxxxxx
        if (avail < 4) return INVALID;
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;
        if (b0 == 0xF0) lo = 0x90;          // overlong
        else if (b0 == 0xF4) hi = 0x8F;     // above U+10FFFF
        if (s[1] < lo || s[1] > hi ||
            !isContinuation(s[2]) || !isContinuation(s[3]))
        {
            return INVALID;
        }
        size = 4;
        return ((b0 & 0x07) << 18) | ((s[1] & 0x3F) << 12) |
            ((s[2] & 0x3F) << 6) | (s[3] & 0x3F);
    }
    return INVALID;
}

} // namespace rosewire
