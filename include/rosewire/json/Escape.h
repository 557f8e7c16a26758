// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once
#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string_view>

// Locates the first byte of a string that cannot be copied verbatim
// into a JSON string literal.
//
// A byte needs escaping if it is a control character (< 0x20), a
// double quote, a backslash, or has its high bit set (the latter
// sends the encoder down the slow path, which validates UTF-8 and
// looks for U+2028/U+2029). The HTML variants additionally flag
// '<', '>' and '&'.
//
// Two implementations:
// - word: tests 8 bytes at a time using SWAR bit tricks
// - scalar: byte-by-byte table lookup
// Both must return identical results for every input. The word
// path is selected at compile time unless ROSEWIRE_SCALAR_ESCAPE
// is defined or the platform lacks 64-bit words.

#if !defined(ROSEWIRE_SCALAR_ESCAPE) && SIZE_MAX >= UINT64_MAX
#define ROSEWIRE_WORD_ESCAPE 1
#endif

namespace rosewire {

namespace detail {

// Byte classification table, built at compile time
struct EscapeTable
{
    constexpr explicit EscapeTable(bool html) : flags()
    {
        for (int i = 0; i < 256; i++)
        {
            flags[i] = i < 0x20 || i >= 0x80 || i == '"' || i == '\\';
        }
        if (html)
        {
            flags['<'] = true;
            flags['>'] = true;
            flags['&'] = true;
        }
    }

    bool flags[256];
};

} // namespace detail

class Escape
{
public:
    static constexpr size_t NONE = std::string_view::npos;

    /// @brief Returns the index of the first byte in s that needs
    /// escaping, or NONE.
    static size_t index(std::string_view s) noexcept
    {
    #ifdef ROSEWIRE_WORD_ESCAPE
        return wordIndex(s);
    #else
        return scalarIndex(s);
    #endif
    }

    /// @brief Like index(), but also flags '<', '>' and '&'.
    static size_t htmlIndex(std::string_view s) noexcept
    {
    #ifdef ROSEWIRE_WORD_ESCAPE
        return wordHtmlIndex(s);
    #else
        return scalarHtmlIndex(s);
    #endif
    }

    static size_t wordIndex(std::string_view s) noexcept
    {
        return scanWords<false>(s);
    }

    static size_t wordHtmlIndex(std::string_view s) noexcept
    {
        return scanWords<true>(s);
    }

    static size_t scalarIndex(std::string_view s) noexcept
    {
        return scanBytes(s, 0, JSON_TABLE.flags);
    }

    static size_t scalarHtmlIndex(std::string_view s) noexcept
    {
        return scanBytes(s, 0, HTML_TABLE.flags);
    }

    static bool needsHtmlEscape(unsigned char ch) noexcept
    {
        return HTML_TABLE.flags[ch];
    }

private:
    static constexpr uint64_t LSB = 0x0101010101010101ULL;
    static constexpr uint64_t MSB = 0x8080808080808080ULL;

    /// Puts the given byte into each of the 8 bytes of a word.
    static constexpr uint64_t expand(uint8_t b) noexcept
    {
        return LSB * b;
    }

    /// The MSB of a byte is set in the result if that byte in n
    /// is below b. Valid only for b < 0x80 and bytes of n < 0x80;
    /// bytes above are caught by n itself.
    static constexpr uint64_t below(uint64_t n, uint8_t b) noexcept
    {
        return n - expand(b);
    }

    /// The MSB of a byte is set in the result if that byte in n
    /// equals b. Same validity constraints as below().
    static constexpr uint64_t contains(uint64_t n, uint8_t b) noexcept
    {
        return (n ^ expand(b)) - LSB;
    }

    // Loads 8 bytes so that the first byte in memory is the least
    // significant. Borrows in below()/contains() only propagate
    // towards higher bytes, i.e. past the first flagged byte, so
    // the lowest flagged byte is always exact.
    static uint64_t loadWord(const char* p) noexcept
    {
        uint64_t n;
        std::memcpy(&n, p, 8);
        if constexpr (std::endian::native == std::endian::big)
        {
            n = ((n & 0x00000000FFFFFFFFULL) << 32) | (n >> 32);
            n = ((n & 0x0000FFFF0000FFFFULL) << 16) |
                ((n >> 16) & 0x0000FFFF0000FFFFULL);
            n = ((n & 0x00FF00FF00FF00FFULL) << 8) |
                ((n >> 8) & 0x00FF00FF00FF00FFULL);
        }
        return n;
    }

    template <bool Html>
    static size_t scanWords(std::string_view s) noexcept
    {
        const char* p = s.data();
        size_t len = s.size();
        size_t chunked = len & ~static_cast<size_t>(7);
        for (size_t i = 0; i < chunked; i += 8)
        {
            uint64_t n = loadWord(p + i);
            // Include n itself so that bytes >= 0x80 set their MSB
            uint64_t mask = n | below(n, 0x20) |
                contains(n, '"') | contains(n, '\\');
            if constexpr (Html)
            {
                mask |= contains(n, '<') | contains(n, '>') |
                    contains(n, '&');
            }
            mask &= MSB;
            if (mask != 0)
            {
                return i + static_cast<size_t>(std::countr_zero(mask)) / 8;
            }
        }
        return scanBytes(s, chunked, Html ? HTML_TABLE.flags : JSON_TABLE.flags);
    }

    static size_t scanBytes(std::string_view s, size_t start,
        const bool* table) noexcept
    {
        const unsigned char* p =
            reinterpret_cast<const unsigned char*>(s.data());
        size_t len = s.size();
        for (size_t i = start; i < len; i++)
        {
            if (table[p[i]]) return i;
        }
        return NONE;
    }

    static constexpr detail::EscapeTable JSON_TABLE { false };
    static constexpr detail::EscapeTable HTML_TABLE { true };
};

} // namespace rosewire
