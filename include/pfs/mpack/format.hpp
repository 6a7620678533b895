////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `mpack-lib`.
//
// Changelog:
//      2026.09.14 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "namespace.hpp"
#include <cstddef>
#include <cstdint>

MPACK__NAMESPACE_BEGIN

/**
 * MessagePack type tags.
 *
 * Fix forms (fixnums, fix raw/array/map) occupy byte ranges and are identified
 * by the base value of the range, the remaining bits hold the embedded value
 * or length.
 */
enum class format: std::uint8_t
{
    // Fix forms (range base)
      positive_fixnum = 0x00 // 0x00 - 0x7f
    , fixmap   = 0x80        // 0x80 - 0x8f
    , fixarray = 0x90        // 0x90 - 0x9f
    , fixraw   = 0xa0        // 0xa0 - 0xbf
    , negative_fixnum = 0xe0 // 0xe0 - 0xff

    // Explicit tags
    , nil      = 0xc0
    , false_   = 0xc2
    , true_    = 0xc3
    , float32  = 0xca
    , float64  = 0xcb
    , uint8    = 0xcc
    , uint16   = 0xcd
    , uint32   = 0xce
    , uint64   = 0xcf
    , int8     = 0xd0
    , int16    = 0xd1
    , int32    = 0xd2
    , int64    = 0xd3
    , real     = 0xd4 // Legacy extended float, never produced, rejected on input
    , raw16    = 0xda
    , raw32    = 0xdb
    , array16  = 0xdc
    , array32  = 0xdd
    , map16    = 0xde
    , map32    = 0xdf
};

namespace limits {

constexpr std::uint64_t positive_fixnum_max = 0x7f;
constexpr std::int64_t  negative_fixnum_min = -32;
constexpr std::size_t   fixraw_max   = 31;
constexpr std::size_t   fixarray_max = 15;
constexpr std::size_t   fixmap_max   = 15;
constexpr std::size_t   size16_max   = 0xffff;
constexpr std::size_t   size32_max   = 0xffffffff;

} // namespace limits

constexpr std::uint8_t to_byte (format f) noexcept
{
    return static_cast<std::uint8_t>(f);
}

constexpr bool is_positive_fixnum (std::uint8_t b) noexcept
{
    return b <= 0x7f;
}

constexpr bool is_negative_fixnum (std::uint8_t b) noexcept
{
    return b >= 0xe0;
}

constexpr bool is_fixmap (std::uint8_t b) noexcept
{
    return b >= 0x80 && b <= 0x8f;
}

constexpr bool is_fixarray (std::uint8_t b) noexcept
{
    return b >= 0x90 && b <= 0x9f;
}

constexpr bool is_fixraw (std::uint8_t b) noexcept
{
    return b >= 0xa0 && b <= 0xbf;
}

/**
 * Length embedded into fix raw/array/map tag.
 */
constexpr std::size_t fix_length (std::uint8_t b) noexcept
{
    return is_fixraw(b) ? (b & 0x1f) : (b & 0x0f);
}

/**
 * Number of payload bytes following the scalar tags uint8..int64 and float32/float64
 * (the low two bits of the tag encode the width).
 */
constexpr std::size_t scalar_trail (std::uint8_t b) noexcept
{
    return std::size_t{1} << (b & 0x03);
}

/**
 * Number of length bytes following the raw16/32, array16/32 and map16/32 tags.
 */
constexpr std::size_t length_trail (std::uint8_t b) noexcept
{
    return std::size_t{2} << (b & 0x01);
}

/**
 * Checks whether @a b is a tag known by this codec (the legacy extended float excluded).
 */
constexpr bool is_known_format (std::uint8_t b) noexcept
{
    return is_positive_fixnum(b)
        || is_negative_fixnum(b)
        || is_fixmap(b)
        || is_fixarray(b)
        || is_fixraw(b)
        || b == to_byte(format::nil)
        || b == to_byte(format::false_)
        || b == to_byte(format::true_)
        || (b >= to_byte(format::float32) && b <= to_byte(format::int64))
        || (b >= to_byte(format::raw16) && b <= to_byte(format::map32));
}

MPACK__NAMESPACE_END
