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
#include <pfs/endian.hpp>
#include <cstdint>
#include <cstring>
#include <type_traits>

MPACK__NAMESPACE_BEGIN

namespace details {

template <std::size_t N> struct uint_of_size;
template <> struct uint_of_size<1> { using type = std::uint8_t; };
template <> struct uint_of_size<2> { using type = std::uint16_t; };
template <> struct uint_of_size<4> { using type = std::uint32_t; };
template <> struct uint_of_size<8> { using type = std::uint64_t; };

template <typename U>
inline U to_native (U value) noexcept
{
    return pfs::to_native_order(value);
}

template <>
inline std::uint8_t to_native<std::uint8_t> (std::uint8_t value) noexcept
{
    return value;
}

template <typename U>
inline U to_network (U value) noexcept
{
    return pfs::to_network_order(value);
}

template <>
inline std::uint8_t to_network<std::uint8_t> (std::uint8_t value) noexcept
{
    return value;
}

} // namespace details

/**
 * Loads big-endian integer of type @a T from @a p (at least sizeof(T) bytes).
 * Signed types are reinterpreted from the unsigned image (two's complement).
 */
template <typename T>
inline T load_be (char const * p) noexcept
{
    static_assert(std::is_integral<T>::value, "integral type expected");

    using uint_type = typename details::uint_of_size<sizeof(T)>::type;

    uint_type u = 0;
    std::memcpy(& u, p, sizeof(uint_type));
    return static_cast<T>(details::to_native(u));
}

/**
 * Stores @a value in big-endian byte order to @a p (at least sizeof(T) bytes).
 */
template <typename T>
inline void store_be (char * p, T value) noexcept
{
    static_assert(std::is_integral<T>::value, "integral type expected");

    using uint_type = typename details::uint_of_size<sizeof(T)>::type;

    uint_type u = details::to_network(static_cast<uint_type>(value));
    std::memcpy(p, & u, sizeof(uint_type));
}

/**
 * Takes the low 8 bits of @a value (fixnum and uint8/int8 payload).
 */
template <typename T>
constexpr char take8 (T value) noexcept
{
    return static_cast<char>(static_cast<std::uint8_t>(value & 0xff));
}

inline float load_float32 (char const * p) noexcept
{
    static_assert(sizeof(float) == sizeof(std::uint32_t), "unsupported float representation");

    float result;
    auto u = load_be<std::uint32_t>(p);
    std::memcpy(& result, & u, sizeof(result));
    return result;
}

inline double load_float64 (char const * p) noexcept
{
    static_assert(sizeof(double) == sizeof(std::uint64_t), "unsupported double representation");

    double result;
    auto u = load_be<std::uint64_t>(p);
    std::memcpy(& result, & u, sizeof(result));
    return result;
}

inline void store_float32 (char * p, float value) noexcept
{
    std::uint32_t u;
    std::memcpy(& u, & value, sizeof(u));
    store_be(p, u);
}

inline void store_float64 (char * p, double value) noexcept
{
    std::uint64_t u;
    std::memcpy(& u, & value, sizeof(u));
    store_be(p, u);
}

MPACK__NAMESPACE_END
