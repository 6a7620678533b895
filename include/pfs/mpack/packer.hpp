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
#include "archive.hpp"
#include "byte_order.hpp"
#include "error.hpp"
#include "format.hpp"
#include "object.hpp"
#include "raw_data.hpp"
#include "type_adaptor.hpp"
#include <pfs/i18n.hpp>
#include <algorithm>
#include <array>
#include <cstdint>
#include <limits>
#include <list>
#include <map>
#include <string>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

MPACK__NAMESPACE_BEGIN

namespace details {

template <typename T, typename Enable = void>
struct value_packer
{
    template <typename Packer>
    static void pack (Packer & p, T const & value)
    {
        type_adaptor<T>::pack(p, value);
    }
};

} // namespace details

/**
 * MessagePack encoder.
 *
 * @details Writes to any sink providing `append (char const * data, std::size_t n)`.
 * Integers are encoded with the most compact tag able to hold the value, containers
 * and raw strings with the most compact length framing.
 *
 * @code
 * mpack::archive<> ar;
 * mpack::packer<> p {ar};
 * p.pack(1).pack(true).pack("Foo");
 *
 * // Equivalent to p.pack_array(3).pack(1).pack(true).pack("Foo")
 * p.pack(1, true, "Foo");
 * @endcode
 */
template <typename Sink = archive<>>
class packer
{
public:
    using sink_type = Sink;

private:
    sink_type * _sink {nullptr};

public:
    explicit packer (sink_type & sink) noexcept
        : _sink(& sink)
    {}

public:
    sink_type & sink () noexcept
    {
        return *_sink;
    }

    template <typename T>
    packer & pack (T const & value)
    {
        details::value_packer<T>::pack(*this, value);
        return *this;
    }

    /**
     * Packs two or more values as array.
     */
    template <typename T1, typename T2, typename ...Ts>
    packer & pack (T1 const & a, T2 const & b, Ts const & ... rest)
    {
        pack_array(2 + sizeof...(Ts));
        pack_each(a, b, rest...);
        return *this;
    }

    packer & pack_nil ()
    {
        put(format::nil);
        return *this;
    }

    packer & pack_true ()
    {
        put(format::true_);
        return *this;
    }

    packer & pack_false ()
    {
        put(format::false_);
        return *this;
    }

    packer & pack_uint (std::uint64_t value)
    {
        if (value <= limits::positive_fixnum_max)
            put_byte(take8(value));
        else if (value <= (std::numeric_limits<std::uint8_t>::max)())
            put(format::uint8, static_cast<std::uint8_t>(value));
        else if (value <= (std::numeric_limits<std::uint16_t>::max)())
            put(format::uint16, static_cast<std::uint16_t>(value));
        else if (value <= (std::numeric_limits<std::uint32_t>::max)())
            put(format::uint32, static_cast<std::uint32_t>(value));
        else
            put(format::uint64, value);

        return *this;
    }

    packer & pack_int (std::int64_t value)
    {
        if (value >= 0)
            return pack_uint(static_cast<std::uint64_t>(value));

        if (value >= limits::negative_fixnum_min)
            put_byte(take8(value));
        else if (value >= (std::numeric_limits<std::int8_t>::min)())
            put(format::int8, static_cast<std::int8_t>(value));
        else if (value >= (std::numeric_limits<std::int16_t>::min)())
            put(format::int16, static_cast<std::int16_t>(value));
        else if (value >= (std::numeric_limits<std::int32_t>::min)())
            put(format::int32, static_cast<std::int32_t>(value));
        else
            put(format::int64, value);

        return *this;
    }

    packer & pack_float (float value)
    {
        char buf[5];
        buf[0] = static_cast<char>(to_byte(format::float32));
        store_float32(buf + 1, value);
        _sink->append(buf, sizeof(buf));
        return *this;
    }

    packer & pack_double (double value)
    {
        char buf[9];
        buf[0] = static_cast<char>(to_byte(format::float64));
        store_float64(buf + 1, value);
        _sink->append(buf, sizeof(buf));
        return *this;
    }

    /**
     * Writes array header, @a n elements must be packed next.
     *
     * @throw mpack::error with errc::length_error if @a n does not fit into 32 bits.
     */
    packer & pack_array (std::size_t n)
    {
        if (n <= limits::fixarray_max)
            put_byte(static_cast<char>(to_byte(format::fixarray) | n));
        else
            put_length(format::array16, format::array32, n, "array");

        return *this;
    }

    /**
     * Writes map header, @a n key-value pairs (2 * @a n values) must be packed next.
     *
     * @throw mpack::error with errc::length_error if @a n does not fit into 32 bits.
     */
    packer & pack_map (std::size_t n)
    {
        if (n <= limits::fixmap_max)
            put_byte(static_cast<char>(to_byte(format::fixmap) | n));
        else
            put_length(format::map16, format::map32, n, "map");

        return *this;
    }

    /**
     * Writes raw header, body must be written next by pack_raw_body().
     *
     * @throw mpack::error with errc::length_error if @a n does not fit into 32 bits.
     */
    packer & pack_raw (std::size_t n)
    {
        if (n <= limits::fixraw_max)
            put_byte(static_cast<char>(to_byte(format::fixraw) | n));
        else
            put_length(format::raw16, format::raw32, n, "raw");

        return *this;
    }

    packer & pack_raw_body (char const * data, std::size_t n)
    {
        if (n > 0)
            _sink->append(data, n);

        return *this;
    }

    packer & pack_raw (char const * data, std::size_t n)
    {
        pack_raw(n);
        return pack_raw_body(data, n);
    }

private:
    template <typename T>
    void pack_each (T const & value)
    {
        pack(value);
    }

    template <typename T, typename ...Ts>
    void pack_each (T const & value, Ts const & ... rest)
    {
        pack(value);
        pack_each(rest...);
    }

    void put_byte (char b)
    {
        _sink->append(& b, 1);
    }

    void put (format f)
    {
        put_byte(static_cast<char>(to_byte(f)));
    }

    template <typename T>
    void put (format f, T value)
    {
        char buf[1 + sizeof(T)];
        buf[0] = static_cast<char>(to_byte(f));
        store_be(buf + 1, value);
        _sink->append(buf, sizeof(buf));
    }

    void put_length (format f16, format f32, std::size_t n, char const * what)
    {
        if (n <= limits::size16_max) {
            put(f16, static_cast<std::uint16_t>(n));
        } else if (n <= limits::size32_max) {
            put(f32, static_cast<std::uint32_t>(n));
        } else {
            throw error {
                  make_error_code(errc::length_error)
                , tr::f_("{} length is too big: {}", what, n)
            };
        }
    }
};

namespace details {

template <>
struct value_packer<bool>
{
    template <typename Packer>
    static void pack (Packer & p, bool value)
    {
        if (value)
            p.pack_true();
        else
            p.pack_false();
    }
};

template <>
struct value_packer<std::nullptr_t>
{
    template <typename Packer>
    static void pack (Packer & p, std::nullptr_t)
    {
        p.pack_nil();
    }
};

template <typename T>
struct value_packer<T, typename std::enable_if<std::is_integral<T>::value
    && !std::is_same<T, bool>::value && std::is_signed<T>::value>::type>
{
    template <typename Packer>
    static void pack (Packer & p, T value)
    {
        p.pack_int(static_cast<std::int64_t>(value));
    }
};

template <typename T>
struct value_packer<T, typename std::enable_if<std::is_integral<T>::value
    && !std::is_same<T, bool>::value && std::is_unsigned<T>::value>::type>
{
    template <typename Packer>
    static void pack (Packer & p, T value)
    {
        p.pack_uint(static_cast<std::uint64_t>(value));
    }
};

template <>
struct value_packer<float>
{
    template <typename Packer>
    static void pack (Packer & p, float value)
    {
        p.pack_float(value);
    }
};

template <>
struct value_packer<double>
{
    template <typename Packer>
    static void pack (Packer & p, double value)
    {
        p.pack_double(value);
    }
};

template <typename T>
struct value_packer<T, typename std::enable_if<std::is_enum<T>::value>::type>
{
    template <typename Packer>
    static void pack (Packer & p, T value)
    {
        using underlying_type = typename std::underlying_type<T>::type;
        value_packer<underlying_type>::pack(p, static_cast<underlying_type>(value));
    }
};

template <>
struct value_packer<char const *>
{
    template <typename Packer>
    static void pack (Packer & p, char const * s)
    {
        if (s == nullptr)
            p.pack_nil();
        else
            p.pack_raw(s, std::char_traits<char>::length(s));
    }
};

template <>
struct value_packer<char *>: value_packer<char const *> {};

// String literals and fixed char buffers: up to the first null character
template <std::size_t N>
struct value_packer<char[N]>
{
    template <typename Packer>
    static void pack (Packer & p, char const (& s)[N])
    {
        auto n = static_cast<std::size_t>(std::find(s, s + N, '\0') - s);
        p.pack_raw(s, n);
    }
};

template <>
struct value_packer<std::string>
{
    template <typename Packer>
    static void pack (Packer & p, std::string const & s)
    {
        p.pack_raw(s.data(), s.size());
    }
};

template <>
struct value_packer<raw_data>
{
    template <typename Packer>
    static void pack (Packer & p, raw_data const & raw)
    {
        p.pack_raw(raw.data(), raw.size());
    }
};

template <typename Alloc>
struct value_packer<std::vector<char, Alloc>>
{
    template <typename Packer>
    static void pack (Packer & p, std::vector<char, Alloc> const & v)
    {
        p.pack_raw(v.data(), v.size());
    }
};

template <typename Alloc>
struct value_packer<std::vector<std::uint8_t, Alloc>>
{
    template <typename Packer>
    static void pack (Packer & p, std::vector<std::uint8_t, Alloc> const & v)
    {
        p.pack_raw(reinterpret_cast<char const *>(v.data()), v.size());
    }
};

template <typename Sequence>
struct sequence_packer
{
    template <typename Packer>
    static void pack (Packer & p, Sequence const & seq)
    {
        p.pack_array(seq.size());

        for (auto const & elem: seq)
            p.pack(elem);
    }
};

template <typename T, typename Alloc>
struct value_packer<std::vector<T, Alloc>>: sequence_packer<std::vector<T, Alloc>> {};

template <typename T, typename Alloc>
struct value_packer<std::list<T, Alloc>>: sequence_packer<std::list<T, Alloc>> {};

template <typename T, std::size_t N>
struct value_packer<std::array<T, N>>: sequence_packer<std::array<T, N>> {};

template <typename Map>
struct map_packer
{
    template <typename Packer>
    static void pack (Packer & p, Map const & m)
    {
        p.pack_map(m.size());

        for (auto const & kv: m)
            p.pack(kv.first).pack(kv.second);
    }
};

template <typename K, typename V, typename Compare, typename Alloc>
struct value_packer<std::map<K, V, Compare, Alloc>>
    : map_packer<std::map<K, V, Compare, Alloc>> {};

template <typename K, typename V, typename Hash, typename KeyEqual, typename Alloc>
struct value_packer<std::unordered_map<K, V, Hash, KeyEqual, Alloc>>
    : map_packer<std::unordered_map<K, V, Hash, KeyEqual, Alloc>> {};

template <typename A, typename B>
struct value_packer<std::pair<A, B>>
{
    template <typename Packer>
    static void pack (Packer & p, std::pair<A, B> const & v)
    {
        p.pack_array(2).pack(v.first).pack(v.second);
    }
};

template <std::size_t I, std::size_t N>
struct tuple_element_packer
{
    template <typename Packer, typename Tuple>
    static void pack (Packer & p, Tuple const & t)
    {
        p.pack(std::get<I>(t));
        tuple_element_packer<I + 1, N>::pack(p, t);
    }
};

template <std::size_t N>
struct tuple_element_packer<N, N>
{
    template <typename Packer, typename Tuple>
    static void pack (Packer &, Tuple const &)
    {}
};

template <typename ...Ts>
struct value_packer<std::tuple<Ts...>>
{
    template <typename Packer>
    static void pack (Packer & p, std::tuple<Ts...> const & t)
    {
        p.pack_array(sizeof...(Ts));
        tuple_element_packer<0, sizeof...(Ts)>::pack(p, t);
    }
};

template <>
struct value_packer<object>
{
    template <typename Packer>
    static void pack (Packer & p, object const & obj)
    {
        switch (obj.type()) {
            case type_enum::nil:
                p.pack_nil();
                break;
            case type_enum::boolean:
                value_packer<bool>::pack(p, obj.boolean());
                break;
            case type_enum::positive_integer:
                p.pack_uint(obj.uinteger());
                break;
            case type_enum::negative_integer:
                p.pack_int(obj.integer());
                break;
            case type_enum::floating:
                p.pack_double(obj.floating());
                break;
            case type_enum::raw:
                value_packer<raw_data>::pack(p, obj.raw());
                break;
            case type_enum::array:
                sequence_packer<object::array_type>::pack(p, obj.array());
                break;
            case type_enum::map:
                p.pack_map(obj.map().size());

                for (auto const & kv: obj.map())
                    p.pack(kv.key).pack(kv.value);

                break;
        }
    }
};

} // namespace details

/**
 * Packs @a args into a new byte vector. Two or more values are packed as array.
 */
template <typename T, typename ...Ts>
std::vector<char> pack (T const & value, Ts const & ... rest)
{
    archive<> ar;
    packer<archive<>> p {ar};
    p.pack(value, rest...);
    return ar.take();
}

MPACK__NAMESPACE_END
