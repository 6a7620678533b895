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
#include "error.hpp"
#include "exports.hpp"
#include "format.hpp"
#include "object.hpp"
#include "raw_data.hpp"
#include "type_adaptor.hpp"
#include <algorithm>
#include <array>
#include <cstddef>
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

class direct_unpacker;

namespace details {

template <typename T, typename Enable = void>
struct value_unpacker
{
    static void unpack (direct_unpacker & u, T & value)
    {
        type_adaptor<T>::unpack(u, value);
    }
};

template <std::size_t ...I>
struct index_sequence {};

template <std::size_t N, std::size_t ...I>
struct make_index_sequence: make_index_sequence<N - 1, N - 1, I...> {};

template <std::size_t ...I>
struct make_index_sequence<0, I...>
{
    using type = index_sequence<I...>;
};

} // namespace details

/**
 * One-shot MessagePack decoder of a complete buffer into typed variables.
 *
 * @details Unlike the streaming unpacker no intermediate object is built (except
 * when unpacking into mpack::object explicitly). Integer values are range checked
 * against the target type.
 *
 * Any failed unpack() restores the read position to the start of the failed value,
 * so the same bytes can be decoded again into another type:
 *      - type mismatch or value out of range of the target type:
 *        mpack::error with errc::invalid_type;
 *      - buffer ends in the middle of the value:
 *        mpack::error with errc::insufficient_data.
 *
 * The buffer is not copied and must outlive the unpacker. Raw values unpacked into
 * raw_data (or as part of mpack::object) are external views into that buffer.
 */
class direct_unpacker
{
    template <typename T, typename E>
    friend struct details::value_unpacker;

private:
    char const * _data {nullptr};
    std::size_t _size {0};
    std::size_t _offset {0};

private:
    // Restores the read position on failure
    class transaction
    {
        direct_unpacker * _u;
        std::size_t _start;
        bool _committed {false};

    public:
        transaction (direct_unpacker & u) noexcept
            : _u(& u)
            , _start(u._offset)
        {}

        ~transaction ()
        {
            if (!_committed)
                _u->_offset = _start;
        }

        transaction (transaction const &) = delete;
        transaction & operator = (transaction const &) = delete;

        void commit () noexcept
        {
            _committed = true;
        }
    };

public:
    direct_unpacker (char const * data, std::size_t n) noexcept
        : _data(data)
        , _size(n)
    {}

public:
    /**
     * Current read position.
     */
    std::size_t offset () const noexcept
    {
        return _offset;
    }

    /**
     * Number of bytes not read yet.
     */
    std::size_t available () const noexcept
    {
        return _size - _offset;
    }

    /**
     * Rewinds the read position to the beginning of the buffer.
     */
    void clear () noexcept
    {
        _offset = 0;
    }

    template <typename T>
    direct_unpacker & unpack (T & value)
    {
        transaction tx {*this};
        details::value_unpacker<T>::unpack(*this, value);
        tx.commit();
        return *this;
    }

    /**
     * Unpacks values in sequence. On failure the values unpacked successfully
     * before remain consumed.
     */
    template <typename T1, typename T2, typename ...Ts>
    direct_unpacker & unpack (T1 & a, T2 & b, Ts & ... rest)
    {
        unpack(a);
        return unpack(b, rest...);
    }

    /**
     * Reads array header.
     *
     * @return Number of elements (zero for nil).
     */
    MPACK__EXPORT std::size_t unpack_array ();

    /**
     * Reads map header.
     *
     * @return Number of key-value pairs (zero for nil).
     */
    MPACK__EXPORT std::size_t unpack_map ();

    /**
     * Reads raw header.
     *
     * @return Number of raw bytes (zero for nil) that follow.
     */
    MPACK__EXPORT std::size_t unpack_raw ();

    /**
     * Consumes nil and assigns the default value to @a value.
     */
    template <typename T>
    direct_unpacker & unpack_nil (T & value)
    {
        transaction tx {*this};

        if (read_header() != to_byte(format::nil))
            throw_invalid_type("nil");

        value = T{};
        tx.commit();
        return *this;
    }

    /**
     * Checks whether the next value is nil (nothing consumed).
     *
     * @throw mpack::error with errc::insufficient_data if no bytes available.
     */
    MPACK__EXPORT bool check_nil ();

    /**
     * Decodes records until the end of the buffer. Each record must be an array
     * of `sizeof...(Ts)` elements, elements are passed to @a f as `Ts & ...`.
     *
     * @return Number of records.
     */
    template <typename ...Ts, typename F>
    std::size_t scan (F && f)
    {
        std::size_t count = 0;

        while (available() > 0) {
            std::tuple<Ts...> record;
            unpack_record(record, typename details::make_index_sequence<sizeof...(Ts)>::type{});
            invoke(f, record, typename details::make_index_sequence<sizeof...(Ts)>::type{});
            count++;
        }

        return count;
    }

private:
    template <typename Tuple, std::size_t ...I>
    void unpack_record (Tuple & record, details::index_sequence<I...>)
    {
        transaction tx {*this};

        if (read_array_header() != sizeof...(I))
            throw_invalid_type("record of fixed size");

        using expander = int[];
        (void)expander{0, (unpack(std::get<I>(record)), 0)...};

        tx.commit();
    }

    template <typename F, typename Tuple, std::size_t ...I>
    static void invoke (F & f, Tuple & record, details::index_sequence<I...>)
    {
        f(std::get<I>(record)...);
    }

    MPACK__EXPORT std::uint8_t read_header ();
    MPACK__EXPORT char const * read (std::size_t n);
    MPACK__EXPORT std::size_t read_array_header ();
    MPACK__EXPORT std::size_t read_map_header ();
    MPACK__EXPORT std::size_t read_raw_header ();
    MPACK__EXPORT raw_data read_raw ();
    MPACK__EXPORT bool read_boolean ();
    MPACK__EXPORT double read_floating (bool & is_float64);
    MPACK__EXPORT object read_object ();

    /**
     * Reads an integer value: for non-negative values @a negative is set to @c false
     * and the value is stored in @a u, otherwise in @a i.
     */
    MPACK__EXPORT void read_integer (std::uint64_t & u, std::int64_t & i, bool & negative);

    [[noreturn]] MPACK__EXPORT void throw_invalid_type (char const * expected);
    [[noreturn]] MPACK__EXPORT void throw_out_of_range ();
};

namespace details {

template <>
struct value_unpacker<bool>
{
    static void unpack (direct_unpacker & u, bool & value)
    {
        value = u.read_boolean();
    }
};

template <typename T>
struct value_unpacker<T, typename std::enable_if<std::is_integral<T>::value
    && !std::is_same<T, bool>::value>::type>
{
    static void unpack (direct_unpacker & u, T & value)
    {
        std::uint64_t uv = 0;
        std::int64_t iv = 0;
        bool negative = false;

        u.read_integer(uv, iv, negative);

        if (negative) {
            if (std::is_unsigned<T>::value
                    || iv < static_cast<std::int64_t>((std::numeric_limits<T>::min)())) {
                u.throw_out_of_range();
            }

            value = static_cast<T>(iv);
        } else {
            if (uv > static_cast<std::uint64_t>((std::numeric_limits<T>::max)()))
                u.throw_out_of_range();

            value = static_cast<T>(uv);
        }
    }
};

template <>
struct value_unpacker<float>
{
    static void unpack (direct_unpacker & u, float & value)
    {
        bool is_float64 = false;
        auto f = u.read_floating(is_float64);

        // Precision loss
        if (is_float64)
            u.throw_invalid_type("float32");

        value = static_cast<float>(f);
    }
};

template <>
struct value_unpacker<double>
{
    static void unpack (direct_unpacker & u, double & value)
    {
        bool is_float64 = false;
        value = u.read_floating(is_float64);
    }
};

template <typename T>
struct value_unpacker<T, typename std::enable_if<std::is_enum<T>::value>::type>
{
    static void unpack (direct_unpacker & u, T & value)
    {
        typename std::underlying_type<T>::type v;
        value_unpacker<decltype(v)>::unpack(u, v);
        value = static_cast<T>(v);
    }
};

template <>
struct value_unpacker<object>
{
    static void unpack (direct_unpacker & u, object & value)
    {
        value = u.read_object();
    }
};

template <>
struct value_unpacker<raw_data>
{
    static void unpack (direct_unpacker & u, raw_data & value)
    {
        value = u.read_raw();
    }
};

template <>
struct value_unpacker<std::string>
{
    static void unpack (direct_unpacker & u, std::string & value)
    {
        value = u.read_raw().str();
    }
};

template <typename Byte, typename Alloc>
struct raw_unpacker
{
    static void unpack (direct_unpacker & u, std::vector<Byte, Alloc> & value)
    {
        raw_data raw;
        u.unpack(raw);
        value.clear();
        value.reserve(raw.size());

        for (char ch: raw)
            value.push_back(static_cast<Byte>(ch));
    }
};

template <typename Alloc>
struct value_unpacker<std::vector<char, Alloc>>: raw_unpacker<char, Alloc> {};

template <typename Alloc>
struct value_unpacker<std::vector<std::uint8_t, Alloc>>: raw_unpacker<std::uint8_t, Alloc> {};

template <typename T, typename Alloc>
struct value_unpacker<std::vector<T, Alloc>>
{
    static void unpack (direct_unpacker & u, std::vector<T, Alloc> & value)
    {
        auto n = u.read_array_header();

        value.clear();
        value.reserve((std::min)(n, u.available()));

        for (std::size_t i = 0; i < n; i++) {
            T elem;
            u.unpack(elem);
            value.push_back(std::move(elem));
        }
    }
};

template <typename T, typename Alloc>
struct value_unpacker<std::list<T, Alloc>>
{
    static void unpack (direct_unpacker & u, std::list<T, Alloc> & value)
    {
        auto n = u.read_array_header();

        value.clear();

        for (std::size_t i = 0; i < n; i++) {
            T elem;
            u.unpack(elem);
            value.push_back(std::move(elem));
        }
    }
};

template <typename T, std::size_t N>
struct value_unpacker<std::array<T, N>>
{
    static void unpack (direct_unpacker & u, std::array<T, N> & value)
    {
        if (u.read_array_header() != N)
            u.throw_invalid_type("array of fixed size");

        for (std::size_t i = 0; i < N; i++)
            u.unpack(value[i]);
    }
};

template <typename Map>
struct map_unpacker
{
    static void unpack (direct_unpacker & u, Map & value)
    {
        auto n = u.unpack_map();

        value.clear();

        for (std::size_t i = 0; i < n; i++) {
            typename Map::key_type k;
            typename Map::mapped_type v;
            u.unpack(k).unpack(v);
            value[std::move(k)] = std::move(v);
        }
    }
};

template <typename K, typename V, typename Compare, typename Alloc>
struct value_unpacker<std::map<K, V, Compare, Alloc>>
    : map_unpacker<std::map<K, V, Compare, Alloc>> {};

template <typename K, typename V, typename Hash, typename KeyEqual, typename Alloc>
struct value_unpacker<std::unordered_map<K, V, Hash, KeyEqual, Alloc>>
    : map_unpacker<std::unordered_map<K, V, Hash, KeyEqual, Alloc>> {};

template <typename A, typename B>
struct value_unpacker<std::pair<A, B>>
{
    static void unpack (direct_unpacker & u, std::pair<A, B> & value)
    {
        if (u.read_array_header() != 2)
            u.throw_invalid_type("pair");

        u.unpack(value.first).unpack(value.second);
    }
};

template <typename ...Ts>
struct value_unpacker<std::tuple<Ts...>>
{
    static void unpack (direct_unpacker & u, std::tuple<Ts...> & value)
    {
        if (u.read_array_header() != sizeof...(Ts))
            u.throw_invalid_type("tuple");

        unpack_elements(u, value, typename make_index_sequence<sizeof...(Ts)>::type{});
    }

private:
    template <std::size_t ...I>
    static void unpack_elements (direct_unpacker & u, std::tuple<Ts...> & value, index_sequence<I...>)
    {
        using expander = int[];
        (void)expander{0, (u.unpack(std::get<I>(value)), 0)...};
    }
};

} // namespace details

/**
 * Unpacks single value from @a n bytes at @a data.
 *
 * @return Number of bytes consumed.
 */
template <typename T>
std::size_t unpack (char const * data, std::size_t n, T & value)
{
    direct_unpacker u {data, n};
    u.unpack(value);
    return u.offset();
}

/**
 * Unpacks two or more values packed as array (see pack()).
 *
 * @throw mpack::error with errc::invalid_type if the array length does not match
 *        the number of values.
 */
template <typename T1, typename T2, typename ...Ts>
std::size_t unpack (char const * data, std::size_t n, T1 & a, T2 & b, Ts & ... rest)
{
    direct_unpacker u {data, n};
    auto values = std::tie(a, b, rest...);
    u.unpack(values);
    return u.offset();
}

MPACK__NAMESPACE_END
