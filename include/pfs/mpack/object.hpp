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
#include "raw_data.hpp"
#include "type_adaptor.hpp"
#include <array>
#include <cstdint>
#include <list>
#include <map>
#include <new>
#include <string>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

MPACK__NAMESPACE_BEGIN

enum class type_enum
{
      nil
    , boolean
    , positive_integer
    , negative_integer
    , floating
    , raw
    , array
    , map
};

MPACK__EXPORT char const * to_string (type_enum t) noexcept;

struct key_value;

/**
 * Dynamically typed MessagePack value.
 *
 * @details Integers are normalized: a non-negative value is always stored as
 *          type_enum::positive_integer, a negative one as type_enum::negative_integer,
 *          whatever tag it was encoded with.
 *
 * @warning Raw payloads produced by the streaming unpacker are zero-copy views into
 *          the unpacker buffer (see raw_data). The views keep the buffer block alive,
 *          but objects produced by the direct unpacker point into the caller's buffer
 *          and are valid only as long as that buffer is. Use raw_data::detach() (or
 *          convert to std::string) to get bytes with independent lifetime.
 */
class object
{
public:
    using array_type = std::vector<object>;
    using map_type = std::vector<key_value>;

private:
    type_enum _type {type_enum::nil};

    // Exactly one member is alive, selected by _type
    union payload
    {
        bool boolean;
        std::uint64_t uinteger;
        std::int64_t integer;
        double floating;
        raw_data raw;
        array_type array;
        map_type map;

        payload () noexcept : uinteger(0) {}
        ~payload () {}
    } _via;

public:
    object () noexcept = default;

    object (std::nullptr_t) noexcept
    {}

    object (bool value) noexcept
        : _type(type_enum::boolean)
    {
        _via.boolean = value;
    }

    template <typename T>
    object (T value, typename std::enable_if<std::is_integral<T>::value
        && !std::is_same<T, bool>::value && std::is_unsigned<T>::value>::type * = nullptr) noexcept
        : _type(type_enum::positive_integer)
    {
        _via.uinteger = static_cast<std::uint64_t>(value);
    }

    template <typename T>
    object (T value, typename std::enable_if<std::is_integral<T>::value
        && !std::is_same<T, bool>::value && std::is_signed<T>::value>::type * = nullptr) noexcept
    {
        if (value < 0) {
            _type = type_enum::negative_integer;
            _via.integer = static_cast<std::int64_t>(value);
        } else {
            _type = type_enum::positive_integer;
            _via.uinteger = static_cast<std::uint64_t>(value);
        }
    }

    object (float value) noexcept
        : _type(type_enum::floating)
    {
        _via.floating = value;
    }

    object (double value) noexcept
        : _type(type_enum::floating)
    {
        _via.floating = value;
    }

    object (char const * s);
    object (std::string const & s);
    object (raw_data raw) noexcept;
    object (array_type && a) noexcept;
    object (map_type && m) noexcept;

    MPACK__EXPORT object (object const & other);
    MPACK__EXPORT object (object && other) noexcept;

    /**
     * Nested arrays and maps are released iteratively, so the depth of the tree
     * is not limited by the call stack.
     */
    MPACK__EXPORT ~object ();

    MPACK__EXPORT object & operator = (object const & other);
    MPACK__EXPORT object & operator = (object && other) noexcept;

public:
    type_enum type () const noexcept
    {
        return _type;
    }

    bool is_nil () const noexcept
    {
        return _type == type_enum::nil;
    }

    bool is_integer () const noexcept
    {
        return _type == type_enum::positive_integer || _type == type_enum::negative_integer;
    }

    bool boolean () const
    {
        expect(type_enum::boolean);
        return _via.boolean;
    }

    std::uint64_t uinteger () const
    {
        expect(type_enum::positive_integer);
        return _via.uinteger;
    }

    std::int64_t integer () const
    {
        expect(type_enum::negative_integer);
        return _via.integer;
    }

    double floating () const
    {
        expect(type_enum::floating);
        return _via.floating;
    }

    raw_data const & raw () const
    {
        expect(type_enum::raw);
        return _via.raw;
    }

    array_type const & array () const
    {
        expect(type_enum::array);
        return _via.array;
    }

    array_type & array ()
    {
        expect(type_enum::array);
        return _via.array;
    }

    map_type const & map () const
    {
        expect(type_enum::map);
        return _via.map;
    }

    map_type & map ()
    {
        expect(type_enum::map);
        return _via.map;
    }

    /**
     * Number of elements for array and map, number of bytes for raw, zero otherwise.
     */
    MPACK__EXPORT std::size_t size () const noexcept;

    /**
     * Converts to @a T.
     *
     * @throw mpack::error with errc::invalid_type if the value type is incompatible with @a T.
     *
     * @note Integers are converted with plain narrowing cast without range check.
     */
    template <typename T>
    T as () const;

    /**
     * Converts to @a T using @a visitor. Visitor signature is
     * `void (object const &, T &)`.
     */
    template <typename T, typename Visitor>
    T as (Visitor && visitor) const
    {
        T result;
        visitor(*this, result);
        return result;
    }

    /**
     * Converts to @a value type and assigns.
     */
    template <typename T>
    void convert (T & value) const;

    [[noreturn]] MPACK__EXPORT void throw_invalid_type (char const * target) const;

    friend MPACK__EXPORT bool operator == (object const & a, object const & b);

    friend bool operator != (object const & a, object const & b)
    {
        return !(a == b);
    }

private:
    void destroy () noexcept;
    void take (object && other) noexcept;

    void expect (type_enum t) const
    {
        if (_type != t)
            throw_invalid_type(to_string(t));
    }
};

struct key_value
{
    object key;
    object value;
};

inline bool operator == (key_value const & a, key_value const & b)
{
    return a.key == b.key && a.value == b.value;
}

inline bool operator != (key_value const & a, key_value const & b)
{
    return !(a == b);
}

inline object::object (char const * s)
    : _type(type_enum::raw)
{
    new (& _via.raw) raw_data(raw_data::copy(s, std::char_traits<char>::length(s)));
}

inline object::object (std::string const & s)
    : _type(type_enum::raw)
{
    new (& _via.raw) raw_data(raw_data::copy(s));
}

inline object::object (raw_data raw) noexcept
    : _type(type_enum::raw)
{
    new (& _via.raw) raw_data(std::move(raw));
}

inline object::object (array_type && a) noexcept
    : _type(type_enum::array)
{
    new (& _via.array) array_type(std::move(a));
}

inline object::object (map_type && m) noexcept
    : _type(type_enum::map)
{
    new (& _via.map) map_type(std::move(m));
}

/**
 * Human readable (JSON-like) representation of the object.
 */
MPACK__EXPORT std::string to_string (object const & obj);

namespace details {

template <typename T, typename Enable = void>
struct object_converter
{
    static void convert (object const & obj, T & value)
    {
        type_adaptor<T>::unpack(obj, value);
    }
};

template <>
struct object_converter<object>
{
    static void convert (object const & obj, object & value)
    {
        value = obj;
    }
};

template <>
struct object_converter<bool>
{
    static void convert (object const & obj, bool & value)
    {
        value = obj.boolean();
    }
};

template <typename T>
struct object_converter<T, typename std::enable_if<std::is_integral<T>::value
    && !std::is_same<T, bool>::value>::type>
{
    static void convert (object const & obj, T & value)
    {
        switch (obj.type()) {
            case type_enum::positive_integer:
                value = static_cast<T>(obj.uinteger());
                break;
            case type_enum::negative_integer:
                value = static_cast<T>(obj.integer());
                break;
            default:
                obj.throw_invalid_type("integer");
        }
    }
};

template <typename T>
struct object_converter<T, typename std::enable_if<std::is_floating_point<T>::value>::type>
{
    static void convert (object const & obj, T & value)
    {
        value = static_cast<T>(obj.floating());
    }
};

template <typename T>
struct object_converter<T, typename std::enable_if<std::is_enum<T>::value>::type>
{
    static void convert (object const & obj, T & value)
    {
        typename std::underlying_type<T>::type v;
        object_converter<decltype(v)>::convert(obj, v);
        value = static_cast<T>(v);
    }
};

template <>
struct object_converter<raw_data>
{
    static void convert (object const & obj, raw_data & value)
    {
        if (obj.is_nil())
            value = raw_data{};
        else
            value = obj.raw();
    }
};

template <>
struct object_converter<std::string>
{
    static void convert (object const & obj, std::string & value)
    {
        if (obj.is_nil())
            value.clear();
        else
            value = obj.raw().str();
    }
};

template <typename Byte, typename Alloc>
struct raw_converter
{
    static void convert (object const & obj, std::vector<Byte, Alloc> & value)
    {
        value.clear();

        if (obj.is_nil())
            return;

        auto const & raw = obj.raw();
        value.reserve(raw.size());

        for (char ch: raw)
            value.push_back(static_cast<Byte>(ch));
    }
};

template <typename Alloc>
struct object_converter<std::vector<char, Alloc>>: raw_converter<char, Alloc> {};

template <typename Alloc>
struct object_converter<std::vector<std::uint8_t, Alloc>>: raw_converter<std::uint8_t, Alloc> {};

template <typename T, typename Alloc>
struct object_converter<std::vector<T, Alloc>>
{
    static void convert (object const & obj, std::vector<T, Alloc> & value)
    {
        value.clear();

        if (obj.is_nil())
            return;

        auto const & a = obj.array();
        value.resize(a.size());

        for (std::size_t i = 0; i < a.size(); i++)
            object_converter<T>::convert(a[i], value[i]);
    }
};

template <typename T, typename Alloc>
struct object_converter<std::list<T, Alloc>>
{
    static void convert (object const & obj, std::list<T, Alloc> & value)
    {
        value.clear();

        if (obj.is_nil())
            return;

        for (auto const & elem: obj.array()) {
            T v;
            object_converter<T>::convert(elem, v);
            value.push_back(std::move(v));
        }
    }
};

template <typename T, std::size_t N>
struct object_converter<std::array<T, N>>
{
    static void convert (object const & obj, std::array<T, N> & value)
    {
        auto const & a = obj.array();

        if (a.size() != N)
            obj.throw_invalid_type("fixed size array");

        for (std::size_t i = 0; i < N; i++)
            object_converter<T>::convert(a[i], value[i]);
    }
};

template <typename Map>
struct map_converter
{
    static void convert (object const & obj, Map & value)
    {
        value.clear();

        if (obj.is_nil())
            return;

        for (auto const & kv: obj.map()) {
            typename Map::key_type k;
            typename Map::mapped_type v;
            object_converter<typename Map::key_type>::convert(kv.key, k);
            object_converter<typename Map::mapped_type>::convert(kv.value, v);
            value[std::move(k)] = std::move(v);
        }
    }
};

template <typename K, typename V, typename Compare, typename Alloc>
struct object_converter<std::map<K, V, Compare, Alloc>>
    : map_converter<std::map<K, V, Compare, Alloc>> {};

template <typename K, typename V, typename Hash, typename KeyEqual, typename Alloc>
struct object_converter<std::unordered_map<K, V, Hash, KeyEqual, Alloc>>
    : map_converter<std::unordered_map<K, V, Hash, KeyEqual, Alloc>> {};

template <typename A, typename B>
struct object_converter<std::pair<A, B>>
{
    static void convert (object const & obj, std::pair<A, B> & value)
    {
        auto const & a = obj.array();

        if (a.size() != 2)
            obj.throw_invalid_type("pair");

        object_converter<A>::convert(a[0], value.first);
        object_converter<B>::convert(a[1], value.second);
    }
};

template <std::size_t I, std::size_t N>
struct tuple_element_converter
{
    template <typename Tuple>
    static void convert (object::array_type const & a, Tuple & value)
    {
        using elem_type = typename std::tuple_element<I, Tuple>::type;
        object_converter<elem_type>::convert(a[I], std::get<I>(value));
        tuple_element_converter<I + 1, N>::convert(a, value);
    }
};

template <std::size_t N>
struct tuple_element_converter<N, N>
{
    template <typename Tuple>
    static void convert (object::array_type const &, Tuple &)
    {}
};

template <typename ...Ts>
struct object_converter<std::tuple<Ts...>>
{
    static void convert (object const & obj, std::tuple<Ts...> & value)
    {
        auto const & a = obj.array();

        if (a.size() != sizeof...(Ts))
            obj.throw_invalid_type("tuple");

        tuple_element_converter<0, sizeof...(Ts)>::convert(a, value);
    }
};

} // namespace details

template <typename T>
inline void object::convert (T & value) const
{
    details::object_converter<T>::convert(*this, value);
}

template <typename T>
inline T object::as () const
{
    T result;
    convert(result);
    return result;
}

MPACK__NAMESPACE_END
