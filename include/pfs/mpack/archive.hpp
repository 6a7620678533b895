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
#include <pfs/i18n.hpp>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

MPACK__NAMESPACE_BEGIN

/**
 * @details
 * Default byte sink for the packer. Any type providing
 * `void append (char const * data, std::size_t n)` can be used instead.
 *
 * Container requirements:
 *      - must satisfy the requirements of ContiguousContainer
 *      - default constructable
 *      - move constructable
 *
 * Consumed bytes can be dropped from the front cheaply with erase_front(),
 * which is convenient when the archive content is sent in portions.
 */
template <typename Container = std::vector<char>>
class archive
{
public:
    using container_type = Container;

private:
    container_type _c;
    std::size_t _offset {0};

public:
    archive () = default;

    archive (char const * data, std::size_t n)
    {
        reserve(n);
        append(data, n);
    }

    archive (container_type && c) noexcept
        : _c(std::move(c))
    {}

    archive (archive && other) noexcept
        : _c(std::move(other._c))
        , _offset(other._offset)
    {
        other._offset = 0;
    }

    archive & operator = (archive && other) noexcept
    {
        if (this != & other) {
            _c = std::move(other._c);
            _offset = other._offset;
            other._offset = 0;
        }

        return *this;
    }

    archive (archive const & other)
        : archive(other.data(), other.size())
    {}

    archive & operator = (archive const &) = delete;

public:
    /**
     * @return @c nullptr on empty.
     */
    char const * data () const noexcept
    {
        return size() == 0 ? nullptr : data(_c) + _offset;
    }

    bool empty () const noexcept
    {
        return size() == 0;
    }

    std::size_t size () const noexcept
    {
        return size(_c) - _offset;
    }

    void reserve (std::size_t n)
    {
        reserve(_c, _offset + n);
    }

    void append (char const * data, std::size_t n)
    {
        if (n > 0)
            append(_c, data, n);
    }

    void append (char ch)
    {
        append(_c, & ch, 1);
    }

    void append (std::string const & s)
    {
        append(s.data(), s.size());
    }

    void clear ()
    {
        clear(_c);
        _offset = 0;
    }

    void erase_front (std::size_t n)
    {
        if (n == 0)
            return;

        if (n > size()) {
            throw std::range_error {
                tr::f_("range to erase from front is out of bounds: "
                    "number of elements to erase: {}, archive size: {}", n, size())
            };
        }

        _offset += n;

        if (size() == 0)
            clear();
    }

    /**
     * Moves out the archive content (bytes already erased from the front are dropped).
     */
    container_type take ()
    {
        if (_offset > 0)
            erase(_c, 0, _offset);

        _offset = 0;
        return std::move(_c);
    }

    std::string str () const
    {
        return empty() ? std::string{} : std::string(data(), size());
    }

private:
    static char const * data (container_type const & c);
    static std::size_t size (container_type const & c);
    static void reserve (container_type & c, std::size_t n);
    static void append (container_type & c, char const * data, std::size_t n);
    static void clear (container_type & c);
    static void erase (container_type & c, std::size_t pos, std::size_t n);
};

template <>
inline char const * archive<std::vector<char>>::data (container_type const & c)
{
    return c.data();
}

template <>
inline std::size_t archive<std::vector<char>>::size (container_type const & c)
{
    return c.size();
}

template <>
inline void archive<std::vector<char>>::reserve (container_type & c, std::size_t n)
{
    c.reserve(n);
}

template <>
inline void archive<std::vector<char>>::append (container_type & c, char const * data, std::size_t n)
{
    c.insert(c.end(), data, data + n);
}

template <>
inline void archive<std::vector<char>>::clear (container_type & c)
{
    c.clear();
}

template <>
inline void archive<std::vector<char>>::erase (container_type & c, std::size_t pos, std::size_t n)
{
    c.erase(c.begin() + pos, c.begin() + pos + n);
}

MPACK__NAMESPACE_END
