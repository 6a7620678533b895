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
#include <cstring>
#include <memory>
#include <string>
#include <vector>

MPACK__NAMESPACE_BEGIN

/**
 * Byte-string payload of the MessagePack Raw type.
 *
 * @details A raw_data is a view of one of three kinds:
 *      - borrowed: points into a buffer block of the streaming unpacker (zero-copy).
 *        The view shares ownership of that block, so the bytes stay valid even after
 *        the unpacker has moved on to another block. The unpacker never overwrites
 *        bytes of a block a borrowed view was produced from (see unpacker::feed()).
 *      - owned: points into a private copy of the bytes (see copy() and detach()).
 *      - external: points into memory owned by the caller (produced by the
 *        direct_unpacker and by the (data, n) constructor). The caller is responsible
 *        for keeping that memory alive while the view (or any object holding it)
 *        is in use. Call detach() to get an independent copy.
 *
 * Copying a raw_data copies the view, not the bytes.
 */
class raw_data
{
public:
    using block_type = std::vector<char>;
    using const_iterator = char const *;

private:
    std::shared_ptr<block_type const> _block;
    char const * _data {nullptr};
    std::size_t _size {0};
    bool _borrowed {false};

public:
    raw_data () = default;

    /**
     * Constructs external view.
     */
    raw_data (char const * data, std::size_t n) noexcept
        : _data(n > 0 ? data : nullptr)
        , _size(n)
    {}

    /**
     * Constructs borrowed view of @a n bytes starting at @a offset of the @a block.
     */
    raw_data (std::shared_ptr<block_type const> block, std::size_t offset, std::size_t n) noexcept
        : _block(std::move(block))
        , _data(n > 0 ? _block->data() + offset : nullptr)
        , _size(n)
        , _borrowed(true)
    {}

public:
    /**
     * Makes owned copy of @a n bytes starting at @a data.
     */
    static raw_data copy (char const * data, std::size_t n)
    {
        raw_data result;

        if (n > 0) {
            auto block = std::make_shared<block_type>(data, data + n);
            result._data = block->data();
            result._size = n;
            result._block = std::move(block);
        }

        return result;
    }

    static raw_data copy (std::string const & s)
    {
        return copy(s.data(), s.size());
    }

public:
    char const * data () const noexcept
    {
        return _data;
    }

    std::size_t size () const noexcept
    {
        return _size;
    }

    bool empty () const noexcept
    {
        return _size == 0;
    }

    const_iterator begin () const noexcept
    {
        return _data;
    }

    const_iterator end () const noexcept
    {
        return _data + _size;
    }

    /**
     * Checks whether this view aliases the streaming unpacker buffer.
     */
    bool borrowed () const noexcept
    {
        return _borrowed;
    }

    /**
     * Checks whether this view is an independent copy.
     */
    bool owned () const noexcept
    {
        return _block != nullptr && !_borrowed;
    }

    /**
     * Returns owned copy of the bytes.
     */
    raw_data detach () const
    {
        return copy(_data, _size);
    }

    std::string str () const
    {
        return _size == 0 ? std::string{} : std::string(_data, _size);
    }

    friend bool operator == (raw_data const & a, raw_data const & b) noexcept
    {
        return a._size == b._size
            && (a._size == 0 || std::memcmp(a._data, b._data, a._size) == 0);
    }

    friend bool operator != (raw_data const & a, raw_data const & b) noexcept
    {
        return !(a == b);
    }
};

MPACK__NAMESPACE_END
