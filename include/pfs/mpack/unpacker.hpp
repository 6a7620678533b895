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
#include "object.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

MPACK__NAMESPACE_BEGIN

/**
 * Streaming (resumable) MessagePack unpacker.
 *
 * @details Bytes are fed in arbitrary portions (e.g. as they arrive from a socket).
 * Each call to execute() continues decoding from the point the previous call
 * stopped at, so a value may be split between portions at any byte boundary.
 *
 * @code
 * mpack::unpacker u;
 *
 * while (auto n = read_some(sock, buf, sizeof(buf))) {
 *     u.feed(buf, n);
 *
 *     while (u.execute()) {
 *         auto obj = u.purge();
 *         process(obj);
 *     }
 * }
 * @endcode
 *
 * Raw payloads are not copied: decoded objects hold borrowed views into the internal
 * buffer (see raw_data). The unpacker never overwrites the memory a borrowed view
 * refers to, a new buffer block is allocated instead.
 *
 * On unknown tag execute() throws mpack::error (errc::unknown_format). The stream is
 * desynchronized since then and the unpacker should be discarded (or reset with
 * remove() and clear()).
 */
class unpacker
{
public:
    using block_type = raw_data::block_type;

    static constexpr std::size_t default_buffer_size = 8192;

private:
    enum class state_enum
    {
          header
        , float32
        , float64
        , uint8
        , uint16
        , uint32
        , uint64
        , int8
        , int16
        , int32
        , int64
        , raw16
        , raw32
        , array16
        , array32
        , map16
        , map32
        , raw
    };

    enum class container_type
    {
          array_item
        , map_key
        , map_value
    };

    struct frame
    {
        container_type ct;
        object obj;
        object key;
        std::size_t count;
    };

private:
    std::size_t _initial_size;
    std::shared_ptr<block_type> _block;

    // Number of bytes written into the block
    std::size_t _used {0};

    // Position of the first unparsed byte in the block
    std::size_t _offset {0};

    // Number of bytes consumed by the current value (including previous blocks)
    std::size_t _parsed {0};

    // Borrowed raw view into the current block was produced
    bool _has_raw {false};

    state_enum _state {state_enum::header};
    std::size_t _trail {0};
    std::vector<frame> _stack;
    object _result;

public:
    MPACK__EXPORT explicit unpacker (std::size_t buffer_size = default_buffer_size);

    /**
     * Constructs unpacker and feeds @a n bytes from @a data.
     */
    MPACK__EXPORT unpacker (char const * data, std::size_t n
        , std::size_t buffer_size = default_buffer_size);

    unpacker (unpacker const &) = delete;
    unpacker & operator = (unpacker const &) = delete;
    unpacker (unpacker &&) = default;
    unpacker & operator = (unpacker &&) = default;

    ~unpacker () = default;

public:
    /**
     * Copies @a n bytes from @a data to the end of the internal buffer.
     */
    MPACK__EXPORT void feed (char const * data, std::size_t n);

    void append (char const * data, std::size_t n)
    {
        feed(data, n);
    }

    /**
     * Continues decoding.
     *
     * @return @c true if a complete top-level value is available (see unpacked(),
     *         purge()), @c false if more bytes are needed.
     *
     * @throw mpack::error with errc::unknown_format on unknown tag.
     */
    MPACK__EXPORT bool execute ();

    /**
     * Returns the value decoded by the last successful execute().
     */
    object const & unpacked () const noexcept
    {
        return _result;
    }

    /**
     * Moves out the value decoded by the last successful execute() and prepares
     * the unpacker for the next value (see clear()).
     */
    MPACK__EXPORT object purge ();

    /**
     * Resets decoding context and drops the decoded value. Unparsed bytes are kept.
     */
    MPACK__EXPORT void clear ();

    /**
     * Number of bytes consumed by the current value plus number of unparsed bytes.
     */
    std::size_t size () const noexcept
    {
        return _parsed - _offset + _used;
    }

    /**
     * Number of bytes consumed by the current value.
     */
    std::size_t parsed_size () const noexcept
    {
        return _parsed;
    }

    /**
     * Number of bytes fed but not parsed yet.
     */
    std::size_t unparsed_size () const noexcept
    {
        return _used - _offset;
    }

    /**
     * Ensures that at least @a n bytes can be written to the buffer without
     * reallocation.
     *
     * @return Pointer to the free space of the buffer (see consume()).
     */
    MPACK__EXPORT char * reserve_buffer (std::size_t n);

    /**
     * Pointer to the free space of the buffer.
     */
    char * buffer () noexcept
    {
        return _block->data() + _used;
    }

    /**
     * Size of the free space of the buffer.
     */
    std::size_t buffer_capacity () const noexcept
    {
        return _block->size() - _used;
    }

    /**
     * Notifies that @a n bytes are written directly to the buffer().
     */
    MPACK__EXPORT void consume (std::size_t n);

    /**
     * Drops @a n unparsed bytes.
     */
    MPACK__EXPORT void skip (std::size_t n);

    /**
     * Drops all unparsed bytes.
     */
    void remove () noexcept
    {
        _offset = _used;
    }

    /**
     * Decodes all complete values and passes each to @a f as `object &&`.
     *
     * @return Number of decoded values.
     */
    template <typename F>
    std::size_t for_each (F && f)
    {
        std::size_t count = 0;

        while (execute()) {
            f(purge());
            count++;
        }

        return count;
    }

private:
    void expand_buffer (std::size_t n);
    bool start_container (container_type ct, std::size_t n, object & value);
    void commit (std::size_t pos) noexcept;
};

/**
 * Unpacks single value from @a n bytes at @a data with the streaming unpacker.
 *
 * @throw mpack::error with errc::insufficient_data if the bytes end in the middle
 *        of the value.
 * @throw mpack::error with errc::unknown_format on unknown tag.
 */
MPACK__EXPORT object unpack (char const * data, std::size_t n);

MPACK__NAMESPACE_END
