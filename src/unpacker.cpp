////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `mpack-lib`.
//
// Changelog:
//      2026.09.14 Initial version
////////////////////////////////////////////////////////////////////////////////
#include "pfs/mpack/unpacker.hpp"
#include "pfs/mpack/byte_order.hpp"
#include "pfs/mpack/format.hpp"
#include "pfs/mpack/trace.hpp"
#include <pfs/assert.hpp>
#include <pfs/i18n.hpp>
#include <algorithm>
#include <cstring>

MPACK__NAMESPACE_BEGIN

static constexpr char const * TAG = "mpack";

constexpr std::size_t unpacker::default_buffer_size;

unpacker::unpacker (std::size_t buffer_size)
    : _initial_size(buffer_size > 0 ? buffer_size : default_buffer_size)
    , _block(std::make_shared<block_type>(_initial_size))
{}

unpacker::unpacker (char const * data, std::size_t n, std::size_t buffer_size)
    : unpacker(std::max(buffer_size, n))
{
    feed(data, n);
}

void unpacker::feed (char const * data, std::size_t n)
{
    if (n == 0)
        return;

    auto p = reserve_buffer(n);
    std::memcpy(p, data, n);
    consume(n);
}

char * unpacker::reserve_buffer (std::size_t n)
{
    if (buffer_capacity() < n)
        expand_buffer(n);

    return buffer();
}

void unpacker::consume (std::size_t n)
{
    if (n > buffer_capacity()) {
        throw error {
              make_error_code(errc::length_error)
            , tr::f_("consumed more bytes than reserved: {}, buffer capacity: {}"
                , n, buffer_capacity())
        };
    }

    _used += n;
}

void unpacker::skip (std::size_t n)
{
    if (n > unparsed_size()) {
        throw error {
              make_error_code(errc::insufficient_data)
            , tr::f_("skipping more bytes than unparsed: {}, unparsed size: {}"
                , n, unparsed_size())
        };
    }

    _offset += n;
}

void unpacker::expand_buffer (std::size_t n)
{
    // Nothing to keep, rewind
    if (_used == _offset && !_has_raw) {
        _used = _offset = 0;

        if (buffer_capacity() >= n)
            return;
    }

    auto unparsed = _used - _offset;
    auto next_size = (std::max)(_initial_size, _block->size());

    while (next_size < n + unparsed)
        next_size *= 2;

    if (_has_raw) {
        // The current block is referenced by borrowed raw views, do not touch it
        auto block = std::make_shared<block_type>(next_size);

        if (unparsed > 0)
            std::memcpy(block->data(), _block->data() + _offset, unparsed);

        MPACK__TRACE(TAG, "new buffer block allocated: size={}, bytes moved={}"
            , next_size, unparsed);

        _block = std::move(block);
        _has_raw = false;
    } else {
        if (_offset > 0 && unparsed > 0)
            std::memmove(_block->data(), _block->data() + _offset, unparsed);

        if (_block->size() < n + unparsed) {
            MPACK__TRACE(TAG, "buffer grown: {} -> {}", _block->size(), next_size);
            _block->resize(next_size);
        }
    }

    _used = unparsed;
    _offset = 0;
}

void unpacker::commit (std::size_t pos) noexcept
{
    _parsed += pos - _offset;
    _offset = pos;
}

bool unpacker::start_container (container_type ct, std::size_t n, object & value)
{
    // Every element occupies one byte at least, so do not trust the length
    // field too much when reserving
    auto reserve_size = (std::min)(n, unparsed_size());

    if (ct == container_type::array_item) {
        object::array_type a;

        if (n > 0)
            a.reserve(reserve_size);

        value = object{std::move(a)};
    } else {
        object::map_type m;

        if (n > 0)
            m.reserve(reserve_size);

        value = object{std::move(m)};
    }

    if (n == 0)
        return true;

    _stack.push_back(frame{ct, std::move(value), object{}, n});
    return false;
}

bool unpacker::execute ()
{
    char const * data = _block->data();
    std::size_t p = _offset;
    std::size_t const end = _used;

    while (p < end) {
        object value;

        if (_state == state_enum::header) {
            auto b = static_cast<std::uint8_t>(data[p]);

            if (is_positive_fixnum(b)) {
                p++;
                value = object{static_cast<std::uint64_t>(b)};
            } else if (is_negative_fixnum(b)) {
                p++;
                value = object{static_cast<std::int64_t>(static_cast<std::int8_t>(b))};
            } else if (is_fixraw(b)) {
                p++;
                _trail = fix_length(b);

                if (_trail > 0) {
                    _state = state_enum::raw;
                    continue;
                }

                value = object{raw_data{}};
            } else if (is_fixarray(b)) {
                p++;

                if (!start_container(container_type::array_item, fix_length(b), value))
                    continue;
            } else if (is_fixmap(b)) {
                p++;

                if (!start_container(container_type::map_key, fix_length(b), value))
                    continue;
            } else {
                switch (static_cast<format>(b)) {
                    case format::nil:
                        p++;
                        break;
                    case format::false_:
                        p++;
                        value = object{false};
                        break;
                    case format::true_:
                        p++;
                        value = object{true};
                        break;

                    case format::float32: _state = state_enum::float32; break;
                    case format::float64: _state = state_enum::float64; break;
                    case format::uint8:   _state = state_enum::uint8;   break;
                    case format::uint16:  _state = state_enum::uint16;  break;
                    case format::uint32:  _state = state_enum::uint32;  break;
                    case format::uint64:  _state = state_enum::uint64;  break;
                    case format::int8:    _state = state_enum::int8;    break;
                    case format::int16:   _state = state_enum::int16;   break;
                    case format::int32:   _state = state_enum::int32;   break;
                    case format::int64:   _state = state_enum::int64;   break;
                    case format::raw16:   _state = state_enum::raw16;   break;
                    case format::raw32:   _state = state_enum::raw32;   break;
                    case format::array16: _state = state_enum::array16; break;
                    case format::array32: _state = state_enum::array32; break;
                    case format::map16:   _state = state_enum::map16;   break;
                    case format::map32:   _state = state_enum::map32;   break;

                    case format::real:
                        commit(p);
                        throw error {
                              make_error_code(errc::unknown_format)
                            , tr::f_("extended float (tag 0x{:02x}) is not supported after {} bytes of the current value"
                                , b, _parsed)
                        };

                    default:
                        commit(p);
                        throw error {
                              make_error_code(errc::unknown_format)
                            , tr::f_("unknown tag 0x{:02x} after {} bytes of the current value", b, _parsed)
                        };
                }

                if (_state != state_enum::header) {
                    p++;
                    _trail = _state >= state_enum::raw16
                        ? length_trail(b)
                        : scalar_trail(b);
                    continue;
                }
            }
        } else {
            if (end - p < _trail)
                break;

            char const * n = data + p;
            p += _trail;

            switch (_state) {
                case state_enum::float32:
                    value = object{load_float32(n)};
                    break;
                case state_enum::float64:
                    value = object{load_float64(n)};
                    break;
                case state_enum::uint8:
                    value = object{load_be<std::uint8_t>(n)};
                    break;
                case state_enum::uint16:
                    value = object{load_be<std::uint16_t>(n)};
                    break;
                case state_enum::uint32:
                    value = object{load_be<std::uint32_t>(n)};
                    break;
                case state_enum::uint64:
                    value = object{load_be<std::uint64_t>(n)};
                    break;
                case state_enum::int8:
                    value = object{load_be<std::int8_t>(n)};
                    break;
                case state_enum::int16:
                    value = object{load_be<std::int16_t>(n)};
                    break;
                case state_enum::int32:
                    value = object{load_be<std::int32_t>(n)};
                    break;
                case state_enum::int64:
                    value = object{load_be<std::int64_t>(n)};
                    break;

                case state_enum::raw16:
                case state_enum::raw32: {
                    _trail = _state == state_enum::raw16
                        ? static_cast<std::size_t>(load_be<std::uint16_t>(n))
                        : static_cast<std::size_t>(load_be<std::uint32_t>(n));

                    if (_trail > 0) {
                        _state = state_enum::raw;
                        continue;
                    }

                    value = object{raw_data{}};
                    break;
                }

                case state_enum::raw:
                    value = object{raw_data{_block, static_cast<std::size_t>(n - data), _trail}};
                    _has_raw = true;
                    break;

                case state_enum::array16:
                case state_enum::array32:
                case state_enum::map16:
                case state_enum::map32: {
                    bool is_array = _state == state_enum::array16 || _state == state_enum::array32;
                    bool is16 = _state == state_enum::array16 || _state == state_enum::map16;

                    std::size_t len = is16
                        ? static_cast<std::size_t>(load_be<std::uint16_t>(n))
                        : static_cast<std::size_t>(load_be<std::uint32_t>(n));

                    _state = state_enum::header;
                    _trail = 0;

                    if (!start_container(is_array ? container_type::array_item
                            : container_type::map_key, len, value)) {
                        continue;
                    }

                    break;
                }

                default:
                    PFS__TERMINATE(false, "unexpected unpacker state");
                    break;
            }
        }

        _state = state_enum::header;
        _trail = 0;

        // Push the complete value up to the enclosing containers
        for (;;) {
            if (_stack.empty()) {
                _result = std::move(value);
                commit(p);
                return true;
            }

            auto & top = _stack.back();

            if (top.ct == container_type::map_key) {
                top.key = std::move(value);
                top.ct = container_type::map_value;
                break;
            }

            if (top.ct == container_type::array_item) {
                top.obj.array().push_back(std::move(value));
            } else {
                top.obj.map().push_back(key_value{std::move(top.key), std::move(value)});
                top.key = object{};
                top.ct = container_type::map_key;
            }

            if (--top.count > 0)
                break;

            value = std::move(top.obj);
            _stack.pop_back();
        }
    }

    commit(p);

    MPACK__TRACE(TAG, "unpacker suspended: parsed={}, depth={}, trail={}"
        , _parsed, _stack.size(), _trail);

    return false;
}

object unpacker::purge ()
{
    object result = std::move(_result);
    clear();
    return result;
}

void unpacker::clear ()
{
    _result = object{};
    _parsed = 0;
    _state = state_enum::header;
    _trail = 0;
    _stack.clear();
}

object unpack (char const * data, std::size_t n)
{
    unpacker u {data, n};

    if (!u.execute()) {
        throw error {
              make_error_code(errc::insufficient_data)
            , tr::f_("incomplete value: {} bytes consumed, more expected", n)
        };
    }

    return u.purge();
}

MPACK__NAMESPACE_END
