////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `mpack-lib`.
//
// Changelog:
//      2026.09.14 Initial version
////////////////////////////////////////////////////////////////////////////////
#include "pfs/mpack/direct_unpacker.hpp"
#include "pfs/mpack/byte_order.hpp"
#include "pfs/mpack/format.hpp"
#include <pfs/i18n.hpp>
#include <vector>

MPACK__NAMESPACE_BEGIN

void direct_unpacker::throw_invalid_type (char const * expected)
{
    throw error {
          make_error_code(errc::invalid_type)
        , tr::f_("{} expected at offset {}", expected, _offset)
    };
}

void direct_unpacker::throw_out_of_range ()
{
    throw error {
          make_error_code(errc::invalid_type)
        , tr::f_("integer value at offset {} is out of range of the target type", _offset)
    };
}

std::uint8_t direct_unpacker::read_header ()
{
    if (_offset >= _size) {
        throw error {
              make_error_code(errc::insufficient_data)
            , tr::f_("no data to read at offset {}", _offset)
        };
    }

    return static_cast<std::uint8_t>(_data[_offset++]);
}

char const * direct_unpacker::read (std::size_t n)
{
    if (available() < n) {
        throw error {
              make_error_code(errc::insufficient_data)
            , tr::f_("insufficient data at offset {}: {} bytes expected, {} available"
                , _offset, n, available())
        };
    }

    auto p = _data + _offset;
    _offset += n;
    return p;
}

std::size_t direct_unpacker::read_array_header ()
{
    auto b = read_header();

    if (is_fixarray(b))
        return fix_length(b);

    switch (static_cast<format>(b)) {
        case format::array16: return load_be<std::uint16_t>(read(2));
        case format::array32: return load_be<std::uint32_t>(read(4));
        case format::nil: return 0;
        default: break;
    }

    throw_invalid_type("array");
}

std::size_t direct_unpacker::read_map_header ()
{
    auto b = read_header();

    if (is_fixmap(b))
        return fix_length(b);

    switch (static_cast<format>(b)) {
        case format::map16: return load_be<std::uint16_t>(read(2));
        case format::map32: return load_be<std::uint32_t>(read(4));
        case format::nil: return 0;
        default: break;
    }

    throw_invalid_type("map");
}

std::size_t direct_unpacker::read_raw_header ()
{
    auto b = read_header();

    if (is_fixraw(b))
        return fix_length(b);

    switch (static_cast<format>(b)) {
        case format::raw16: return load_be<std::uint16_t>(read(2));
        case format::raw32: return load_be<std::uint32_t>(read(4));
        case format::nil: return 0;
        default: break;
    }

    throw_invalid_type("raw");
}

raw_data direct_unpacker::read_raw ()
{
    auto n = read_raw_header();
    return raw_data{read(n), n};
}

bool direct_unpacker::read_boolean ()
{
    auto b = read_header();

    switch (static_cast<format>(b)) {
        case format::true_: return true;
        case format::false_: return false;
        default: break;
    }

    throw_invalid_type("boolean");
}

double direct_unpacker::read_floating (bool & is_float64)
{
    auto b = read_header();

    switch (static_cast<format>(b)) {
        case format::float32:
            is_float64 = false;
            return load_float32(read(4));
        case format::float64:
            is_float64 = true;
            return load_float64(read(8));
        default:
            break;
    }

    throw_invalid_type("floating");
}

void direct_unpacker::read_integer (std::uint64_t & u, std::int64_t & i, bool & negative)
{
    auto b = read_header();

    if (is_positive_fixnum(b)) {
        u = b;
        negative = false;
        return;
    }

    if (is_negative_fixnum(b)) {
        i = static_cast<std::int8_t>(b);
        negative = true;
        return;
    }

    switch (static_cast<format>(b)) {
        case format::uint8:  u = load_be<std::uint8_t>(read(1)); break;
        case format::uint16: u = load_be<std::uint16_t>(read(2)); break;
        case format::uint32: u = load_be<std::uint32_t>(read(4)); break;
        case format::uint64: u = load_be<std::uint64_t>(read(8)); break;
        case format::int8:   i = load_be<std::int8_t>(read(1)); break;
        case format::int16:  i = load_be<std::int16_t>(read(2)); break;
        case format::int32:  i = load_be<std::int32_t>(read(4)); break;
        case format::int64:  i = load_be<std::int64_t>(read(8)); break;
        default:
            throw_invalid_type("integer");
    }

    if (b >= to_byte(format::int8)) {
        // Signed tags may carry non-negative values
        negative = i < 0;

        if (!negative)
            u = static_cast<std::uint64_t>(i);
    } else {
        negative = false;
    }
}

object direct_unpacker::read_object ()
{
    struct frame
    {
        object obj;
        object key;
        std::size_t count;
        bool is_array;
        bool has_key;
    };

    // Nesting is tracked explicitly, the depth of the input is not limited
    // by the call stack
    std::vector<frame> stack;

    for (;;) {
        object value;
        auto b = read_header();
        bool is_container = false;
        bool is_array = true;
        std::size_t n = 0;

        if (is_positive_fixnum(b)) {
            value = object{static_cast<std::uint64_t>(b)};
        } else if (is_negative_fixnum(b)) {
            value = object{static_cast<std::int64_t>(static_cast<std::int8_t>(b))};
        } else if (is_fixraw(b)) {
            n = fix_length(b);
            value = object{raw_data{read(n), n}};
        } else if (is_fixarray(b)) {
            n = fix_length(b);
            is_container = true;
        } else if (is_fixmap(b)) {
            n = fix_length(b);
            is_container = true;
            is_array = false;
        } else {
            switch (static_cast<format>(b)) {
                case format::nil:     break;
                case format::false_:  value = object{false}; break;
                case format::true_:   value = object{true}; break;
                case format::float32: value = object{load_float32(read(4))}; break;
                case format::float64: value = object{load_float64(read(8))}; break;
                case format::uint8:   value = object{load_be<std::uint8_t>(read(1))}; break;
                case format::uint16:  value = object{load_be<std::uint16_t>(read(2))}; break;
                case format::uint32:  value = object{load_be<std::uint32_t>(read(4))}; break;
                case format::uint64:  value = object{load_be<std::uint64_t>(read(8))}; break;
                case format::int8:    value = object{load_be<std::int8_t>(read(1))}; break;
                case format::int16:   value = object{load_be<std::int16_t>(read(2))}; break;
                case format::int32:   value = object{load_be<std::int32_t>(read(4))}; break;
                case format::int64:   value = object{load_be<std::int64_t>(read(8))}; break;

                case format::raw16:
                    n = load_be<std::uint16_t>(read(2));
                    value = object{raw_data{read(n), n}};
                    break;
                case format::raw32:
                    n = load_be<std::uint32_t>(read(4));
                    value = object{raw_data{read(n), n}};
                    break;

                case format::array16:
                    n = load_be<std::uint16_t>(read(2));
                    is_container = true;
                    break;
                case format::array32:
                    n = load_be<std::uint32_t>(read(4));
                    is_container = true;
                    break;
                case format::map16:
                    n = load_be<std::uint16_t>(read(2));
                    is_container = true;
                    is_array = false;
                    break;
                case format::map32:
                    n = load_be<std::uint32_t>(read(4));
                    is_container = true;
                    is_array = false;
                    break;

                default:
                    throw error {
                          make_error_code(errc::unknown_format)
                        , tr::f_("unknown tag 0x{:02x} at offset {}", b, _offset - 1)
                    };
            }
        }

        if (is_container) {
            // Every element occupies one byte at least
            auto reserve_size = (std::min)(n, available());

            if (is_array) {
                object::array_type a;
                a.reserve(reserve_size);
                value = object{std::move(a)};
            } else {
                object::map_type m;
                m.reserve(reserve_size);
                value = object{std::move(m)};
            }

            if (n > 0) {
                stack.push_back(frame{std::move(value), object{}, n, is_array, false});
                continue;
            }
        }

        // Push the complete value up to the enclosing containers
        for (;;) {
            if (stack.empty())
                return value;

            auto & top = stack.back();

            if (top.is_array) {
                top.obj.array().push_back(std::move(value));
            } else if (!top.has_key) {
                top.key = std::move(value);
                top.has_key = true;
                break;
            } else {
                top.obj.map().push_back(key_value{std::move(top.key), std::move(value)});
                top.key = object{};
                top.has_key = false;
            }

            if (--top.count > 0)
                break;

            value = std::move(top.obj);
            stack.pop_back();
        }
    }
}

std::size_t direct_unpacker::unpack_array ()
{
    transaction tx {*this};
    auto n = read_array_header();
    tx.commit();
    return n;
}

std::size_t direct_unpacker::unpack_map ()
{
    transaction tx {*this};
    auto n = read_map_header();
    tx.commit();
    return n;
}

std::size_t direct_unpacker::unpack_raw ()
{
    transaction tx {*this};
    auto n = read_raw_header();
    tx.commit();
    return n;
}

bool direct_unpacker::check_nil ()
{
    if (_offset >= _size) {
        throw error {
              make_error_code(errc::insufficient_data)
            , tr::f_("no data to read at offset {}", _offset)
        };
    }

    return static_cast<std::uint8_t>(_data[_offset]) == to_byte(format::nil);
}

MPACK__NAMESPACE_END
