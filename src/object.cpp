////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `mpack-lib`.
//
// Changelog:
//      2026.09.14 Initial version
////////////////////////////////////////////////////////////////////////////////
#include "pfs/mpack/object.hpp"
#include <pfs/i18n.hpp>
#include <fmt/format.h>
#include <iterator>
#include <new>
#include <utility>
#include <vector>

MPACK__NAMESPACE_BEGIN

char const * to_string (type_enum t) noexcept
{
    switch (t) {
        case type_enum::nil: return "nil";
        case type_enum::boolean: return "boolean";
        case type_enum::positive_integer: return "positive integer";
        case type_enum::negative_integer: return "negative integer";
        case type_enum::floating: return "floating";
        case type_enum::raw: return "raw";
        case type_enum::array: return "array";
        case type_enum::map: return "map";
    }

    return "<unknown>";
}

namespace {

inline bool is_container (object const & obj) noexcept
{
    return obj.type() == type_enum::array || obj.type() == type_enum::map;
}

// Moves non-empty nested containers of the @a obj to the @a pending
void move_nested (object & obj, std::vector<object> & pending)
{
    if (obj.type() == type_enum::array) {
        for (auto & elem: obj.array()) {
            if (is_container(elem) && elem.size() > 0)
                pending.push_back(std::move(elem));
        }
    } else {
        for (auto & kv: obj.map()) {
            if (is_container(kv.key) && kv.key.size() > 0)
                pending.push_back(std::move(kv.key));

            if (is_container(kv.value) && kv.value.size() > 0)
                pending.push_back(std::move(kv.value));
        }
    }
}

} // namespace

object::object (object const & other)
    : _type(other._type)
{
    switch (_type) {
        case type_enum::nil:
            break;
        case type_enum::boolean:
            _via.boolean = other._via.boolean;
            break;
        case type_enum::positive_integer:
            _via.uinteger = other._via.uinteger;
            break;
        case type_enum::negative_integer:
            _via.integer = other._via.integer;
            break;
        case type_enum::floating:
            _via.floating = other._via.floating;
            break;
        case type_enum::raw:
            new (& _via.raw) raw_data(other._via.raw);
            break;
        case type_enum::array:
            new (& _via.array) array_type(other._via.array);
            break;
        case type_enum::map:
            new (& _via.map) map_type(other._via.map);
            break;
    }
}

object::object (object && other) noexcept
{
    take(std::move(other));
}

object::~object ()
{
    if (is_container(*this) && size() > 0) {
        std::vector<object> pending;
        move_nested(*this, pending);

        while (!pending.empty()) {
            object obj {std::move(pending.back())};
            pending.pop_back();

            move_nested(obj, pending);

            // obj holds no nested containers here and is destroyed without recursion
        }
    }

    destroy();
}

object & object::operator = (object const & other)
{
    if (this != & other) {
        object tmp {other};
        *this = std::move(tmp);
    }

    return *this;
}

object & object::operator = (object && other) noexcept
{
    if (this != & other) {
        // other may be a part of this tree, release the old value after taking
        object old {std::move(*this)};
        take(std::move(other));
    }

    return *this;
}

void object::destroy () noexcept
{
    switch (_type) {
        case type_enum::raw:
            _via.raw.~raw_data();
            break;
        case type_enum::array:
            _via.array.~array_type();
            break;
        case type_enum::map:
            _via.map.~map_type();
            break;
        default:
            break;
    }

    _type = type_enum::nil;
    _via.uinteger = 0;
}

// Expects this object is nil, leaves other nil
void object::take (object && other) noexcept
{
    switch (other._type) {
        case type_enum::nil:
            break;
        case type_enum::boolean:
            _via.boolean = other._via.boolean;
            break;
        case type_enum::positive_integer:
            _via.uinteger = other._via.uinteger;
            break;
        case type_enum::negative_integer:
            _via.integer = other._via.integer;
            break;
        case type_enum::floating:
            _via.floating = other._via.floating;
            break;
        case type_enum::raw:
            new (& _via.raw) raw_data(std::move(other._via.raw));
            break;
        case type_enum::array:
            new (& _via.array) array_type(std::move(other._via.array));
            break;
        case type_enum::map:
            new (& _via.map) map_type(std::move(other._via.map));
            break;
    }

    _type = other._type;
    other.destroy();
}

std::size_t object::size () const noexcept
{
    switch (_type) {
        case type_enum::raw: return _via.raw.size();
        case type_enum::array: return _via.array.size();
        case type_enum::map: return _via.map.size();
        default: break;
    }

    return 0;
}

void object::throw_invalid_type (char const * target) const
{
    throw error {
          make_error_code(errc::invalid_type)
        , tr::f_("{} expected, but object type is {}", target, to_string(_type))
    };
}

bool operator == (object const & a, object const & b)
{
    std::vector<std::pair<object const *, object const *>> pending;
    pending.emplace_back(& a, & b);

    while (!pending.empty()) {
        auto x = pending.back().first;
        auto y = pending.back().second;
        pending.pop_back();

        if (x->_type != y->_type)
            return false;

        switch (x->_type) {
            case type_enum::nil:
                break;
            case type_enum::boolean:
                if (x->_via.boolean != y->_via.boolean)
                    return false;
                break;
            case type_enum::positive_integer:
                if (x->_via.uinteger != y->_via.uinteger)
                    return false;
                break;
            case type_enum::negative_integer:
                if (x->_via.integer != y->_via.integer)
                    return false;
                break;
            case type_enum::floating:
                if (x->_via.floating != y->_via.floating)
                    return false;
                break;
            case type_enum::raw:
                if (x->_via.raw != y->_via.raw)
                    return false;
                break;

            case type_enum::array: {
                auto const & xa = x->_via.array;
                auto const & ya = y->_via.array;

                if (xa.size() != ya.size())
                    return false;

                for (std::size_t i = 0; i < xa.size(); i++)
                    pending.emplace_back(& xa[i], & ya[i]);

                break;
            }

            case type_enum::map: {
                auto const & xm = x->_via.map;
                auto const & ym = y->_via.map;

                if (xm.size() != ym.size())
                    return false;

                for (std::size_t i = 0; i < xm.size(); i++) {
                    pending.emplace_back(& xm[i].key, & ym[i].key);
                    pending.emplace_back(& xm[i].value, & ym[i].value);
                }

                break;
            }
        }
    }

    return true;
}

namespace {

using output_iterator = std::back_insert_iterator<std::string>;

void print_raw (output_iterator out, raw_data const & raw)
{
    *out++ = '"';

    for (char ch: raw) {
        auto uch = static_cast<unsigned char>(ch);

        switch (ch) {
            case '"':  fmt::format_to(out, "\\\""); break;
            case '\\': fmt::format_to(out, "\\\\"); break;
            case '\n': fmt::format_to(out, "\\n"); break;
            case '\r': fmt::format_to(out, "\\r"); break;
            case '\t': fmt::format_to(out, "\\t"); break;
            default:
                if (uch < 0x20 || uch >= 0x7f)
                    fmt::format_to(out, "\\x{:02x}", uch);
                else
                    *out++ = ch;
                break;
        }
    }

    *out++ = '"';
}

void print (output_iterator out, object const & obj)
{
    switch (obj.type()) {
        case type_enum::nil:
            fmt::format_to(out, "nil");
            break;
        case type_enum::boolean:
            fmt::format_to(out, "{}", obj.boolean());
            break;
        case type_enum::positive_integer:
            fmt::format_to(out, "{}", obj.uinteger());
            break;
        case type_enum::negative_integer:
            fmt::format_to(out, "{}", obj.integer());
            break;
        case type_enum::floating:
            fmt::format_to(out, "{}", obj.floating());
            break;
        case type_enum::raw:
            print_raw(out, obj.raw());
            break;

        case type_enum::array: {
            bool first = true;
            *out++ = '[';

            for (auto const & elem: obj.array()) {
                if (!first)
                    fmt::format_to(out, ", ");

                print(out, elem);
                first = false;
            }

            *out++ = ']';
            break;
        }

        case type_enum::map: {
            bool first = true;
            *out++ = '{';

            for (auto const & kv: obj.map()) {
                if (!first)
                    fmt::format_to(out, ", ");

                print(out, kv.key);
                fmt::format_to(out, ": ");
                print(out, kv.value);
                first = false;
            }

            *out++ = '}';
            break;
        }
    }
}

} // namespace

std::string to_string (object const & obj)
{
    std::string result;
    print(std::back_inserter(result), obj);
    return result;
}

MPACK__NAMESPACE_END
