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

MPACK__NAMESPACE_BEGIN

/**
 * Customization point for user defined types.
 *
 * @details Specialize this template for a type to make it packable and unpackable.
 * Only the members actually used need to be defined:
 *
 * @code
 * template <>
 * struct mpack::type_adaptor<point>
 * {
 *     // Used by packer::pack()
 *     template <typename Packer>
 *     static void pack (Packer & p, point const & v)
 *     {
 *         p.pack_array(2).pack(v.x).pack(v.y);
 *     }
 *
 *     // Used by object::as<point>()
 *     static void unpack (mpack::object const & obj, point & v)
 *     {
 *         auto const & a = obj.array();
 *         ...
 *     }
 *
 *     // Used by direct_unpacker::unpack()
 *     static void unpack (mpack::direct_unpacker & u, point & v)
 *     {
 *         ...
 *     }
 * };
 * @endcode
 */
template <typename T, typename Enable = void>
struct type_adaptor;

MPACK__NAMESPACE_END
