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
#include "exports.hpp"
#include <pfs/error.hpp>
#include <string>
#include <system_error>

MPACK__NAMESPACE_BEGIN

using error_code = std::error_code;

enum class errc
{
      success = 0
    , unknown_format    // Unrecognized tag byte, the stream is desynchronized
    , invalid_type      // Serialized type does not match the requested one (or does not fit into it)
    , insufficient_data // Complete buffer expected but it ends in the middle of a value
    , length_error      // Container or raw length does not fit into 32 bits
};

class error_category : public std::error_category
{
public:
    MPACK__EXPORT virtual char const * name () const noexcept override;
    MPACK__EXPORT virtual std::string message (int ev) const override;
};

MPACK__EXPORT std::error_category const & get_error_category ();

inline std::error_code make_error_code (errc e)
{
    return std::error_code(static_cast<int>(e), get_error_category());
}

class error: public pfs::error
{
public:
    using pfs::error::error;
};

MPACK__NAMESPACE_END
