////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `mpack-lib`.
//
// Changelog:
//      2026.09.14 Initial version
////////////////////////////////////////////////////////////////////////////////
#include "pfs/mpack/error.hpp"
#include "pfs/i18n.hpp"

MPACK__NAMESPACE_BEGIN

char const * error_category::name () const noexcept
{
    return "mpack::category";
}

std::string error_category::message (int ev) const
{
    switch (static_cast<errc>(ev)) {
        case errc::success:
            return tr::_("no error");
        case errc::unknown_format:
            return tr::_("unknown format");
        case errc::invalid_type:
            return tr::_("invalid type");
        case errc::insufficient_data:
            return tr::_("insufficient data");
        case errc::length_error:
            return tr::_("length error");

        default: return tr::_("unknown mpack error");
    }
}

std::error_category const & get_error_category ()
{
    static error_category instance;
    return instance;
}

MPACK__NAMESPACE_END
