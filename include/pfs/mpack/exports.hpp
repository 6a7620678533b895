////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `mpack-lib`.
//
// Changelog:
//      2026.09.14 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#ifndef MPACK__STATIC
#   ifndef MPACK__EXPORT
#       if _MSC_VER
#           if defined(MPACK__EXPORTS)
#               define MPACK__EXPORT __declspec(dllexport)
#           else
#               define MPACK__EXPORT __declspec(dllimport)
#           endif
#       else
#           define MPACK__EXPORT
#       endif
#   endif
#else
#   define MPACK__EXPORT
#endif // !MPACK__STATIC
