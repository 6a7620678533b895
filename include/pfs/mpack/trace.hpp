////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `mpack-lib`.
//
// Changelog:
//      2026.09.14 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once

#if MPACK__TRACE_ENABLED
#   include <pfs/log.hpp>
#   define MPACK__TRACE(t, f, ...) LOGD(t, f , ##__VA_ARGS__)
#else // MPACK__TRACE_ENABLED
#   define MPACK__TRACE(t, f, ...)
#endif // !MPACK__TRACE_ENABLED
