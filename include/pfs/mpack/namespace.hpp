////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `mpack-lib`.
//
// Changelog:
//      2026.09.14 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once

#ifndef MPACK__NAMESPACE_NAME
#   define MPACK__NAMESPACE_NAME mpack
#   define MPACK__NAMESPACE_BEGIN namespace MPACK__NAMESPACE_NAME {
#   define MPACK__NAMESPACE_END }
#endif
