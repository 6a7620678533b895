////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `mpack-lib`.
//
// Changelog:
//      2026.09.14 Initial version.
////////////////////////////////////////////////////////////////////////////////
#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"
#include "pfs/mpack/byte_order.hpp"
#include <cstdint>
#include <limits>

TEST_CASE("load big-endian") {
    char const data[] = {'\x01', '\x02', '\x03', '\x04', '\x05', '\x06', '\x07', '\x08'};

    CHECK_EQ(mpack::load_be<std::uint8_t>(data), 0x01);
    CHECK_EQ(mpack::load_be<std::uint16_t>(data), 0x0102);
    CHECK_EQ(mpack::load_be<std::uint32_t>(data), 0x01020304);
    CHECK_EQ(mpack::load_be<std::uint64_t>(data), 0x0102030405060708ULL);

    char const neg[] = {'\xff', '\xfe'};
    CHECK_EQ(mpack::load_be<std::int8_t>(neg), -1);
    CHECK_EQ(mpack::load_be<std::int16_t>(neg), -2);
}

TEST_CASE("store big-endian") {
    char buf[8];

    mpack::store_be(buf, std::uint16_t{0x0102});
    CHECK_EQ(buf[0], '\x01');
    CHECK_EQ(buf[1], '\x02');

    mpack::store_be(buf, std::uint32_t{0x01020304});
    CHECK_EQ(buf[0], '\x01');
    CHECK_EQ(buf[3], '\x04');

    mpack::store_be(buf, std::int64_t{-2});
    CHECK_EQ(buf[0], '\xff');
    CHECK_EQ(buf[7], '\xfe');
    CHECK_EQ(mpack::load_be<std::int64_t>(buf), -2);

    mpack::store_be(buf, (std::numeric_limits<std::uint64_t>::max)());
    CHECK_EQ(mpack::load_be<std::uint64_t>(buf), (std::numeric_limits<std::uint64_t>::max)());
}

TEST_CASE("take low byte") {
    CHECK_EQ(mpack::take8(0x1234), '\x34');
    CHECK_EQ(mpack::take8(std::int64_t{-1}), '\xff');
    CHECK_EQ(mpack::take8(std::int64_t{-32}), '\xe0');
}

TEST_CASE("floats") {
    char buf[8];

    // 1.0f = 0x3f800000
    mpack::store_float32(buf, 1.0f);
    CHECK_EQ(buf[0], '\x3f');
    CHECK_EQ(buf[1], '\x80');
    CHECK_EQ(buf[2], '\x00');
    CHECK_EQ(buf[3], '\x00');
    CHECK_EQ(mpack::load_float32(buf), 1.0f);

    // 1.5 = 0x3ff8000000000000
    mpack::store_float64(buf, 1.5);
    CHECK_EQ(buf[0], '\x3f');
    CHECK_EQ(buf[1], '\xf8');
    CHECK_EQ(buf[7], '\x00');
    CHECK_EQ(mpack::load_float64(buf), 1.5);

    mpack::store_float64(buf, -0.25);
    CHECK_EQ(mpack::load_float64(buf), -0.25);
}
