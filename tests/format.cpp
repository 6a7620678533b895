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
#include "pfs/mpack/format.hpp"

TEST_CASE("fix ranges") {
    CHECK(mpack::is_positive_fixnum(0x00));
    CHECK(mpack::is_positive_fixnum(0x7f));
    CHECK_FALSE(mpack::is_positive_fixnum(0x80));

    CHECK(mpack::is_negative_fixnum(0xe0));
    CHECK(mpack::is_negative_fixnum(0xff));
    CHECK_FALSE(mpack::is_negative_fixnum(0xdf));

    CHECK(mpack::is_fixmap(0x80));
    CHECK(mpack::is_fixmap(0x8f));
    CHECK_FALSE(mpack::is_fixmap(0x90));

    CHECK(mpack::is_fixarray(0x90));
    CHECK(mpack::is_fixarray(0x9f));
    CHECK_FALSE(mpack::is_fixarray(0xa0));

    CHECK(mpack::is_fixraw(0xa0));
    CHECK(mpack::is_fixraw(0xbf));
    CHECK_FALSE(mpack::is_fixraw(0xc0));
}

TEST_CASE("fix length") {
    CHECK_EQ(mpack::fix_length(0x80), 0);
    CHECK_EQ(mpack::fix_length(0x8f), 15);
    CHECK_EQ(mpack::fix_length(0x93), 3);
    CHECK_EQ(mpack::fix_length(0xa3), 3);
    CHECK_EQ(mpack::fix_length(0xbf), 31);
}

TEST_CASE("trail") {
    CHECK_EQ(mpack::scalar_trail(mpack::to_byte(mpack::format::uint8)), 1);
    CHECK_EQ(mpack::scalar_trail(mpack::to_byte(mpack::format::uint16)), 2);
    CHECK_EQ(mpack::scalar_trail(mpack::to_byte(mpack::format::uint32)), 4);
    CHECK_EQ(mpack::scalar_trail(mpack::to_byte(mpack::format::uint64)), 8);
    CHECK_EQ(mpack::scalar_trail(mpack::to_byte(mpack::format::int8)), 1);
    CHECK_EQ(mpack::scalar_trail(mpack::to_byte(mpack::format::int64)), 8);
    CHECK_EQ(mpack::scalar_trail(mpack::to_byte(mpack::format::float32)), 4);
    CHECK_EQ(mpack::scalar_trail(mpack::to_byte(mpack::format::float64)), 8);

    CHECK_EQ(mpack::length_trail(mpack::to_byte(mpack::format::raw16)), 2);
    CHECK_EQ(mpack::length_trail(mpack::to_byte(mpack::format::raw32)), 4);
    CHECK_EQ(mpack::length_trail(mpack::to_byte(mpack::format::array16)), 2);
    CHECK_EQ(mpack::length_trail(mpack::to_byte(mpack::format::array32)), 4);
    CHECK_EQ(mpack::length_trail(mpack::to_byte(mpack::format::map16)), 2);
    CHECK_EQ(mpack::length_trail(mpack::to_byte(mpack::format::map32)), 4);
}

TEST_CASE("known formats") {
    int known = 0;

    for (int b = 0; b < 256; b++) {
        if (mpack::is_known_format(static_cast<std::uint8_t>(b)))
            known++;
    }

    // 256 minus reserved 0xc1, 0xc4..0xc9, 0xd4..0xd9
    CHECK_EQ(known, 256 - 1 - 6 - 6);

    CHECK_FALSE(mpack::is_known_format(0xc1));
    CHECK_FALSE(mpack::is_known_format(0xd4));
    CHECK_FALSE(mpack::is_known_format(0xd9));
    CHECK(mpack::is_known_format(0xda));
}
