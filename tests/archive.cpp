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
#include "pfs/mpack/archive.hpp"
#include <stdexcept>
#include <string>

using archive_t = mpack::archive<>;

constexpr char const * kABC = "ABC";

TEST_CASE("constructors") {
    archive_t ar1;
    CHECK(ar1.empty());
    CHECK(ar1.data() == nullptr);

    archive_t ar2 {kABC, 3};
    CHECK_EQ(ar2.size(), 3);

    archive_t ar3 {std::move(ar2)};
    CHECK_EQ(ar3.size(), 3);
    CHECK(ar2.empty());

    archive_t ar4 {ar3};
    CHECK_EQ(ar3.size(), 3);
    CHECK_EQ(ar4.str(), "ABC");

    archive_t ar5 {std::vector<char>{'x', 'y'}};
    CHECK_EQ(ar5.str(), "xy");
}

TEST_CASE("move assignment") {
    archive_t ar1 {kABC, 3};
    archive_t ar2;

    ar1.erase_front(1);
    ar2 = std::move(ar1);

    CHECK_EQ(ar2.str(), "BC");
    CHECK(ar1.empty());
}

TEST_CASE("append") {
    archive_t ar;
    ar.append(kABC, 3);
    ar.append('x');
    ar.append(std::string{"yz"});
    ar.append(nullptr, 0);

    CHECK_EQ(ar.size(), 6);
    CHECK_EQ(ar.str(), "ABCxyz");
}

TEST_CASE("erase_front") {
    {
        archive_t ar {kABC, 3};

        ar.erase_front(1);
        CHECK_EQ(ar.size(), 2);
        CHECK_EQ(ar.data()[0], 'B');

        ar.erase_front(0);
        CHECK_EQ(ar.size(), 2);

        ar.erase_front(2);
        CHECK(ar.empty());

        // Fully consumed archive is reusable
        ar.append(kABC, 3);
        CHECK_EQ(ar.str(), "ABC");
    }

    {
        archive_t ar {kABC, 3};
        CHECK_THROWS_AS(ar.erase_front(4), std::range_error);
        CHECK_EQ(ar.size(), 3);
    }
}

TEST_CASE("take") {
    archive_t ar {kABC, 3};
    ar.erase_front(1);

    auto c = ar.take();

    CHECK_EQ(c.size(), 2);
    CHECK_EQ(c[0], 'B');
    CHECK_EQ(c[1], 'C');
}

TEST_CASE("clear") {
    archive_t ar {kABC, 3};
    ar.reserve(64);
    CHECK_EQ(ar.str(), std::string{"ABC"});
    ar.clear();
    CHECK(ar.empty());
    CHECK_EQ(ar.str(), std::string{});
}
