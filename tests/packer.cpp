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
#include "pfs/mpack/packer.hpp"
#include <cstdint>
#include <limits>
#include <map>
#include <string>
#include <tuple>
#include <vector>

using archive_t = mpack::archive<>;
using packer_t = mpack::packer<archive_t>;

template <typename T>
std::string pack_one (T const & value)
{
    archive_t ar;
    packer_t p {ar};
    p.pack(value);
    return ar.str();
}

std::string bytes (std::initializer_list<int> list)
{
    std::string result;

    for (auto b: list)
        result.push_back(static_cast<char>(b));

    return result;
}

// First byte of the packed value
template <typename T>
int tag_of (T const & value)
{
    return static_cast<std::uint8_t>(pack_one(value)[0]);
}

enum class color: std::uint8_t { red = 1, green = 200 };

struct point
{
    int x;
    int y;
};

namespace mpack {

template <>
struct type_adaptor<point>
{
    template <typename Packer>
    static void pack (Packer & p, point const & v)
    {
        p.pack_array(2).pack(v.x).pack(v.y);
    }
};

} // namespace mpack

TEST_CASE("nil and booleans") {
    CHECK_EQ(pack_one(nullptr), bytes({0xc0}));
    CHECK_EQ(pack_one(true), bytes({0xc3}));
    CHECK_EQ(pack_one(false), bytes({0xc2}));
}

TEST_CASE("unsigned integers use minimal width") {
    CHECK_EQ(pack_one(0), bytes({0x00}));
    CHECK_EQ(pack_one(127), bytes({0x7f}));
    CHECK_EQ(pack_one(128), bytes({0xcc, 0x80}));
    CHECK_EQ(pack_one(255), bytes({0xcc, 0xff}));
    CHECK_EQ(pack_one(256), bytes({0xcd, 0x01, 0x00}));
    CHECK_EQ(pack_one(65535), bytes({0xcd, 0xff, 0xff}));
    CHECK_EQ(pack_one(65536), bytes({0xce, 0x00, 0x01, 0x00, 0x00}));
    CHECK_EQ(pack_one(std::uint64_t{0xffffffff}), bytes({0xce, 0xff, 0xff, 0xff, 0xff}));
    CHECK_EQ(pack_one(std::uint64_t{0x100000000}), bytes({0xcf, 0, 0, 0, 1, 0, 0, 0, 0}));

    // Width depends on the value, not on the type
    CHECK_EQ(pack_one(std::uint64_t{1}), bytes({0x01}));
    CHECK_EQ(pack_one(std::int64_t{300}), bytes({0xcd, 0x01, 0x2c}));
}

TEST_CASE("signed integers use minimal width") {
    CHECK_EQ(pack_one(-1), bytes({0xff}));
    CHECK_EQ(pack_one(-32), bytes({0xe0}));
    CHECK_EQ(pack_one(-33), bytes({0xd0, 0xdf}));
    CHECK_EQ(pack_one(-128), bytes({0xd0, 0x80}));
    CHECK_EQ(pack_one(-129), bytes({0xd1, 0xff, 0x7f}));
    CHECK_EQ(pack_one(-32768), bytes({0xd1, 0x80, 0x00}));
    CHECK_EQ(pack_one(-32769), bytes({0xd2, 0xff, 0xff, 0x7f, 0xff}));
    CHECK_EQ(tag_of(std::int64_t{-2147483648LL}), 0xd2);
    CHECK_EQ(tag_of(std::int64_t{-2147483649LL}), 0xd3);
    CHECK_EQ(tag_of((std::numeric_limits<std::int64_t>::min)()), 0xd3);
}

TEST_CASE("floating point") {
    CHECK_EQ(pack_one(1.0f), bytes({0xca, 0x3f, 0x80, 0x00, 0x00}));
    CHECK_EQ(pack_one(1.5), bytes({0xcb, 0x3f, 0xf8, 0, 0, 0, 0, 0, 0}));
}

TEST_CASE("raw") {
    CHECK_EQ(pack_one(""), bytes({0xa0}));
    CHECK_EQ(pack_one("Foo"), bytes({0xa3, 'F', 'o', 'o'}));
    CHECK_EQ(pack_one(std::string{"Foo"}), bytes({0xa3, 'F', 'o', 'o'}));
    CHECK_EQ(pack_one(std::vector<char>{'a', '\0'}), bytes({0xa2, 'a', 0}));
    CHECK_EQ(pack_one(std::vector<std::uint8_t>{0xff}), bytes({0xa1, 0xff}));

    char const * cs = "ab";
    CHECK_EQ(pack_one(cs), bytes({0xa2, 'a', 'b'}));

    char const * null_cs = nullptr;
    CHECK_EQ(pack_one(null_cs), bytes({0xc0}));
}

TEST_CASE("raw length framing") {
    CHECK_EQ(tag_of(std::string(31, 'x')), 0xbf);
    CHECK_EQ(pack_one(std::string(32, 'x')).substr(0, 3), bytes({0xda, 0x00, 0x20}));
    CHECK_EQ(pack_one(std::string(65535, 'x')).substr(0, 3), bytes({0xda, 0xff, 0xff}));
    CHECK_EQ(pack_one(std::string(65536, 'x')).substr(0, 5), bytes({0xdb, 0x00, 0x01, 0x00, 0x00}));
    CHECK_EQ(pack_one(std::string(65536, 'x')).size(), 65536 + 5);
}

TEST_CASE("array length framing") {
    CHECK_EQ(pack_one(std::vector<int>{}), bytes({0x90}));
    CHECK_EQ(tag_of(std::vector<int>(15, 1)), 0x9f);
    CHECK_EQ(pack_one(std::vector<int>(16, 1)).substr(0, 3), bytes({0xdc, 0x00, 0x10}));
    CHECK_EQ(pack_one(std::vector<int>(65535, 1)).substr(0, 3), bytes({0xdc, 0xff, 0xff}));
    CHECK_EQ(pack_one(std::vector<int>(65536, 1)).substr(0, 5), bytes({0xdd, 0x00, 0x01, 0x00, 0x00}));
}

TEST_CASE("map length framing") {
    std::map<int, int> m;
    CHECK_EQ(pack_one(m), bytes({0x80}));

    for (int i = 0; i < 15; i++)
        m[i] = i;

    CHECK_EQ(tag_of(m), 0x8f);

    m[15] = 15;
    CHECK_EQ(pack_one(m).substr(0, 3), bytes({0xde, 0x00, 0x10}));

    archive_t ar;
    packer_t p {ar};
    p.pack_map(65536);
    CHECK_EQ(ar.str(), bytes({0xdf, 0x00, 0x01, 0x00, 0x00}));
}

TEST_CASE("length overflow") {
    archive_t ar;
    packer_t p {ar};

    if (sizeof(std::size_t) > 4) {
        auto n = static_cast<std::size_t>(0xffffffffULL) + 1;

        CHECK_THROWS_AS(p.pack_array(n), mpack::error);
        CHECK_THROWS_AS(p.pack_map(n), mpack::error);
        CHECK_THROWS_AS(p.pack_raw(n), mpack::error);
        CHECK(ar.empty());
    }
}

TEST_CASE("containers and tuples") {
    CHECK_EQ(pack_one(std::vector<int>{1, -1}), bytes({0x92, 0x01, 0xff}));
    CHECK_EQ(pack_one(std::array<bool, 2>{{true, false}}), bytes({0x92, 0xc3, 0xc2}));
    CHECK_EQ(pack_one(std::make_pair(1, "a")), bytes({0x92, 0x01, 0xa1, 'a'}));
    CHECK_EQ(pack_one(std::make_tuple(1, true, nullptr)), bytes({0x93, 0x01, 0xc3, 0xc0}));

    std::map<std::string, int> m {{"a", 1}};
    CHECK_EQ(pack_one(m), bytes({0x81, 0xa1, 'a', 0x01}));
}

TEST_CASE("enums and adaptors") {
    CHECK_EQ(pack_one(color::red), bytes({0x01}));
    CHECK_EQ(pack_one(color::green), bytes({0xcc, 200}));
    CHECK_EQ(pack_one(point{1, -2}), bytes({0x92, 0x01, 0xfe}));
}

TEST_CASE("object") {
    mpack::object::array_type a;
    a.push_back(mpack::object{1});
    a.push_back(mpack::object{"x"});
    a.push_back(mpack::object{});
    a.push_back(mpack::object{-200});

    CHECK_EQ(pack_one(mpack::object{std::move(a)})
        , bytes({0x94, 0x01, 0xa1, 'x', 0xc0, 0xd1, 0xff, 0x38}));
}

TEST_CASE("variadic pack wraps values as array") {
    archive_t ar;
    packer_t p {ar};

    p.pack(1, true, "Foo");

    CHECK_EQ(ar.str(), bytes({0x93, 0x01, 0xc3, 0xa3, 'F', 'o', 'o'}));
}

TEST_CASE("chained pack") {
    archive_t ar;
    packer_t p {ar};

    p.pack(1).pack(true).pack("Foo");
    CHECK_EQ(ar.str(), bytes({0x01, 0xc3, 0xa3, 'F', 'o', 'o'}));

    ar.clear();
    p.pack_array(2).pack_nil().pack_raw(3).pack_raw_body("abc", 3);
    CHECK_EQ(ar.str(), bytes({0x92, 0xc0, 0xa3, 'a', 'b', 'c'}));
    CHECK_EQ(& p.sink(), & ar);
}
