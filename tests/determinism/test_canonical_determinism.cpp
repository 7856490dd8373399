/**
 * @file test_canonical_determinism.cpp
 * @brief End-to-end determinism: JSON text -> canonical bytes -> digest
 */

#include "canonjson/canonical_json.hpp"
#include "canonjson/json_reader.hpp"

#include <string>
#include <string_view>

#include <gtest/gtest.h>

using namespace canonjson::canonical;
using canonjson::reader::parse_json;

namespace {

std::string canonical_text(std::string_view json)
{
    auto value = parse_json(json);
    EXPECT_TRUE(value) << (value ? "" : value.error().message);
    if (!value) {
        return {};
    }
    auto canonical = canonicalize(*value);
    EXPECT_TRUE(canonical) << (canonical ? "" : canonical.error().message);
    return canonical ? *canonical : std::string{};
}

}  // namespace

TEST(CanonicalDeterminism, Rfc8785Sample)
{
    constexpr std::string_view input = R"({
  "numbers": [333333333.33333329, 1E30, 4.50, 2e-3, 0.000000000000000000000000001],
  "string": "\u20ac$\u000F\u000aA'\u0042\u0022\u005c\\\"\/",
  "literals": [null, true, false]
})";
    const std::string expected =
        std::string(R"({"literals":[null,true,false],)")
        + R"("numbers":[333333333.3333333,1e+30,4.5,0.002,1e-27],)"
        + R"("string":")" + "\xe2\x82\xac" + R"($\u000f\nA'B\"\\\\\"/"})";
    EXPECT_EQ(canonical_text(input), expected);
}

TEST(CanonicalDeterminism, WhitespaceAndOrderInsensitive)
{
    const auto compact = canonical_text(R"({"b":[1,2,{"y":1,"x":2}],"a":"s"})");
    const auto spaced = canonical_text(R"(
        {
            "a" : "s",
            "b" : [ 1.0, 2e0, { "x" : 2, "y" : 1 } ]
        })");
    EXPECT_EQ(compact, spaced);
    EXPECT_EQ(compact, R"({"a":"s","b":[1,2,{"x":2,"y":1}]})");
}

TEST(CanonicalDeterminism, Idempotence)
{
    for (std::string_view doc : {
             std::string_view(R"({"z":[0.1,-0.0,1e21,1e-7],"a":{"\u00e9":"\u0001","A":null}})"),
             std::string_view(R"([true,false,"\ud83d\ude00",123456789012345678901234567890])"),
             std::string_view(R"("plain")"),
         }) {
        const auto first = canonical_text(doc);
        const auto second = canonical_text(first);
        EXPECT_EQ(first, second) << doc;
        EXPECT_TRUE(canonjson::reader::is_canonical_json(first)) << first;
    }
}

TEST(CanonicalDeterminism, LargeIntegersBecomeDoubles)
{
    // Beyond 2^53 the IEEE value is what is canonicalized
    EXPECT_EQ(canonical_text("9007199254740993"), "9007199254740992");
    EXPECT_EQ(canonical_text("18446744073709551615"), "18446744073709552000");
    EXPECT_EQ(canonical_text("-9223372036854775808"), "-9223372036854776000");
}

TEST(CanonicalDeterminism, HashAcrossSpellings)
{
    auto a = parse_json(R"({"id":123,"tags":["x","y"]})");
    auto b = parse_json(R"({ "tags" : [ "x", "y" ], "id" : 1.23e2 })");
    ASSERT_TRUE(a);
    ASSERT_TRUE(b);
    auto ha = canonical_hash(*a, "sha-256");
    auto hb = canonical_hash(*b, "sha-256");
    ASSERT_TRUE(ha);
    ASSERT_TRUE(hb);
    EXPECT_EQ(*ha, *hb);
    EXPECT_EQ(ha->size(), 64u);
}
