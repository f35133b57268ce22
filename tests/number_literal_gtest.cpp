#include <gtest/gtest.h>
#include <cmath>
#include <cstdint>
#include <string>
#include <string_view>
#include "lexlit/literals.hpp"

using namespace lexlit;

namespace {

struct Parsed { bool ok; literal_node node; scan_state st; };

Parsed run_number(std::string_view src){
    auto p = number_lit();
    Parsed r{false, {}, scan_state(src, skip_ascii_ws)};
    r.ok = p->parse(r.st, r.node);
    return r;
}

}

TEST(NumberLiteral, Integers){
    auto r = run_number("42");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(kind_of(r.node), number_kind::integer);
    EXPECT_EQ(as_int(r.node), 42);
    EXPECT_EQ(r.node.start, 0u);
    EXPECT_EQ(r.node.end, 2u);
    EXPECT_EQ(r.st.pos, 2u);

    r = run_number("+5");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(as_int(r.node), 5);

    r = run_number("-17 tail");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(as_int(r.node), -17);
    EXPECT_EQ(r.st.pos, 3u);

    r = run_number("007");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(as_int(r.node), 7);
}

TEST(NumberLiteral, Floats){
    auto r = run_number("-3.14");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(kind_of(r.node), number_kind::floating);
    EXPECT_DOUBLE_EQ(*as_float(r.node), -3.14);

    r = run_number("1e10");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(kind_of(r.node), number_kind::floating);
    EXPECT_DOUBLE_EQ(*as_float(r.node), 1e10);

    r = run_number("2.5E-3");
    ASSERT_TRUE(r.ok);
    EXPECT_DOUBLE_EQ(*as_float(r.node), 2.5e-3);

    r = run_number("+.5");
    ASSERT_TRUE(r.ok);
    EXPECT_DOUBLE_EQ(*as_float(r.node), 0.5);

    r = run_number("7.");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(kind_of(r.node), number_kind::floating);
    EXPECT_DOUBLE_EQ(*as_float(r.node), 7.0);
}

TEST(NumberLiteral, SkipsLeadingWhitespaceAndRecordsRange){
    auto r = run_number("   12.5,");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.node.start, 3u);
    EXPECT_EQ(r.node.end, 7u);
    EXPECT_EQ(r.st.pos, 7u);
}

TEST(NumberLiteral, StopsAtFirstNonNumericCharacter){
    auto r = run_number("12abc");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(as_int(r.node), 12);
    EXPECT_EQ(r.st.pos, 2u);
}

TEST(NumberLiteral, BareDotOrSignIsNotANumber){
    for(std::string_view src : {".", "-", "+", "-.", "", "  ", "abc", "e5"}){
        auto r = run_number(src);
        ASSERT_FALSE(r.ok) << src;
        EXPECT_EQ(r.st.error.expected, number_expected) << src;
        EXPECT_EQ(r.st.pos, 0u) << "zero characters consumed for '" << src << "'";
        EXPECT_TRUE(is_empty(r.node));
    }
}

TEST(NumberLiteral, ErrorReportedAtScanStart){
    auto r = run_number("   -x");
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.st.error.pos, 3u);
    EXPECT_EQ(r.st.pos, 0u);
}

TEST(NumberLiteral, ExponentWithoutDigitsFails){
    auto r = run_number("1e");
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.st.error.expected, number_expected);
    r = run_number("1e+");
    ASSERT_FALSE(r.ok);
}

TEST(NumberLiteral, OverflowFails){
    auto r = run_number("9223372036854775807");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(as_int(r.node), INT64_MAX);
    r = run_number("-9223372036854775808");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(as_int(r.node), INT64_MIN);
    r = run_number("9223372036854775808");
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.st.error.expected, number_expected);
    r = run_number("1e400");
    ASSERT_FALSE(r.ok);
    r = run_number("-0.5e309");
    ASSERT_FALSE(r.ok);
}

TEST(NumberLiteral, UnderflowReadsAsZero){
    auto r = run_number("1e-400");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(kind_of(r.node), number_kind::floating);
    EXPECT_EQ(as_float(r.node), 0.0);
    EXPECT_EQ(r.st.pos, 6u);
    r = run_number("0.0000001e-330");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(as_float(r.node), 0.0);
    r = run_number("-1e-400");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(as_float(r.node), 0.0);
    EXPECT_TRUE(std::signbit(*as_float(r.node)));
    r = run_number("2.5e-310");
    ASSERT_TRUE(r.ok) << "subnormals are accepted";
    EXPECT_GE(*as_float(r.node), 0.0);
    EXPECT_LT(*as_float(r.node), 1e-300);
}

TEST(NumberLiteral, ToString){
    auto r = run_number("-3.5");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(to_string(r.node), "-3.5");
    r = run_number("42");
    EXPECT_EQ(to_string(r.node), "42");
}
