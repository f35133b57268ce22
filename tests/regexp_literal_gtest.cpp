#include <gtest/gtest.h>
#include <string>
#include <string_view>
#include "lexlit/literals.hpp"

using namespace lexlit;

namespace {

struct Parsed { bool ok; literal_node node; scan_state st; };

Parsed run(const literal_parser& p, std::string_view src){
    Parsed r{false, {}, scan_state(src, skip_ascii_ws)};
    r.ok = p.parse(r.st, r.node);
    return r;
}

std::string_view child_text(const literal_node& n, size_t i){
    auto *c = as_children(n);
    return (c && i < c->size()) ? text((*c)[i]) : std::string_view{};
}

}

TEST(RegexpMatchLiteral, SlashDelimited){
    auto p = unicode_regexp_match_lit();
    EXPECT_EQ(p->name(), "regexp match literal");
    auto r = run(*p, R"( /a+\/b*/ rest)");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(text(r.node), "a+/b*");
    EXPECT_EQ(r.node.start, 2u);
    EXPECT_EQ(r.node.end, 8u);
    EXPECT_EQ(r.st.pos, 9u);
}

TEST(RegexpMatchLiteral, PairedBrackets){
    auto p = unicode_regexp_match_lit();
    auto r = run(*p, "{a(b)c}");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(text(r.node), "a(b)c");
    r = run(*p, "\xE3\x80\x8C" "x+\xE3\x80\x8D");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(text(r.node), "x+");
}

TEST(RegexpMatchLiteral, PatternBackslashesPassThrough){
    auto p = unicode_regexp_match_lit();
    auto r = run(*p, R"(/\d+\.\w/)");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(text(r.node), R"(\d+\.\w)");
}

TEST(RegexpMatchLiteral, RejectsNonDelimiter){
    auto p = unicode_regexp_match_lit();
    auto r = run(*p, "  abc/");
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.st.error.expected, regexp_delimiter_expected);
    EXPECT_EQ(r.st.error.pos, 2u);
    EXPECT_EQ(r.st.pos, 0u);
}

TEST(RegexpMatchLiteral, UnterminatedReportsCloser){
    auto p = unicode_regexp_match_lit();
    std::string src = "[abc";
    auto r = run(*p, src);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.st.error.expected, "]");
    EXPECT_EQ(r.st.error.pos, src.size());
    EXPECT_EQ(r.st.pos, 0u);
}

TEST(RegexpMatchLiteral, CustomPolicy){
    auto p = custom_regexp_match_lit([](char32_t c){ return c == U'%' ? delimiter_match{true, U'%'} : delimiter_match{}; });
    auto r = run(*p, "%a.b%");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(text(r.node), "a.b");
    r = run(*p, "/a/");
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.st.error.expected, regexp_delimiter_expected);
}

TEST(RegexpReplaceLiteral, SymmetricDelimiterSharesTheMiddle){
    auto p = unicode_regexp_replace_lit();
    EXPECT_EQ(p->name(), "regexp replace literal");
    std::string src = "/foo/bar/";
    auto r = run(*p, src);
    ASSERT_TRUE(r.ok);
    ASSERT_TRUE(is_compound(r.node));
    ASSERT_EQ(as_children(r.node)->size(), 2u);
    EXPECT_EQ(child_text(r.node, 0), "foo");
    EXPECT_EQ(child_text(r.node, 1), "bar");
    const auto &kids = *as_children(r.node);
    EXPECT_EQ(kids[0].start, 1u);
    EXPECT_EQ(kids[0].end, 4u);
    EXPECT_EQ(kids[1].start, 5u);
    EXPECT_EQ(kids[1].end, 8u);
    EXPECT_EQ(r.node.start, 1u);
    EXPECT_EQ(r.node.end, 8u);
    EXPECT_EQ(r.st.pos, src.size());
}

TEST(RegexpReplaceLiteral, AsymmetricPairsNeedASecondOpener){
    auto p = unicode_regexp_replace_lit();
    auto r = run(*p, "(foo)[bar]");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(child_text(r.node, 0), "foo");
    EXPECT_EQ(child_text(r.node, 1), "bar");
    EXPECT_EQ(r.st.pos, 10u);

    r = run(*p, "{a}/b/");
    ASSERT_TRUE(r.ok) << "the second opener may be any valid delimiter";
    EXPECT_EQ(child_text(r.node, 0), "a");
    EXPECT_EQ(child_text(r.node, 1), "b");
}

TEST(RegexpReplaceLiteral, InvalidSecondOpener){
    auto p = unicode_regexp_replace_lit();
    auto r = run(*p, "(foo)bar)");
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.st.error.expected, regexp_delimiter_expected);
    EXPECT_EQ(r.st.error.pos, 5u) << "at the rejected opener";
    EXPECT_EQ(r.st.pos, 5u) << "pattern segment stays consumed";
    EXPECT_TRUE(is_empty(r.node));

    r = run(*p, "(foo)");
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.st.error.expected, regexp_delimiter_expected);
    EXPECT_EQ(r.st.error.pos, 5u);
}

TEST(RegexpReplaceLiteral, EscapesInBothSegments){
    auto p = unicode_regexp_replace_lit();
    auto r = run(*p, R"(/a\/b/c\td\/e/)");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(child_text(r.node, 0), "a/b");
    EXPECT_EQ(child_text(r.node, 1), "c\td/e");
}

TEST(RegexpReplaceLiteral, SecondSegmentUsesDefaultEscapes){
    auto p = custom_regexp_replace_lit(regexp_delimiter, escape_table{{U'n', U'N'}});
    auto r = run(*p, R"(/a\n/b\n/)");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(child_text(r.node, 0), "aN");
    EXPECT_EQ(child_text(r.node, 1), "b\n");
}

TEST(RegexpReplaceLiteral, SecondOpenerUsesBuiltInMatcher){
    auto p = custom_regexp_replace_lit([](char32_t c){ return c == U'#' ? delimiter_match{true, U';'} : delimiter_match{}; });
    auto r = run(*p, "#a;(b)");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(child_text(r.node, 0), "a");
    EXPECT_EQ(child_text(r.node, 1), "b");
}

TEST(RegexpReplaceLiteral, UnterminatedSegments){
    auto p = unicode_regexp_replace_lit();
    std::string first = "  /foo";
    auto r = run(*p, first);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.st.error.expected, "/");
    EXPECT_EQ(r.st.error.pos, first.size());
    EXPECT_EQ(r.st.pos, 3u) << "opener stays consumed";

    std::string second = "/foo/bar";
    r = run(*p, second);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.st.error.expected, "/");
    EXPECT_EQ(r.st.error.pos, second.size());
    EXPECT_EQ(r.st.pos, 5u) << "pattern segment stays consumed";

    std::string paired = "<a>{b";
    r = run(*p, paired);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.st.error.expected, "}");
    EXPECT_EQ(r.st.pos, 4u);
}

TEST(RegexpReplaceLiteral, RejectsNonDelimiter){
    auto p = unicode_regexp_replace_lit();
    auto r = run(*p, " s/a/b/");
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.st.error.expected, regexp_delimiter_expected);
    EXPECT_EQ(r.st.error.pos, 1u);
    EXPECT_EQ(r.st.pos, 0u) << "a rejected first opener consumes nothing";
}

TEST(RegexpReplaceLiteral, BorrowedSegmentsAndToString){
    auto p = unicode_regexp_replace_lit();
    auto r = run(*p, "/colou?r/color/");
    ASSERT_TRUE(r.ok);
    for(auto &ch : *as_children(r.node)) EXPECT_TRUE(as_text(ch)->borrowed());
    EXPECT_EQ(to_string(r.node), "[/colou?r/ /color/]");
}
