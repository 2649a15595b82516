#include "token_kind.hpp"
#include <gtest/gtest.h>
#include <sstream>

using namespace corvid::lexer;

TEST(TokenKind, NamesRoundTrip) {
    for (int i = 0; i <= static_cast<int>(TokenKind::Num); ++i) {
        auto kind = static_cast<TokenKind>(i);
        auto name = token_kind_name(kind);
        EXPECT_FALSE(name.empty());
        EXPECT_EQ(token_kind_from_name(name), kind) << name;
    }
    EXPECT_EQ(token_kind_from_name("Bogus"), std::nullopt);
}

TEST(TokenKind, StreamOperatorPrintsName) {
    std::ostringstream oss;
    oss << TokenKind::StringInterpMid << " " << TokenKind::LShift;
    EXPECT_EQ(oss.str(), "StringInterpMid LShift");
}

TEST(TokenKind, TwoByteOperatorWins) {
    auto arrow = match_operator("->x");
    ASSERT_TRUE(arrow.has_value());
    EXPECT_EQ(arrow->kind, TokenKind::Arrow);
    EXPECT_EQ(arrow->length, 2u);

    auto minus = match_operator("-x");
    ASSERT_TRUE(minus.has_value());
    EXPECT_EQ(minus->kind, TokenKind::Minus);
    EXPECT_EQ(minus->length, 1u);

    auto shift = match_operator("<<=");
    ASSERT_TRUE(shift.has_value());
    EXPECT_EQ(shift->kind, TokenKind::LShift);
}

TEST(TokenKind, NoOperator) {
    EXPECT_FALSE(match_operator("").has_value());
    EXPECT_FALSE(match_operator("!").has_value());
    EXPECT_FALSE(match_operator("$\"").has_value());
    EXPECT_FALSE(match_operator("a").has_value());
}

TEST(TokenKind, KeywordLookup) {
    EXPECT_EQ(match_keyword("while", KeywordMatch::Exact), TokenKind::While);
    EXPECT_EQ(match_keyword("whiles", KeywordMatch::Exact), std::nullopt);
    EXPECT_EQ(match_keyword("whiles", KeywordMatch::Prefix), TokenKind::While);
    EXPECT_EQ(match_keyword("packedx", KeywordMatch::Prefix), TokenKind::Packed);
    EXPECT_EQ(match_keyword("x", KeywordMatch::Prefix), std::nullopt);
    EXPECT_EQ(match_keyword("", KeywordMatch::Exact), std::nullopt);
}

TEST(TokenKind, Categories) {
    EXPECT_TRUE(is_keyword(TokenKind::Xor));
    EXPECT_TRUE(is_keyword(TokenKind::Continue));
    EXPECT_FALSE(is_keyword(TokenKind::Equal));

    EXPECT_TRUE(is_operator(TokenKind::Feather));
    EXPECT_TRUE(is_operator(TokenKind::RBrace));
    EXPECT_FALSE(is_operator(TokenKind::Pub));

    EXPECT_TRUE(is_literal(TokenKind::StringInterpEnd));
    EXPECT_TRUE(is_literal(TokenKind::Num));
    EXPECT_FALSE(is_literal(TokenKind::Ident));
}
