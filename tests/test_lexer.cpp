#include <gtest/gtest.h>
#include <arithexpr/lexer.hpp>

#include <string>
#include <vector>

namespace {

using arithexpr::LexError;
using arithexpr::TokKind;
using arithexpr::tokenize;

std::vector<std::string> texts(const std::vector<arithexpr::Token>& toks) {
    std::vector<std::string> out;
    for (const auto& t : toks) out.push_back(t.text);
    return out;
}

TEST(Lexer, OperatorsAndParens) {
    auto toks = tokenize("+-*/()");
    ASSERT_EQ(toks.size(), 6u);
    EXPECT_EQ(toks[0].kind, TokKind::Plus);
    EXPECT_EQ(toks[1].kind, TokKind::Minus);
    EXPECT_EQ(toks[2].kind, TokKind::Star);
    EXPECT_EQ(toks[3].kind, TokKind::Slash);
    EXPECT_EQ(toks[4].kind, TokKind::LParen);
    EXPECT_EQ(toks[5].kind, TokKind::RParen);
}

TEST(Lexer, SkipsWhitespaceAndRecordsPositions) {
    auto toks = tokenize("  12 +\t3.5\n");
    ASSERT_EQ(toks.size(), 3u);
    EXPECT_EQ(toks[0].kind, TokKind::Number);
    EXPECT_EQ(toks[0].text, "12");
    EXPECT_EQ(toks[0].pos, 2u);
    EXPECT_EQ(toks[1].kind, TokKind::Plus);
    EXPECT_EQ(toks[1].pos, 5u);
    EXPECT_EQ(toks[2].text, "3.5");
    EXPECT_EQ(toks[2].pos, 7u);
}

TEST(Lexer, EmptyAndBlankInputGiveNoTokens) {
    EXPECT_TRUE(tokenize("").empty());
    EXPECT_TRUE(tokenize(" \t ").empty());
}

TEST(Lexer, LiteralsMayStartOrEndWithDot) {
    EXPECT_EQ(texts(tokenize(".5 + 5.")), (std::vector<std::string>{".5", "+", "5."}));
    EXPECT_EQ(texts(tokenize(".")), (std::vector<std::string>{"."}));
}

TEST(Lexer, SecondDotStartsANewLiteral) {
    auto toks = tokenize("1.2.3");
    ASSERT_EQ(toks.size(), 2u);
    EXPECT_EQ(toks[0].text, "1.2");
    EXPECT_EQ(toks[1].text, ".3");
    EXPECT_EQ(toks[1].pos, 3u);

    EXPECT_EQ(texts(tokenize("1..2")), (std::vector<std::string>{"1.", ".2"}));
}

TEST(Lexer, AdjacentLiteralsWithoutSeparator) {
    EXPECT_EQ(texts(tokenize("2(3)")), (std::vector<std::string>{"2", "(", "3", ")"}));
}

TEST(Lexer, RejectsUnknownCharacter) {
    try {
        tokenize("1 + x");
        FAIL() << "expected LexError";
    } catch (const LexError& e) {
        EXPECT_EQ(e.character(), 'x');
        EXPECT_EQ(e.position(), 4u);
        EXPECT_STREQ(e.what(), "Unexpected character: 'x' at position 4");
    }
}

TEST(Lexer, ErrorStopsAtFirstBadCharacter) {
    try {
        tokenize("2 ^ 3 % 4");
        FAIL() << "expected LexError";
    } catch (const LexError& e) {
        EXPECT_EQ(e.character(), '^');
        EXPECT_EQ(e.position(), 2u);
    }
}

TEST(Lexer, NextReturnsNulloptAtEnd) {
    arithexpr::Lexer lex("7");
    auto t = lex.next();
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->text, "7");
    EXPECT_FALSE(lex.next().has_value());
    EXPECT_FALSE(lex.next().has_value());
}

} // namespace
