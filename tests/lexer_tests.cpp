#include "../src/lexer.hpp"
#include "../src/error.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace bbcx;

namespace {
struct TokenExpectation {
    Type type;
    std::string value;
};

void expect_tokens(std::string_view source, const std::vector<TokenExpectation>& expected) {
    Lexer lexer(source);
    const auto tokens = lexer.tokenize();

    ASSERT_EQ(tokens.size(), expected.size()) << "Token count mismatch";

    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(tokens[i].type, expected[i].type) << "Token type mismatch at index " << i;
        EXPECT_EQ(tokens[i].value, expected[i].value) << "Token value mismatch at index " << i;
    }
}

void expect_lex_failure(std::string_view source) {
    Lexer lexer(source);
    try {
        lexer.tokenize();
        ADD_FAILURE() << "Expected a ParseFailed error for: " << source;
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ParseFailed);
    }
}
} // namespace

TEST(LexerTests, ParsesInstructionLine) {
    const std::string source = "0100 LOOP: ADD 1, +10 ;count up";

    expect_tokens(source, {
        {Type::NUMBER, "0100"},
        {Type::IDENTIFIER, "LOOP"},
        {Type::COLON, ":"},
        {Type::IDENTIFIER, "ADD"},
        {Type::NUMBER, "1"},
        {Type::COMMA, ","},
        {Type::PLUS, "+"},
        {Type::NUMBER, "10"},
        {Type::COMMENT, ";count up"},
        {Type::END, ""},
    });
}

TEST(LexerTests, ParsesStringLiteral) {
    const std::string source = "0002 \"A; B\"";

    expect_tokens(source, {
        {Type::NUMBER, "0002"},
        {Type::STRING, "A; B"},
        {Type::END, ""},
    });
}

TEST(LexerTests, ParsesFloatPieces) {
    const std::string source = "0003 -1.25@-3";

    expect_tokens(source, {
        {Type::NUMBER, "0003"},
        {Type::MINUS, "-"},
        {Type::NUMBER, "1"},
        {Type::PERIOD, "."},
        {Type::NUMBER, "25"},
        {Type::AT, "@"},
        {Type::MINUS, "-"},
        {Type::NUMBER, "3"},
        {Type::END, ""},
    });
}

TEST(LexerTests, ParsesIndirectIndexedOperand) {
    const std::string source = "0010 TAKE 2, *TABLE[3]";

    expect_tokens(source, {
        {Type::NUMBER, "0010"},
        {Type::IDENTIFIER, "TAKE"},
        {Type::NUMBER, "2"},
        {Type::COMMA, ","},
        {Type::ASTERISK, "*"},
        {Type::IDENTIFIER, "TABLE"},
        {Type::OPEN_BRACKET, "["},
        {Type::NUMBER, "3"},
        {Type::CLOSE_BRACKET, "]"},
        {Type::END, ""},
    });
}

TEST(LexerTests, IdentifierMayEndInDigits) {
    expect_tokens("JUMP2, L1", {
        {Type::IDENTIFIER, "JUMP2"},
        {Type::COMMA, ","},
        {Type::IDENTIFIER, "L1"},
        {Type::END, ""},
    });
}

TEST(LexerTests, CommentRunsToEndOfLine) {
    expect_tokens("; \"not a string\" +1 *", {
        {Type::COMMENT, "; \"not a string\" +1 *"},
        {Type::END, ""},
    });
}

TEST(LexerTests, BlankLineIsJustEnd) {
    expect_tokens("   \t ", {
        {Type::END, ""},
    });
}

TEST(LexerTests, RecordsColumns) {
    Lexer lexer("0001 +12");
    const auto tokens = lexer.tokenize();

    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[0].column, 0u);
    EXPECT_EQ(tokens[1].column, 5u);
    EXPECT_EQ(tokens[2].column, 6u);
    EXPECT_EQ(tokens[3].column, 8u);

    EXPECT_FALSE(tokens[0].touches(tokens[1]));
    EXPECT_TRUE(tokens[1].touches(tokens[2]));
}

TEST(LexerTests, RejectsUnknownCharacters) {
    expect_lex_failure("0001 TAKE 1, #5");
    expect_lex_failure("0001 take 1, 5");
    expect_lex_failure("0001 +1 / 2");
}

TEST(LexerTests, RejectsUnterminatedString) {
    expect_lex_failure("0001 \"ABC");
}
