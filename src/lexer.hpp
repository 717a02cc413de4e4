#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace bbcx {

enum class Type
{
    NUMBER,
    IDENTIFIER,
    STRING,
    PLUS,
    MINUS,
    PERIOD,
    AT,
    COLON,
    COMMA,
    ASTERISK,
    OPEN_BRACKET,
    CLOSE_BRACKET,
    COMMENT,
    END = -1,
};

struct Token
{
    Type type;
    std::string_view value; // points into the source line
    std::size_t column = 0;
    std::string to_string() const;

    // True when other starts on the column right after this token.
    bool touches(const Token& other) const { return column + value.size() == other.column; }
};

/**
 * @brief Splits one BBC-X source line into tokens.
 *
 * Whitespace separates tokens but is otherwise dropped; a ';' starts a
 * comment that runs to the end of the line. Throws ParseFailed on a
 * character the source language does not use.
 */
class Lexer
{
    std::string_view source;
    size_t cursor = 0;

public:
    explicit Lexer(std::string_view src) : source(src) {}
    std::vector<Token> tokenize();

private:
    void skip_whitespace();
    constexpr bool is_eof() const { return cursor >= source.length(); }
    constexpr char peek() const { return is_eof() ? '\0' : source[cursor]; }
    constexpr void advance() { cursor++; }
};

} // namespace bbcx
