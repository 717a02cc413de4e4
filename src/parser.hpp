#pragma once
#include "ast.hpp"
#include "error.hpp"
#include "lexer.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bbcx {

/**
 * @brief Recursive-descent parser for a single BBC-X source line.
 *
 *   line      ::= LOCATION [LABEL ":"] word [COMMENT]
 *   word      ::= pword | signed-integer | signed-float | STRING
 *   pword     ::= MNEMONIC [octal-digit ","] [operand]
 *   operand   ::= ["*"] (IDENTIFIER | NUMBER) ["[" NUMBER "]"] | constant
 *
 * Every failure throws ParseFailed.
 */
class Parser
{
    Token currentToken;
    std::vector<Token> tokens;
    size_t position = 0;

    inline void consume(Type type)
    {
        if (currentToken.type == type)
        {
            position++;
            if (position < tokens.size())
                currentToken = tokens[position];
        }
        else
            throw Error(ErrorKind::ParseFailed, "unexpected " + currentToken.to_string() + " at column " + std::to_string(currentToken.column + 1));
    }

    inline Token peek(int offset = 1) {
        if (position + offset >= tokens.size())
            return tokens.back();

        return tokens[position + offset];
    }

    [[noreturn]] void unexpected() const;

public:
    explicit Parser(const std::vector<Token>& toks) : tokens(toks)
    {
        currentToken = tokens[position];
    }

    // Blank and comment-only lines yield nothing.
    std::optional<SourceLine> parseLine();

    static std::optional<SourceLine> parse(std::string_view line);

    Location parseLocation();
    std::optional<std::string> parseLabel();
    std::unique_ptr<Node> parseSourceWord();
    std::unique_ptr<PWordNode> parsePWord();
    Operand parseOperand();
    AddressOperand parseAddressOperand();
    ConstOperand parseConstOperand();

    // Sign, then an integer or a float; both parts must be written without spaces.
    std::variant<IntType, FloatType> parseSignedNumber();
    IntType parseUnsigned();
};

/**
 * @brief One line of a source file after parsing.
 *
 * Exactly one of line and error is set for a source line; both are empty for
 * a blank or comment-only line.
 */
struct ParsedLine
{
    std::size_t lineNumber = 0;
    std::string text;
    std::optional<SourceLine> line;
    std::optional<std::string> error;

    bool failed() const { return error.has_value(); }
};

// Parses every line of a program, recording failures instead of stopping at the first.
std::vector<ParsedLine> parseProgram(std::string_view text);

// Moves the source lines out, or throws one ParseFailed naming every failing line.
std::vector<SourceLine> takeSourceLines(std::vector<ParsedLine>& lines);

} // namespace bbcx
