#include "lexer.hpp"
#include "error.hpp"

namespace bbcx {

namespace {

bool isUpper(char c) { return c >= 'A' && c <= 'Z'; }
bool isDigit(char c) { return c >= '0' && c <= '9'; }

std::string_view typeName(Type type)
{
    switch (type) {
        case Type::NUMBER: return "NUMBER";
        case Type::IDENTIFIER: return "IDENTIFIER";
        case Type::STRING: return "STRING";
        case Type::PLUS: return "PLUS";
        case Type::MINUS: return "MINUS";
        case Type::PERIOD: return "PERIOD";
        case Type::AT: return "AT";
        case Type::COLON: return "COLON";
        case Type::COMMA: return "COMMA";
        case Type::ASTERISK: return "ASTERISK";
        case Type::OPEN_BRACKET: return "OPEN_BRACKET";
        case Type::CLOSE_BRACKET: return "CLOSE_BRACKET";
        case Type::COMMENT: return "COMMENT";
        case Type::END: return "END";
    }
    return "UNKNOWN";
}

} // namespace

std::string Token::to_string() const
{
    if (type == Type::END)
        return "end of line";
    return std::string(typeName(type)) + " '" + std::string(value) + "'";
}

void Lexer::skip_whitespace() {
    while (!is_eof() && (peek() == ' ' || peek() == '\t' || peek() == '\r' || peek() == '\n'))
        advance();
}

std::vector<Token> Lexer::tokenize() {
    std::vector<Token> tokens;

    while (true) {
        skip_whitespace();
        if (is_eof()) break;

        size_t start = cursor;
        char c = peek();

        if (isDigit(c)) {
            while (!is_eof() && isDigit(peek())) advance();
            tokens.push_back({Type::NUMBER, source.substr(start, cursor - start), start});
            continue;
        }

        if (isUpper(c)) {
            while (!is_eof() && (isUpper(peek()) || isDigit(peek()))) advance();
            tokens.push_back({Type::IDENTIFIER, source.substr(start, cursor - start), start});
            continue;
        }

        if (c == '"') {
            advance();
            while (!is_eof() && peek() != '"') advance();
            if (is_eof())
                throw Error(ErrorKind::ParseFailed, "unterminated string at column " + std::to_string(start + 1));
            tokens.push_back({Type::STRING, source.substr(start + 1, cursor - start - 1), start});
            advance();
            continue;
        }

        if (c == ';') {
            tokens.push_back({Type::COMMENT, source.substr(start), start});
            cursor = source.length();
            continue;
        }

        Type symType;
        switch (c) {
            case '+': symType = Type::PLUS; break;
            case '-': symType = Type::MINUS; break;
            case '.': symType = Type::PERIOD; break;
            case '@': symType = Type::AT; break;
            case ':': symType = Type::COLON; break;
            case ',': symType = Type::COMMA; break;
            case '*': symType = Type::ASTERISK; break;
            case '[': symType = Type::OPEN_BRACKET; break;
            case ']': symType = Type::CLOSE_BRACKET; break;
            default:
                throw Error(ErrorKind::ParseFailed,
                            std::string("unexpected character '") + c + "' at column " + std::to_string(start + 1));
        }

        tokens.push_back({symType, source.substr(cursor, 1), start});
        advance();
    }

    tokens.push_back({Type::END, "", source.length()});
    return tokens;
}

} // namespace bbcx
