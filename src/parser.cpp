#include "parser.hpp"
#include <memory>
#include <stdexcept>

namespace bbcx {

namespace {

bool isOctalDigit(const Token& token)
{
    return token.type == Type::NUMBER && token.value.size() == 1 && token.value[0] >= '0' && token.value[0] <= '7';
}

} // namespace

void Parser::unexpected() const
{
    throw Error(ErrorKind::ParseFailed,
                "unexpected " + currentToken.to_string() + " at column " + std::to_string(currentToken.column + 1));
}

std::optional<SourceLine> Parser::parse(std::string_view line)
{
    Lexer lexer(line);
    Parser parser(lexer.tokenize());
    return parser.parseLine();
}

std::optional<SourceLine> Parser::parseLine()
{
    if (currentToken.type == Type::END)
        return std::nullopt;
    if (currentToken.type == Type::COMMENT)
        return std::nullopt;

    SourceLine line;
    line.location = parseLocation();
    line.label = parseLabel();
    line.word = parseSourceWord();

    if (currentToken.type == Type::COMMENT) {
        line.comment = std::string(currentToken.value);
        consume(Type::COMMENT);
    }
    if (currentToken.type != Type::END)
        unexpected();
    return line;
}

Location Parser::parseLocation()
{
    if (currentToken.type != Type::NUMBER)
        throw Error(ErrorKind::ParseFailed, "a line must start with its location");
    Token number = currentToken;
    auto location = static_cast<Location>(parseUnsigned());
    if (number.touches(currentToken))
        throw Error(ErrorKind::ParseFailed, "location must be followed by a space");
    return location;
}

std::optional<std::string> Parser::parseLabel()
{
    if (currentToken.type != Type::IDENTIFIER || peek().type != Type::COLON)
        return std::nullopt;
    std::string label(currentToken.value);
    consume(Type::IDENTIFIER);
    consume(Type::COLON);
    return label;
}

std::unique_ptr<Node> Parser::parseSourceWord()
{
    switch (currentToken.type)
    {
    case Type::PLUS:
    case Type::MINUS:
    {
        auto number = parseSignedNumber();
        if (auto i = std::get_if<IntType>(&number))
            return std::make_unique<IWordNode>(*i);
        return std::make_unique<FWordNode>(std::get<FloatType>(number));
    }
    case Type::STRING:
    {
        std::string text(currentToken.value);
        if (text.empty() || text.size() > SWORD_LENGTH)
            throw Error(ErrorKind::ParseFailed, "an S-word holds one to four characters");
        consume(Type::STRING);
        return std::make_unique<SWordNode>(std::move(text));
    }
    case Type::IDENTIFIER:
        return parsePWord();
    default:
        unexpected();
    }
}

std::unique_ptr<PWordNode> Parser::parsePWord()
{
    std::string spelled(currentToken.value);
    consume(Type::IDENTIFIER);

    std::optional<unsigned> acc;
    auto meaning = lookupMnemonic(spelled);
    if (!meaning) {
        // Accumulator written against the mnemonic: JUMP2, LOOP
        const char last = spelled.back();
        if (spelled.size() > 1 && last >= '0' && last <= '7') {
            auto prefix = lookupMnemonic(std::string_view(spelled).substr(0, spelled.size() - 1));
            if (prefix && (prefix->isLibraryRoutine() || currentToken.type == Type::COMMA)) {
                meaning = prefix;
                acc = static_cast<unsigned>(last - '0');
                spelled.pop_back();
                if (currentToken.type == Type::COMMA)
                    consume(Type::COMMA);
            }
        }
        if (!meaning)
            throw Error(ErrorKind::ParseFailed, "unknown mnemonic " + spelled);
    }

    if (meaning->isLibraryRoutine()) {
        if (!acc && isOctalDigit(currentToken)) {
            acc = static_cast<unsigned>(currentToken.value[0] - '0');
            consume(Type::NUMBER);
            if (currentToken.type == Type::COMMA)
                consume(Type::COMMA);
        }
        return std::make_unique<PWordNode>(std::move(spelled), *meaning, acc);
    }

    if (!acc && currentToken.type == Type::NUMBER && peek().type == Type::COMMA) {
        if (!isOctalDigit(currentToken))
            throw Error(ErrorKind::ParseFailed, "accumulator must be an octal digit, not " + std::string(currentToken.value));
        acc = static_cast<unsigned>(currentToken.value[0] - '0');
        consume(Type::NUMBER);
        consume(Type::COMMA);
    }

    return std::make_unique<PWordNode>(std::move(spelled), *meaning, acc, parseOperand());
}

Operand Parser::parseOperand()
{
    switch (currentToken.type)
    {
    case Type::END:
    case Type::COMMENT:
        return std::monostate{};
    case Type::PLUS:
    case Type::MINUS:
    case Type::STRING:
        return parseConstOperand();
    case Type::ASTERISK:
    case Type::IDENTIFIER:
    case Type::NUMBER:
        return parseAddressOperand();
    default:
        unexpected();
    }
}

AddressOperand Parser::parseAddressOperand()
{
    AddressOperand operand;
    if (currentToken.type == Type::ASTERISK) {
        operand.indirect = true;
        consume(Type::ASTERISK);
    }

    if (currentToken.type == Type::IDENTIFIER) {
        operand.address = std::string(currentToken.value);
        consume(Type::IDENTIFIER);
    } else if (currentToken.type == Type::NUMBER) {
        operand.address = parseUnsigned();
    } else {
        unexpected();
    }

    if (currentToken.type == Type::OPEN_BRACKET) {
        consume(Type::OPEN_BRACKET);
        if (currentToken.type != Type::NUMBER)
            unexpected();
        operand.index = parseUnsigned();
        consume(Type::CLOSE_BRACKET);
    }
    return operand;
}

ConstOperand Parser::parseConstOperand()
{
    if (currentToken.type == Type::STRING) {
        std::string text(currentToken.value);
        if (text.empty() || text.size() > SWORD_LENGTH)
            throw Error(ErrorKind::ParseFailed, "an S-word holds one to four characters");
        consume(Type::STRING);
        return text;
    }
    auto number = parseSignedNumber();
    if (auto i = std::get_if<IntType>(&number))
        return *i;
    return std::get<FloatType>(number);
}

std::variant<IntType, FloatType> Parser::parseSignedNumber()
{
    if (currentToken.type != Type::PLUS && currentToken.type != Type::MINUS)
        unexpected();
    const bool negative = currentToken.type == Type::MINUS;
    Token previous = currentToken;
    consume(currentToken.type);

    auto follows = [&](Type type) {
        return currentToken.type == type && previous.touches(currentToken);
    };
    auto take = [&]() {
        previous = currentToken;
        consume(currentToken.type);
        return std::string(previous.value);
    };

    std::string integerPart;
    std::string fractionPart;
    std::string exponentPart;
    bool isFloat = false;

    if (follows(Type::NUMBER))
        integerPart = take();

    if (follows(Type::PERIOD)) {
        take();
        if (!follows(Type::NUMBER))
            throw Error(ErrorKind::ParseFailed, "expected digits after '.' at column " + std::to_string(currentToken.column + 1));
        fractionPart = take();
        isFloat = true;
    }

    if (integerPart.empty() && !isFloat)
        throw Error(ErrorKind::ParseFailed, "expected a number at column " + std::to_string(currentToken.column + 1));

    if (follows(Type::AT)) {
        take();
        if (follows(Type::PLUS) || follows(Type::MINUS))
            exponentPart = take();
        if (!follows(Type::NUMBER) || currentToken.value.size() > 2)
            throw Error(ErrorKind::ParseFailed, "an exponent has one or two digits");
        exponentPart += take();
        isFloat = true;
    }

    if (!isFloat) {
        try {
            IntType value = std::stoll(integerPart);
            return negative ? -value : value;
        } catch (const std::out_of_range&) {
            throw Error(ErrorKind::ParseFailed, "integer " + integerPart + " is too large");
        }
    }

    std::string text = (integerPart.empty() ? "0" : integerPart) + "." + (fractionPart.empty() ? "0" : fractionPart);
    if (!exponentPart.empty())
        text += "e" + exponentPart;
    try {
        FloatType value = std::stod(text);
        return negative ? -value : value;
    } catch (const std::out_of_range&) {
        throw Error(ErrorKind::ParseFailed, "number " + text + " is out of range");
    }
}

IntType Parser::parseUnsigned()
{
    std::string digits(currentToken.value);
    consume(Type::NUMBER);
    try {
        return std::stoll(digits);
    } catch (const std::out_of_range&) {
        throw Error(ErrorKind::ParseFailed, "number " + digits + " is too large");
    }
}

std::vector<ParsedLine> parseProgram(std::string_view text)
{
    std::vector<ParsedLine> lines;
    std::size_t lineNumber = 0;
    std::size_t start = 0;
    while (start < text.size()) {
        std::size_t end = text.find('\n', start);
        if (end == std::string_view::npos)
            end = text.size();

        ParsedLine parsed;
        parsed.lineNumber = ++lineNumber;
        parsed.text = std::string(text.substr(start, end - start));
        if (!parsed.text.empty() && parsed.text.back() == '\r')
            parsed.text.pop_back();

        try {
            parsed.line = Parser::parse(parsed.text);
        } catch (const Error& e) {
            if (e.kind() != ErrorKind::ParseFailed)
                throw;
            parsed.error = e.message();
        }
        lines.push_back(std::move(parsed));
        start = end + 1;
    }
    return lines;
}

std::vector<SourceLine> takeSourceLines(std::vector<ParsedLine>& lines)
{
    std::vector<std::string> offenders;
    for (const auto& parsed : lines) {
        if (parsed.failed())
            offenders.push_back("line " + std::to_string(parsed.lineNumber) + ": " + *parsed.error);
    }
    if (!offenders.empty())
        throw Error(ErrorKind::ParseFailed,
                    std::to_string(offenders.size()) + (offenders.size() == 1 ? " line" : " lines") + " failed to parse",
                    offenders);

    std::vector<SourceLine> source;
    for (auto& parsed : lines) {
        if (parsed.line)
            source.push_back(std::move(*parsed.line));
    }
    return source;
}

} // namespace bbcx
