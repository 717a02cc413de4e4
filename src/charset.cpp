#include "charset.hpp"

namespace bbcx {

namespace {

constexpr int X = CharSet::NO_CHARACTER;

// Inverse of CharSet::CODE_TO_CHAR, built once at compile time.
constexpr std::array<int, 256> makeCharToCode(const std::array<int, CharSet::CODE_COUNT>& codes)
{
    std::array<int, 256> table{};
    for (auto& entry : table)
        entry = X;
    for (std::size_t code = 0; code < codes.size(); ++code) {
        if (codes[code] != X)
            table[static_cast<unsigned char>(codes[code])] = static_cast<int>(code);
    }
    return table;
}

} // namespace

const std::array<int, CharSet::CODE_COUNT> CharSet::CODE_TO_CHAR = {
    '\0', 'A',  'B',  'C',  'D',  'E',  'F',  'G',   // 00
    'H',  'I',  'J',  'K',  'L',  'M',  'N',  'O',   // 10
    'P',  'Q',  'R',  'S',  'T',  'U',  'V',  'W',   // 20
    'X',  'Y',  'Z',  '\'', '<',  '>',  X,    X,     // 30: <= and >= are not representable
    '0',  '1',  '2',  '3',  '4',  '5',  '6',  '7',   // 40
    '8',  '9',  '.',  '@',  '+',  '-',  '(',  ')',   // 50
    '[',  ']',  '*',  '/',  '=',  X,    '^',  X,     // 60: not-equal and left-arrow are not representable
    '?',  '"',  ':',  ';',  ',',  ' ',  '\n', X,     // 70
};

std::optional<uint8_t> CharSet::toCode(char c)
{
    static const std::array<int, 256> CHAR_TO_CODE = makeCharToCode(CODE_TO_CHAR);
    int code = CHAR_TO_CODE[static_cast<unsigned char>(c)];
    if (code == X)
        return std::nullopt;
    return static_cast<uint8_t>(code);
}

std::optional<char> CharSet::toChar(uint8_t code)
{
    if (code >= CODE_COUNT || CODE_TO_CHAR[code] == X)
        return std::nullopt;
    return static_cast<char>(CODE_TO_CHAR[code]);
}

} // namespace bbcx
