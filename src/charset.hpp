#pragma once
#include <array>
#include <cstdint>
#include <optional>

namespace bbcx {

/**
 * @brief The BBC-X 6-bit character set.
 *
 * Codes 30, 31, 53, 55 and 63 are reserved and have no byte. Lower-case
 * letters are not part of the set.
 */
class CharSet
{
public:
    static constexpr std::size_t CODE_COUNT = 64;
    static constexpr uint8_t CODE_MASK = 077;
    static constexpr int NO_CHARACTER = -1;

    static std::optional<uint8_t> toCode(char c);
    static std::optional<char> toChar(uint8_t code);

    static bool contains(char c) { return toCode(c).has_value(); }

private:
    static const std::array<int, CODE_COUNT> CODE_TO_CHAR;
};

} // namespace bbcx
