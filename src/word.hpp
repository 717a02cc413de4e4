/**
 * @file word.hpp
 * @brief The BBC-X 24-bit machine word.
 *
 * A word is a tag plus 24 raw bits. The tag selects one of four
 * interpretations of the bits:
 *
 * - I-word: two's-complement signed integer, range [-2^23, 2^23 - 1]
 * - F-word: sign (1 bit), biased exponent (7 bits, bias 63), mantissa (16 bits)
 *           with a hidden leading 1. All-zero bits are 0.0.
 * - S-word: four 6-bit character codes, first character most significant
 * - P-word: a packed instruction (see instruction.hpp)
 *
 * An Undefined word has no bits. Bitwise operations work on the raw bits of
 * any defined word and keep the left operand's tag; arithmetic is defined for
 * I and F words only and promotes to floating point when either side is F.
 */

#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace bbcx {

using RawBits = uint32_t;
using DoubleRawBits = uint64_t;
using IntType = int64_t;
using FloatType = double;

// =============================================================================
// WORD GEOMETRY
// =============================================================================

constexpr unsigned WORD_SIZE = 24;
constexpr RawBits WORD_MASK = 077777777;
constexpr RawBits WORD_SIGN_MASK = 040000000;

constexpr unsigned DOUBLE_WORD_SIZE = 2 * WORD_SIZE;
constexpr DoubleRawBits DOUBLE_WORD_MASK = (DoubleRawBits{1} << DOUBLE_WORD_SIZE) - 1;

constexpr IntType IWORD_MIN = -(IntType{1} << (WORD_SIZE - 1));
constexpr IntType IWORD_MAX = (IntType{1} << (WORD_SIZE - 1)) - 1;

// =============================================================================
// F-WORD LAYOUT
// =============================================================================

constexpr RawBits FWORD_SIGN_MASK = 040000000;
constexpr RawBits FWORD_EXPONENT_MASK = 037600000;
constexpr RawBits FWORD_MANTISSA_MASK = 000177777;
constexpr unsigned FWORD_EXPONENT_SHIFT = 16;
constexpr unsigned FWORD_MANTISSA_BITS = 16;
constexpr int FWORD_EXPONENT_BIAS = 63;

// Exponent field 0 is kept for the all-zero encoding of 0.0.
constexpr int FWORD_EXPONENT_MIN = 1 - FWORD_EXPONENT_BIAS;
constexpr int FWORD_EXPONENT_MAX = 63;

// =============================================================================
// S-WORD LAYOUT
// =============================================================================

constexpr std::size_t SWORD_LENGTH = 4;
constexpr unsigned SWORD_CHARACTER_BITS = 6;

enum class WordType
{
    Undefined,
    IWord,
    FWord,
    SWord,
    PWord,
};

std::string_view to_string(WordType type);

class Word
{
    WordType wordType = WordType::Undefined;
    RawBits raw = 0;

public:
    constexpr Word() = default;
    constexpr Word(WordType type, RawBits bits)
        : wordType(type), raw(type == WordType::Undefined ? 0 : bits & WORD_MASK) {}

    // --- Encoders ---
    // fromInteger() rejects values outside the I-word range, wrapInteger()
    // keeps the low 24 bits.
    static Word fromInteger(IntType value);
    static Word wrapInteger(IntType value);
    static Word fromFloat(FloatType value);
    static Word fromString(std::string_view text);

    WordType type() const { return wordType; }
    RawBits bits() const { return raw; }

    bool isUndefined() const { return wordType == WordType::Undefined; }
    bool isInteger() const { return wordType == WordType::IWord; }
    bool isFloat() const { return wordType == WordType::FWord; }
    bool isString() const { return wordType == WordType::SWord; }
    bool isInstruction() const { return wordType == WordType::PWord; }
    bool isNumeric() const { return isInteger() || isFloat(); }

    // --- Decoders: read the raw bits with a given interpretation ---
    IntType integerValue() const;
    FloatType floatValue() const;
    std::string stringValue() const;

    // --- Numeric views: I or F only ---
    IntType toInteger() const;
    FloatType toFloat() const;

    // --- Arithmetic ---
    Word operator+(const Word& rhs) const;
    Word operator-(const Word& rhs) const;
    Word operator*(const Word& rhs) const;
    Word operator/(const Word& rhs) const;
    Word operator-() const;
    Word power(const Word& exponent) const;

    // --- Bitwise ---
    Word operator|(const Word& rhs) const;
    Word operator^(const Word& rhs) const;
    Word operator&(const Word& rhs) const;
    Word operator~() const;
    Word shiftLeft(IntType count) const;
    Word rotateLeft(IntType count) const;

    // --- Comparison ---
    // compare() orders numeric words; sameValue() also accepts S and P words,
    // which are equal when tag and bits are equal.
    int compare(const Word& rhs) const;
    bool sameValue(const Word& rhs) const;

    // --- Type introspection ---
    IntType typeCode() const;
    Word bitsAsInteger() const;
    Word withTypeCode(IntType code) const;
    Word withType(WordType type) const { return Word(type, raw); }

    bool operator==(const Word& rhs) const { return wordType == rhs.wordType && raw == rhs.raw; }
    bool operator!=(const Word& rhs) const { return !(*this == rhs); }

    std::string to_string() const;
};

/**
 * @brief The accumulator pair (acc - 1, acc) seen as one 48-bit value.
 *
 * The high half is the most significant. Shifts and rotates keep the tag of
 * each half; multiply and divide produce two I-words.
 */
struct DoubleWord
{
    Word high;
    Word low;

    DoubleRawBits bits() const;
    IntType value() const;

    DoubleWord shiftLeft(IntType count) const;
    DoubleWord rotateLeft(IntType count) const;
    DoubleWord multiply(const Word& operand) const;
    DoubleWord divide(const Word& operand) const;

    // Low 24 bits of the pair, tagged like the low half.
    Word squash() const;

    static DoubleWord fromValue(IntType value);
};

} // namespace bbcx
