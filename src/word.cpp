#include "word.hpp"
#include "charset.hpp"
#include "error.hpp"
#include <algorithm>
#include <bit>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace bbcx {

namespace {

IntType signExtend(RawBits bits)
{
    IntType value = static_cast<IntType>(bits & WORD_MASK);
    return (bits & WORD_SIGN_MASK) ? value - (IntType{1} << WORD_SIZE) : value;
}

IntType signExtendDouble(DoubleRawBits bits)
{
    bits &= DOUBLE_WORD_MASK;
    IntType value = static_cast<IntType>(bits);
    return (bits >> (DOUBLE_WORD_SIZE - 1)) ? value - (IntType{1} << DOUBLE_WORD_SIZE) : value;
}

void requireDefined(const Word& word, const char* operation)
{
    if (word.isUndefined())
        throw Error(ErrorKind::InvalidOperand, std::string(operation) + " on an undefined word");
}

void requireNumeric(const Word& lhs, const Word& rhs, const char* operation)
{
    requireDefined(lhs, operation);
    requireDefined(rhs, operation);
    if (!lhs.isNumeric() || !rhs.isNumeric()) {
        throw Error(ErrorKind::ArithmeticTypeMismatch,
                    std::string(operation) + " not supported between " +
                        std::string(to_string(lhs.type())) + " and " + std::string(to_string(rhs.type())));
    }
}

std::string describe(FloatType value)
{
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

} // namespace

std::string_view to_string(WordType type)
{
    switch (type) {
        case WordType::Undefined: return "Undefined";
        case WordType::IWord: return "I-word";
        case WordType::FWord: return "F-word";
        case WordType::SWord: return "S-word";
        case WordType::PWord: return "P-word";
    }
    return "Unknown";
}

// =============================================================================
// ENCODERS
// =============================================================================

Word Word::fromInteger(IntType value)
{
    if (value < IWORD_MIN || value > IWORD_MAX)
        throw Error(ErrorKind::InvalidIWordValue, "cannot create I-word from " + std::to_string(value));
    return wrapInteger(value);
}

Word Word::wrapInteger(IntType value)
{
    return Word(WordType::IWord, static_cast<RawBits>(static_cast<uint64_t>(value) & WORD_MASK));
}

Word Word::fromFloat(FloatType value)
{
    if (value == 0.0)
        return Word(WordType::FWord, 0);
    if (!std::isfinite(value))
        throw Error(ErrorKind::InvalidFWordValue, "cannot create F-word from " + describe(value));

    const auto ieee = std::bit_cast<uint64_t>(value);
    const RawBits sign = static_cast<RawBits>(ieee >> 63);
    int exponent = static_cast<int>((ieee >> 52) & 03777) - 1023;
    const uint64_t fraction = ieee & ((uint64_t{1} << 52) - 1);

    // Keep the top 16 fraction bits, rounding to nearest.
    constexpr unsigned DROPPED = 52 - FWORD_MANTISSA_BITS;
    uint64_t mantissa = (fraction + (uint64_t{1} << (DROPPED - 1))) >> DROPPED;
    if (mantissa == (uint64_t{1} << FWORD_MANTISSA_BITS)) {
        mantissa = 0;
        ++exponent;
    }

    if (exponent < FWORD_EXPONENT_MIN || exponent > FWORD_EXPONENT_MAX)
        throw Error(ErrorKind::InvalidFWordValue, "cannot create F-word from " + describe(value));

    const RawBits biased = static_cast<RawBits>(exponent + FWORD_EXPONENT_BIAS);
    return Word(WordType::FWord,
                (sign << (WORD_SIZE - 1)) | (biased << FWORD_EXPONENT_SHIFT) | static_cast<RawBits>(mantissa));
}

Word Word::fromString(std::string_view text)
{
    if (text.size() > SWORD_LENGTH)
        throw Error(ErrorKind::InvalidSWordValue,
                    "cannot create S-word from \"" + std::string(text) + "\": more than 4 characters");

    RawBits bits = 0;
    for (std::size_t i = 0; i < SWORD_LENGTH; ++i) {
        uint8_t code = 0;
        if (i < text.size()) {
            auto mapped = CharSet::toCode(text[i]);
            if (!mapped)
                throw Error(ErrorKind::InvalidSWordValue,
                            "cannot create S-word from \"" + std::string(text) + "\": invalid character");
            code = *mapped;
        }
        bits = (bits << SWORD_CHARACTER_BITS) | code;
    }
    return Word(WordType::SWord, bits);
}

// =============================================================================
// DECODERS
// =============================================================================

IntType Word::integerValue() const
{
    return signExtend(raw);
}

FloatType Word::floatValue() const
{
    if (raw == 0)
        return 0.0;

    const FloatType sign = (raw & FWORD_SIGN_MASK) ? -1.0 : 1.0;
    const int exponent = static_cast<int>((raw & FWORD_EXPONENT_MASK) >> FWORD_EXPONENT_SHIFT) - FWORD_EXPONENT_BIAS;
    const FloatType mantissa = static_cast<FloatType>(raw & FWORD_MANTISSA_MASK) /
                               static_cast<FloatType>(1u << FWORD_MANTISSA_BITS);
    return sign * std::ldexp(1.0 + mantissa, exponent);
}

std::string Word::stringValue() const
{
    std::string text(SWORD_LENGTH, '\0');
    for (std::size_t i = 0; i < SWORD_LENGTH; ++i) {
        const unsigned shift = static_cast<unsigned>(SWORD_LENGTH - 1 - i) * SWORD_CHARACTER_BITS;
        const uint8_t code = static_cast<uint8_t>((raw >> shift) & CharSet::CODE_MASK);
        auto c = CharSet::toChar(code);
        if (!c)
            throw Error(ErrorKind::InvalidSWordValue, "unknown character code " + std::to_string(code));
        text[i] = *c;
    }
    return text;
}

IntType Word::toInteger() const
{
    if (isInteger())
        return integerValue();
    if (isFloat()) {
        // F-words reach far past the I-word range; saturate instead.
        const FloatType value = std::trunc(floatValue());
        return static_cast<IntType>(std::clamp(value, static_cast<FloatType>(IWORD_MIN),
                                               static_cast<FloatType>(IWORD_MAX)));
    }
    requireDefined(*this, "integer conversion");
    throw Error(ErrorKind::ArithmeticTypeMismatch,
                "cannot read " + std::string(bbcx::to_string(wordType)) + " as a number");
}

FloatType Word::toFloat() const
{
    if (isFloat())
        return floatValue();
    if (isInteger())
        return static_cast<FloatType>(integerValue());
    requireDefined(*this, "float conversion");
    throw Error(ErrorKind::ArithmeticTypeMismatch,
                "cannot read " + std::string(bbcx::to_string(wordType)) + " as a number");
}

// =============================================================================
// ARITHMETIC
// =============================================================================

Word Word::operator+(const Word& rhs) const
{
    requireNumeric(*this, rhs, "ADD");
    if (isInteger() && rhs.isInteger())
        return wrapInteger(integerValue() + rhs.integerValue());
    return fromFloat(toFloat() + rhs.toFloat());
}

Word Word::operator-(const Word& rhs) const
{
    requireNumeric(*this, rhs, "SUBT");
    if (isInteger() && rhs.isInteger())
        return wrapInteger(integerValue() - rhs.integerValue());
    return fromFloat(toFloat() - rhs.toFloat());
}

Word Word::operator*(const Word& rhs) const
{
    requireNumeric(*this, rhs, "MULT");
    if (isInteger() && rhs.isInteger())
        return wrapInteger(integerValue() * rhs.integerValue());
    return fromFloat(toFloat() * rhs.toFloat());
}

Word Word::operator/(const Word& rhs) const
{
    requireNumeric(*this, rhs, "DVD");
    if (rhs.toFloat() == 0.0)
        throw Error(ErrorKind::DivisionByZero, "division of " + to_string() + " by zero");
    if (isInteger() && rhs.isInteger())
        return wrapInteger(integerValue() / rhs.integerValue());
    return fromFloat(toFloat() / rhs.toFloat());
}

Word Word::operator-() const
{
    requireDefined(*this, "NEG");
    if (isInteger())
        return wrapInteger(-integerValue());
    if (isFloat())
        return raw == 0 ? Word(WordType::FWord, 0) : Word(WordType::FWord, raw ^ FWORD_SIGN_MASK);
    throw Error(ErrorKind::ArithmeticTypeMismatch,
                "NEG not supported for " + std::string(bbcx::to_string(wordType)));
}

Word Word::power(const Word& exponent) const
{
    requireNumeric(*this, exponent, "POWR");
    if (exponent.toFloat() == 0.0)
        return wrapInteger(1);

    if (isInteger() && exponent.isInteger()) {
        IntType base = integerValue();
        IntType n = exponent.integerValue();
        if (n < 0) {
            if (base == 0)
                throw Error(ErrorKind::DivisionByZero, "zero raised to a negative power");
            return wrapInteger(static_cast<IntType>(std::trunc(std::pow(static_cast<FloatType>(base),
                                                                        static_cast<FloatType>(n)))));
        }
        // Square and multiply, wrapping to 24 bits at each step.
        IntType result = 1;
        while (n > 0) {
            if (n & 1)
                result = signExtend(static_cast<RawBits>(static_cast<uint64_t>(result * base) & WORD_MASK));
            base = signExtend(static_cast<RawBits>(static_cast<uint64_t>(base * base) & WORD_MASK));
            n >>= 1;
        }
        return wrapInteger(result);
    }
    return fromFloat(std::pow(toFloat(), exponent.toFloat()));
}

// =============================================================================
// BITWISE
// =============================================================================

Word Word::operator|(const Word& rhs) const
{
    requireDefined(*this, "OR");
    requireDefined(rhs, "OR");
    return Word(wordType, raw | rhs.raw);
}

Word Word::operator^(const Word& rhs) const
{
    requireDefined(*this, "NEQV");
    requireDefined(rhs, "NEQV");
    return Word(wordType, raw ^ rhs.raw);
}

Word Word::operator&(const Word& rhs) const
{
    requireDefined(*this, "AND");
    requireDefined(rhs, "AND");
    return Word(wordType, raw & rhs.raw);
}

Word Word::operator~() const
{
    requireDefined(*this, "NOT");
    return Word(wordType, ~raw);
}

Word Word::shiftLeft(IntType count) const
{
    requireDefined(*this, "SHL");
    if (count >= 0) {
        if (count >= static_cast<IntType>(WORD_SIZE))
            return Word(wordType, 0);
        return Word(wordType, raw << count);
    }
    // Negative counts shift right, copying the sign bit.
    const IntType places = count < -static_cast<IntType>(WORD_SIZE) ? WORD_SIZE : -count;
    const IntType value = integerValue();
    if (places >= static_cast<IntType>(WORD_SIZE))
        return Word(wordType, value < 0 ? WORD_MASK : 0);
    return Word(wordType, static_cast<RawBits>(static_cast<uint64_t>(value >> places) & WORD_MASK));
}

Word Word::rotateLeft(IntType count) const
{
    requireDefined(*this, "ROT");
    const IntType size = WORD_SIZE;
    const unsigned n = static_cast<unsigned>(((count % size) + size) % size);
    if (n == 0)
        return *this;
    return Word(wordType, (raw << n) | (raw >> (WORD_SIZE - n)));
}

// =============================================================================
// COMPARISON
// =============================================================================

int Word::compare(const Word& rhs) const
{
    requireNumeric(*this, rhs, "comparison");
    if (isInteger() && rhs.isInteger()) {
        const IntType lhsValue = integerValue();
        const IntType rhsValue = rhs.integerValue();
        return (lhsValue > rhsValue) - (lhsValue < rhsValue);
    }
    const FloatType lhsValue = toFloat();
    const FloatType rhsValue = rhs.toFloat();
    return (lhsValue > rhsValue) - (lhsValue < rhsValue);
}

bool Word::sameValue(const Word& rhs) const
{
    requireDefined(*this, "comparison");
    requireDefined(rhs, "comparison");
    if (isNumeric() && rhs.isNumeric())
        return compare(rhs) == 0;
    return *this == rhs;
}

// =============================================================================
// TYPE INTROSPECTION
// =============================================================================

IntType Word::typeCode() const
{
    switch (wordType) {
        case WordType::IWord: return 0;
        case WordType::FWord: return 1;
        case WordType::SWord: return 2;
        case WordType::PWord: return 3;
        case WordType::Undefined: break;
    }
    throw Error(ErrorKind::InvalidOperand, "an undefined word has no type");
}

Word Word::bitsAsInteger() const
{
    requireDefined(*this, "TTYZ");
    return Word(WordType::IWord, raw);
}

Word Word::withTypeCode(IntType code) const
{
    static constexpr WordType TYPES[] = {WordType::IWord, WordType::FWord, WordType::SWord, WordType::PWord};
    return Word(TYPES[static_cast<uint64_t>(code) & 03], raw);
}

std::string Word::to_string() const
{
    std::ostringstream oss;
    switch (wordType) {
        case WordType::Undefined:
            break;
        case WordType::IWord:
            oss << std::showpos << integerValue();
            break;
        case WordType::FWord: {
            oss << std::showpos << floatValue();
            std::string text = oss.str();
            auto e = text.find('e');
            if (e != std::string::npos)
                text[e] = '@';
            return text;
        }
        case WordType::SWord: {
            std::string text;
            for (std::size_t i = 0; i < SWORD_LENGTH; ++i) {
                const unsigned shift = static_cast<unsigned>(SWORD_LENGTH - 1 - i) * SWORD_CHARACTER_BITS;
                auto c = CharSet::toChar(static_cast<uint8_t>((raw >> shift) & CharSet::CODE_MASK));
                text += (c && *c != '\0') ? *c : ' ';
            }
            oss << '"' << text << '"';
            break;
        }
        case WordType::PWord:
            oss << std::oct << std::setw(8) << std::setfill('0') << raw;
            break;
    }
    return oss.str();
}

// =============================================================================
// DOUBLE LENGTH
// =============================================================================

DoubleRawBits DoubleWord::bits() const
{
    return (static_cast<DoubleRawBits>(high.bits()) << WORD_SIZE) | low.bits();
}

IntType DoubleWord::value() const
{
    return signExtendDouble(bits());
}

DoubleWord DoubleWord::fromValue(IntType value)
{
    const DoubleRawBits bits = static_cast<DoubleRawBits>(value) & DOUBLE_WORD_MASK;
    return DoubleWord{Word(WordType::IWord, static_cast<RawBits>(bits >> WORD_SIZE)),
                      Word(WordType::IWord, static_cast<RawBits>(bits & WORD_MASK))};
}

DoubleWord DoubleWord::shiftLeft(IntType count) const
{
    requireDefined(high, "DSHL");
    requireDefined(low, "DSHL");
    DoubleRawBits shifted = 0;
    if (count >= 0) {
        shifted = count >= static_cast<IntType>(DOUBLE_WORD_SIZE) ? 0 : (bits() << count) & DOUBLE_WORD_MASK;
    } else {
        const IntType places = count < -static_cast<IntType>(DOUBLE_WORD_SIZE) ? DOUBLE_WORD_SIZE - 1
                                                                               : std::min<IntType>(-count, DOUBLE_WORD_SIZE - 1);
        shifted = static_cast<DoubleRawBits>(value() >> places) & DOUBLE_WORD_MASK;
    }
    return DoubleWord{Word(high.type(), static_cast<RawBits>(shifted >> WORD_SIZE)),
                      Word(low.type(), static_cast<RawBits>(shifted & WORD_MASK))};
}

DoubleWord DoubleWord::rotateLeft(IntType count) const
{
    requireDefined(high, "DROT");
    requireDefined(low, "DROT");
    const IntType size = DOUBLE_WORD_SIZE;
    const unsigned n = static_cast<unsigned>(((count % size) + size) % size);
    DoubleRawBits rotated = bits();
    if (n != 0)
        rotated = ((rotated << n) | (rotated >> (DOUBLE_WORD_SIZE - n))) & DOUBLE_WORD_MASK;
    return DoubleWord{Word(high.type(), static_cast<RawBits>(rotated >> WORD_SIZE)),
                      Word(low.type(), static_cast<RawBits>(rotated & WORD_MASK))};
}

DoubleWord DoubleWord::multiply(const Word& operand) const
{
    requireNumeric(high, low, "DMULT");
    if (!high.isInteger() || !low.isInteger() || !operand.isInteger()) {
        requireDefined(operand, "DMULT");
        throw Error(ErrorKind::ArithmeticTypeMismatch, "DMULT requires I-words");
    }
    // Wrapping multiply: anything above 48 bits is discarded.
    const uint64_t product = static_cast<uint64_t>(value()) * static_cast<uint64_t>(operand.integerValue());
    return fromValue(static_cast<IntType>(product));
}

DoubleWord DoubleWord::divide(const Word& operand) const
{
    requireNumeric(high, low, "DDIV");
    if (!high.isInteger() || !low.isInteger() || !operand.isInteger()) {
        requireDefined(operand, "DDIV");
        throw Error(ErrorKind::ArithmeticTypeMismatch, "DDIV requires I-words");
    }
    if (operand.integerValue() == 0)
        throw Error(ErrorKind::DivisionByZero, "double length division by zero");
    return fromValue(value() / operand.integerValue());
}

Word DoubleWord::squash() const
{
    requireDefined(low, "PSQU");
    return Word(low.type(), static_cast<RawBits>(bits() & WORD_MASK));
}

} // namespace bbcx
