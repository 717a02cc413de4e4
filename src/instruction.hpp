/**
 * @file instruction.hpp
 * @brief BBC-X function codes and the packed P-word instruction.
 *
 * P-word layout (bit 0 is least significant):
 *
 *   | 23..18   | 17..15 | 14..12 | 11       | 10   | 9..0    |
 *   | function | acc    | index  | indirect | page | address |
 */

#pragma once
#include "word.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace bbcx {

// =============================================================================
// P-WORD LAYOUT
// =============================================================================

constexpr RawBits PWORD_FUNCTION_MASK = 077000000;
constexpr RawBits PWORD_ACCUMULATOR_MASK = 000700000;
constexpr RawBits PWORD_INDEX_REGISTER_MASK = 000070000;
constexpr RawBits PWORD_INDIRECT_MASK = 000004000;
constexpr RawBits PWORD_PAGE_MASK = 000002000;
constexpr RawBits PWORD_ADDRESS_MASK = 000001777;

constexpr unsigned PWORD_FUNCTION_SHIFT = 18;
constexpr unsigned PWORD_ACCUMULATOR_SHIFT = 15;
constexpr unsigned PWORD_INDEX_REGISTER_SHIFT = 12;
constexpr unsigned PWORD_INDIRECT_SHIFT = 11;
constexpr unsigned PWORD_PAGE_SHIFT = 10;

constexpr unsigned MAX_ACCUMULATOR = 7;
constexpr unsigned MAX_INDEX_REGISTER = 7;
constexpr unsigned MAX_ADDRESS = PWORD_ADDRESS_MASK;

constexpr unsigned DEFAULT_ACCUMULATOR = 1;

// The ordinal is the 6-bit function code.
enum class Function : uint8_t
{
    NIL, OR, NEQV, AND, ADD, SUBT, MULT, DVD,
    TAKE, TSTR, TNEG, TNOT, TTYP, TTYZ, TTTT, TOUT,
    SKIP, SKAE, SKAN, SKET, SKAL, SKAG, SKED, SKEI,
    SHL, ROT, DSHL, DROT, POWR, DMULT, DIV, DDIV,
    NILX, ORX, NEQVX, ANDX, ADDX, SUBTX, MULTX, DVDX,
    PUT, PSQU, PNEG, PNOT, PTYP, PTYZ, PFFP, PIN,
    JUMP, JEZ, JNZ, JAT, JLZ, JGZ, JZD, JZI,
    DECR, INCR, MOCKP, MOCKS, DBYTE, UNUSED, EXEC, EXTRA,
};

constexpr std::size_t FUNCTION_COUNT = 64;

// Library routines are called through EXTRA; the routine code sits in the
// address field.
enum class LibraryRoutine : uint8_t
{
    NONE = 0,
    SQRT, LN, EXP, READ, PRINT, SIN, COS, TAN, ATN,
    STOP, LINE, INT, FRAC, FLOAT, CAPTN, PAGE, RND, ABS,
};

constexpr std::size_t LIBRARY_ROUTINE_COUNT = 19;

/**
 * @brief What a source mnemonic stands for.
 *
 * Plain mnemonics and their synonyms map to a function; library names map to
 * EXTRA plus a routine.
 */
struct Mnemonic
{
    Function function;
    LibraryRoutine routine = LibraryRoutine::NONE;

    bool isLibraryRoutine() const { return routine != LibraryRoutine::NONE; }
};

std::optional<Mnemonic> lookupMnemonic(std::string_view name);

std::string_view to_string(Function function);
std::string_view to_string(LibraryRoutine routine);

struct Instruction
{
    Function function = Function::NIL;
    unsigned accumulator = DEFAULT_ACCUMULATOR;
    unsigned indexRegister = 0;
    bool indirect = false;
    unsigned page = 0;
    unsigned address = 0;

    // Throws InvalidOperand when a field does not fit its mask.
    Word encode() const;

    // Throws CannotConvertWordToInstruction for anything but a P-word.
    static Instruction decode(const Word& word);

    bool operator==(const Instruction& other) const = default;

    std::string to_string() const;
};

} // namespace bbcx
