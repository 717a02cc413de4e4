#include "instruction.hpp"
#include "error.hpp"
#include <array>
#include <map>
#include <sstream>

namespace bbcx {

namespace {

constexpr std::array<std::string_view, FUNCTION_COUNT> FUNCTION_NAMES = {
    "NIL",  "OR",   "NEQV",  "AND",  "ADD",   "SUBT",   "MULT", "DVD",
    "TAKE", "TSTR", "TNEG",  "TNOT", "TTYP",  "TTYZ",   "TTTT", "TOUT",
    "SKIP", "SKAE", "SKAN",  "SKET", "SKAL",  "SKAG",   "SKED", "SKEI",
    "SHL",  "ROT",  "DSHL",  "DROT", "POWR",  "DMULT",  "DIV",  "DDIV",
    "NILX", "ORX",  "NEQVX", "ANDX", "ADDX",  "SUBTX",  "MULTX", "DVDX",
    "PUT",  "PSQU", "PNEG",  "PNOT", "PTYP",  "PTYZ",   "PFFP", "PIN",
    "JUMP", "JEZ",  "JNZ",   "JAT",  "JLZ",   "JGZ",    "JZD",  "JZI",
    "DECR", "INCR", "MOCKP", "MOCKS", "DBYTE", "UNUSED", "EXEC", "EXTRA",
};

constexpr std::array<std::string_view, LIBRARY_ROUTINE_COUNT> ROUTINE_NAMES = {
    "",     "SQRT", "LN",   "EXP",   "READ",  "PRINT", "SIN",
    "COS",  "TAN",  "ATN",  "STOP",  "LINE",  "INT",   "FRAC",
    "FLOAT", "CAPTN", "PAGE", "RND", "ABS",
};

std::map<std::string_view, Mnemonic> buildMnemonicTable()
{
    std::map<std::string_view, Mnemonic> table;
    for (std::size_t code = 0; code < FUNCTION_COUNT; ++code)
        table.emplace(FUNCTION_NAMES[code], Mnemonic{static_cast<Function>(code)});

    table.emplace("NTHG", Mnemonic{Function::NIL});
    table.emplace("MPLY", Mnemonic{Function::MULT});
    table.emplace("MPLYX", Mnemonic{Function::MULTX});
    table.emplace("SWAP", Mnemonic{Function::NILX});

    for (std::size_t code = 1; code < LIBRARY_ROUTINE_COUNT; ++code)
        table.emplace(ROUTINE_NAMES[code], Mnemonic{Function::EXTRA, static_cast<LibraryRoutine>(code)});
    return table;
}

void checkField(const char* name, unsigned value, unsigned max)
{
    if (value > max)
        throw Error(ErrorKind::InvalidOperand,
                    std::string(name) + " " + std::to_string(value) + " out of range 0.." + std::to_string(max));
}

} // namespace

std::optional<Mnemonic> lookupMnemonic(std::string_view name)
{
    static const std::map<std::string_view, Mnemonic> TABLE = buildMnemonicTable();
    auto it = TABLE.find(name);
    if (it == TABLE.end())
        return std::nullopt;
    return it->second;
}

std::string_view to_string(Function function)
{
    return FUNCTION_NAMES[static_cast<std::size_t>(function) % FUNCTION_COUNT];
}

std::string_view to_string(LibraryRoutine routine)
{
    return ROUTINE_NAMES[static_cast<std::size_t>(routine) % LIBRARY_ROUTINE_COUNT];
}

Word Instruction::encode() const
{
    checkField("accumulator", accumulator, MAX_ACCUMULATOR);
    checkField("index register", indexRegister, MAX_INDEX_REGISTER);
    checkField("page", page, 1);
    checkField("address", address, MAX_ADDRESS);

    RawBits bits = (static_cast<RawBits>(function) << PWORD_FUNCTION_SHIFT) |
                   (accumulator << PWORD_ACCUMULATOR_SHIFT) |
                   (indexRegister << PWORD_INDEX_REGISTER_SHIFT) |
                   (static_cast<RawBits>(indirect) << PWORD_INDIRECT_SHIFT) |
                   (page << PWORD_PAGE_SHIFT) |
                   address;
    return Word(WordType::PWord, bits);
}

Instruction Instruction::decode(const Word& word)
{
    if (!word.isInstruction())
        throw Error(ErrorKind::CannotConvertWordToInstruction,
                    "cannot decode " + std::string(bbcx::to_string(word.type())) + " as an instruction");

    const RawBits bits = word.bits();
    Instruction instruction;
    instruction.function = static_cast<Function>((bits & PWORD_FUNCTION_MASK) >> PWORD_FUNCTION_SHIFT);
    instruction.accumulator = (bits & PWORD_ACCUMULATOR_MASK) >> PWORD_ACCUMULATOR_SHIFT;
    instruction.indexRegister = (bits & PWORD_INDEX_REGISTER_MASK) >> PWORD_INDEX_REGISTER_SHIFT;
    instruction.indirect = (bits & PWORD_INDIRECT_MASK) != 0;
    instruction.page = (bits & PWORD_PAGE_MASK) >> PWORD_PAGE_SHIFT;
    instruction.address = bits & PWORD_ADDRESS_MASK;
    return instruction;
}

std::string Instruction::to_string() const
{
    std::ostringstream oss;
    if (function == Function::EXTRA && address > 0 && address < LIBRARY_ROUTINE_COUNT) {
        oss << bbcx::to_string(static_cast<LibraryRoutine>(address)) << ' ' << accumulator;
        return oss.str();
    }
    oss << bbcx::to_string(function) << ' ' << accumulator << ", ";
    if (indirect)
        oss << '*';
    oss << address;
    if (indexRegister != 0)
        oss << '[' << indexRegister << ']';
    return oss.str();
}

} // namespace bbcx
