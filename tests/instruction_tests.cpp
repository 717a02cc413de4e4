#include "test_helpers.hpp"
#include "../src/instruction.hpp"

using namespace bbcx;

namespace {

struct MnemonicExpectation {
    std::string name;
    Function function;
    LibraryRoutine routine = LibraryRoutine::NONE;
};

void expect_mnemonic(const MnemonicExpectation& expected) {
    auto meaning = lookupMnemonic(expected.name);
    ASSERT_TRUE(meaning.has_value()) << expected.name;
    EXPECT_EQ(meaning->function, expected.function) << expected.name;
    EXPECT_EQ(meaning->routine, expected.routine) << expected.name;
}

} // namespace

TEST(InstructionTests, FunctionCodesAreOrdinals) {
    EXPECT_EQ(static_cast<int>(Function::NIL), 0);
    EXPECT_EQ(static_cast<int>(Function::TAKE), 8);
    EXPECT_EQ(static_cast<int>(Function::DMULT), 29);
    EXPECT_EQ(static_cast<int>(Function::PTYZ), 45);
    EXPECT_EQ(static_cast<int>(Function::JUMP), 48);
    EXPECT_EQ(static_cast<int>(Function::EXTRA), 63);

    for (std::size_t code = 0; code < FUNCTION_COUNT; ++code) {
        const auto function = static_cast<Function>(code);
        auto meaning = lookupMnemonic(to_string(function));
        ASSERT_TRUE(meaning.has_value()) << to_string(function);
        EXPECT_EQ(meaning->function, function);
    }
}

TEST(InstructionTests, SynonymsAndLibraryNames) {
    expect_mnemonic({"NTHG", Function::NIL});
    expect_mnemonic({"MPLY", Function::MULT});
    expect_mnemonic({"MPLYX", Function::MULTX});
    expect_mnemonic({"SWAP", Function::NILX});
    expect_mnemonic({"SQRT", Function::EXTRA, LibraryRoutine::SQRT});
    expect_mnemonic({"READ", Function::EXTRA, LibraryRoutine::READ});
    expect_mnemonic({"STOP", Function::EXTRA, LibraryRoutine::STOP});
    expect_mnemonic({"ABS", Function::EXTRA, LibraryRoutine::ABS});

    EXPECT_EQ(static_cast<int>(LibraryRoutine::RND), 17);
    EXPECT_FALSE(lookupMnemonic("FOO").has_value());
    EXPECT_FALSE(lookupMnemonic("add").has_value());
}

TEST(InstructionTests, EncodesFieldsIntoMasks) {
    Instruction instruction;
    instruction.function = Function::ADD;
    instruction.accumulator = 2;
    instruction.indexRegister = 3;
    instruction.indirect = true;
    instruction.page = 1;
    instruction.address = 0127;

    const Word word = instruction.encode();
    ASSERT_TRUE(word.isInstruction());
    EXPECT_EQ(word.bits(), 04236127u);
    EXPECT_EQ((word.bits() & PWORD_FUNCTION_MASK) >> PWORD_FUNCTION_SHIFT, 4u);
    EXPECT_EQ((word.bits() & PWORD_ACCUMULATOR_MASK) >> PWORD_ACCUMULATOR_SHIFT, 2u);
    EXPECT_EQ((word.bits() & PWORD_INDEX_REGISTER_MASK) >> PWORD_INDEX_REGISTER_SHIFT, 3u);
    EXPECT_EQ(word.bits() & PWORD_INDIRECT_MASK, PWORD_INDIRECT_MASK);
    EXPECT_EQ(word.bits() & PWORD_PAGE_MASK, PWORD_PAGE_MASK);
    EXPECT_EQ(word.bits() & PWORD_ADDRESS_MASK, 0127u);
}

TEST(InstructionTests, DecodeInvertsEncode) {
    for (std::size_t code = 0; code < FUNCTION_COUNT; code += 7) {
        Instruction instruction;
        instruction.function = static_cast<Function>(code);
        instruction.accumulator = code % 8;
        instruction.indexRegister = (code / 8) % 8;
        instruction.indirect = code % 2 == 1;
        instruction.page = code % 3 == 0 ? 1 : 0;
        instruction.address = static_cast<unsigned>(code * 13) % (MAX_ADDRESS + 1);

        EXPECT_EQ(Instruction::decode(instruction.encode()), instruction) << to_string(instruction.function);
    }
    EXPECT_EQ(Instruction::decode(Word(WordType::PWord, 077777777)).encode().bits(), 077777777u);
}

TEST(InstructionTests, RejectsFieldsThatDoNotFit) {
    expectError([] { Instruction{Function::ADD, 8}.encode(); }, ErrorKind::InvalidOperand);
    expectError([] { Instruction{Function::ADD, 1, 8}.encode(); }, ErrorKind::InvalidOperand);
    expectError([] { Instruction{Function::ADD, 1, 0, false, 2}.encode(); }, ErrorKind::InvalidOperand);
    expectError([] { Instruction{Function::ADD, 1, 0, false, 0, MAX_ADDRESS + 1}.encode(); }, ErrorKind::InvalidOperand);
}

TEST(InstructionTests, DecodeNeedsAPWord) {
    expectError([] { Instruction::decode(Word::fromInteger(5)); }, ErrorKind::CannotConvertWordToInstruction);
    expectError([] { Instruction::decode(Word()); }, ErrorKind::CannotConvertWordToInstruction);
}

TEST(InstructionTests, Rendering) {
    EXPECT_EQ((Instruction{Function::ADD, 1, 3, true, 0, 5}).to_string(), "ADD 1, *5[3]");
    EXPECT_EQ((Instruction{Function::TAKE, 2, 0, false, 0, 127}).to_string(), "TAKE 2, 127");
    EXPECT_EQ((Instruction{Function::EXTRA, 1, 0, false, 0, 1}).to_string(), "SQRT 1");
    EXPECT_EQ((Instruction{Function::EXTRA, 4, 0, false, 0, 99}).to_string(), "EXTRA 4, 99");
}
