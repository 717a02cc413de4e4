#include <gtest/gtest.h>
#include "../src/parser.hpp"
#include <vector>
#include <functional>
#include <stdexcept>
#include <string>

using namespace bbcx;

namespace {

struct AddressExpectation {
    std::variant<std::string, IntType> address;
    bool indirect = false;
    std::optional<IntType> index;
};

SourceLine parse_line(std::string_view source) {
    auto line = Parser::parse(source);
    if (!line)
        throw std::runtime_error("line produced no source word");
    return std::move(*line);
}

const PWordNode* expect_pword(const SourceLine& line, Function function, std::optional<unsigned> acc) {
    const auto* pword = dynamic_cast<const PWordNode*>(line.word.get());
    EXPECT_NE(pword, nullptr) << "Expected PWordNode";
    if (!pword)
        return nullptr;
    EXPECT_EQ(pword->meaning.function, function);
    EXPECT_EQ(pword->accumulator, acc);
    return pword;
}

void expect_address(const PWordNode* pword, const AddressExpectation& expected) {
    ASSERT_NE(pword, nullptr);
    const auto* operand = pword->addressOperand();
    ASSERT_NE(operand, nullptr) << "Expected an address operand";
    EXPECT_EQ(operand->address, expected.address);
    EXPECT_EQ(operand->indirect, expected.indirect);
    EXPECT_EQ(operand->index, expected.index);
}

void expect_constant(const PWordNode* pword, const ConstOperand& expected) {
    ASSERT_NE(pword, nullptr);
    const auto* operand = pword->constOperand();
    ASSERT_NE(operand, nullptr) << "Expected a constant operand";
    EXPECT_EQ(*operand, expected);
}

void expect_parse_failure(std::string_view source) {
    try {
        Parser::parse(source);
        ADD_FAILURE() << "Expected a ParseFailed error for: " << source;
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ParseFailed) << e.what();
    }
}

} // namespace

TEST(ParserTests, IntegerWord) {
    auto line = parse_line("0001 +12");
    EXPECT_EQ(line.location, 1u);
    EXPECT_FALSE(line.label.has_value());
    const auto* word = dynamic_cast<const IWordNode*>(line.word.get());
    ASSERT_NE(word, nullptr);
    EXPECT_EQ(word->value, 12);
}

TEST(ParserTests, NegativeIntegerWord) {
    auto line = parse_line("0002 -16000");
    const auto* word = dynamic_cast<const IWordNode*>(line.word.get());
    ASSERT_NE(word, nullptr);
    EXPECT_EQ(word->value, -16000);
}

TEST(ParserTests, FloatWordForms) {
    const std::vector<std::pair<std::string, FloatType>> cases = {
        {"0003 +3.14", 3.14},
        {"0003 -.5", -0.5},
        {"0003 -1@5", -1e5},
        {"0003 +1.5@-2", 1.5e-2},
        {"0003 +.25@+1", 2.5},
    };
    for (const auto& [source, expected] : cases) {
        auto line = parse_line(source);
        const auto* word = dynamic_cast<const FWordNode*>(line.word.get());
        ASSERT_NE(word, nullptr) << source;
        EXPECT_DOUBLE_EQ(word->value, expected) << source;
    }
}

TEST(ParserTests, StringWord) {
    auto line = parse_line("0004 \"AB C\"");
    const auto* word = dynamic_cast<const SWordNode*>(line.word.get());
    ASSERT_NE(word, nullptr);
    EXPECT_EQ(word->value, "AB C");
}

TEST(ParserTests, LabelAndComment) {
    auto line = parse_line("0100 START: TAKE 2, COUNT ;load");
    EXPECT_EQ(line.location, 100u);
    EXPECT_EQ(line.label, std::optional<std::string>("START"));
    EXPECT_EQ(line.comment, ";load");
    expect_address(expect_pword(line, Function::TAKE, 2u), {std::string("COUNT")});
}

TEST(ParserTests, DefaultAccumulatorIsLeftUnset) {
    auto line = parse_line("0100 ADD 110");
    const auto* pword = expect_pword(line, Function::ADD, std::nullopt);
    ASSERT_NE(pword, nullptr);
    EXPECT_EQ(pword->effectiveAccumulator(), 1u);
    expect_address(pword, {IntType{110}});
}

TEST(ParserTests, AddressOperandForms) {
    expect_address(expect_pword(parse_line("0100 TAKE 3, *PTR"), Function::TAKE, 3u),
                   {std::string("PTR"), true});
    expect_address(expect_pword(parse_line("0100 TAKE 3, 110[2]"), Function::TAKE, 3u),
                   {IntType{110}, false, IntType{2}});
    expect_address(expect_pword(parse_line("0100 TAKE 3, *TABLE[7]"), Function::TAKE, 3u),
                   {std::string("TABLE"), true, IntType{7}});
}

TEST(ParserTests, ConstantOperandForms) {
    expect_constant(expect_pword(parse_line("0100 ADD 1, +10"), Function::ADD, 1u), ConstOperand{IntType{10}});
    expect_constant(expect_pword(parse_line("0100 ADD 1, -2.5"), Function::ADD, 1u), ConstOperand{FloatType{-2.5}});
    expect_constant(expect_pword(parse_line("0100 TAKE 1, \"HI\""), Function::TAKE, 1u), ConstOperand{std::string("HI")});
}

TEST(ParserTests, AccumulatorWrittenAgainstMnemonic) {
    auto line = parse_line("0100 JUMP2, LOOP");
    const auto* pword = expect_pword(line, Function::JUMP, 2u);
    ASSERT_NE(pword, nullptr);
    EXPECT_EQ(pword->mnemonic, "JUMP");
    expect_address(pword, {std::string("LOOP")});
}

TEST(ParserTests, MnemonicSynonyms) {
    expect_pword(parse_line("0100 NTHG"), Function::NIL, std::nullopt);
    expect_pword(parse_line("0100 MPLY 2, X"), Function::MULT, 2u);
    expect_pword(parse_line("0100 MPLYX 2, X"), Function::MULTX, 2u);
    expect_pword(parse_line("0100 SWAP 3, X"), Function::NILX, 3u);
}

TEST(ParserTests, LibraryRoutines) {
    auto plain = parse_line("0100 STOP");
    const auto* stop = expect_pword(plain, Function::EXTRA, std::nullopt);
    ASSERT_NE(stop, nullptr);
    EXPECT_EQ(stop->meaning.routine, LibraryRoutine::STOP);

    auto spaced = parse_line("0101 PRINT 2");
    const auto* print = expect_pword(spaced, Function::EXTRA, 2u);
    ASSERT_NE(print, nullptr);
    EXPECT_EQ(print->meaning.routine, LibraryRoutine::PRINT);

    auto glued = parse_line("0102 SQRT3");
    const auto* sqrt = expect_pword(glued, Function::EXTRA, 3u);
    ASSERT_NE(sqrt, nullptr);
    EXPECT_EQ(sqrt->meaning.routine, LibraryRoutine::SQRT);
    EXPECT_TRUE(std::holds_alternative<std::monostate>(sqrt->operand));
}

TEST(ParserTests, BlankAndCommentLinesYieldNothing) {
    EXPECT_FALSE(Parser::parse("").has_value());
    EXPECT_FALSE(Parser::parse("    ").has_value());
    EXPECT_FALSE(Parser::parse("; just a remark").has_value());
}

TEST(ParserTests, RejectsMalformedLines) {
    expect_parse_failure("ADD 1, +10");        // no location
    expect_parse_failure("0100 +12 +13");      // two words
    expect_parse_failure("0100 12");           // unsigned number is not a word
    expect_parse_failure("0100 + 12");         // sign must touch the digits
    expect_parse_failure("0100 FOO 1, 2");     // unknown mnemonic
    expect_parse_failure("0100 ADD 9, 2");     // accumulator is octal
    expect_parse_failure("0100 \"ABCDE\"");    // S-word too long
    expect_parse_failure("0100 \"\"");         // S-word empty
    expect_parse_failure("0100 +1@123");       // three exponent digits
    expect_parse_failure("0100 +1.");          // missing fraction digits
    expect_parse_failure("0100 TAKE 1, X[");   // unterminated index
}

TEST(ParserTests, RendersSourceLine) {
    EXPECT_EQ(parse_line("100 LBL: ADD 1, +10 ;c").to_string(), "0100 LBL: ADD 1, +10 ;c");
    EXPECT_EQ(parse_line("0005 TAKE *T[2]").to_string(), "0005 TAKE *T[2]");
    EXPECT_EQ(parse_line("0006 -1.5").to_string(), "0006 -1.5");
    EXPECT_EQ(parse_line("0007 PRINT 2").to_string(), "0007 PRINT 2");
}

TEST(ParserTests, ProgramCollectsEveryFailingLine) {
    auto lines = parseProgram("0001 +1\n\n0002 BAD\n; note\n0003 +\n0004 \"OK\"\n");

    ASSERT_EQ(lines.size(), 6u);
    EXPECT_FALSE(lines[0].failed());
    EXPECT_TRUE(lines[0].line.has_value());
    EXPECT_FALSE(lines[1].line.has_value());
    EXPECT_TRUE(lines[2].failed());
    EXPECT_FALSE(lines[3].line.has_value());
    EXPECT_TRUE(lines[4].failed());
    EXPECT_EQ(lines[5].lineNumber, 6u);

    try {
        takeSourceLines(lines);
        FAIL() << "Expected ParseFailed";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ParseFailed);
        EXPECT_EQ(e.message(), "2 lines failed to parse");
        ASSERT_EQ(e.offenders().size(), 2u);
        EXPECT_EQ(e.offenders()[0].rfind("line 3: ", 0), 0u);
        EXPECT_EQ(e.offenders()[1].rfind("line 5: ", 0), 0u);
    }
}

TEST(ParserTests, ProgramKeepsSourceLinesInOrder) {
    auto lines = parseProgram("0001 +12\r\n0100 ADD 1, +10\r\n");
    auto source = takeSourceLines(lines);

    ASSERT_EQ(source.size(), 2u);
    EXPECT_EQ(source[0].location, 1u);
    EXPECT_EQ(source[1].location, 100u);
}
