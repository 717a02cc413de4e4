#include "test_helpers.hpp"
#include "../src/assembler.hpp"

using namespace bbcx;

namespace {

Error assembleExpectingError(std::string_view text) {
    try {
        assembleSource(text);
    } catch (const Error& e) {
        return e;
    }
    throw std::runtime_error("assembly succeeded");
}

} // namespace

TEST(AssemblerTests, FilesLinesByLocation) {
    Assembly assembly = assembleSource(
        "0100 START: TAKE 1, COUNT\n"
        "0001 COUNT: +12\n"
        "0102 STOP\n");

    EXPECT_EQ(assembly.codeMap().size(), 3u);
    EXPECT_EQ(assembly.location("START"), std::optional<Location>(100));
    EXPECT_EQ(assembly.location("COUNT"), std::optional<Location>(1));
    EXPECT_FALSE(assembly.location("MISSING").has_value());

    EXPECT_TRUE(assembly.occupies(1));
    EXPECT_FALSE(assembly.occupies(101));
    EXPECT_NE(dynamic_cast<const IWordNode*>(assembly.content(1)), nullptr);
    EXPECT_NE(dynamic_cast<const PWordNode*>(assembly.content(100)), nullptr);
    EXPECT_EQ(assembly.content(50), nullptr);

    // Ordered by location, not by source order.
    EXPECT_EQ(assembly.codeMap().begin()->first, 1u);
    EXPECT_EQ(assembly.firstPWordLocation(), std::optional<Location>(100));
}

TEST(AssemblerTests, EmptyProgram) {
    Assembly assembly = assembleSource("");
    EXPECT_TRUE(assembly.codeMap().empty());
    EXPECT_TRUE(assembly.symbolTable().empty());
    EXPECT_FALSE(assembly.firstPWordLocation().has_value());
}

TEST(AssemblerTests, ReportsEveryDuplicate) {
    Error error = assembleExpectingError(
        "0005 B: +1\n"
        "0002 A: +2\n"
        "0005 +3\n"
        "0003 B: +4\n"
        "0002 A: +5\n");

    EXPECT_EQ(error.kind(), ErrorKind::DuplicatedSymbols);
    EXPECT_EQ(error.message(), "Multiple definitions: locations: \"2, 5\", labels: \"A, B\"");
    EXPECT_EQ(error.offenders(), (std::vector<std::string>{"2", "5", "A", "B"}));
}

TEST(AssemblerTests, DuplicateLabelAlone) {
    Error error = assembleExpectingError(
        "0001 X: +1\n"
        "0002 X: +2\n");

    EXPECT_EQ(error.kind(), ErrorKind::DuplicatedSymbols);
    EXPECT_EQ(error.message(), "Multiple definitions: locations: \"\", labels: \"X\"");
    EXPECT_EQ(error.offenders(), (std::vector<std::string>{"X"}));
}

TEST(AssemblerTests, LocationsPastMemoryAreOutOfMemory) {
    Error error = assembleExpectingError(
        "0200 +1\n"
        "0128 +2\n"
        "0127 +3\n");

    EXPECT_EQ(error.kind(), ErrorKind::OutOfMemory);
    EXPECT_EQ(error.offenders(), (std::vector<std::string>{"128", "200"}));
}

TEST(AssemblerTests, UndefinedSymbolsAreCollected) {
    Assembly assembly = assembleSource(
        "0100 TAKE 1, ZED\n"
        "0101 ADD 1, ALPHA\n"
        "0102 ADD 1, ZED\n"
        "0103 ADD 1, +1\n"
        "0104 ALPHA2: ADD 1, 7\n");

    EXPECT_EQ(assembly.undefinedSymbols(), (std::set<std::string>{"ALPHA", "ZED"}));
}
