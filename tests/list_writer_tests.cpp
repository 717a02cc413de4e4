#include "test_helpers.hpp"
#include "../src/list_writer.hpp"
#include <filesystem>
#include <fstream>

using namespace bbcx;

namespace {

const std::string TITLE = std::string(14, ' ') + "PROG.BBC" + std::string(34, ' ') + " THU 01 JAN 1970 00:00\n";

std::string listSuccessfully(std::string_view text) {
    auto parsed = parseProgram(text);
    ListWriter listing("prog.bbc", 0);
    listing.addSource(parsed);
    Assembly assembly = Assembler::assemble(takeSourceLines(parsed));
    listing.addSymbolTable(assembly.symbolTable());
    return listing.str();
}

} // namespace

TEST(ListWriterTests, Timestamp) {
    EXPECT_EQ(ListWriter::timestamp(0), "THU 01 JAN 1970 00:00");
    EXPECT_EQ(ListWriter::timestamp(4 * 86400 + 10 * 3600 + 30 * 60), "MON 05 JAN 1970 10:30");
}

TEST(ListWriterTests, SourceAndSymbolTable) {
    const std::string listing = listSuccessfully(
        "0001 X: +12\n"
        "\n"
        "; hi\n"
        "0100 START: ADD 1, X\n");

    EXPECT_EQ(listing,
              TITLE +
              "\n"
              "    1         0001 X: +12\n"
              "    2\n"
              "    3         ; hi\n"
              "    4         0100 START: ADD 1, X\n"
              "\n"
              "SYMBOL TABLE:\n"
              "=============\n"
              "\n"
              "START   00000144\n"
              "X       00000001\n");
}

TEST(ListWriterTests, FailedLinesAndErrors) {
    auto parsed = parseProgram("0001 +1\n0002 BAD\n");
    ListWriter listing("prog.bbc", 0);
    listing.addSource(parsed);
    try {
        takeSourceLines(parsed);
        FAIL() << "Expected ParseFailed";
    } catch (const Error& e) {
        listing.addErrors(e);
    }

    EXPECT_EQ(listing.str(),
              TITLE +
              "\n"
              "    1         0001 +1\n"
              "    2  *****  unknown mnemonic BAD\n"
              "0002 BAD\n"
              "\n"
              "***** Errors: *****\n"
              "\n"
              "ParseFailed: 1 line failed to parse\n"
              "    line 2: unknown mnemonic BAD\n");
}

TEST(ListWriterTests, AssemblyErrorsListOffenders) {
    auto parsed = parseProgram("0001 A: +1\n0001 A: +2\n");
    ListWriter listing("prog.bbc", 0);
    listing.addSource(parsed);
    try {
        Assembler::assemble(takeSourceLines(parsed));
        FAIL() << "Expected DuplicatedSymbols";
    } catch (const Error& e) {
        listing.addErrors(e);
    }

    const std::string text = listing.str();
    EXPECT_NE(text.find("DuplicatedSymbols: Multiple definitions: locations: \"1\", labels: \"A\"\n"
                        "    1\n"
                        "    A\n"),
              std::string::npos)
        << text;
}

TEST(ListWriterTests, WritesFile) {
    const auto dir = std::filesystem::temp_directory_path() / "bbcx_list_writer_tests";
    std::filesystem::create_directories(dir);
    const auto path = dir / "prog.lst";

    ListWriter listing("prog.bbc", 0);
    listing.addSource(parseProgram("0001 +1\n"));
    listing.write(path);

    std::ifstream file(path);
    std::stringstream contents;
    contents << file.rdbuf();
    EXPECT_EQ(contents.str(), listing.str());

    std::filesystem::remove_all(dir);
    EXPECT_THROW(listing.write(dir / "missing" / "prog.lst"), std::runtime_error);
}
