#pragma once
#include "assembly.hpp"
#include "error.hpp"
#include "parser.hpp"
#include <ctime>
#include <filesystem>
#include <string>
#include <vector>

namespace bbcx {

/**
 * @brief Builds the listing file of one source file.
 *
 * The listing is a title line, the numbered source, and then either the
 * symbol table or the errors that stopped the assembly.
 */
class ListWriter
{
    std::vector<std::string> listing;

    void addText(const std::string& text);

public:
    ListWriter(const std::string& fileName, std::time_t when);

    void addSource(const std::vector<ParsedLine>& lines);
    void addSymbolTable(const SymbolTable& symbols);
    void addErrors(const Error& error);

    std::string str() const;
    void write(const std::filesystem::path& path) const;

    // "MON 05 JAN 1970 10:30" in UTC.
    static std::string timestamp(std::time_t when);
};

} // namespace bbcx
