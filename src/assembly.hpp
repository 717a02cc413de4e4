#pragma once
#include "ast.hpp"
#include "memory.hpp"
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>

namespace bbcx {

using SymbolTable = std::map<std::string, Location>;
using CodeMap = std::map<Location, std::unique_ptr<Node>>;

/**
 * @brief Assembler output: labels and source words by location.
 *
 * Immutable once built. The code map is ordered by location, which is the
 * order the linker walks it in.
 */
class Assembly
{
    SymbolTable symbols;
    CodeMap code;

public:
    Assembly() = default;
    Assembly(SymbolTable symbols, CodeMap code) : symbols(std::move(symbols)), code(std::move(code)) {}

    const SymbolTable& symbolTable() const { return symbols; }
    const CodeMap& codeMap() const { return code; }

    std::optional<Location> location(const std::string& label) const;
    const Node* content(Location location) const;
    bool occupies(Location location) const { return code.count(location) != 0; }

    // Where execution starts: the lowest location holding a P-word.
    std::optional<Location> firstPWordLocation() const;

    // Identifiers used as operands that no label defines, sorted.
    std::set<std::string> undefinedSymbols() const;
};

} // namespace bbcx
