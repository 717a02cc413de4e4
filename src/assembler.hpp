#pragma once
#include "assembly.hpp"
#include <vector>

namespace bbcx {

/**
 * @brief Checks the parsed lines and files them into an Assembly.
 *
 * Throws DuplicatedSymbols naming every repeated location and label, then
 * OutOfMemory naming every location past the end of memory.
 */
class Assembler
{
public:
    static Assembly assemble(std::vector<SourceLine> lines);
};

} // namespace bbcx
