#include "memory.hpp"
#include "error.hpp"

namespace bbcx {

Word& Memory::at(IntType location)
{
    if (!contains(location))
        throw Error(ErrorKind::InvalidOperand, "address " + std::to_string(location) + " is outside memory");
    return words[static_cast<std::size_t>(location)];
}

const Word& Memory::at(IntType location) const
{
    if (!contains(location))
        throw Error(ErrorKind::InvalidOperand, "address " + std::to_string(location) + " is outside memory");
    return words[static_cast<std::size_t>(location)];
}

} // namespace bbcx
