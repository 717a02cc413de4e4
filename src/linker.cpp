#include "linker.hpp"
#include "error.hpp"

namespace bbcx {

Image Linker::link()
{
    auto undefined = assembly.undefinedSymbols();
    if (!undefined.empty()) {
        std::vector<std::string> offenders(undefined.begin(), undefined.end());
        std::string names;
        for (const auto& name : offenders)
            names += (names.empty() ? "" : ", ") + name;
        throw Error(ErrorKind::UndefinedSymbols, "Undefined symbols: \"" + names + "\"", offenders);
    }

    memory = Memory();
    for (const auto& [location, node] : assembly.codeMap()) {
        current = location;
        try {
            node->accept(*this);
        } catch (const Error& e) {
            throw e.at(location);
        }
    }

    return Image{memory, assembly.firstPWordLocation().value_or(0)};
}

Location Linker::allocateLiteral()
{
    for (Location slot = MEMORY_SIZE; slot-- > 0;) {
        if (memory[slot].isUndefined() && !assembly.occupies(slot))
            return slot;
    }
    throw Error(ErrorKind::OutOfMemory, "no free word left for a literal");
}

Word Linker::literalValue(const ConstOperand& operand) const
{
    if (auto i = std::get_if<IntType>(&operand))
        return Word::fromInteger(*i);
    if (auto f = std::get_if<FloatType>(&operand))
        return Word::fromFloat(*f);
    return Word::fromString(std::get<std::string>(operand));
}

unsigned Linker::resolve(const AddressOperand& operand) const
{
    IntType address;
    if (operand.isIdentifier())
        address = static_cast<IntType>(*assembly.location(std::get<std::string>(operand.address)));
    else
        address = std::get<IntType>(operand.address);

    if (!Memory::contains(address))
        throw Error(ErrorKind::InvalidOperand, "address " + operand.to_string() + " is outside memory");
    return static_cast<unsigned>(address);
}

void Linker::visit(const IWordNode& node)
{
    memory[current] = Word::fromInteger(node.value);
}

void Linker::visit(const FWordNode& node)
{
    memory[current] = Word::fromFloat(node.value);
}

void Linker::visit(const SWordNode& node)
{
    memory[current] = Word::fromString(node.value);
}

void Linker::visit(const PWordNode& node)
{
    Instruction instruction;
    instruction.function = node.meaning.function;
    instruction.accumulator = node.effectiveAccumulator();

    if (node.meaning.isLibraryRoutine()) {
        instruction.address = static_cast<unsigned>(node.meaning.routine);
    } else if (auto operand = node.addressOperand()) {
        instruction.address = resolve(*operand);
        instruction.indirect = operand->indirect;
        if (operand->index) {
            if (*operand->index > static_cast<IntType>(MAX_INDEX_REGISTER))
                throw Error(ErrorKind::InvalidOperand, "index register " + std::to_string(*operand->index) + " out of range 0..7");
            instruction.indexRegister = static_cast<unsigned>(*operand->index);
        }
    } else if (auto value = node.constOperand()) {
        Word literal = literalValue(*value);
        Location slot = allocateLiteral();
        memory[slot] = literal;
        instruction.address = static_cast<unsigned>(slot);
    }

    memory[current] = instruction.encode();
}

} // namespace bbcx
