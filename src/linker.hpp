#pragma once
#include "assembly.hpp"
#include "ast.hpp"
#include "memory.hpp"

namespace bbcx {

// A memory image ready to run.
struct Image
{
    Memory memory;
    Location entry = 0;
};

/**
 * @brief Folds an Assembly into a memory image.
 *
 * Source words are written in ascending location order. Constant operands
 * are stored in fresh literal slots taken from the top of memory downwards,
 * one slot per use, skipping locations that hold source words.
 */
class Linker : public Visitor
{
    const Assembly& assembly;
    Memory memory;
    Location current = 0;

    Location allocateLiteral();
    Word literalValue(const ConstOperand& operand) const;
    unsigned resolve(const AddressOperand& operand) const;

public:
    explicit Linker(const Assembly& assembly) : assembly(assembly) {}

    // Throws UndefinedSymbols before writing anything, then link errors tagged with their location.
    Image link();

    static Image link(const Assembly& assembly) { return Linker(assembly).link(); }

    void visit(const IWordNode& node) override;
    void visit(const FWordNode& node) override;
    void visit(const SWordNode& node) override;
    void visit(const PWordNode& node) override;
};

} // namespace bbcx
