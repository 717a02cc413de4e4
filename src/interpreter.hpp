#pragma once
#include "instruction.hpp"
#include "linker.hpp"
#include "memory.hpp"
#include <array>
#include <cstddef>
#include <istream>
#include <ostream>
#include <random>

namespace bbcx {

constexpr std::size_t DEFAULT_MAX_STEPS = 1000000;

/**
 * @brief Fetch, decode and execute over a linked memory image.
 *
 * Execution stops when the word at the program counter is not a P-word, the
 * counter runs off the end of memory, or the STOP routine is called. Any
 * fault throws an Error carrying the faulting PC; the PC is left on the
 * faulting instruction and memory is as it was before that instruction.
 */
class Interpreter
{
public:
    Interpreter(Image image, std::istream& in, std::ostream& out);

    // One line per executed instruction is written here when set.
    void setTrace(std::ostream* trace) { traceStream = trace; }

    // Runs until halted. maxSteps == 0 means no limit, otherwise StepLimitExceeded.
    std::size_t run(std::size_t maxSteps = DEFAULT_MAX_STEPS);

    // Executes one instruction; returns false when already halted.
    bool step();

    bool halted() const;
    Location programCounter() const { return pc; }
    const Memory& memory() const { return store; }
    std::size_t steps() const { return executed; }

    // Final PC and every defined word, one per line.
    void dump(std::ostream& os) const;

private:
    using Handler = void (Interpreter::*)(const Instruction&);
    using BinaryOp = Word (*)(const Word&, const Word&);

    Memory store;
    Location pc = 0;
    std::istream& input;
    std::ostream& output;
    std::ostream* traceStream = nullptr;
    bool stopped = false;
    std::size_t executed = 0;
    std::mt19937 random;

    static const std::array<Handler, FUNCTION_COUNT> HANDLERS;

    // --- Operand resolution ---
    Location effectiveAddress(const Instruction& instruction) const;
    const Word& operand(const Instruction& instruction) const { return store[effectiveAddress(instruction)]; }
    Word& direct(const Instruction& instruction) { return store.at(instruction.address); }
    Word& accumulator(const Instruction& instruction) { return store.accumulator(instruction.accumulator); }
    Word& lowerAccumulator(const Instruction& instruction);
    DoubleWord accumulatorPair(const Instruction& instruction);
    void storePair(const Instruction& instruction, const DoubleWord& pair);
    void skipIf(bool condition) { if (condition) ++pc; }

    // --- Single-length arithmetic and logic ---
    template <BinaryOp Op>
    void execAccumulate(const Instruction& instruction);
    template <BinaryOp Op>
    void execAccumulateAndSwap(const Instruction& instruction);
    template <Word (Word::*Op)(IntType) const>
    void execShift(const Instruction& instruction);

    // --- Double-length ---
    template <DoubleWord (DoubleWord::*Op)(IntType) const>
    void execDoubleShift(const Instruction& instruction);
    template <DoubleWord (DoubleWord::*Op)(const Word&) const>
    void execDoubleArithmetic(const Instruction& instruction);

    void execNil(const Instruction& instruction);
    void execTake(const Instruction& instruction);
    void execTstr(const Instruction& instruction);
    void execTneg(const Instruction& instruction);
    void execTnot(const Instruction& instruction);
    void execTtyp(const Instruction& instruction);
    void execTtyz(const Instruction& instruction);
    void execTout(const Instruction& instruction);

    void execSkip(const Instruction& instruction);
    void execSkae(const Instruction& instruction);
    void execSkan(const Instruction& instruction);
    void execSket(const Instruction& instruction);
    void execSkal(const Instruction& instruction);
    void execSkag(const Instruction& instruction);
    void execSked(const Instruction& instruction);
    void execSkei(const Instruction& instruction);

    void execNilx(const Instruction& instruction);
    void execPut(const Instruction& instruction);
    void execPsqu(const Instruction& instruction);
    void execPneg(const Instruction& instruction);
    void execPnot(const Instruction& instruction);
    void execPtyp(const Instruction& instruction);
    void execPtyz(const Instruction& instruction);
    void execPin(const Instruction& instruction);

    void execJump(const Instruction& instruction);
    void execJez(const Instruction& instruction);
    void execJnz(const Instruction& instruction);
    void execJlz(const Instruction& instruction);
    void execJgz(const Instruction& instruction);
    void execDecr(const Instruction& instruction);
    void execIncr(const Instruction& instruction);

    void execUnsupported(const Instruction& instruction);
    void execExtra(const Instruction& instruction);

    // --- Library routines (EXTRA) ---
    Word readNumber();
    void printWord(const Word& word);
    void writeCharacters(const Word& word);
    Word randomFraction();

    void trace(Location at, const Instruction& instruction);
};

} // namespace bbcx
