#pragma once
#include "word.hpp"
#include <array>
#include <cstddef>

namespace bbcx {

constexpr std::size_t MEMORY_SIZE = 128;

using Location = std::size_t;

/**
 * @brief The machine's store: 128 words, nothing else.
 *
 * Accumulators and index registers are low memory cells, so every accessor
 * below indexes the same array.
 */
class Memory
{
    std::array<Word, MEMORY_SIZE> words{};

public:
    Word& operator[](Location location) { return words[location]; }
    const Word& operator[](Location location) const { return words[location]; }

    // Range checked; throws InvalidOperand.
    Word& at(IntType location);
    const Word& at(IntType location) const;

    Word& accumulator(unsigned acc) { return at(acc); }
    const Word& accumulator(unsigned acc) const { return at(acc); }
    Word& indexRegister(unsigned index) { return at(index); }
    const Word& indexRegister(unsigned index) const { return at(index); }

    static bool contains(IntType location)
    {
        return location >= 0 && location < static_cast<IntType>(MEMORY_SIZE);
    }

    std::size_t size() const { return words.size(); }

    bool operator==(const Memory& other) const { return words == other.words; }
};

} // namespace bbcx
