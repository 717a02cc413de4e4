#pragma once
#include "instruction.hpp"
#include "memory.hpp"
#include "word.hpp"
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace bbcx {

class Visitor; // Forward declaration
struct IWordNode;
struct FWordNode;
struct SWordNode;
struct PWordNode;

struct Node
{
    virtual void accept(Visitor &v) const = 0;
    virtual std::string to_string() const = 0;
    virtual ~Node() = default;
};

class Visitor
{
public:
    virtual ~Visitor() = default;
    virtual void visit(const IWordNode &node) = 0;
    virtual void visit(const FWordNode &node) = 0;
    virtual void visit(const SWordNode &node) = 0;
    virtual void visit(const PWordNode &node) = 0;
};

// Renders a float the way source text writes it: explicit sign, '@' for the exponent.
std::string formatFloat(FloatType value);
std::string formatInteger(IntType value);

struct IWordNode : Node
{
    IntType value;
    explicit IWordNode(IntType val) : value(val) {}
    void accept(Visitor &v) const override { v.visit(*this); }
    std::string to_string() const override { return formatInteger(value); }
};

struct FWordNode : Node
{
    FloatType value;
    explicit FWordNode(FloatType val) : value(val) {}
    void accept(Visitor &v) const override { v.visit(*this); }
    std::string to_string() const override { return formatFloat(value); }
};

struct SWordNode : Node
{
    std::string value;
    explicit SWordNode(std::string val) : value(std::move(val)) {}
    void accept(Visitor &v) const override { v.visit(*this); }
    std::string to_string() const override { return "\"" + value + "\""; }
};

// LABEL, 110, *LABEL or 110[3]
struct AddressOperand
{
    std::variant<std::string, IntType> address;
    bool indirect = false;
    std::optional<IntType> index;

    bool isIdentifier() const { return std::holds_alternative<std::string>(address); }
    std::string to_string() const;
};

using ConstOperand = std::variant<IntType, FloatType, std::string>;

// No operand, an address, or a literal that the linker stores for us.
using Operand = std::variant<std::monostate, AddressOperand, ConstOperand>;

std::string to_string(const ConstOperand& operand);

struct PWordNode : Node
{
    std::string mnemonic; // as written, synonyms included
    Mnemonic meaning;
    std::optional<unsigned> accumulator;
    Operand operand;

    explicit PWordNode(std::string name, Mnemonic meaning, std::optional<unsigned> acc = std::nullopt, Operand operand = {})
        : mnemonic(std::move(name)), meaning(meaning), accumulator(acc), operand(std::move(operand)) {}
    void accept(Visitor &v) const override { v.visit(*this); }
    std::string to_string() const override;

    unsigned effectiveAccumulator() const { return accumulator.value_or(DEFAULT_ACCUMULATOR); }
    const AddressOperand* addressOperand() const { return std::get_if<AddressOperand>(&operand); }
    const ConstOperand* constOperand() const { return std::get_if<ConstOperand>(&operand); }
};

struct SourceLine
{
    Location location = 0;
    std::optional<std::string> label;
    std::unique_ptr<Node> word;
    std::string comment;

    std::string to_string() const;
};

} // namespace bbcx
