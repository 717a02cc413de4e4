#include "assembly.hpp"

namespace bbcx {

std::optional<Location> Assembly::location(const std::string& label) const
{
    auto it = symbols.find(label);
    if (it == symbols.end())
        return std::nullopt;
    return it->second;
}

const Node* Assembly::content(Location location) const
{
    auto it = code.find(location);
    return it == code.end() ? nullptr : it->second.get();
}

std::optional<Location> Assembly::firstPWordLocation() const
{
    for (const auto& [location, node] : code) {
        if (dynamic_cast<const PWordNode*>(node.get()))
            return location;
    }
    return std::nullopt;
}

std::set<std::string> Assembly::undefinedSymbols() const
{
    std::set<std::string> undefined;
    for (const auto& [location, node] : code) {
        auto pword = dynamic_cast<const PWordNode*>(node.get());
        if (!pword)
            continue;
        auto operand = pword->addressOperand();
        if (!operand || !operand->isIdentifier())
            continue;
        const auto& name = std::get<std::string>(operand->address);
        if (!symbols.count(name))
            undefined.insert(name);
    }
    return undefined;
}

} // namespace bbcx
