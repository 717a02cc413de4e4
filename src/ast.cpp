#include "ast.hpp"
#include <iomanip>
#include <sstream>

namespace bbcx {

std::string formatInteger(IntType value)
{
    return (value < 0 ? "-" : "+") + std::to_string(value < 0 ? -value : value);
}

std::string formatFloat(FloatType value)
{
    std::ostringstream oss;
    oss << std::showpos << std::setprecision(8) << value;
    std::string text = oss.str();
    auto e = text.find('e');
    if (e != std::string::npos)
        text[e] = '@';
    else if (text.find('.') == std::string::npos)
        text += ".0";
    return text;
}

std::string AddressOperand::to_string() const
{
    std::string text = indirect ? "*" : "";
    if (auto name = std::get_if<std::string>(&address))
        text += *name;
    else
        text += std::to_string(std::get<IntType>(address));
    if (index)
        text += "[" + std::to_string(*index) + "]";
    return text;
}

std::string to_string(const ConstOperand& operand)
{
    if (auto i = std::get_if<IntType>(&operand))
        return formatInteger(*i);
    if (auto f = std::get_if<FloatType>(&operand))
        return formatFloat(*f);
    return "\"" + std::get<std::string>(operand) + "\"";
}

std::string PWordNode::to_string() const
{
    std::string text = mnemonic;
    if (meaning.isLibraryRoutine()) {
        if (accumulator)
            text += " " + std::to_string(*accumulator);
        return text;
    }
    if (accumulator)
        text += " " + std::to_string(*accumulator) + ",";
    if (auto address = addressOperand())
        text += " " + address->to_string();
    else if (auto value = constOperand())
        text += " " + bbcx::to_string(*value);
    return text;
}

std::string SourceLine::to_string() const
{
    std::ostringstream oss;
    oss << std::setw(4) << std::setfill('0') << location << ' ';
    if (label)
        oss << *label << ": ";
    if (word)
        oss << word->to_string();
    if (!comment.empty())
        oss << ' ' << comment;
    return oss.str();
}

} // namespace bbcx
