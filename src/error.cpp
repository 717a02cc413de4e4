#include "error.hpp"
#include <iomanip>
#include <sstream>

namespace bbcx {

std::string_view to_string(ErrorKind kind)
{
    switch (kind) {
        case ErrorKind::ParseFailed: return "ParseFailed";
        case ErrorKind::DuplicatedSymbols: return "DuplicatedSymbols";
        case ErrorKind::UndefinedSymbols: return "UndefinedSymbols";
        case ErrorKind::InvalidIWordValue: return "InvalidIWordValue";
        case ErrorKind::InvalidFWordValue: return "InvalidFWordValue";
        case ErrorKind::InvalidSWordValue: return "InvalidSWordValue";
        case ErrorKind::OutOfMemory: return "OutOfMemory";
        case ErrorKind::CannotConvertWordToInstruction: return "CannotConvertWordToInstruction";
        case ErrorKind::InvalidOperand: return "InvalidOperand";
        case ErrorKind::ArithmeticTypeMismatch: return "ArithmeticTypeMismatch";
        case ErrorKind::DivisionByZero: return "DivisionByZero";
        case ErrorKind::UnsupportedFunction: return "UnsupportedFunction";
        case ErrorKind::StepLimitExceeded: return "StepLimitExceeded";
    }
    return "Unknown";
}

std::string Error::compose(ErrorKind kind, const std::string& detail,
                           const std::optional<std::size_t>& address)
{
    std::ostringstream oss;
    oss << to_string(kind);
    if (address)
        oss << " at " << std::setw(4) << std::setfill('0') << *address;
    if (!detail.empty())
        oss << ": " << detail;
    return oss.str();
}

Error::Error(ErrorKind kind, std::string detail, std::vector<std::string> offenders)
    : std::runtime_error(compose(kind, detail, std::nullopt)),
      errorKind(kind),
      detail(std::move(detail)),
      offenderList(std::move(offenders))
{
}

Error Error::at(std::size_t address) const
{
    Error located(*this);
    located.faultAddress = address;
    static_cast<std::runtime_error&>(located) = std::runtime_error(compose(errorKind, detail, address));
    return located;
}

} // namespace bbcx
