#pragma once
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace bbcx {

enum class ErrorKind
{
    ParseFailed,
    DuplicatedSymbols,
    UndefinedSymbols,
    InvalidIWordValue,
    InvalidFWordValue,
    InvalidSWordValue,
    OutOfMemory,
    CannotConvertWordToInstruction,
    InvalidOperand,
    ArithmeticTypeMismatch,
    DivisionByZero,
    UnsupportedFunction,
    StepLimitExceeded,
};

std::string_view to_string(ErrorKind kind);

/**
 * @brief The one exception type thrown by the assembler, linker and interpreter.
 *
 * Static errors carry every offender (already sorted). Link errors carry the
 * source location of the failing line, runtime errors the PC at fault.
 */
class Error : public std::runtime_error
{
    ErrorKind errorKind;
    std::string detail;
    std::vector<std::string> offenderList;
    std::optional<std::size_t> faultAddress;

    static std::string compose(ErrorKind kind, const std::string& detail,
                               const std::optional<std::size_t>& address);

public:
    Error(ErrorKind kind, std::string detail, std::vector<std::string> offenders = {});

    ErrorKind kind() const { return errorKind; }
    const std::string& message() const { return detail; }
    const std::vector<std::string>& offenders() const { return offenderList; }
    std::optional<std::size_t> address() const { return faultAddress; }

    // Copy of this error tagged with the location (or PC) it was raised at.
    Error at(std::size_t address) const;
};

} // namespace bbcx
