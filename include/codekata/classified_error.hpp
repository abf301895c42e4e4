#pragma once

#include <codekata/common/formatters/macros.hpp>

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

namespace codekata {

/// Every way a submission can fail, as seen by callers of the engine.
/// The category drives user messaging; the message is free text.
enum class ErrorCategory {
    SyntaxError,
    CompileError,
    ArithmeticError,
    ArgumentError,
    UndefinedOperation,
    FunctionMismatch,
    Timeout,
    ResourceExceeded,
    DangerousCode,
    UnknownRuntimeError,
};

struct ClassifiedError
{
    ErrorCategory category;
    std::string message;

    bool operator==(const ClassifiedError&) const = default;
};

/// Lower-case human readable name of a category, e.g. "arithmetic error"
std::string_view describe(ErrorCategory category);

ClassifiedError make_timeout_error(std::chrono::milliseconds timeout);

ClassifiedError make_resource_error(std::string_view what);

ClassifiedError make_dangerous_code_error(std::string_view rule_name, std::string_view capability);

} // namespace codekata

FMT_SERIALIZE_ENUM(::codekata::ErrorCategory, SyntaxError, CompileError, ArithmeticError, ArgumentError,
                   UndefinedOperation, FunctionMismatch, Timeout, ResourceExceeded, DangerousCode,
                   UnknownRuntimeError);
