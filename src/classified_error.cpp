#include <codekata/classified_error.hpp>

#include <fmt/format.h>

#include <chrono>
#include <string_view>

namespace codekata {

std::string_view describe(ErrorCategory category) {
    switch (category) {
    case ErrorCategory::SyntaxError:
        return "syntax error";
    case ErrorCategory::CompileError:
        return "compilation error";
    case ErrorCategory::ArithmeticError:
        return "arithmetic error";
    case ErrorCategory::ArgumentError:
        return "argument error";
    case ErrorCategory::UndefinedOperation:
        return "undefined function";
    case ErrorCategory::FunctionMismatch:
        return "function clause error";
    case ErrorCategory::Timeout:
        return "timeout";
    case ErrorCategory::ResourceExceeded:
        return "resource limit";
    case ErrorCategory::DangerousCode:
        return "restricted operation";
    case ErrorCategory::UnknownRuntimeError:
        return "runtime error";
    }

    return "unknown error";
}

ClassifiedError make_timeout_error(std::chrono::milliseconds timeout) {
    return {.category = ErrorCategory::Timeout,
            .message = fmt::format("Execution timed out after {}ms. Check for infinite loops or unbounded recursion.",
                                   timeout.count())};
}

ClassifiedError make_resource_error(std::string_view what) {
    return {.category = ErrorCategory::ResourceExceeded,
            .message = fmt::format("Resource limit exceeded: {}. Check for unbounded allocation or output.", what)};
}

ClassifiedError make_dangerous_code_error(std::string_view rule_name, std::string_view capability) {
    return {.category = ErrorCategory::DangerousCode,
            .message = fmt::format("Code contains a restricted operation: {} ({})", rule_name, capability)};
}

} // namespace codekata
