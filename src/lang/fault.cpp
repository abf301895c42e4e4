#include <codekata/lang/fault.hpp>

#include <codekata/classified_error.hpp>

#include <fmt/format.h>

#include <string>

namespace codekata::lang {

namespace {

std::string with_line(const Fault& fault) {
    if (fault.line <= 0) {
        return fault.message;
    }
    return fmt::format("{} (line {})", fault.message, fault.line);
}

} // namespace

ClassifiedError classify(const Fault& fault) {
    switch (fault.kind) {
    case FaultKind::Syntax:
        return {ErrorCategory::SyntaxError, "Syntax Error: " + with_line(fault)};
    case FaultKind::Compile:
        return {ErrorCategory::CompileError, "Compilation Error: " + with_line(fault)};
    case FaultKind::Arithmetic:
        return {ErrorCategory::ArithmeticError, "Arithmetic Error: " + with_line(fault)};
    case FaultKind::Argument:
        return {ErrorCategory::ArgumentError, "Argument Error: " + with_line(fault)};
    case FaultKind::Undefined:
        return {ErrorCategory::UndefinedOperation, "Undefined Function Error: " + with_line(fault)};
    case FaultKind::FunctionMismatch:
        return {ErrorCategory::FunctionMismatch, "Function Clause Error: " + with_line(fault)};
    case FaultKind::Raised:
        return {ErrorCategory::UnknownRuntimeError, "Runtime Error: " + with_line(fault)};
    case FaultKind::MemoryLimit:
        return make_resource_error(fmt::format("memory ({})", fault.message));
    case FaultKind::CallDepth:
        return make_resource_error(fmt::format("stack depth ({})", fault.message));
    case FaultKind::OutputLimit:
        return make_resource_error(fmt::format("output size ({})", fault.message));
    }

    return {ErrorCategory::UnknownRuntimeError, "Runtime Error: " + with_line(fault)};
}

} // namespace codekata::lang
