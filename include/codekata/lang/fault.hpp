#pragma once

#include <codekata/classified_error.hpp>
#include <codekata/common/formatters/macros.hpp>

#include <string>

namespace codekata::lang {

/// Why evaluation of a Kata program stopped early
enum class FaultKind {
    Syntax,           ///< Lexer or parser rejected the source
    Compile,          ///< Static checks failed (undefined variable, misplaced def, ...)
    Arithmetic,       ///< Division by zero, integer overflow, non-numeric operand
    Argument,         ///< A builtin received a value of the wrong type or out of range
    Undefined,        ///< Unknown function or module, or a variable unbound at runtime
    FunctionMismatch, ///< Wrong arity, or calling something that is not a function
    Raised,           ///< Explicit ``raise``
    MemoryLimit,      ///< The memory budget was exhausted
    CallDepth,        ///< Too many nested calls, or values nested too deeply
    OutputLimit,      ///< The program wrote more output than allowed
};

struct Fault
{
    FaultKind kind;
    std::string message;
    int line = 0; ///< 1-based; 0 when unknown

    bool operator==(const Fault&) const = default;
};

/// Maps a fault onto the caller-facing error taxonomy. Total over FaultKind.
ClassifiedError classify(const Fault& fault);

} // namespace codekata::lang

FMT_SERIALIZE_ENUM(::codekata::lang::FaultKind, Syntax, Compile, Arithmetic, Argument, Undefined, FunctionMismatch,
                   Raised, MemoryLimit, CallDepth, OutputLimit);
