#pragma once

#include <codekata/classified_error.hpp>
#include <codekata/lang/value.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <utility>

namespace codekata {

/// Outcome of running one submission.
///
/// Exactly one of ``value`` (success) or ``error`` (failure) is meaningful. A program that
/// evaluates to nil succeeds with no value. Output may be present in either case.
struct ExecutionResult
{
    std::optional<lang::Value> value;
    std::string output;
    std::optional<ClassifiedError> error;
    std::chrono::milliseconds elapsed{0};

    bool success() const { return !error.has_value(); }

    static ExecutionResult make_success(lang::Value value, std::string output, std::chrono::milliseconds elapsed) {
        std::optional<lang::Value> result;
        if (!value.is_nil()) {
            result = std::move(value);
        }
        return {std::move(result), std::move(output), std::nullopt, elapsed};
    }

    static ExecutionResult make_failure(ClassifiedError error, std::string output, std::chrono::milliseconds elapsed) {
        return {std::nullopt, std::move(output), std::move(error), elapsed};
    }
};

} // namespace codekata
