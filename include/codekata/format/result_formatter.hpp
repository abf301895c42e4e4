#pragma once

#include <codekata/execution_result.hpp>
#include <codekata/lang/value.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace codekata {

/// An ``ExecutionResult`` reduced to what a person should see
struct DisplayResult
{
    bool success;
    std::string value_text;                ///< "nil" when there is no value
    std::optional<std::string> output_text; ///< absent when the program printed nothing visible
    std::optional<std::string> error_text;
    std::string elapsed_text;

    bool operator==(const DisplayResult&) const = default;
};

/// Pure conversions from results to display text. None of these fail.
namespace result_formatter {

inline constexpr std::size_t PRETTY_PRINT_WIDTH = 80;
inline constexpr std::size_t SUMMARY_FIELD_WIDTH = 100;

DisplayResult format(const ExecutionResult& result);

/// Bounded rendering of a value.
///
/// Lists of more than 10 elements show the first 5, maps of more than 5 keys show the
/// first 3 and tuples of more than 5 elements show the first 3, each followed by the
/// total count. Renderings wider than ``PRETTY_PRINT_WIDTH`` are broken one element per line.
std::string format_value(const std::optional<lang::Value>& value);

/// Trailing whitespace removed; nullopt if nothing is left
std::optional<std::string> format_output(std::string_view output);

/// Whitespace runs collapsed to a single space, then trimmed
std::string format_error_message(std::string_view message);

/// "< 1ms", "150ms", "1.5s", "2.0min"
std::string format_elapsed(std::chrono::milliseconds elapsed);

/// One line, e.g. "Result: 42 | Output: hi | Executed in 3ms" or "Error: ... | Failed in 3ms"
std::string create_summary(const DisplayResult& display);

} // namespace result_formatter

} // namespace codekata
