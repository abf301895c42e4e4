#pragma once

#include <codekata/classified_error.hpp>
#include <codekata/common/formatters/macros.hpp>

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace codekata {

/// Any successful run passes
struct NoCheck
{
    bool operator==(const NoCheck&) const = default;
};

/// Trimmed program output (or the inspected value if nothing was printed) must match
struct ExpectedOutput
{
    std::string text;

    bool operator==(const ExpectedOutput&) const = default;
};

/// Named expectations. Recognised keys are ``expected_result``, a Kata literal compared
/// structurally against the value, and ``expected_output``. Other keys are ignored.
struct TestCase
{
    std::map<std::string, std::string, std::less<>> expectations;

    bool operator==(const TestCase&) const = default;

    static constexpr std::string_view EXPECTED_RESULT = "expected_result";
    static constexpr std::string_view EXPECTED_OUTPUT = "expected_output";
};

using GradingSpec = std::variant<NoCheck, ExpectedOutput, TestCase>;

enum class Difficulty { Unspecified, Beginner, Intermediate, Advanced };

/// "beginner", "intermediate", "advanced"; anything else is nullopt
std::optional<Difficulty> parse_difficulty(std::string_view name);

struct Verdict
{
    bool passed;
    std::optional<std::string> actual_output;
    std::optional<std::string> expected_output;
    std::optional<ClassifiedError> error; ///< the run's failure, category intact; never set for a mismatch
    std::string feedback;

    bool operator==(const Verdict&) const = default;
};

} // namespace codekata

FMT_SERIALIZE_ENUM(::codekata::Difficulty, Unspecified, Beginner, Intermediate, Advanced);
