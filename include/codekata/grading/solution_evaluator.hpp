#pragma once

#include <codekata/classified_error.hpp>
#include <codekata/common/class_traits.hpp>
#include <codekata/execution_result.hpp>
#include <codekata/grading/grading_spec.hpp>

#include <array>
#include <mutex>
#include <random>
#include <string>
#include <string_view>

namespace codekata {

/// Builds the text shown alongside a verdict. Never affects whether a submission passes.
class FeedbackGenerator : NonMovable
{
public:
    /// Seeded from std::random_device
    FeedbackGenerator();

    explicit FeedbackGenerator(std::mt19937::result_type seed)
        : engine_{seed} {}

    static constexpr std::array<std::string_view, 5> SUCCESS_PHRASES{
        "Excellent work! You've mastered this concept.", "Perfect! Your solution is correct.",
        "Great job! You're making excellent progress.", "Well done! Your understanding is solid.",
        "Fantastic! You've got it right."};

    std::string success(Difficulty difficulty);

    std::string error(const ClassifiedError& error, Difficulty difficulty) const;

    std::string mismatch(std::string_view expected, std::string_view actual, Difficulty difficulty) const;

    /// When there is nothing specific to point at
    std::string generic(Difficulty difficulty) const;

    static std::string_view hint(Difficulty difficulty);

private:
    std::mutex engine_mutex_;
    std::mt19937 engine_;
};

/// Decides whether a run satisfies a lesson's grading spec
class SolutionEvaluator
{
public:
    explicit SolutionEvaluator(FeedbackGenerator& feedback)
        : feedback_{&feedback} {}

    /// Rules, first match wins:
    ///  1. a failed run never passes
    ///  2. ExpectedOutput compares trimmed text
    ///  3. TestCase checks ``expected_result`` if present, otherwise ``expected_output``, otherwise passes
    ///  4. NoCheck passes
    Verdict evaluate(const GradingSpec& spec, const ExecutionResult& result,
                     Difficulty difficulty = Difficulty::Unspecified) const;

private:
    Verdict evaluate_output(const ExpectedOutput& spec, const ExecutionResult& result, Difficulty difficulty) const;
    Verdict evaluate_test_case(const TestCase& spec, const ExecutionResult& result, Difficulty difficulty) const;

    Verdict pass(Difficulty difficulty) const;

    FeedbackGenerator* feedback_;
};

} // namespace codekata
