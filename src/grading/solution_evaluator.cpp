#include <codekata/grading/solution_evaluator.hpp>

#include <codekata/classified_error.hpp>
#include <codekata/execution_result.hpp>
#include <codekata/grading/grading_spec.hpp>
#include <codekata/lang/fault.hpp>
#include <codekata/lang/parser.hpp>
#include <codekata/lang/value.hpp>
#include <codekata/logging.hpp>

#include <fmt/format.h>

#include <cstddef>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <variant>

namespace codekata {

namespace {

constexpr std::string_view NOT_QUITE = "Not quite right. ";

std::string_view trim(std::string_view str) {
    constexpr std::string_view whitespace = " \t\n\r\f\v";

    auto first = str.find_first_not_of(whitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = str.find_last_not_of(whitespace);
    return str.substr(first, last - first + 1);
}

/// What a learner "produced": printed text if any, otherwise the value
std::string comparable_output(const ExecutionResult& result) {
    auto output = trim(result.output);
    if (!output.empty()) {
        return std::string{output};
    }
    if (result.value) {
        return lang::inspect(*result.value);
    }
    return "";
}

} // namespace

std::optional<Difficulty> parse_difficulty(std::string_view name) {
    if (name == "beginner") {
        return Difficulty::Beginner;
    }
    if (name == "intermediate") {
        return Difficulty::Intermediate;
    }
    if (name == "advanced") {
        return Difficulty::Advanced;
    }
    return std::nullopt;
}

FeedbackGenerator::FeedbackGenerator()
    : engine_{std::random_device{}()} {}

std::string FeedbackGenerator::success(Difficulty difficulty) {
    std::size_t idx = 0;
    {
        std::lock_guard lock{engine_mutex_};
        idx = std::uniform_int_distribution<std::size_t>{0, SUCCESS_PHRASES.size() - 1}(engine_);
    }

    std::string message{SUCCESS_PHRASES[idx]};

    if (difficulty == Difficulty::Advanced) {
        message += " This was a challenging lesson!";
    }

    return message;
}

std::string FeedbackGenerator::error(const ClassifiedError& error, Difficulty difficulty) const {
    return fmt::format("{}Your code has an error: {}\nFix the {} in your code and try again.{}", NOT_QUITE,
                       error.message, describe(error.category), hint(difficulty));
}

std::string FeedbackGenerator::mismatch(std::string_view expected, std::string_view actual,
                                        Difficulty difficulty) const {
    return fmt::format("{}Expected: {}\nGot: {}{}", NOT_QUITE, expected, actual, hint(difficulty));
}

std::string FeedbackGenerator::generic(Difficulty difficulty) const {
    return fmt::format("{}Review the lesson instructions and try a different approach.{}", NOT_QUITE,
                       hint(difficulty));
}

std::string_view FeedbackGenerator::hint(Difficulty difficulty) {
    switch (difficulty) {
    case Difficulty::Beginner:
        return " Remember to follow the examples closely.";
    case Difficulty::Intermediate:
        return " Think about the problem step by step.";
    case Difficulty::Advanced:
        return " Consider edge cases and alternative approaches.";
    case Difficulty::Unspecified:
        break;
    }
    return "";
}

Verdict SolutionEvaluator::evaluate(const GradingSpec& spec, const ExecutionResult& result,
                                    Difficulty difficulty) const {
    if (result.error) {
        return {.passed = false,
                .actual_output = std::nullopt,
                .expected_output = std::nullopt,
                .error = result.error,
                .feedback = feedback_->error(*result.error, difficulty)};
    }

    if (const auto* expected = std::get_if<ExpectedOutput>(&spec)) {
        return evaluate_output(*expected, result, difficulty);
    }

    if (const auto* test_case = std::get_if<TestCase>(&spec)) {
        return evaluate_test_case(*test_case, result, difficulty);
    }

    return pass(difficulty);
}

Verdict SolutionEvaluator::evaluate_output(const ExpectedOutput& spec, const ExecutionResult& result,
                                           Difficulty difficulty) const {
    std::string actual = comparable_output(result);
    bool passed = trim(actual) == trim(spec.text);

    return {.passed = passed,
            .actual_output = actual,
            .expected_output = spec.text,
            .error = std::nullopt,
            .feedback = passed ? feedback_->success(difficulty) : feedback_->mismatch(trim(spec.text), actual, difficulty)};
}

Verdict SolutionEvaluator::evaluate_test_case(const TestCase& spec, const ExecutionResult& result,
                                              Difficulty difficulty) const {
    if (auto iter = spec.expectations.find(TestCase::EXPECTED_RESULT); iter != spec.expectations.end()) {
        auto expected = lang::parse_literal(iter->second);

        if (!expected) {
            LOG_ERROR("Lesson has an unreadable expected_result {:?}: {}", iter->second, expected.error().message);
            return {.passed = false,
                    .actual_output = std::nullopt,
                    .expected_output = iter->second,
                    .error = std::nullopt,
                    .feedback = feedback_->generic(difficulty)};
        }

        lang::Value actual_value = result.value.value_or(lang::Value{});
        bool passed = actual_value == expected.value();
        std::string actual = lang::inspect(actual_value);
        std::string expected_text = lang::inspect(expected.value());

        return {.passed = passed,
                .actual_output = actual,
                .expected_output = expected_text,
                .error = std::nullopt,
                .feedback = passed ? feedback_->success(difficulty) : feedback_->mismatch(expected_text, actual, difficulty)};
    }

    if (auto iter = spec.expectations.find(TestCase::EXPECTED_OUTPUT); iter != spec.expectations.end()) {
        std::string actual{trim(result.output)};
        bool passed = actual == trim(iter->second);

        return {.passed = passed,
                .actual_output = actual,
                .expected_output = iter->second,
                .error = std::nullopt,
                .feedback = passed ? feedback_->success(difficulty)
                                   : feedback_->mismatch(trim(iter->second), actual, difficulty)};
    }

    return pass(difficulty);
}

Verdict SolutionEvaluator::pass(Difficulty difficulty) const {
    return {.passed = true,
            .actual_output = std::nullopt,
            .expected_output = std::nullopt,
            .error = std::nullopt,
            .feedback = feedback_->success(difficulty)};
}

} // namespace codekata
