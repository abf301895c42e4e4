#include "catch2_custom.hpp"

#include <codekata/classified_error.hpp>
#include <codekata/execution_result.hpp>
#include <codekata/grading/grading_spec.hpp>
#include <codekata/grading/solution_evaluator.hpp>
#include <codekata/lang/value.hpp>

#include <range/v3/algorithm/any_of.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

using namespace std::chrono_literals;
using namespace codekata;
using lang::Value;

namespace {

ExecutionResult printed(std::string output, std::optional<Value> value = std::nullopt) {
    return ExecutionResult::make_success(value.value_or(Value{}), std::move(output), 1ms);
}

bool is_success_phrase(std::string_view feedback) {
    return ranges::any_of(FeedbackGenerator::SUCCESS_PHRASES,
                          [feedback](std::string_view phrase) { return feedback.starts_with(phrase); });
}

TestCase test_case(std::string_view key, std::string value) {
    TestCase spec;
    spec.expectations.emplace(key, std::move(value));
    return spec;
}

} // namespace

TEST_CASE("A failed run never passes") {
    FeedbackGenerator feedback{7};
    SolutionEvaluator evaluator{feedback};

    const ClassifiedError division{ErrorCategory::ArithmeticError,
                                   "Arithmetic Error: division by zero in 1 / 0 (line 1)"};
    auto result = ExecutionResult::make_failure(division, "", 2ms);

    auto spec = GENERATE(GradingSpec{NoCheck{}}, GradingSpec{ExpectedOutput{"anything"}},
                         GradingSpec{test_case(TestCase::EXPECTED_OUTPUT, "x")});

    auto verdict = evaluator.evaluate(spec, result);
    REQUIRE_FALSE(verdict.passed);
    REQUIRE(verdict.error == division);
    REQUIRE(verdict.error->category == ErrorCategory::ArithmeticError);
    REQUIRE(verdict.feedback == "Not quite right. Your code has an error: Arithmetic Error: division by zero in 1 / 0 "
                                "(line 1)\nFix the arithmetic error in your code and try again.");
    REQUIRE(verdict.actual_output == std::nullopt);
}

TEST_CASE("The failure category reaches the verdict") {
    FeedbackGenerator feedback{7};
    SolutionEvaluator evaluator{feedback};

    auto category = GENERATE(ErrorCategory::Timeout, ErrorCategory::ResourceExceeded, ErrorCategory::DangerousCode,
                             ErrorCategory::SyntaxError);

    auto verdict = evaluator.evaluate(NoCheck{}, ExecutionResult::make_failure({category, "boom"}, "", 0ms));
    REQUIRE(verdict.error.has_value());
    REQUIRE(verdict.error->category == category);
    REQUIRE(verdict.error->message == "boom");
}

TEST_CASE("Expected output") {
    FeedbackGenerator feedback{7};
    SolutionEvaluator evaluator{feedback};
    const GradingSpec spec = ExpectedOutput{"Hello, World!"};

    SECTION("Matching output passes") {
        auto verdict = evaluator.evaluate(spec, printed("Hello, World!\n", Value::ok()));
        REQUIRE(verdict.passed);
        REQUIRE(verdict.actual_output == "Hello, World!");
        REQUIRE(verdict.expected_output == "Hello, World!");
        REQUIRE(verdict.error == std::nullopt);
        REQUIRE(is_success_phrase(verdict.feedback));
    }

    SECTION("Surrounding whitespace is ignored on both sides") {
        const GradingSpec padded = ExpectedOutput{"  Hello, World!\n\n"};
        REQUIRE(evaluator.evaluate(padded, printed("\n Hello, World!  ")).passed);
    }

    SECTION("Different output fails with both sides shown") {
        auto verdict = evaluator.evaluate(spec, printed("Hello\n"), Difficulty::Beginner);
        REQUIRE_FALSE(verdict.passed);
        REQUIRE(verdict.actual_output == "Hello");
        REQUIRE(verdict.feedback == "Not quite right. Expected: Hello, World!\nGot: Hello Remember to follow the "
                                    "examples closely.");
    }

    SECTION("Without output the value is compared") {
        const GradingSpec number = ExpectedOutput{"42"};
        REQUIRE(evaluator.evaluate(number, printed("", Value::integer(42))).passed);

        const GradingSpec text = ExpectedOutput{"\"hi\""};
        REQUIRE(evaluator.evaluate(text, printed("", lang::make_string("hi"))).passed);
    }

    SECTION("Nothing at all compares as empty") {
        auto verdict = evaluator.evaluate(spec, printed(""));
        REQUIRE_FALSE(verdict.passed);
        REQUIRE(verdict.actual_output == "");
    }
}

TEST_CASE("Test cases with an expected result") {
    FeedbackGenerator feedback{7};
    SolutionEvaluator evaluator{feedback};
    const GradingSpec spec = test_case(TestCase::EXPECTED_RESULT, "[1, 2, 3]");

    auto value = lang::make_list({Value::integer(1), Value::integer(2), Value::integer(3)});

    SECTION("Structurally equal values pass") {
        auto verdict = evaluator.evaluate(spec, printed("noise\n", value));
        REQUIRE(verdict.passed);
        REQUIRE(verdict.actual_output == "[1, 2, 3]");
        REQUIRE(verdict.expected_output == "[1, 2, 3]");
    }

    SECTION("Numbers compare across integer and float") {
        const GradingSpec number = test_case(TestCase::EXPECTED_RESULT, "6.0");
        REQUIRE(evaluator.evaluate(number, printed("", Value::integer(6))).passed);
    }

    SECTION("Different values fail") {
        auto verdict = evaluator.evaluate(spec, printed("", Value::integer(6)));
        REQUIRE_FALSE(verdict.passed);
        REQUIRE(verdict.feedback == "Not quite right. Expected: [1, 2, 3]\nGot: 6");
    }

    SECTION("A nil result is compared as nil") {
        const GradingSpec nil = test_case(TestCase::EXPECTED_RESULT, "nil");
        REQUIRE(evaluator.evaluate(nil, printed("")).passed);
    }

    SECTION("An unreadable expectation fails without blaming the learner's code") {
        const GradingSpec broken = test_case(TestCase::EXPECTED_RESULT, "[1, 2");
        auto verdict = evaluator.evaluate(broken, printed("", value));
        REQUIRE_FALSE(verdict.passed);
        REQUIRE(verdict.error == std::nullopt);
        REQUIRE(verdict.feedback == "Not quite right. Review the lesson instructions and try a different approach.");
    }
}

TEST_CASE("Test cases with expected output") {
    FeedbackGenerator feedback{7};
    SolutionEvaluator evaluator{feedback};
    const GradingSpec spec = test_case(TestCase::EXPECTED_OUTPUT, "3\n");

    REQUIRE(evaluator.evaluate(spec, printed("3\n")).passed);
    // Unlike ExpectedOutput, the value is never a stand-in for output
    REQUIRE_FALSE(evaluator.evaluate(spec, printed("", Value::integer(3))).passed);
}

TEST_CASE("Anything else passes any successful run") {
    FeedbackGenerator feedback{7};
    SolutionEvaluator evaluator{feedback};

    REQUIRE(evaluator.evaluate(NoCheck{}, printed("")).passed);
    REQUIRE(evaluator.evaluate(test_case("unrelated_key", "x"), printed("")).passed);
}

TEST_CASE("Feedback text") {
    FeedbackGenerator feedback{123};

    SECTION("Success phrases come from a fixed set") {
        for (int i = 0; i < 20; ++i) {
            REQUIRE(is_success_phrase(feedback.success(Difficulty::Beginner)));
        }
    }

    SECTION("Advanced lessons get extra praise") {
        REQUIRE_THAT(feedback.success(Difficulty::Advanced),
                     Catch::Matchers::EndsWith(" This was a challenging lesson!"));
        REQUIRE_THAT(feedback.success(Difficulty::Intermediate),
                     !Catch::Matchers::ContainsSubstring("challenging"));
    }

    SECTION("Hints depend on difficulty") {
        REQUIRE(FeedbackGenerator::hint(Difficulty::Unspecified).empty());
        REQUIRE(feedback.generic(Difficulty::Intermediate) ==
                "Not quite right. Review the lesson instructions and try a different approach. Think about the "
                "problem step by step.");
        REQUIRE(feedback.error({ErrorCategory::Timeout, "Execution timed out"}, Difficulty::Advanced) ==
                "Not quite right. Your code has an error: Execution timed out\nFix the timeout in your code and try "
                "again. Consider edge cases and alternative approaches.");
    }

    SECTION("Seeded generators are reproducible") {
        FeedbackGenerator first{99};
        FeedbackGenerator second{99};
        for (int i = 0; i < 5; ++i) {
            REQUIRE(first.success(Difficulty::Beginner) == second.success(Difficulty::Beginner));
        }
    }
}

TEST_CASE("Difficulty names") {
    REQUIRE(parse_difficulty("beginner") == Difficulty::Beginner);
    REQUIRE(parse_difficulty("intermediate") == Difficulty::Intermediate);
    REQUIRE(parse_difficulty("advanced") == Difficulty::Advanced);
    REQUIRE(parse_difficulty("expert") == std::nullopt);
    REQUIRE(parse_difficulty("") == std::nullopt);
}
