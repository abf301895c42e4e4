#include "catch2_custom.hpp"

#include <codekata/classified_error.hpp>
#include <codekata/execution_result.hpp>
#include <codekata/format/result_formatter.hpp>
#include <codekata/lang/value.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace std::chrono_literals;
using namespace codekata;
using lang::Value;

namespace rf = codekata::result_formatter;

namespace {

Value int_list(std::int64_t count) {
    std::vector<Value> items;
    for (std::int64_t i = 1; i <= count; ++i) {
        items.push_back(Value::integer(i));
    }
    return lang::make_list(std::move(items));
}

} // namespace

TEST_CASE("Scalars and small composites render inline") {
    REQUIRE(rf::format_value(std::nullopt) == "nil");
    REQUIRE(rf::format_value(Value::integer(42)) == "42");
    REQUIRE(rf::format_value(Value::floating(2.0)) == "2.0");
    REQUIRE(rf::format_value(lang::make_string("hi")) == "\"hi\"");
    REQUIRE(rf::format_value(Value::ok()) == ":ok");
    REQUIRE(rf::format_value(int_list(3)) == "[1, 2, 3]");
    REQUIRE(rf::format_value(lang::make_list({})) == "[]");
    REQUIRE(rf::format_value(lang::make_tuple({Value::ok(), Value::integer(1)})) == "{:ok, 1}");
}

TEST_CASE("Large composites are truncated") {
    SECTION("Lists of more than 10 show the first 5") {
        REQUIRE(rf::format_value(int_list(10)) == "[1, 2, 3, 4, 5, 6, 7, 8, 9, 10]");
        REQUIRE(rf::format_value(int_list(20)) == "[1, 2, 3, 4, 5 ... (20 items)]");
    }

    SECTION("Maps of more than 5 keys show the first 3") {
        std::vector<std::pair<Value, Value>> entries;
        for (std::int64_t i = 0; i < 10; ++i) {
            entries.emplace_back(Value::integer(i), Value::boolean(i % 2 == 0));
        }

        REQUIRE(rf::format_value(lang::make_map(entries)) == "%{0 => true, 1 => false, 2 => true ... (10 keys)}");

        entries.resize(5);
        REQUIRE(rf::format_value(lang::make_map(entries)) ==
                "%{0 => true, 1 => false, 2 => true, 3 => false, 4 => true}");
    }

    SECTION("Tuples of more than 5 show the first 3") {
        std::vector<Value> items;
        for (std::int64_t i = 1; i <= 7; ++i) {
            items.push_back(Value::integer(i));
        }
        REQUIRE(rf::format_value(lang::make_tuple(items)) == "{1, 2, 3 ... (7 elements)}");
    }
}

TEST_CASE("Wide values are printed one element per line") {
    std::string word(30, 'a');
    auto value = lang::make_list({lang::make_string(word), lang::make_string(word), lang::make_string(word)});

    std::string quoted = "\"" + word + "\"";
    REQUIRE(rf::format_value(value) == "[\n  " + quoted + ",\n  " + quoted + ",\n  " + quoted + "\n]");

    SECTION("The truncation note stays on the last line") {
        std::vector<Value> items(12, lang::make_string(word));
        std::string expected = "[\n";
        for (int i = 0; i < 4; ++i) {
            expected += "  " + quoted + ",\n";
        }
        expected += "  " + quoted + " ... (12 items)\n]";

        REQUIRE(rf::format_value(lang::make_list(items)) == expected);
    }
}

TEST_CASE("Output is trimmed on the right only") {
    REQUIRE(rf::format_output("") == std::nullopt);
    REQUIRE(rf::format_output(" \n\t\n") == std::nullopt);
    REQUIRE(rf::format_output("Hello\n") == "Hello");
    REQUIRE(rf::format_output("  indented\nlines\n\n") == "  indented\nlines");
}

TEST_CASE("Error messages are collapsed onto one line") {
    REQUIRE(rf::format_error_message("Syntax Error: unexpected token") == "Syntax Error: unexpected token");
    REQUIRE(rf::format_error_message("  Syntax Error:\n   unexpected \t token \n") == "Syntax Error: unexpected token");
    REQUIRE(rf::format_error_message("") == "");
}

TEST_CASE("Elapsed time uses the coarsest sensible unit") {
    REQUIRE(rf::format_elapsed(0ms) == "< 1ms");
    REQUIRE(rf::format_elapsed(1ms) == "1ms");
    REQUIRE(rf::format_elapsed(150ms) == "150ms");
    REQUIRE(rf::format_elapsed(999ms) == "999ms");
    REQUIRE(rf::format_elapsed(1000ms) == "1.0s");
    REQUIRE(rf::format_elapsed(1500ms) == "1.5s");
    REQUIRE(rf::format_elapsed(1234ms) == "1.23s");
    REQUIRE(rf::format_elapsed(30s) == "30.0s");
    REQUIRE(rf::format_elapsed(90s) == "1.5min");
    REQUIRE(rf::format_elapsed(2min) == "2.0min");
}

TEST_CASE("Formatting a whole result") {
    SECTION("Success") {
        auto display = rf::format(ExecutionResult::make_success(Value::integer(42), "42\n", 3ms));
        REQUIRE(display == DisplayResult{.success = true,
                                         .value_text = "42",
                                         .output_text = "42",
                                         .error_text = std::nullopt,
                                         .elapsed_text = "3ms"});
    }

    SECTION("Nil value") {
        auto display = rf::format(ExecutionResult::make_success(Value{}, "", 0ms));
        REQUIRE(display.success);
        REQUIRE(display.value_text == "nil");
        REQUIRE(display.output_text == std::nullopt);
        REQUIRE(display.elapsed_text == "< 1ms");
    }

    SECTION("Failure keeps partial output") {
        auto display = rf::format(ExecutionResult::make_failure(
            {ErrorCategory::ArithmeticError, "Arithmetic Error: division by zero in 1 / 0 (line 2)"}, "Hello\n", 12ms));

        REQUIRE_FALSE(display.success);
        REQUIRE(display.value_text == "nil");
        REQUIRE(display.output_text == "Hello");
        REQUIRE(display.error_text == "Arithmetic Error: division by zero in 1 / 0 (line 2)");
    }
}

TEST_CASE("One-line summaries") {
    REQUIRE(rf::create_summary({.success = true,
                                .value_text = "42",
                                .output_text = "hi",
                                .error_text = std::nullopt,
                                .elapsed_text = "3ms"}) == "Result: 42 | Output: hi | Executed in 3ms");

    REQUIRE(rf::create_summary({.success = true,
                                .value_text = "nil",
                                .output_text = std::nullopt,
                                .error_text = std::nullopt,
                                .elapsed_text = "< 1ms"}) == "Executed in < 1ms");

    REQUIRE(rf::create_summary({.success = false,
                                .value_text = "nil",
                                .output_text = std::nullopt,
                                .error_text = "Runtime Error: boom (line 1)",
                                .elapsed_text = "5ms"}) == "Error: Runtime Error: boom (line 1) | Failed in 5ms");

    SECTION("Long fields are cut without splitting characters") {
        std::string wide;
        for (int i = 0; i < 150; ++i) {
            wide += "\xc3\xa9"; // U+00E9
        }

        auto summary = rf::create_summary({.success = true,
                                           .value_text = "nil",
                                           .output_text = wide,
                                           .error_text = std::nullopt,
                                           .elapsed_text = "1ms"});

        REQUIRE(summary == "Output: " + wide.substr(0, 200) + " | Executed in 1ms");
    }
}
