#include "catch2_custom.hpp"

#include <codekata/classified_error.hpp>
#include <codekata/common/linux.hpp>
#include <codekata/execution_result.hpp>
#include <codekata/lang/value.hpp>
#include <codekata/sandbox/sandbox.hpp>
#include <codekata/sandbox/sandbox_options.hpp>

#include <fmt/format.h>

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

#include <signal.h>

using namespace std::chrono_literals;
using codekata::ErrorCategory;
using codekata::ExecutionResult;
using codekata::Sandbox;
using codekata::SandboxOptions;
using codekata::lang::Value;

TEST_CASE("Empty and trivial programs") {
    Sandbox sandbox;

    auto empty = sandbox.run("", {});
    REQUIRE(empty.success());
    REQUIRE_FALSE(empty.value.has_value());
    REQUIRE(empty.output.empty());

    auto sum = sandbox.run("1 + 1", {});
    REQUIRE(sum.success());
    REQUIRE(sum.value.has_value());
    REQUIRE(*sum.value == Value::integer(2));
    REQUIRE(sum.output.empty());
}

TEST_CASE("Composite values come back intact") {
    Sandbox sandbox;

    auto result = sandbox.run("%{:name => \"kata\", :scores => [1, 2.5, {:ok, nil}]}", {});
    REQUIRE(result.success());
    REQUIRE(codekata::lang::inspect(*result.value) == R"(%{:name => "kata", :scores => [1, 2.5, {:ok, nil}]})");
}

TEST_CASE("Output produced before a fault is kept") {
    Sandbox sandbox;

    auto result = sandbox.run("IO.puts(\"Hello\")\n1 / 0", {});
    REQUIRE_FALSE(result.success());
    REQUIRE(result.output == "Hello\n");
    REQUIRE(result.error->category == ErrorCategory::ArithmeticError);
    REQUIRE_THAT(result.error->message, Catch::Matchers::StartsWith("Arithmetic Error: division by zero"));
}

TEST_CASE("Front-end failures are classified") {
    Sandbox sandbox;

    REQUIRE(sandbox.run("1 +", {}).error->category == ErrorCategory::SyntaxError);
    REQUIRE(sandbox.run("y = x", {}).error->category == ErrorCategory::CompileError);
    REQUIRE(sandbox.run("nope()", {}).error->category == ErrorCategory::UndefinedOperation);
    REQUIRE(sandbox.run("raise(\"stop\")", {}).error ==
            codekata::ClassifiedError{ErrorCategory::UnknownRuntimeError, "Runtime Error: stop (line 1)"});
}

TEST_CASE("Infinite loops time out") {
    Sandbox sandbox;
    SandboxOptions options{.timeout = 100ms};

    auto start = std::chrono::steady_clock::now();
    auto result = sandbox.run("IO.puts(\"started\")\nwhile true do end", options);
    auto took = std::chrono::steady_clock::now() - start;

    REQUIRE_FALSE(result.success());
    REQUIRE(result.error == codekata::make_timeout_error(100ms));
    REQUIRE(result.error->message ==
            "Execution timed out after 100ms. Check for infinite loops or unbounded recursion.");
    REQUIRE(result.output == "started\n");
    REQUIRE(result.elapsed >= 100ms);
    REQUIRE(took < 2s);
}

TEST_CASE("Resource limits end the run") {
    Sandbox sandbox;

    SECTION("Memory") {
        SandboxOptions options{.memory_ceiling = std::size_t{1024} * 1024};

        auto result = sandbox.run("String.duplicate(\"x\", 10000000)", options);
        REQUIRE(result.error->category == ErrorCategory::ResourceExceeded);
        REQUIRE_THAT(result.error->message, Catch::Matchers::ContainsSubstring("memory"));
    }

    SECTION("Output") {
        SandboxOptions options{.max_output_bytes = 100};

        auto result = sandbox.run("while true do IO.puts(\"spam\") end", options);
        REQUIRE(result.error->category == ErrorCategory::ResourceExceeded);
        REQUIRE_THAT(result.error->message, Catch::Matchers::ContainsSubstring("output size"));
        REQUIRE(result.output.size() <= 100);
    }

    SECTION("Recursion") {
        auto result = sandbox.run("def down(n) do down(n + 1) end\ndown(0)", {});
        REQUIRE(result.error->category == ErrorCategory::ResourceExceeded);
        REQUIRE_THAT(result.error->message, Catch::Matchers::ContainsSubstring("stack depth"));
    }
}

TEST_CASE("Output can be discarded") {
    Sandbox sandbox;
    SandboxOptions options{.capture_output = false};

    auto result = sandbox.run("IO.puts(\"hidden\")\n5", options);
    REQUIRE(result.success());
    REQUIRE(result.output.empty());
    REQUIRE(*result.value == Value::integer(5));
}

TEST_CASE("Runs share no state") {
    Sandbox sandbox;

    REQUIRE(sandbox.run("x = 1", {}).success());
    REQUIRE(sandbox.run("x", {}).error->category == ErrorCategory::CompileError);
}

TEST_CASE("Invalid options are reported, not run") {
    Sandbox sandbox;
    SandboxOptions options{.timeout = 0ms};

    auto result = sandbox.run("1", options);
    REQUIRE(result.error->category == ErrorCategory::UnknownRuntimeError);
    REQUIRE_THAT(result.error->message, Catch::Matchers::StartsWith("Runtime Error: invalid sandbox options"));
}

TEST_CASE("Memory ceilings must fit a worker report") {
    SandboxOptions options;
    REQUIRE(options.validate().has_value());

    options.memory_ceiling = SandboxOptions::MAX_MEMORY_CEILING;
    REQUIRE(options.validate().has_value());

    options.memory_ceiling = SandboxOptions::MAX_MEMORY_CEILING + 1;
    REQUIRE_FALSE(options.validate().has_value());
    REQUIRE_THAT(options.validate().error(), Catch::Matchers::StartsWith("memory ceiling may be at most"));

    Sandbox sandbox;
    REQUIRE(sandbox.run("1", options).error->category == ErrorCategory::UnknownRuntimeError);
}

TEST_CASE("Concurrent runs are independent") {
    Sandbox sandbox{2};
    REQUIRE(sandbox.max_concurrent_workers() == 2);

    constexpr std::size_t NUM_RUNS = 6;
    std::array<ExecutionResult, NUM_RUNS> results;

    {
        std::vector<std::jthread> threads;
        for (std::size_t i = 0; i < NUM_RUNS; ++i) {
            threads.emplace_back([&sandbox, &results, i] {
                results[i] = sandbox.run(fmt::format("IO.puts({0})\n{0} * 10", i), {});
            });
        }
    }

    for (std::size_t i = 0; i < NUM_RUNS; ++i) {
        INFO(i);
        REQUIRE(results[i].success());
        REQUIRE(results[i].output == fmt::format("{}\n", i));
        REQUIRE(*results[i].value == Value::integer(static_cast<std::int64_t>(i * 10)));
    }
}

TEST_CASE("Signals that end a worker are named") {
    codekata::linux::Signal kill = SIGKILL;
    REQUIRE(kill == SIGKILL);
    REQUIRE(kill.name() == "SIGKILL");
    REQUIRE(kill.to_string() == "Killed");

    codekata::linux::Signal bogus = 999;
    REQUIRE(bogus.name() == "signal 999");
    REQUIRE(bogus.to_string() == "signal 999");
}
