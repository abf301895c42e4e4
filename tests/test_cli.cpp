#include "catch2_custom.hpp"

#include <codekata/classified_error.hpp>
#include <codekata/execution_result.hpp>
#include <codekata/grading/grading_spec.hpp>
#include <codekata/lang/value.hpp>
#include <codekata/output/sink.hpp>
#include <codekata/sandbox/sandbox_options.hpp>

#include "app/kata_app.hpp"
#include "output/verbosity.hpp"
#include "user/cl_args.hpp"
#include "user/program_options.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <initializer_list>
#include <optional>
#include <string>
#include <variant>
#include <vector>

using namespace std::chrono_literals;
using namespace codekata;
using Catch::Matchers::ContainsSubstring;

namespace {

const auto resources_path = std::filesystem::path{RESOURCES_DIR} / "cli";

std::string snippet(const char* name) {
    return (resources_path / name).string();
}

Expected<ProgramOptions, std::string> parse(std::initializer_list<std::string> args) {
    std::vector<std::string> owned{"codekata"};
    owned.insert(owned.end(), args.begin(), args.end());

    std::vector<const char*> argv;
    for (const auto& arg : owned) {
        argv.push_back(arg.c_str());
    }

    CommandLineArgs cl_args{argv};
    return cl_args.parse();
}

int run_app(std::initializer_list<std::string> args, StringSink& sink) {
    auto options = parse(args);
    REQUIRE(options.has_value());

    options.value().colorize_option = ProgramOptions::ColorizeOpt::Never;

    KataApp app{options.value(), sink};
    return app.run();
}

} // namespace

TEST_CASE("Parsing a valid command line") {
    auto hello = snippet("hello.kata");

    SECTION("Defaults") {
        auto options = parse({hello});
        REQUIRE(options.has_value());

        REQUIRE(options.value().file_name == hello);
        REQUIRE(options.value().verbosity == ProgramOptions::DEFAULT_VERBOSITY_LEVEL);
        REQUIRE(options.value().grading_spec() == std::nullopt);
        REQUIRE(options.value().timeout == SandboxOptions::DEFAULT_TIMEOUT);
        REQUIRE(options.value().sandbox_options().memory_ceiling == SandboxOptions::DEFAULT_MEMORY_CEILING);
        REQUIRE(options.value().sandbox_options().max_output_bytes == SandboxOptions::DEFAULT_MAX_OUTPUT_BYTES);
        REQUIRE_FALSE(options.value().check_only);
    }

    SECTION("Every option") {
        auto options = parse({hello, "--timeout", "500", "-m", "16", "--max-output", "4", "--no-capture", "-e",
                              "Hello, World!", "-d", "advanced", "-q", "--check-only", "--color", "never"});
        REQUIRE(options.has_value());

        const auto& opts = options.value();
        REQUIRE(opts.timeout == 500ms);
        REQUIRE(opts.sandbox_options().memory_ceiling == 16U * 1024 * 1024);
        REQUIRE(opts.sandbox_options().max_output_bytes == 4U * 1024);
        REQUIRE_FALSE(opts.capture_output);
        REQUIRE(opts.difficulty == Difficulty::Advanced);
        REQUIRE(opts.verbosity == VerbosityLevel::Quiet);
        REQUIRE(opts.check_only);
        REQUIRE(opts.colorize_option == ProgramOptions::ColorizeOpt::Never);

        auto spec = opts.grading_spec();
        REQUIRE(spec.has_value());
        REQUIRE(std::get<ExpectedOutput>(*spec).text == "Hello, World!");
    }

    SECTION("An expected result is a literal") {
        auto options = parse({hello, "--expect-result", "[1, 2, 3]"});
        REQUIRE(options.has_value());
        REQUIRE(std::holds_alternative<TestCase>(options.value().grading_spec().value()));
    }
}

TEST_CASE("Parsing an invalid command line") {
    auto hello = snippet("hello.kata");

    SECTION("Non-numeric limits") {
        auto options = parse({hello, "--timeout", "soon"});
        REQUIRE_FALSE(options.has_value());
        REQUIRE_THAT(options.error(), ContainsSubstring("Timeout must be a positive integer"));

        REQUIRE_FALSE(parse({hello, "-m", "0"}).has_value());
        REQUIRE_FALSE(parse({hello, "--max-output", "-3"}).has_value());
    }

    SECTION("Two kinds of expectation") {
        auto options = parse({hello, "-e", "1", "-r", "1"});
        REQUIRE(options == std::string{"--expect and --expect-result may not be used together"});
    }

    SECTION("Missing snippet") {
        auto options = parse({snippet("missing.kata")});
        REQUIRE_FALSE(options.has_value());
        REQUIRE_THAT(options.error(), ContainsSubstring("does not exist"));
    }

    SECTION("No snippet at all") {
        REQUIRE_FALSE(parse({}).has_value());
    }

    SECTION("Unknown difficulty") {
        REQUIRE_FALSE(parse({hello, "-d", "expert"}).has_value());
    }
}

TEST_CASE("Exit codes of a CLI run") {
    StringSink sink;

    SECTION("Clean run") {
        REQUIRE(run_app({snippet("answer.kata")}, sink) == EXIT_SUCCESS);
        REQUIRE_THAT(sink.str(), ContainsSubstring("Execution PASSED"));
        REQUIRE_THAT(sink.str(), ContainsSubstring("Result: 42"));
    }

    SECTION("Run that raises") {
        REQUIRE(run_app({snippet("divide.kata")}, sink) == EXIT_FAILURE);
        REQUIRE_THAT(sink.str(), ContainsSubstring("Arithmetic Error"));
    }

    SECTION("Graded run that passes") {
        REQUIRE(run_app({snippet("hello.kata"), "-e", "Hello, World!"}, sink) == EXIT_SUCCESS);
        REQUIRE_THAT(sink.str(), ContainsSubstring("Solution PASSED"));
    }

    SECTION("Graded run that fails") {
        REQUIRE(run_app({snippet("answer.kata"), "-r", "41"}, sink) == EXIT_FAILURE);
        REQUIRE_THAT(sink.str(), ContainsSubstring("Solution FAILED"));
    }

    SECTION("Rejected snippet") {
        REQUIRE(run_app({snippet("dangerous.kata")}, sink) == EXIT_REJECTED);
        REQUIRE_THAT(sink.str(), ContainsSubstring("REJECTED restricted operation: System."));
        REQUIRE_THAT(sink.str(), !ContainsSubstring("Execution"));
    }

    SECTION("Check only") {
        REQUIRE(run_app({snippet("divide.kata"), "--check-only"}, sink) == EXIT_SUCCESS);
        REQUIRE_THAT(sink.str(), ContainsSubstring("SAFE"));
        REQUIRE_THAT(sink.str(), !ContainsSubstring("Arithmetic Error"));

        StringSink rejected_sink;
        REQUIRE(run_app({snippet("dangerous.kata"), "--check-only"}, rejected_sink) == EXIT_REJECTED);
    }

    SECTION("Silent runs still exit with the outcome") {
        REQUIRE(run_app({snippet("divide.kata"), "-q", "-q"}, sink) == EXIT_FAILURE);
        REQUIRE(sink.str().empty());
    }

    SECTION("Unreadable snippet") {
        KataApp app{ProgramOptions{.file_name = snippet("missing.kata")}, sink};
        REQUIRE(app.run() == EXIT_BAD_ARGUMENTS);
        REQUIRE_THAT(sink.str(), ContainsSubstring("Could not read"));
    }
}

TEST_CASE("A verdict decides the exit code over the run") {
    auto ok = ExecutionResult::make_success(lang::Value::integer(1), "", 1ms);
    auto failed = ExecutionResult::make_failure({ErrorCategory::UnknownRuntimeError, "boom"}, "", 1ms);

    REQUIRE(exit_code_for(ok, std::nullopt) == EXIT_SUCCESS);
    REQUIRE(exit_code_for(failed, std::nullopt) == EXIT_FAILURE);

    REQUIRE(exit_code_for(ok, Verdict{.passed = false}) == EXIT_FAILURE);
    REQUIRE(exit_code_for(failed, Verdict{.passed = true}) == EXIT_SUCCESS);
}
