#pragma once

#include <codekata/common/error_types.hpp>
#include <codekata/common/expected.hpp>
#include <codekata/common/formatters/debug.hpp>
#include <codekata/grading/grading_spec.hpp>
#include <codekata/sandbox/sandbox_options.hpp>

#include "output/verbosity.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace codekata {

struct ProgramOptions
{

    // ###### Argument fields

    VerbosityLevel verbosity = DEFAULT_VERBOSITY_LEVEL;

    /// Kata snippet to run
    std::string file_name;

    std::chrono::milliseconds timeout = SandboxOptions::DEFAULT_TIMEOUT;
    std::size_t memory_mb = DEFAULT_MEMORY_MB;
    std::size_t max_output_kb = DEFAULT_MAX_OUTPUT_KB;
    bool capture_output = true;

    /// --expect and --expect-result are mutually exclusive
    std::optional<std::string> expected_output;
    std::optional<std::string> expected_result;

    Difficulty difficulty = Difficulty::Unspecified;

    /// Only run the safety gate
    bool check_only = false;

    enum class ColorizeOpt { Auto, Always, Never } colorize_option = ColorizeOpt::Auto;

    // ###### Argument defaults

    static constexpr std::size_t DEFAULT_MEMORY_MB = SandboxOptions::DEFAULT_MEMORY_CEILING / (1024 * 1024);
    static constexpr std::size_t DEFAULT_MAX_OUTPUT_KB = SandboxOptions::DEFAULT_MAX_OUTPUT_BYTES / 1024;
    static constexpr auto DEFAULT_VERBOSITY_LEVEL = VerbosityLevel::Summary;

    static Expected<void, std::string> ensure_is_regular_file(const std::filesystem::path& path,
                                                              fmt::format_string<std::string> fmt) {
        if (!std::filesystem::exists(path)) {
            return (fmt::format(fmt, path.string()) + " does not exist");
        }

        if (!std::filesystem::is_regular_file(path)) {
            return (fmt::format(fmt, path.string()) + " is not a regular file");
        }

        return {};
    }

    SandboxOptions sandbox_options() const {
        return {.timeout = timeout,
                .memory_ceiling = memory_mb * 1024 * 1024,
                .capture_output = capture_output,
                .max_output_bytes = max_output_kb * 1024,
                .max_call_depth = SandboxOptions::DEFAULT_MAX_CALL_DEPTH};
    }

    /// nullopt unless one of --expect or --expect-result was given
    std::optional<GradingSpec> grading_spec() const {
        if (expected_output) {
            return ExpectedOutput{*expected_output};
        }
        if (expected_result) {
            return TestCase{{{std::string{TestCase::EXPECTED_RESULT}, *expected_result}}};
        }
        return std::nullopt;
    }

    /// Verify that all fields are valid
    Expected<void, std::string> validate() {
        // Verbosity is clamped to [MIN, MAX] rather than rejected
        constexpr auto MAX_VERBOSITY = VerbosityLevel::Max;
        constexpr auto MIN_VERBOSITY = VerbosityLevel{};

        verbosity = std::clamp(verbosity, MIN_VERBOSITY, MAX_VERBOSITY);

        if (expected_output && expected_result) {
            return std::string{"--expect and --expect-result may not be used together"};
        }

        TRY(ensure_is_regular_file(file_name, "Snippet file {:?}"));

        TRY(sandbox_options().validate());

        return {};
    }
};

} // namespace codekata

template <>
struct fmt::formatter<::codekata::ProgramOptions> : ::codekata::DebugFormatter
{
    auto format(const ::codekata::ProgramOptions& from, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(),
                              "{{verbosity={}, file_name={:?}, timeout={}ms, memory={}MiB, max_output={}KiB, "
                              "capture={}, expect={:?}, expect_result={:?}, difficulty={}, check_only={}, color_opt={}}}",
                              fmt::underlying(from.verbosity), from.file_name, from.timeout.count(), from.memory_mb,
                              from.max_output_kb, from.capture_output, from.expected_output.value_or(""),
                              from.expected_result.value_or(""), from.difficulty, from.check_only,
                              fmt::underlying(from.colorize_option));
    }
};
