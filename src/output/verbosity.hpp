#pragma once

namespace codekata {

/// `Max` is just used as a sentinal
enum class VerbosityLevel {
    Silent,  ///< Nothing at all; only the exit code
    Quiet,   ///< The PASSED/FAILED banner and the error, if any
    Summary, ///< Result, output and error
    All,     ///< Additionally the one-line summary and elapsed time
    Max
};

constexpr bool should_output_banner(VerbosityLevel level) {
    using enum VerbosityLevel;

    return level >= Quiet;
}

constexpr bool should_output_details(VerbosityLevel level) {
    using enum VerbosityLevel;

    return level >= Summary;
}

constexpr bool should_output_summary(VerbosityLevel level) {
    using enum VerbosityLevel;

    return level >= All;
}

} // namespace codekata
