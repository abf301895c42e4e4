#include "user/cl_args.hpp"

#include <codekata/common/expected.hpp>
#include <codekata/grading/grading_spec.hpp>
#include <codekata/logging.hpp>
#include <codekata/version.hpp>

#include "common/terminal_checks.hpp"
#include "user/program_options.hpp"

#include <argparse/argparse.hpp>
#include <fmt/color.h>
#include <fmt/format.h>

#include <chrono>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

namespace codekata {

CommandLineArgs::CommandLineArgs(std::span<const char*> args)
    : arg_parser_{get_basename(args[0]), CODEKATA_VERSION_STRING, argparse::default_arguments::help}
    , args_{args.begin(), args.end()} {
    // Add parser arguments
    setup_parser();
}

namespace {

std::size_t parse_positive(const std::string& opt, std::string_view what) {
    std::size_t pos = 0;
    unsigned long long value = 0; // NOLINT(google-runtime-int)

    try {
        value = std::stoull(opt, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument(fmt::format("{} must be a positive integer (got {:?})", what, opt));
    }

    if (pos != opt.size() || value == 0 || opt.front() == '-') {
        throw std::invalid_argument(fmt::format("{} must be a positive integer (got {:?})", what, opt));
    }

    return static_cast<std::size_t>(value);
}

} // namespace

void CommandLineArgs::setup_parser() {
    if (auto term_sz = terminal_size(stdout)) {
        arg_parser_.set_usage_max_line_width(term_sz->ws_col * 3 / 4);
    } else {
        constexpr std::size_t DEFAULT_MAX_WIDTH = 80;
        LOG_DEBUG("Failed to get terminal size. Setting max width to 80");
        arg_parser_.set_usage_max_line_width(DEFAULT_MAX_WIDTH);
    }

    arg_parser_.add_description(fmt::format("codekata v{}: run and grade Kata snippets in a sandbox",
                                            CODEKATA_VERSION_STRING));

    // FIXME: argparse is kind of annoying. Behavior is dependant upon ORDER of chained fn calls.

    // clang-format off
    arg_parser_.add_argument("file")
        .store_into(opts_buffer_.file_name)
        .help("The Kata snippet to run");

    // Verbatim from argparse.hpp, except replacing `-v` with `-V`
    arg_parser_.add_argument("-V", "--version")
        .default_value(false)
        .implicit_value(true)
        .nargs(0)
        .action([&](const auto & /*unused*/) {
            fmt::print("{}\n", CODEKATA_VERSION_STRING);
            std::exit(0);
        })
        .help("prints version information and exits");

    {
        // Block to reduce scope of `using enum`

        using enum VerbosityLevel;

        constexpr auto DEFAULT_VERBOSITY_VALUE =
            static_cast<VerbosityLevelUnderlyingT>(ProgramOptions::DEFAULT_VERBOSITY_LEVEL);
        constexpr auto MAX_VERBOSITY_VALUE = static_cast<VerbosityLevelUnderlyingT>(Max);
        constexpr auto MIN_VERBOSITY_VALUE = static_cast<VerbosityLevelUnderlyingT>(Silent);

        constexpr auto MAX_VERBOSITY_INCREASE = MAX_VERBOSITY_VALUE - DEFAULT_VERBOSITY_VALUE;
        constexpr auto MAX_VERBOSITY_DECREASE = DEFAULT_VERBOSITY_VALUE - MIN_VERBOSITY_VALUE;

        arg_parser_.add_argument("-v", "--verbose")
            .flag()
            .action([this] (const std::string& /*unused*/) {
                    auto level = static_cast<VerbosityLevelUnderlyingT>(opts_buffer_.verbosity) + 1;

                    if (level > MAX_VERBOSITY_VALUE) {
                        throw std::invalid_argument("Verbosity specification exceeds maximum level");
                    }

                    opts_buffer_.verbosity = static_cast<VerbosityLevel>(level);
                })
            .append()
            .help(fmt::format("Increase verbosity level (up to {}x)", MAX_VERBOSITY_INCREASE));

        arg_parser_.add_argument("-q", "--quiet")
            .flag()
            .action([this] (const std::string& /*unused*/) {
                    auto level = static_cast<VerbosityLevelUnderlyingT>(opts_buffer_.verbosity) - 1;

                    if (level < MIN_VERBOSITY_VALUE) {
                        throw std::invalid_argument("Verbosity specification is lower than minimum level");
                    }

                    opts_buffer_.verbosity = static_cast<VerbosityLevel>(level);
                })
            .append()
            .help(fmt::format("Decrease verbosity level (up to {}x)", MAX_VERBOSITY_DECREASE));

        opts_buffer_.verbosity = ProgramOptions::DEFAULT_VERBOSITY_LEVEL;
    }

    arg_parser_.add_argument("-t", "--timeout")
        .metavar("MS")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.timeout = std::chrono::milliseconds{parse_positive(opt, "Timeout")};
        })
        .help(fmt::format("Wall-clock limit for the run, in milliseconds (default: {})",
                          SandboxOptions::DEFAULT_TIMEOUT.count()));

    arg_parser_.add_argument("-m", "--memory")
        .metavar("MB")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.memory_mb = parse_positive(opt, "Memory limit");
        })
        .help(fmt::format("Memory ceiling, in MiB (default: {})", ProgramOptions::DEFAULT_MEMORY_MB));

    arg_parser_.add_argument("--max-output")
        .metavar("KB")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.max_output_kb = parse_positive(opt, "Output limit");
        })
        .help(fmt::format("Output limit, in KiB (default: {})", ProgramOptions::DEFAULT_MAX_OUTPUT_KB));

    arg_parser_.add_argument("--no-capture")
        .flag()
        .action([this] (const std::string& /*unused*/) { opts_buffer_.capture_output = false; })
        .help("Discard the program's output");

    // Manual implementation of mutually exclusive options, checked in ProgramOptions::validate
    arg_parser_.add_argument("-e", "--expect")
        .metavar("TEXT")
        .nargs(1)
        .action([this] (const std::string& opt) { opts_buffer_.expected_output = opt; })
        .help("Grade the run: trimmed output (or the value, if nothing is printed) must equal TEXT");

    arg_parser_.add_argument("-r", "--expect-result")
        .metavar("LITERAL")
        .nargs(1)
        .action([this] (const std::string& opt) { opts_buffer_.expected_result = opt; })
        .help("Grade the run: the value must equal the Kata literal LITERAL, e.g. \"[1, 2, 3]\"");

    arg_parser_.add_argument("-d", "--difficulty")
        .choices("beginner", "intermediate", "advanced")
        .metavar("LEVEL")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.difficulty = parse_difficulty(opt).value_or(Difficulty::Unspecified);
        })
        .help("Lesson difficulty, which tailors feedback hints");

    arg_parser_.add_argument("--check-only")
        .flag()
        .action([this] (const std::string& /*unused*/) { opts_buffer_.check_only = true; })
        .help("Only run the safety check; do not execute anything");

    arg_parser_.add_argument("-c", "--color")
        .choices("never", "auto", "always")
        .default_value(std::string{"auto"})
        .metavar("WHEN")
        .nargs(1)
        .help("When to use colors")
        .action([this] (const std::string& opt) {
                using enum ProgramOptions::ColorizeOpt;

                if (opt == "never") {
                    opts_buffer_.colorize_option = Never;
                } else if (opt == "auto") {
                    opts_buffer_.colorize_option = Auto;
                } else if (opt == "always") {
                    opts_buffer_.colorize_option = Always;
                }
        });
    // clang-format on
}

Expected<ProgramOptions, std::string> CommandLineArgs::parse() {
    try {
        arg_parser_.parse_args(args_);
    } catch (const std::exception& err) {
        return std::string{err.what()};
    }

    TRY(opts_buffer_.validate());

    LOG_DEBUG("Parsed CLI arguments: {}", opts_buffer_);

    return opts_buffer_;
}

std::string CommandLineArgs::help_message() const {
    return arg_parser_.help().str();
}

std::string CommandLineArgs::usage_message() const {
    return arg_parser_.usage();
}

std::string CommandLineArgs::get_basename(std::string_view full_name) {
    return std::string{full_name.substr(full_name.find_last_of('/') + 1)};
}

ProgramOptions parse_args_or_exit(std::span<const char*> args, int exit_code) noexcept {
    CommandLineArgs cl_args{args};
    auto opts_res = cl_args.parse();

    if (!opts_res) {
        fmt::print(stderr, "{}\n{}\n", fmt::styled(opts_res.error(), fmt::fg(fmt::color::red)), cl_args.usage_message());
        std::exit(exit_code);
    }

    return opts_res.value();
}

} // namespace codekata
