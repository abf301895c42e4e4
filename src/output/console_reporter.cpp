#include "output/console_reporter.hpp"

#include <codekata/format/result_formatter.hpp>
#include <codekata/grading/grading_spec.hpp>
#include <codekata/logging.hpp>
#include <codekata/output/sink.hpp>
#include <codekata/sandbox/safety_gate.hpp>

#include "common/terminal_checks.hpp"
#include "output/verbosity.hpp"
#include "user/program_options.hpp"

#include <fmt/color.h>
#include <fmt/format.h>

#include <algorithm>
#include <cstddef>
#include <cstdio>
#include <string>
#include <string_view>

#include <sys/ioctl.h>

namespace codekata {

ConsoleReporter::ConsoleReporter(Sink& sink, ProgramOptions::ColorizeOpt colorize_option, VerbosityLevel verbosity)
    : sink_{sink}
    , verbosity_{verbosity}
    , do_colorize_{process_colorize_opt(colorize_option)}
    , terminal_width_{get_terminal_width()} {}

void ConsoleReporter::on_run_begin(std::string_view file_name) {
    if (!should_output_summary(verbosity_)) {
        return;
    }

    sink_.write(fmt::format("{0}\nSnippet: {1}\n{0}\n", line_divider_em(terminal_width_), file_name));
}

void ConsoleReporter::on_safe() {
    if (!should_output_banner(verbosity_)) {
        return;
    }

    sink_.write(fmt::format("{} no restricted operations found\n", style_str("SAFE", SUCCESS_STYLE)));
}

void ConsoleReporter::on_rejected(const Rejection& rejection) {
    if (!should_output_banner(verbosity_)) {
        return;
    }

    sink_.write(fmt::format("{} restricted operation: {} ({})\n", style_str("REJECTED", ERROR_STYLE),
                            style(rejection.rule, VALUE_STYLE), describe(rejection.capability)));
}

void ConsoleReporter::on_result(const DisplayResult& display) {
    if (should_output_banner(verbosity_)) {
        std::string banner = display.success ? style_str("PASSED", SUCCESS_STYLE) : style_str("FAILED", ERROR_STYLE);
        sink_.write(fmt::format("Execution {}\n", banner));
    }

    if (should_output_details(verbosity_)) {
        if (display.success) {
            labeled("Result", display.value_text, VALUE_STYLE);
        }

        if (display.output_text) {
            labeled("Output", *display.output_text, VALUE_STYLE);
        }
    }

    // Errors are shown even when quiet; they are the point of a failed run
    if (display.error_text && should_output_banner(verbosity_)) {
        labeled("Error", *display.error_text, ERROR_STYLE);
    }

    if (should_output_summary(verbosity_)) {
        labeled("Time", display.elapsed_text, {});
        sink_.write(fmt::format("{}\n{}\n", line_divider(terminal_width_), result_formatter::create_summary(display)));
    }
}

void ConsoleReporter::on_verdict(const Verdict& verdict) {
    if (!should_output_banner(verbosity_)) {
        return;
    }

    std::string banner = verdict.passed ? style_str("PASSED", SUCCESS_STYLE) : style_str("FAILED", ERROR_STYLE);
    sink_.write(fmt::format("{}\nSolution {}\n", line_divider(terminal_width_), banner));

    if (should_output_details(verbosity_)) {
        if (verdict.expected_output) {
            labeled("Expected", *verdict.expected_output, VALUE_STYLE);
        }
        if (verdict.actual_output) {
            labeled("Got", *verdict.actual_output, VALUE_STYLE);
        }
    }

    sink_.write(verdict.feedback + "\n");
}

void ConsoleReporter::on_error(std::string_view what) {
    sink_.write(style_str(what, ERROR_STYLE) + "\n");
}

void ConsoleReporter::finalize() {
    sink_.flush();
}

void ConsoleReporter::labeled(std::string_view label, std::string_view text, fmt::text_style text_style) {
    std::string label_text = style_str(fmt::format("{}:", label), LABEL_STYLE);

    // Multi-line values start on their own line
    if (text.find('\n') != std::string_view::npos) {
        sink_.write(fmt::format("{}\n{}\n", label_text, style(text, text_style)));
        return;
    }

    sink_.write(fmt::format("{} {}\n", label_text, style(text, text_style)));
}

bool ConsoleReporter::process_colorize_opt(ProgramOptions::ColorizeOpt colorize_option) {
    switch (colorize_option) {
    case ProgramOptions::ColorizeOpt::Always:
        return true;
    case ProgramOptions::ColorizeOpt::Never:
        return false;
    case ProgramOptions::ColorizeOpt::Auto:
        break;
    }

    return in_terminal(stdout) && is_color_terminal();
}

std::size_t ConsoleReporter::get_terminal_width() {
    auto width = terminal_size(stdout);

    if (!width) {
        LOG_DEBUG("Could not obtain terminal width because {}. Defaulting to {}", width.error().message(),
                  DEFAULT_WIDTH);
        return DEFAULT_WIDTH;
    }

    return std::clamp<std::size_t>(width.value().ws_col, 1, DEFAULT_WIDTH);
}

} // namespace codekata
