#pragma once

#include <codekata/format/result_formatter.hpp>
#include <codekata/grading/grading_spec.hpp>
#include <codekata/output/sink.hpp>
#include <codekata/sandbox/safety_gate.hpp>

#include "output/verbosity.hpp"
#include "user/program_options.hpp"

#include <fmt/color.h>
#include <fmt/format.h>

#include <cstddef>
#include <string>
#include <string_view>

namespace codekata {

/// Human readable report of one CLI run
class ConsoleReporter
{
public:
    ConsoleReporter(Sink& sink, ProgramOptions::ColorizeOpt colorize_option, VerbosityLevel verbosity);

    void on_run_begin(std::string_view file_name);
    void on_safe();
    void on_rejected(const Rejection& rejection);
    void on_result(const DisplayResult& display);
    void on_verdict(const Verdict& verdict);

    void on_error(std::string_view what);

    void finalize();

private:
    void labeled(std::string_view label, std::string_view text, fmt::text_style text_style);

    static bool process_colorize_opt(ProgramOptions::ColorizeOpt colorize_option);
    static std::size_t get_terminal_width();

    template <typename T>
    auto style(const T& arg, fmt::text_style style) const -> decltype(fmt::styled(arg, style));

    template <typename T>
    std::string style_str(const T& arg, fmt::text_style style) const;

    // Basic styles for different kinds of output:
    //   error    - FAILED messages, fatal errors, etc.
    //   success  - PASSED messages
    //   label    - field names like "Result:"
    //   value    - values and program output
    static constexpr auto ERROR_STYLE = fmt::fg(fmt::color::red) | fmt::emphasis::bold;
    static constexpr auto WARNING_STYLE = fmt::fg(fmt::color::yellow) | fmt::emphasis::bold;
    static constexpr auto SUCCESS_STYLE = fmt::fg(fmt::color::lime_green);
    static constexpr auto LABEL_STYLE = fmt::emphasis::bold;
    static constexpr auto VALUE_STYLE = fmt::fg(fmt::color::aqua);

    static constexpr std::size_t DEFAULT_WIDTH = 80;

    // Line Divider Emphasized    : "======="...
    // Line Divider               : "--------...
    static std::string line_divider(std::size_t len) { return std::string(len, '-'); }
    static std::string line_divider_em(std::size_t len) { return std::string(len, '='); }

    Sink& sink_;
    VerbosityLevel verbosity_;
    bool do_colorize_;
    std::size_t terminal_width_;
};

template <typename T>
auto ConsoleReporter::style(const T& arg, fmt::text_style style) const -> decltype(fmt::styled(arg, style)) {
    if (!do_colorize_) {
        return fmt::styled(arg, {});
    }
    return fmt::styled(arg, style);
}

template <typename T>
std::string ConsoleReporter::style_str(const T& arg, fmt::text_style style) const {
    return fmt::format("{}", this->style(arg, style));
}

} // namespace codekata
