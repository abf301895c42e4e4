#include "app/kata_app.hpp"

#include <codekata/engine.hpp>
#include <codekata/execution_result.hpp>
#include <codekata/format/result_formatter.hpp>
#include <codekata/grading/grading_spec.hpp>
#include <codekata/grading/solution_evaluator.hpp>
#include <codekata/logging.hpp>
#include <codekata/output/sink.hpp>
#include <codekata/sandbox/safety_gate.hpp>
#include <codekata/sandbox/sandbox.hpp>

#include "output/console_reporter.hpp"
#include "user/program_options.hpp"

#include <fmt/format.h>

#include <cstdlib>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

namespace codekata {

namespace {

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file{path, std::ios::binary};
    if (!file) {
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return std::move(contents).str();
}

} // namespace

KataApp::KataApp(ProgramOptions opts, Sink& sink)
    : OPTS{std::move(opts)}
    , sink_{sink} {}

int KataApp::run() {
    ConsoleReporter reporter{sink_, OPTS.colorize_option, OPTS.verbosity};

    auto source = read_file(OPTS.file_name);
    if (!source) {
        reporter.on_error(fmt::format("Could not read {:?}", OPTS.file_name));
        reporter.finalize();
        return EXIT_BAD_ARGUMENTS;
    }

    reporter.on_run_begin(OPTS.file_name);

    SafetyGate gate;
    Sandbox sandbox;
    Engine engine{gate, sandbox};

    if (OPTS.check_only) {
        auto safe = engine.check_safety(*source);
        if (!safe) {
            reporter.on_rejected(safe.error());
        } else {
            reporter.on_safe();
        }
        reporter.finalize();
        return safe ? EXIT_SUCCESS : EXIT_REJECTED;
    }

    auto executed = engine.try_execute(*source, OPTS.sandbox_options());
    if (!executed) {
        LOG_DEBUG("{:?} was rejected on {:?}", OPTS.file_name, executed.error().rule);
        reporter.on_rejected(executed.error());
        reporter.finalize();
        return EXIT_REJECTED;
    }

    const ExecutionResult& result = executed.value();
    reporter.on_result(result_formatter::format(result));

    std::optional<Verdict> verdict;

    if (auto spec = OPTS.grading_spec()) {
        FeedbackGenerator feedback;
        SolutionEvaluator evaluator{feedback};

        verdict = evaluator.evaluate(*spec, result, OPTS.difficulty);
        reporter.on_verdict(*verdict);
    }

    reporter.finalize();
    return exit_code_for(result, verdict);
}

int exit_code_for(const ExecutionResult& result, const std::optional<Verdict>& verdict) {
    if (verdict) {
        return verdict->passed ? EXIT_SUCCESS : EXIT_FAILURE;
    }
    return result.success() ? EXIT_SUCCESS : EXIT_FAILURE;
}

} // namespace codekata
