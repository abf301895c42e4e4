#pragma once

#include <codekata/common/class_traits.hpp>
#include <codekata/execution_result.hpp>
#include <codekata/grading/grading_spec.hpp>
#include <codekata/output/sink.hpp>

#include "user/cl_args.hpp"
#include "user/program_options.hpp"

#include <optional>

namespace codekata {

/// Exit code for a snippet that the safety gate refused
inline constexpr int EXIT_REJECTED = EXIT_BAD_ARGUMENTS;

/// Runs one snippet as described by the command line and reports to ``sink``
class KataApp : NonCopyable
{
public:
    KataApp(ProgramOptions opts, Sink& sink);

    /// Returns the process exit code:
    ///   0                  - safe (``--check-only``), or ran and passed
    ///   1                  - the run failed, or the verdict did
    ///   EXIT_BAD_ARGUMENTS - the snippet could not be read
    ///   EXIT_REJECTED      - the snippet was refused by the safety gate
    int run();

    const ProgramOptions OPTS;

private:
    Sink& sink_;
};

/// A grading verdict, when there is one, decides over the run's own outcome
int exit_code_for(const ExecutionResult& result, const std::optional<Verdict>& verdict);

} // namespace codekata
