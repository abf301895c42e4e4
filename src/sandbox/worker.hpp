#pragma once

#include <codekata/common/class_traits.hpp>
#include <codekata/common/error_types.hpp>
#include <codekata/common/linux.hpp>
#include <codekata/execution_result.hpp>
#include <codekata/sandbox/sandbox_options.hpp>

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

#include <sys/types.h>

namespace codekata {

/// A forked process that evaluates exactly one submission.
///
/// The child never execs; it runs a fresh interpreter on the source it inherited and reports
/// back over two pipes owned by this object only: one streaming program output, one carrying
/// the final ``WorkerReport``. The child never logs and always leaves through ``_exit``.
class Worker : NonMovable
{
public:
    Worker(std::string_view source, const SandboxOptions& options);

    /// Kills and (asynchronously) reaps the child if it is still around
    ~Worker();

    /// Forks the child. Failures here are infrastructure failures of the host.
    Result<void> start();

    /// Collects output and the report until the child finishes or the deadline passes,
    /// then classifies what happened. Only valid after a successful ``start``.
    ExecutionResult finish();

private:
    [[noreturn]] void run_child();

    /// Drains whatever is readable on ``fd`` into ``into``, stopping early once ``into`` grows
    /// past ``cap``. Returns false on EOF.
    static Result<bool> drain(int fd, std::string& into, std::size_t cap);

    ExecutionResult collect();

    ExecutionResult timed_out();

    ExecutionResult lost_contact(std::string_view what);

    ExecutionResult classify_exit(int status);

    /// SIGKILL, then hand reaping off to a detached thread
    void kill_and_forget();

    Result<void> close_pipes();

    std::chrono::milliseconds elapsed() const;

    std::string_view source_;
    SandboxOptions options_;

    pid_t child_pid_ = 0;
    bool reaped_ = false;

    linux::Pipe output_pipe_{.read_fd = -1, .write_fd = -1};
    linux::Pipe report_pipe_{.read_fd = -1, .write_fd = -1};

    std::string output_;
    std::string report_;

    std::chrono::steady_clock::time_point start_time_;
    std::chrono::steady_clock::time_point deadline_;
};

} // namespace codekata
