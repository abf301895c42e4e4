#include "sandbox/worker.hpp"

#include "sandbox/report_codec.hpp"

#include <codekata/classified_error.hpp>
#include <codekata/common/error_types.hpp>
#include <codekata/common/expected.hpp>
#include <codekata/common/linux.hpp>
#include <codekata/execution_result.hpp>
#include <codekata/lang/fault.hpp>
#include <codekata/lang/interpreter.hpp>
#include <codekata/lang/memory_budget.hpp>
#include <codekata/logging.hpp>
#include <codekata/output/sink.hpp>
#include <codekata/sandbox/sandbox_options.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <climits>
#include <cstddef>
#include <cstdlib>
#include <new>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <tuple>
#include <utility>
#include <variant>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

namespace codekata {

namespace {

using namespace std::chrono_literals;

constexpr std::size_t READ_CHUNK = 64 * 1024;

/// Room above the memory ceiling for the interpreter itself and allocator overhead
constexpr std::size_t ADDRESS_SPACE_SLACK = std::size_t{64} * 1024 * 1024;

constexpr auto REAP_POLL_INTERVAL = 1ms;

// ----------------------------------------------------------------------------
// Child side. Nothing here may log; only raw syscalls and the non-logging wrappers.

bool write_all(int fd, std::string_view data) {
    while (!data.empty()) {
        ssize_t res = ::write(fd, data.data(), data.size());
        if (res == -1) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        data.remove_prefix(static_cast<std::size_t>(res));
    }
    return true;
}

/// Streams program output straight into the output pipe
class PipeSink : public Sink
{
public:
    explicit PipeSink(int fd)
        : fd_{fd} {}

    // A failed write means the parent stopped listening and is about to kill us
    void write(std::string_view str) override { std::ignore = write_all(fd_, str); }

    void flush() override {}

private:
    int fd_;
};

/// Current virtual size of this process, from /proc/self/statm
std::optional<std::size_t> current_address_space() {
    int fd = ::open("/proc/self/statm", O_RDONLY | O_CLOEXEC);
    if (fd == -1) {
        return std::nullopt;
    }

    std::array<char, 128> buf{};
    ssize_t len = ::read(fd, buf.data(), buf.size());
    ::close(fd);

    if (len <= 0) {
        return std::nullopt;
    }

    std::size_t pages = 0;
    auto [ptr, errc] = std::from_chars(buf.data(), buf.data() + len, pages);
    if (errc != std::errc{}) {
        return std::nullopt;
    }

    return pages * static_cast<std::size_t>(::sysconf(_SC_PAGESIZE));
}

/// Lowers both the soft and hard limit, never asking for more than the current hard limit
Expected<> lower_limit(int resource, rlim_t wanted) {
    auto current = TRY(linux::getrlimit(resource));
    return linux::setrlimit(resource, std::min(wanted, current.rlim_max));
}

/// Closes every inherited descriptor above stderr except the two we report through.
/// Otherwise a sibling worker forked at the same moment would keep our pipes open.
Expected<> isolate_descriptors(int keep_a, int keep_b) {
    auto low = static_cast<unsigned int>(std::min(keep_a, keep_b));
    auto high = static_cast<unsigned int>(std::max(keep_a, keep_b));

    TRY(linux::close_range(STDERR_FILENO + 1, low - 1));
    TRY(linux::close_range(low + 1, high - 1));
    TRY(linux::close_range(high + 1, UINT_MAX));

    return {};
}

Expected<> harden(const SandboxOptions& options) {
    TRY(linux::prctl(PR_SET_PDEATHSIG, SIGKILL));
    TRY(lower_limit(RLIMIT_CORE, 0));
    TRY(lower_limit(RLIMIT_FSIZE, 0));

    auto cpu_seconds = std::chrono::ceil<std::chrono::seconds>(options.timeout).count() + 1;
    TRY(lower_limit(RLIMIT_CPU, static_cast<rlim_t>(cpu_seconds)));

    // The address space already holds a copy of the host; the ceiling is on top of that
    if (auto address_space = current_address_space()) {
        TRY(lower_limit(RLIMIT_AS, *address_space + options.memory_ceiling + ADDRESS_SPACE_SLACK));
    }

    return {};
}

ClassifiedError memory_error(std::size_t ceiling) {
    return make_resource_error(fmt::format("memory (more than {} bytes allocated)", ceiling));
}

ClassifiedError runtime_error(std::string_view what) {
    return {ErrorCategory::UnknownRuntimeError, fmt::format("Runtime Error: {}", what)};
}

} // namespace

Worker::Worker(std::string_view source, const SandboxOptions& options)
    : source_{source}
    , options_{options} {}

Worker::~Worker() {
    kill_and_forget();

    if (auto res = close_pipes(); !res) {
        LOG_WARN("Failed to close worker pipes: {}", res.error());
    }
}

Result<void> Worker::start() {
    output_pipe_ = TRYE(linux::pipe2(O_CLOEXEC), SyscallFailure);
    report_pipe_ = TRYE(linux::pipe2(O_CLOEXEC), SyscallFailure);

    start_time_ = std::chrono::steady_clock::now();
    deadline_ = start_time_ + options_.timeout;

    linux::Fork fork_res = TRYE(linux::fork(), SyscallFailure);

    if (fork_res.which == linux::Fork::Child) {
        run_child();
    }

    child_pid_ = fork_res.pid;
    LOG_DEBUG("Started worker {} (timeout {}ms)", child_pid_, options_.timeout.count());

    // Close the write ends; the child holds the only copies now
    TRYE(linux::close(output_pipe_.write_fd), SyscallFailure);
    output_pipe_.write_fd = -1;
    TRYE(linux::close(report_pipe_.write_fd), SyscallFailure);
    report_pipe_.write_fd = -1;

    for (int read_fd : {output_pipe_.read_fd, report_pipe_.read_fd}) {
        int pre_flags = TRYE(linux::fcntl(read_fd, F_GETFL), SyscallFailure);
        TRYE(linux::fcntl(read_fd, F_SETFL, pre_flags | O_NONBLOCK), SyscallFailure); // NOLINT
    }

    return {};
}

void Worker::run_child() {
    ::close(output_pipe_.read_fd);
    ::close(report_pipe_.read_fd);

    const int output_fd = output_pipe_.write_fd;
    const int report_fd = report_pipe_.write_fd;

    // Encoded up front so that it can still be sent once nothing more can be allocated
    const std::string out_of_memory = encode_report({memory_error(options_.memory_ceiling)});

    try {
        if (auto isolated = isolate_descriptors(output_fd, report_fd); !isolated) {
            std::ignore = write_all(report_fd, encode_report({runtime_error(fmt::format(
                                                   "could not isolate the worker ({})", isolated.error().message()))}));
            _exit(EXIT_FAILURE);
        }

        if (auto hardened = harden(options_); !hardened) {
            std::ignore = write_all(report_fd, encode_report({runtime_error(fmt::format(
                                                   "could not apply worker limits ({})", hardened.error().message()))}));
            _exit(EXIT_FAILURE);
        }

        lang::MemoryBudget budget{options_.memory_ceiling};
        PipeSink pipe_sink{output_fd};
        NullSink discard;
        Sink& sink = options_.capture_output ? static_cast<Sink&>(pipe_sink) : discard;

        lang::Interpreter interpreter{sink, budget,
                                      lang::Limits{.max_call_depth = options_.max_call_depth,
                                                   .max_output_bytes = options_.max_output_bytes}};

        auto result = interpreter.run(source_);

        // Output is complete before the report arrives
        ::close(output_fd);

        WorkerReport report = result ? WorkerReport{result.value()} : WorkerReport{lang::classify(result.error())};
        std::ignore = write_all(report_fd, encode_report(report));
    } catch (const std::bad_alloc&) {
        std::ignore = write_all(report_fd, out_of_memory);
    } catch (const std::exception& ex) {
        std::ignore = write_all(report_fd, encode_report({runtime_error(ex.what())}));
    }

    ::close(report_fd);
    _exit(EXIT_SUCCESS);
}

ExecutionResult Worker::finish() {
    auto result = collect();

    if (auto res = close_pipes(); !res) {
        LOG_WARN("Failed to close worker pipes: {}", res.error());
    }

    return result;
}

Result<bool> Worker::drain(int fd, std::string& into, std::size_t cap) {
    while (into.size() <= cap) {
        auto chunk = linux::read(fd, READ_CHUNK);

        if (!chunk) {
            if (chunk.error() == std::errc::resource_unavailable_try_again) {
                return true;
            }
            return ErrorKind::SyscallFailure;
        }

        if (chunk.value().empty()) {
            return false;
        }

        into += chunk.value();
    }

    return true;
}

ExecutionResult Worker::collect() {
    const std::size_t report_cap = options_.memory_ceiling + ADDRESS_SPACE_SLACK;

    while (output_pipe_.read_fd != -1 || report_pipe_.read_fd != -1) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline_) {
            return timed_out();
        }

        auto remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline_ - now);

        // poll ignores negative descriptors, so closed pipes can stay in the set
        std::array<pollfd, 2> fds{{
            {.fd = output_pipe_.read_fd, .events = POLLIN, .revents = 0},
            {.fd = report_pipe_.read_fd, .events = POLLIN, .revents = 0},
        }};

        auto ready = linux::poll(fds.data(), fds.size(), static_cast<int>(remaining.count()));
        if (!ready) {
            return lost_contact("polling");
        }

        if (fds[0].revents != 0) {
            auto open = drain(output_pipe_.read_fd, output_, options_.max_output_bytes);
            if (!open) {
                return lost_contact("reading output");
            }
            if (!open.value()) {
                std::ignore = linux::close(std::exchange(output_pipe_.read_fd, -1));
            }

            if (output_.size() > options_.max_output_bytes) {
                LOG_DEBUG("Worker {} exceeded the output limit", child_pid_);
                kill_and_forget();
                output_.resize(options_.max_output_bytes);
                return ExecutionResult::make_failure(
                    make_resource_error(fmt::format("output size (more than {} bytes written)",
                                                    options_.max_output_bytes)),
                    std::move(output_), elapsed());
            }
        }

        if (fds[1].revents != 0) {
            auto open = drain(report_pipe_.read_fd, report_, report_cap);
            if (!open) {
                return lost_contact("reading the report");
            }
            if (!open.value()) {
                std::ignore = linux::close(std::exchange(report_pipe_.read_fd, -1));
            }

            if (report_.size() > report_cap) {
                kill_and_forget();
                return ExecutionResult::make_failure(memory_error(options_.memory_ceiling), std::move(output_),
                                                     elapsed());
            }
        }
    }

    // Both pipes are closed, so the child is on its way out
    while (true) {
        auto waited = linux::waitpid(child_pid_, WNOHANG);
        if (!waited) {
            return lost_contact("waiting for exit");
        }

        if (waited.value().pid != 0) {
            reaped_ = true;
            return classify_exit(waited.value().status);
        }

        if (std::chrono::steady_clock::now() >= deadline_) {
            return timed_out();
        }

        std::this_thread::sleep_for(REAP_POLL_INTERVAL);
    }
}

ExecutionResult Worker::timed_out() {
    LOG_DEBUG("Worker {} timed out after {}ms", child_pid_, options_.timeout.count());
    kill_and_forget();

    return ExecutionResult::make_failure(make_timeout_error(options_.timeout), std::move(output_), options_.timeout);
}

ExecutionResult Worker::lost_contact(std::string_view what) {
    LOG_ERROR("Lost contact with worker {} while {}", child_pid_, what);
    kill_and_forget();

    return ExecutionResult::make_failure(runtime_error(fmt::format("lost contact with the worker while {}", what)),
                                         std::move(output_), elapsed());
}

ExecutionResult Worker::classify_exit(int status) {
    if (WIFSIGNALED(status)) {
        linux::Signal sig = WTERMSIG(status);
        LOG_DEBUG("Worker {} was terminated by {}", child_pid_, sig.name());

        // SIGXCPU: CPU backstop, SIGKILL: killed from outside (e.g., host shutdown or OOM)
        if (sig == SIGXCPU || sig == SIGKILL) {
            return ExecutionResult::make_failure(make_timeout_error(options_.timeout), std::move(output_),
                                                 options_.timeout);
        }

        return ExecutionResult::make_failure(
            runtime_error(fmt::format("worker terminated by {} ({})", sig.name(), sig.to_string())),
            std::move(output_), elapsed());
    }

    int exit_code = WEXITSTATUS(status);

    if (report_.empty()) {
        return ExecutionResult::make_failure(
            runtime_error(fmt::format("worker exited with status {} without reporting a result", exit_code)),
            std::move(output_), elapsed());
    }

    auto report = decode_report(report_);
    if (!report) {
        LOG_WARN("Malformed report from worker {}: {}", child_pid_, report.error());
        return ExecutionResult::make_failure(runtime_error(fmt::format("malformed worker report ({})", report.error())),
                                             std::move(output_), elapsed());
    }

    if (auto* value = std::get_if<lang::Value>(&report.value().outcome)) {
        return ExecutionResult::make_success(std::move(*value), std::move(output_), elapsed());
    }

    return ExecutionResult::make_failure(std::get<ClassifiedError>(std::move(report.value().outcome)),
                                         std::move(output_), elapsed());
}

void Worker::kill_and_forget() {
    if (child_pid_ == 0 || reaped_) {
        return;
    }

    if (auto killed = linux::kill(child_pid_, SIGKILL); !killed) {
        LOG_WARN("Failed to kill worker {}: {}", child_pid_, killed.error().message());
    }

    reaped_ = true;
    pid_t pid = child_pid_;

    auto reap = [pid] {
        if (auto res = linux::waitpid(pid); !res) {
            LOG_WARN("Failed to reap worker {}: {}", pid, res.error().message());
        }
    };

    try {
        std::thread{reap}.detach();
    } catch (const std::system_error& ex) {
        // No thread to spare; a killed process goes away quickly, so wait here instead
        LOG_WARN("Could not start a reaper thread ({}); reaping worker {} inline", ex.what(), pid);
        reap();
    }
}

Result<void> Worker::close_pipes() {
    for (int* fd : {&output_pipe_.read_fd, &output_pipe_.write_fd, &report_pipe_.read_fd, &report_pipe_.write_fd}) {
        if (*fd != -1) {
            TRYE(linux::close(std::exchange(*fd, -1)), SyscallFailure);
        }
    }

    return {};
}

std::chrono::milliseconds Worker::elapsed() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_time_);
}

} // namespace codekata
