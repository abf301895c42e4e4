#pragma once

#include <codekata/common/class_traits.hpp>
#include <codekata/execution_result.hpp>
#include <codekata/sandbox/sandbox_options.hpp>

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string_view>

namespace codekata {

/// Anything that can evaluate a submission and report how it went.
/// Implementations never throw; every failure is part of the returned result.
class CodeRunner
{
public:
    virtual ~CodeRunner() = default;

    virtual ExecutionResult run(std::string_view source, const SandboxOptions& options) = 0;

protected:
    CodeRunner() = default;
    CodeRunner(const CodeRunner&) = default;
    CodeRunner(CodeRunner&&) = default;
    CodeRunner& operator=(const CodeRunner&) = default;
    CodeRunner& operator=(CodeRunner&&) = default;
};

/// Runs every submission in its own freshly forked worker process.
///
/// Thread-safe: any number of threads may call ``run`` at once. If ``max_concurrent_workers``
/// is non-zero, callers beyond that many block until a worker slot frees up; the wait does not
/// count against their timeout.
///
/// Loggers must be initialized before the first ``run``, and the host must not hold any lock a
/// worker could need (in particular, none of spdlog's) while a fork may be in progress.
class Sandbox : public CodeRunner, NonMovable
{
public:
    explicit Sandbox(std::size_t max_concurrent_workers = 0);

    ExecutionResult run(std::string_view source, const SandboxOptions& options) override;

    std::size_t max_concurrent_workers() const { return max_workers_; }

private:
    void acquire_slot();
    void release_slot();

    std::size_t max_workers_;

    std::mutex slots_mutex_;
    std::condition_variable slot_freed_;
    std::size_t active_workers_ = 0;
};

} // namespace codekata
