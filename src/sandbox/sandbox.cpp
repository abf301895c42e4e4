#include <codekata/sandbox/sandbox.hpp>

#include "sandbox/worker.hpp"

#include <codekata/classified_error.hpp>
#include <codekata/execution_result.hpp>
#include <codekata/logging.hpp>
#include <codekata/sandbox/sandbox_options.hpp>

#include <fmt/format.h>
#include <gsl/util>

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>

namespace codekata {

namespace {

ExecutionResult infrastructure_failure(std::string_view what) {
    return ExecutionResult::make_failure({ErrorCategory::UnknownRuntimeError, fmt::format("Runtime Error: {}", what)},
                                         "", std::chrono::milliseconds{0});
}

} // namespace

Sandbox::Sandbox(std::size_t max_concurrent_workers)
    : max_workers_{max_concurrent_workers} {}

ExecutionResult Sandbox::run(std::string_view source, const SandboxOptions& options) {
    if (auto valid = options.validate(); !valid) {
        LOG_WARN("Refusing to run with invalid sandbox options: {}", valid.error());
        return infrastructure_failure(fmt::format("invalid sandbox options ({})", valid.error()));
    }

    acquire_slot();
    auto slot_guard = gsl::finally([this] { release_slot(); });

    Worker worker{source, options};

    if (auto started = worker.start(); !started) {
        LOG_ERROR("Could not start a worker: {}", started.error());
        return infrastructure_failure("could not start a worker");
    }

    auto result = worker.finish();

    LOG_DEBUG("Worker finished in {}ms ({})", result.elapsed.count(),
              result.success() ? "success" : describe(result.error->category));

    return result;
}

void Sandbox::acquire_slot() {
    if (max_workers_ == 0) {
        return;
    }

    std::unique_lock lock{slots_mutex_};
    slot_freed_.wait(lock, [this] { return active_workers_ < max_workers_; });
    ++active_workers_;
}

void Sandbox::release_slot() {
    if (max_workers_ == 0) {
        return;
    }

    {
        std::lock_guard lock{slots_mutex_};
        --active_workers_;
    }
    slot_freed_.notify_one();
}

} // namespace codekata
