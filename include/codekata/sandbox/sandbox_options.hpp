#pragma once

#include <codekata/common/expected.hpp>

#include <fmt/format.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>

namespace codekata {

struct SandboxOptions
{
    /// Wall-clock budget for one run. The worker is killed when it expires.
    std::chrono::milliseconds timeout = DEFAULT_TIMEOUT;

    /// Live bytes the program's values may occupy
    std::size_t memory_ceiling = DEFAULT_MEMORY_CEILING;

    /// When false, program output is discarded
    bool capture_output = true;

    /// Writing more than this kills the worker
    std::size_t max_output_bytes = DEFAULT_MAX_OUTPUT_BYTES;

    std::size_t max_call_depth = DEFAULT_MAX_CALL_DEPTH;

    static constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{5000};
    static constexpr std::size_t DEFAULT_MEMORY_CEILING = std::size_t{50} * 1024 * 1024;
    static constexpr std::size_t DEFAULT_MAX_OUTPUT_BYTES = std::size_t{1024} * 1024;
    static constexpr std::size_t DEFAULT_MAX_CALL_DEPTH = 1000;

    /// Keeps every string and collection length within the 32-bit fields of a worker report
    static constexpr std::size_t MAX_MEMORY_CEILING = std::numeric_limits<std::uint32_t>::max();

    /// Verify that all fields are usable
    Expected<void, std::string> validate() const {
        if (timeout <= std::chrono::milliseconds{0}) {
            return fmt::format("timeout must be positive (got {}ms)", timeout.count());
        }

        if (memory_ceiling == 0) {
            return std::string{"memory ceiling must be positive"};
        }

        if (memory_ceiling > MAX_MEMORY_CEILING) {
            return fmt::format("memory ceiling may be at most {} bytes (got {})", MAX_MEMORY_CEILING, memory_ceiling);
        }

        if (max_output_bytes == 0) {
            return std::string{"output limit must be positive"};
        }

        if (max_call_depth == 0) {
            return std::string{"call depth limit must be positive"};
        }

        return {};
    }
};

} // namespace codekata
