#pragma once

#include <codekata/common/expected.hpp>
#include <codekata/execution_result.hpp>
#include <codekata/format/result_formatter.hpp>
#include <codekata/sandbox/safety_gate.hpp>
#include <codekata/sandbox/sandbox.hpp>
#include <codekata/sandbox/sandbox_options.hpp>

#include <string_view>

namespace codekata {

/// Entry point for running untrusted snippets: the safety gate, then the sandbox.
///
/// Holds references only; the gate and runner must outlive the engine.
class Engine
{
public:
    Engine(const SafetyGate& gate, CodeRunner& runner)
        : gate_{&gate}
        , runner_{&runner} {}

    Expected<void, Rejection> check_safety(std::string_view source) const;

    /// The gate runs once; a rejection is returned as-is and nothing is run
    Expected<ExecutionResult, Rejection> try_execute(std::string_view source, const SandboxOptions& options = {}) const;

    /// A gate rejection is reported as a DangerousCode failure; nothing is run in that case
    ExecutionResult execute(std::string_view source, const SandboxOptions& options = {}) const;

    /// Unlike ``execute``, a gate rejection is returned as-is rather than as a result
    Expected<DisplayResult, Rejection> execute_and_format(std::string_view source,
                                                          const SandboxOptions& options = {}) const;

    const SafetyGate& gate() const { return *gate_; }

private:
    const SafetyGate* gate_;
    CodeRunner* runner_;
};

/// The failure ``execute`` reports for a rejected submission
ExecutionResult rejected_result(const Rejection& rejection);

} // namespace codekata
