#include <codekata/engine.hpp>

#include <codekata/classified_error.hpp>
#include <codekata/common/expected.hpp>
#include <codekata/execution_result.hpp>
#include <codekata/format/result_formatter.hpp>
#include <codekata/sandbox/safety_gate.hpp>
#include <codekata/sandbox/sandbox_options.hpp>

#include <chrono>
#include <string_view>
#include <utility>

namespace codekata {

ExecutionResult rejected_result(const Rejection& rejection) {
    return ExecutionResult::make_failure(make_dangerous_code_error(rejection.rule, describe(rejection.capability)), "",
                                         std::chrono::milliseconds{0});
}

Expected<void, Rejection> Engine::check_safety(std::string_view source) const {
    return gate_->check(source);
}

Expected<ExecutionResult, Rejection> Engine::try_execute(std::string_view source, const SandboxOptions& options) const {
    TRY(check_safety(source));

    return runner_->run(source, options);
}

ExecutionResult Engine::execute(std::string_view source, const SandboxOptions& options) const {
    auto result = try_execute(source, options);
    if (!result) {
        return rejected_result(result.error());
    }

    return std::move(result).value();
}

Expected<DisplayResult, Rejection> Engine::execute_and_format(std::string_view source,
                                                              const SandboxOptions& options) const {
    return try_execute(source, options).transform(
        [](const ExecutionResult& result) { return result_formatter::format(result); });
}

} // namespace codekata
