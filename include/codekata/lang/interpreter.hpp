#pragma once

#include <codekata/common/class_traits.hpp>
#include <codekata/common/expected.hpp>
#include <codekata/lang/fault.hpp>
#include <codekata/lang/memory_budget.hpp>
#include <codekata/lang/value.hpp>
#include <codekata/output/sink.hpp>

#include <cstddef>
#include <limits>
#include <string_view>

namespace codekata::lang {

struct Limits
{
    /// Nested Kata calls allowed before a CallDepth fault
    std::size_t max_call_depth = 1000;

    /// Native stack the evaluator may use, measured from the start of ``run``
    std::size_t max_stack_bytes = 4 * 1024 * 1024;

    std::size_t max_output_bytes = std::numeric_limits<std::size_t>::max();
};

/// Tree-walking evaluator for Kata programs.
///
/// Every ``run`` starts from a clean slate: no bindings or definitions survive between runs.
/// Program output goes only to the sink given at construction.
///
/// The budget must outlive every Value returned by ``run``, as heap-backed values keep
/// their reservations against it.
class Interpreter : NonMovable
{
public:
    Interpreter(Sink& output, MemoryBudget& budget, Limits limits = {});

    /// tokenize, parse, resolve and evaluate ``source``. The value of the last statement
    /// is returned; an empty program evaluates to nil.
    Expected<Value, Fault> run(std::string_view source);

    /// Bytes written to the sink by the most recent run
    std::size_t output_bytes() const { return output_bytes_; }

private:
    Sink* output_;
    MemoryBudget* budget_;
    Limits limits_;
    std::size_t output_bytes_ = 0;
};

} // namespace codekata::lang
