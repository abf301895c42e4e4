#pragma once

#include <codekata/common/expected.hpp>
#include <codekata/lang/fault.hpp>
#include <codekata/lang/memory_budget.hpp>
#include <codekata/lang/value.hpp>

#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

namespace codekata::lang {

/// What a builtin may ask of the interpreter that called it
class CallContext
{
public:
    virtual ~CallContext() = default;

    /// Calls a Kata function value (closure or named definition)
    virtual Expected<Value, Fault> invoke(const Value& callee, std::vector<Value> args) = 0;

    /// Writes program output, subject to the output limit
    virtual Expected<void, Fault> write_output(std::string_view text) = 0;

    virtual MemoryBudget& budget() = 0;
};

using BuiltinFn = Expected<Value, Fault> (*)(CallContext& ctx, std::span<const Value> args);

struct Builtin
{
    std::string_view module; ///< "Kernel" for unqualified functions
    std::string_view name;
    std::size_t min_arity;
    std::size_t max_arity;
    BuiltinFn fn;
};

inline constexpr std::string_view KERNEL_MODULE = "Kernel";

/// The full table, grouped by module
std::span<const Builtin> builtin_table();

/// nullptr if ``module`` has no function ``name`` (of any arity)
const Builtin* find_builtin(std::string_view module, std::string_view name);

bool is_builtin_module(std::string_view module);

} // namespace codekata::lang
