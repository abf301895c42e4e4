#include <codekata/lang/interpreter.hpp>

#include "lang/arithmetic.hpp"

#include <codekata/common/error_types.hpp>
#include <codekata/common/expected.hpp>
#include <codekata/lang/ast.hpp>
#include <codekata/lang/builtins.hpp>
#include <codekata/lang/fault.hpp>
#include <codekata/lang/memory_budget.hpp>
#include <codekata/lang/parser.hpp>
#include <codekata/lang/resolver.hpp>
#include <codekata/lang/value.hpp>
#include <codekata/output/sink.hpp>

#include <fmt/format.h>
#include <gsl/util>

#include <cstddef>
#include <cstdint>
#include <new>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace codekata::lang {

namespace {

using Scope = std::unordered_map<std::string, Value>;
using EvalResult = Expected<Value, Fault>;

std::string_view operator_text(TokenKind op) {
    switch (op) {
    case TokenKind::Equal:
        return "==";
    case TokenKind::NotEqual:
        return "!=";
    case TokenKind::Less:
        return "<";
    case TokenKind::LessEqual:
        return "<=";
    case TokenKind::Greater:
        return ">";
    case TokenKind::GreaterEqual:
        return ">=";
    case TokenKind::Concat:
        return "<>";
    case TokenKind::ListConcat:
        return "++";
    default:
        return "?";
    }
}

std::string describe_callee(const Value& callee) {
    const auto& func = callee.as_function();
    return fmt::format("{}/{}", func.name.empty() ? "fn" : func.name, func.params.size());
}

/// Evaluation state for one run
class Evaluator : public CallContext
{
public:
    Evaluator(Sink& output, MemoryBudget& budget, const Limits& limits, std::size_t& output_bytes)
        : output_{&output}
        , budget_{&budget}
        , limits_{&limits}
        , output_bytes_{&output_bytes}
        , stack_base_{reinterpret_cast<std::uintptr_t>(__builtin_frame_address(0))} {}

    EvalResult run(const Program& program) {
        for (const auto& stmt : program.statements) {
            if (stmt->kind == NodeKind::FunctionDef) {
                functions_.emplace(stmt->name, make_function(stmt->name, stmt->params, stmt->children.front(), {},
                                                             budget_));
            }
        }

        Scope top_level;
        Value last;

        for (const auto& stmt : program.statements) {
            last = TRY(eval(*stmt, top_level));
        }

        return last;
    }

    EvalResult invoke(const Value& callee, std::vector<Value> args) override {
        if (callee.type() != Value::Type::Function) {
            return Fault{FaultKind::FunctionMismatch, fmt::format("{} is not a function", inspect(callee))};
        }

        const auto& func = callee.as_function();

        if (args.size() != func.params.size()) {
            return Fault{FaultKind::FunctionMismatch,
                         fmt::format("{} called with {} argument(s)", describe_callee(callee), args.size())};
        }

        if (call_depth_ >= limits_->max_call_depth) {
            return Fault{FaultKind::CallDepth, fmt::format("more than {} nested calls", limits_->max_call_depth)};
        }

        ++call_depth_;
        auto leave = gsl::finally([this] { --call_depth_; });

        Scope scope;
        for (const auto& [name, val] : func.captured) {
            scope.insert_or_assign(name, val);
        }
        for (std::size_t i = 0; i < args.size(); ++i) {
            scope.insert_or_assign(func.params[i], std::move(args[i]));
        }

        return eval(*func.body, scope);
    }

    Expected<void, Fault> write_output(std::string_view text) override {
        if (text.size() > limits_->max_output_bytes - *output_bytes_) {
            return Fault{FaultKind::OutputLimit, fmt::format("more than {} bytes written", limits_->max_output_bytes)};
        }

        *output_bytes_ += text.size();
        output_->write(text);

        return {};
    }

    MemoryBudget& budget() override { return *budget_; }

private:
    std::size_t stack_used() const {
        auto here = reinterpret_cast<std::uintptr_t>(__builtin_frame_address(0));
        return stack_base_ > here ? stack_base_ - here : here - stack_base_;
    }

    /// Dispatches on the node kind and attaches a line to faults that lack one
    EvalResult eval(const Node& node, Scope& scope) {
        if (stack_used() > limits_->max_stack_bytes) {
            return Fault{FaultKind::CallDepth, "native stack exhausted", node.pos.line};
        }

        auto result = eval_node(node, scope);

        if (!result && result.error().line == 0) {
            Fault fault = result.error();
            fault.line = node.pos.line;
            return fault;
        }

        return result;
    }

    EvalResult eval_node(const Node& node, Scope& scope) {
        switch (node.kind) {
        case NodeKind::Literal:
            return node.literal;

        case NodeKind::Variable:
            return variable(node, scope);

        case NodeKind::Assign: {
            auto val = TRY(eval(*node.children[0], scope));
            scope.insert_or_assign(node.name, val);
            return val;
        }

        case NodeKind::Binary:
            return binary(node, scope);

        case NodeKind::Logical: {
            auto lhs = TRY(eval(*node.children[0], scope));
            bool short_circuit = node.op == TokenKind::AndAnd ? !lhs.is_truthy() : lhs.is_truthy();
            if (short_circuit) {
                return lhs;
            }
            return eval(*node.children[1], scope);
        }

        case NodeKind::Unary: {
            auto operand = TRY(eval(*node.children[0], scope));
            if (node.op == TokenKind::Bang) {
                return Value::boolean(!operand.is_truthy());
            }
            return negate(operand);
        }

        case NodeKind::Call:
            return call(node, scope);

        case NodeKind::ModuleCall:
            return module_call(node, scope);

        case NodeKind::Index:
            return index(node, scope);

        case NodeKind::ListLit:
            return make_list(TRY(eval_all(node.children, scope)), budget_);

        case NodeKind::TupleLit:
            return make_tuple(TRY(eval_all(node.children, scope)), budget_);

        case NodeKind::MapLit: {
            auto flat = TRY(eval_all(node.children, scope));
            std::vector<std::pair<Value, Value>> entries;
            entries.reserve(flat.size() / 2);
            for (std::size_t i = 0; i + 1 < flat.size(); i += 2) {
                entries.emplace_back(std::move(flat[i]), std::move(flat[i + 1]));
            }
            return make_map(std::move(entries), budget_);
        }

        case NodeKind::Lambda: {
            std::vector<std::pair<std::string, Value>> captured(scope.begin(), scope.end());
            return make_function("", node.params, node.children[0], std::move(captured), budget_);
        }

        case NodeKind::If: {
            auto cond = TRY(eval(*node.children[0], scope));
            if (cond.is_truthy()) {
                return eval(*node.children[1], scope);
            }
            if (node.children.size() > 2) {
                return eval(*node.children[2], scope);
            }
            return Value{};
        }

        case NodeKind::While: {
            while (true) {
                auto cond = TRY(eval(*node.children[0], scope));
                if (!cond.is_truthy()) {
                    return Value{};
                }
                TRY(eval(*node.children[1], scope));
            }
        }

        case NodeKind::Block: {
            Value last;
            for (const auto& stmt : node.children) {
                last = TRY(eval(*stmt, scope));
            }
            return last;
        }

        case NodeKind::FunctionDef:
            // Hoisted before evaluation starts
            return Value{};
        }

        return Fault{FaultKind::Compile, fmt::format("cannot evaluate {}", node.kind), node.pos.line};
    }

    Expected<std::vector<Value>, Fault> eval_all(const std::vector<NodePtr>& nodes, Scope& scope) {
        std::vector<Value> values;
        values.reserve(nodes.size());
        for (const auto& child : nodes) {
            values.push_back(TRY(eval(*child, scope)));
        }
        return values;
    }

    EvalResult variable(const Node& node, const Scope& scope) const {
        if (auto iter = scope.find(node.name); iter != scope.end()) {
            return iter->second;
        }
        if (auto iter = functions_.find(node.name); iter != functions_.end()) {
            return iter->second;
        }
        return Fault{FaultKind::Undefined, fmt::format("variable '{}' is not bound", node.name), node.pos.line};
    }

    EvalResult binary(const Node& node, Scope& scope) {
        auto lhs = TRY(eval(*node.children[0], scope));
        auto rhs = TRY(eval(*node.children[1], scope));

        switch (node.op) {
        case TokenKind::Plus:
        case TokenKind::Minus:
        case TokenKind::Star:
        case TokenKind::Slash:
            return arithmetic(node.op, lhs, rhs);

        case TokenKind::Equal:
            return Value::boolean(lhs == rhs);
        case TokenKind::NotEqual:
            return Value::boolean(!(lhs == rhs));

        case TokenKind::Less:
        case TokenKind::LessEqual:
        case TokenKind::Greater:
        case TokenKind::GreaterEqual: {
            auto order = compare(lhs, rhs);
            if (!order) {
                return Fault{FaultKind::Argument, fmt::format("cannot compare {} {} {}", inspect(lhs),
                                                              operator_text(node.op), inspect(rhs))};
            }
            switch (node.op) {
            case TokenKind::Less:
                return Value::boolean(*order < 0);
            case TokenKind::LessEqual:
                return Value::boolean(*order <= 0);
            case TokenKind::Greater:
                return Value::boolean(*order > 0);
            default:
                return Value::boolean(*order >= 0);
            }
        }

        case TokenKind::Concat: {
            if (lhs.type() != Value::Type::String || rhs.type() != Value::Type::String) {
                return Fault{FaultKind::Argument,
                             fmt::format("<> expects two strings, got {} <> {}", inspect(lhs), inspect(rhs))};
            }
            budget_->ensure_available(lhs.as_string().size() + rhs.as_string().size());
            return make_string(lhs.as_string() + rhs.as_string(), budget_);
        }

        case TokenKind::ListConcat: {
            if (lhs.type() != Value::Type::List || rhs.type() != Value::Type::List) {
                return Fault{FaultKind::Argument,
                             fmt::format("++ expects two lists, got {} ++ {}", inspect(lhs), inspect(rhs))};
            }
            const auto& front = lhs.as_list().items;
            const auto& back = rhs.as_list().items;
            budget_->ensure_available(list_footprint(front.size() + back.size()));

            std::vector<Value> joined;
            joined.reserve(front.size() + back.size());
            joined.insert(joined.end(), front.begin(), front.end());
            joined.insert(joined.end(), back.begin(), back.end());
            return make_list(std::move(joined), budget_);
        }

        default:
            break;
        }

        return Fault{FaultKind::Compile, fmt::format("unsupported operator {}", node.op), node.pos.line};
    }

    /// Bare names resolve to a bound variable, then a named function, then a Kernel builtin
    EvalResult call(const Node& node, Scope& scope) {
        const Node& target = *node.children[0];
        std::span<const NodePtr> arg_nodes{node.children.begin() + 1, node.children.end()};

        if (target.kind == NodeKind::Variable && !scope.contains(target.name)) {
            if (auto iter = functions_.find(target.name); iter != functions_.end()) {
                Value callee = iter->second;
                return invoke(callee, TRY(eval_args(arg_nodes, scope)));
            }

            if (const Builtin* builtin = find_builtin(KERNEL_MODULE, target.name)) {
                return call_builtin(*builtin, target.name, TRY(eval_args(arg_nodes, scope)));
            }

            return Fault{FaultKind::Undefined, fmt::format("undefined function {}/{}", target.name, arg_nodes.size()),
                         node.pos.line};
        }

        auto callee = TRY(eval(target, scope));
        return invoke(callee, TRY(eval_args(arg_nodes, scope)));
    }

    EvalResult module_call(const Node& node, Scope& scope) {
        const Builtin* builtin = find_builtin(node.name, node.member);

        if (builtin == nullptr) {
            if (!is_builtin_module(node.name)) {
                return Fault{FaultKind::Undefined, fmt::format("module {} is not available", node.name),
                             node.pos.line};
            }
            return Fault{FaultKind::Undefined,
                         fmt::format("undefined function {}.{}/{}", node.name, node.member, node.children.size()),
                         node.pos.line};
        }

        auto args = TRY(eval_args(node.children, scope));
        return call_builtin(*builtin, fmt::format("{}.{}", node.name, node.member), std::move(args));
    }

    EvalResult call_builtin(const Builtin& builtin, std::string_view display_name, std::vector<Value> args) {
        if (args.size() < builtin.min_arity || args.size() > builtin.max_arity) {
            return Fault{FaultKind::FunctionMismatch,
                         fmt::format("{}/{} does not exist (expects {} argument(s))", display_name, args.size(),
                                     builtin.min_arity == builtin.max_arity
                                         ? fmt::format("{}", builtin.min_arity)
                                         : fmt::format("{} to {}", builtin.min_arity, builtin.max_arity))};
        }

        return builtin.fn(*this, args);
    }

    Expected<std::vector<Value>, Fault> eval_args(std::span<const NodePtr> nodes, Scope& scope) {
        std::vector<Value> values;
        values.reserve(nodes.size());
        for (const auto& child : nodes) {
            values.push_back(TRY(eval(*child, scope)));
        }
        return values;
    }

    /// list[i] (negative counts from the end) and map[key]; misses are nil
    EvalResult index(const Node& node, Scope& scope) {
        auto target = TRY(eval(*node.children[0], scope));
        auto key = TRY(eval(*node.children[1], scope));

        if (target.type() == Value::Type::Map) {
            const Value* found = target.as_map().find(key);
            return found != nullptr ? *found : Value{};
        }

        if (target.type() != Value::Type::List) {
            return Fault{FaultKind::Argument, fmt::format("cannot index into {}", inspect(target)), node.pos.line};
        }

        if (key.type() != Value::Type::Integer) {
            return Fault{FaultKind::Argument, fmt::format("list index must be an integer, got {}", inspect(key)),
                         node.pos.line};
        }

        const auto& items = target.as_list().items;
        auto size = gsl::narrow_cast<std::int64_t>(items.size());
        std::int64_t pos = key.as_int() < 0 ? key.as_int() + size : key.as_int();

        if (pos < 0 || pos >= size) {
            return Value{};
        }

        return items[gsl::narrow_cast<std::size_t>(pos)];
    }

    Sink* output_;
    MemoryBudget* budget_;
    const Limits* limits_;
    std::size_t* output_bytes_;
    std::uintptr_t stack_base_;

    std::unordered_map<std::string, Value> functions_;
    std::size_t call_depth_ = 0;
};

} // namespace

Interpreter::Interpreter(Sink& output, MemoryBudget& budget, Limits limits)
    : output_{&output}
    , budget_{&budget}
    , limits_{limits} {}

Expected<Value, Fault> Interpreter::run(std::string_view source) {
    output_bytes_ = 0;

    auto program = TRY(parse(source));
    TRY(resolve(program));

    try {
        Evaluator evaluator{*output_, *budget_, limits_, output_bytes_};
        return evaluator.run(program);
    } catch (const NestingLimitError& ex) {
        return Fault{FaultKind::CallDepth, ex.what()};
    } catch (const std::bad_alloc&) {
        return Fault{FaultKind::MemoryLimit, fmt::format("more than {} bytes allocated", budget_->ceiling())};
    }
}

} // namespace codekata::lang
