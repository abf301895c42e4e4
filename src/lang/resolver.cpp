#include <codekata/lang/resolver.hpp>

#include <codekata/common/error_types.hpp>
#include <codekata/common/expected.hpp>
#include <codekata/lang/ast.hpp>
#include <codekata/lang/fault.hpp>

#include <fmt/format.h>

#include <string>
#include <unordered_set>
#include <vector>

namespace codekata::lang {

namespace {

using Scope = std::unordered_set<std::string>;

Fault compile_fault(const Node& node, std::string message) {
    return {FaultKind::Compile, std::move(message), node.pos.line};
}

class Resolver
{
public:
    Expected<void, Fault> run(const Program& program) {
        for (const auto& stmt : program.statements) {
            if (stmt->kind != NodeKind::FunctionDef) {
                continue;
            }
            if (!functions_.insert(stmt->name).second) {
                return compile_fault(*stmt, fmt::format("function {} is already defined", stmt->name));
            }
        }

        Scope top_level;

        for (const auto& stmt : program.statements) {
            if (stmt->kind == NodeKind::FunctionDef) {
                Scope body_scope = TRY(parameter_scope(*stmt, {}));
                TRY(visit(*stmt->children.front(), body_scope));
            } else {
                TRY(visit(*stmt, top_level));
            }
        }

        return {};
    }

private:
    static Expected<Scope, Fault> parameter_scope(const Node& node, Scope scope) {
        Scope seen;
        for (const auto& param : node.params) {
            if (!seen.insert(param).second) {
                return compile_fault(node, fmt::format("duplicate parameter '{}'", param));
            }
            scope.insert(param);
        }
        return scope;
    }

    Expected<void, Fault> visit_all(const std::vector<NodePtr>& nodes, Scope& scope) {
        for (const auto& child : nodes) {
            TRY(visit(*child, scope));
        }
        return {};
    }

    Expected<void, Fault> visit(const Node& node, Scope& scope) {
        switch (node.kind) {
        case NodeKind::Literal:
            return {};

        case NodeKind::Variable:
            if (!scope.contains(node.name) && !functions_.contains(node.name)) {
                return compile_fault(node, fmt::format("undefined variable '{}'", node.name));
            }
            return {};

        case NodeKind::Assign:
            TRY(visit(*node.children.front(), scope));
            scope.insert(node.name);
            return {};

        case NodeKind::Call: {
            const Node& callee = *node.children.front();
            if (callee.kind != NodeKind::Variable) {
                TRY(visit(callee, scope));
            }
            for (std::size_t i = 1; i < node.children.size(); ++i) {
                TRY(visit(*node.children[i], scope));
            }
            return {};
        }

        case NodeKind::FunctionDef:
            return compile_fault(node, fmt::format("def {}/{} is only allowed at the top level", node.name,
                                                   node.params.size()));

        case NodeKind::Lambda: {
            // Closures capture by value: their assignments never leak out
            Scope inner = TRY(parameter_scope(node, scope));
            return visit(*node.children.front(), inner);
        }

        default:
            return visit_all(node.children, scope);
        }
    }

    Scope functions_;
};

} // namespace

Expected<void, Fault> resolve(const Program& program) {
    return Resolver{}.run(program);
}

} // namespace codekata::lang
