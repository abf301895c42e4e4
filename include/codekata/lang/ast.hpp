#pragma once

#include <codekata/common/formatters/macros.hpp>
#include <codekata/lang/token.hpp>
#include <codekata/lang/value.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace codekata::lang {

enum class NodeKind {
    Literal,     ///< ``literal``
    Variable,    ///< ``name``
    Assign,      ///< ``name`` = children[0]
    Binary,      ///< children[0] ``op`` children[1]
    Logical,     ///< short-circuiting ``and``/``or``; op is AndAnd or OrOr
    Unary,       ///< ``op`` children[0]; op is Minus or Bang
    Call,        ///< children[0](children[1..])
    ModuleCall,  ///< ``name``.``member``(children)
    Index,       ///< children[0][children[1]]
    ListLit,     ///< [children]
    TupleLit,    ///< {children}
    MapLit,      ///< %{children[0] => children[1], ...}
    Lambda,      ///< fn(params) -> children[0] end
    If,          ///< if children[0] do children[1] [else children[2]] end
    While,       ///< while children[0] do children[1] end
    Block,       ///< statements, value of the last one
    FunctionDef, ///< def ``name``(params) do children[0] end
};

/// One node of the syntax tree. Immutable once parsed, shared with the function values that refer to it.
struct Node
{
    NodeKind kind;
    SourcePos pos;
    std::string name;
    std::string member;
    TokenKind op = TokenKind::EndOfInput;
    Value literal;
    std::vector<NodePtr> children;
    std::vector<std::string> params;
    std::size_t height = 1; ///< 1 + height of the tallest child
};

struct Program
{
    /// Top-level statements, in order. Function definitions are among them.
    std::vector<NodePtr> statements;
};

} // namespace codekata::lang

FMT_SERIALIZE_ENUM(::codekata::lang::NodeKind, Literal, Variable, Assign, Binary, Logical, Unary, Call, ModuleCall,
                   Index, ListLit, TupleLit, MapLit, Lambda, If, While, Block, FunctionDef);
