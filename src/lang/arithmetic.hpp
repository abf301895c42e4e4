#pragma once

#include <codekata/common/expected.hpp>
#include <codekata/lang/fault.hpp>
#include <codekata/lang/token.hpp>
#include <codekata/lang/value.hpp>

namespace codekata::lang {

/// Checked numeric operators shared by the interpreter and the builtins.
/// Integer overflow, division by zero and non-numeric operands are Arithmetic faults.
///
/// ``op`` is one of Plus, Minus, Star, Slash. Slash always produces a float.
Expected<Value, Fault> arithmetic(TokenKind op, const Value& lhs, const Value& rhs);

Expected<Value, Fault> negate(const Value& operand);

/// Truncated integer division and remainder, as Kernel.div / Kernel.rem
Expected<Value, Fault> integer_div(const Value& lhs, const Value& rhs);
Expected<Value, Fault> integer_rem(const Value& lhs, const Value& rhs);

} // namespace codekata::lang
