#include "lang/arithmetic.hpp"

#include <codekata/common/expected.hpp>
#include <codekata/lang/fault.hpp>
#include <codekata/lang/token.hpp>
#include <codekata/lang/value.hpp>

#include <fmt/format.h>

#include <cstdint>
#include <limits>
#include <string_view>

namespace codekata::lang {

namespace {

std::string_view symbol(TokenKind op) {
    switch (op) {
    case TokenKind::Plus:
        return "+";
    case TokenKind::Minus:
        return "-";
    case TokenKind::Star:
        return "*";
    case TokenKind::Slash:
        return "/";
    default:
        return "?";
    }
}

Fault bad_operands(std::string_view operation, const Value& lhs, const Value& rhs) {
    return {FaultKind::Arithmetic,
            fmt::format("bad argument in arithmetic expression: {} {} {}", inspect(lhs), operation, inspect(rhs))};
}

Fault overflow(std::string_view operation, const Value& lhs, const Value& rhs) {
    return {FaultKind::Arithmetic,
            fmt::format("integer overflow in {} {} {}", inspect(lhs), operation, inspect(rhs))};
}

Fault division_by_zero(const Value& lhs, const Value& rhs) {
    return {FaultKind::Arithmetic, fmt::format("division by zero in {} / {}", inspect(lhs), inspect(rhs))};
}

} // namespace

Expected<Value, Fault> arithmetic(TokenKind op, const Value& lhs, const Value& rhs) {
    if (!lhs.is_number() || !rhs.is_number()) {
        return bad_operands(symbol(op), lhs, rhs);
    }

    if (op == TokenKind::Slash) {
        double divisor = rhs.as_number();
        if (divisor == 0.0) {
            return division_by_zero(lhs, rhs);
        }
        return Value::floating(lhs.as_number() / divisor);
    }

    if (lhs.type() == Value::Type::Integer && rhs.type() == Value::Type::Integer) {
        std::int64_t result{};
        bool overflowed = false;

        switch (op) {
        case TokenKind::Plus:
            overflowed = __builtin_add_overflow(lhs.as_int(), rhs.as_int(), &result);
            break;
        case TokenKind::Minus:
            overflowed = __builtin_sub_overflow(lhs.as_int(), rhs.as_int(), &result);
            break;
        case TokenKind::Star:
            overflowed = __builtin_mul_overflow(lhs.as_int(), rhs.as_int(), &result);
            break;
        default:
            return bad_operands(symbol(op), lhs, rhs);
        }

        if (overflowed) {
            return overflow(symbol(op), lhs, rhs);
        }
        return Value::integer(result);
    }

    double left = lhs.as_number();
    double right = rhs.as_number();

    switch (op) {
    case TokenKind::Plus:
        return Value::floating(left + right);
    case TokenKind::Minus:
        return Value::floating(left - right);
    case TokenKind::Star:
        return Value::floating(left * right);
    default:
        return bad_operands(symbol(op), lhs, rhs);
    }
}

Expected<Value, Fault> negate(const Value& operand) {
    if (operand.type() == Value::Type::Float) {
        return Value::floating(-operand.as_float());
    }
    if (operand.type() != Value::Type::Integer) {
        return Fault{FaultKind::Arithmetic, fmt::format("bad argument in arithmetic expression: -{}", inspect(operand))};
    }
    if (operand.as_int() == std::numeric_limits<std::int64_t>::min()) {
        return Fault{FaultKind::Arithmetic, fmt::format("integer overflow in -({})", operand.as_int())};
    }
    return Value::integer(-operand.as_int());
}

Expected<Value, Fault> integer_div(const Value& lhs, const Value& rhs) {
    if (lhs.type() != Value::Type::Integer || rhs.type() != Value::Type::Integer) {
        return bad_operands("div", lhs, rhs);
    }
    if (rhs.as_int() == 0) {
        return division_by_zero(lhs, rhs);
    }
    if (lhs.as_int() == std::numeric_limits<std::int64_t>::min() && rhs.as_int() == -1) {
        return overflow("div", lhs, rhs);
    }
    return Value::integer(lhs.as_int() / rhs.as_int());
}

Expected<Value, Fault> integer_rem(const Value& lhs, const Value& rhs) {
    if (lhs.type() != Value::Type::Integer || rhs.type() != Value::Type::Integer) {
        return bad_operands("rem", lhs, rhs);
    }
    if (rhs.as_int() == 0) {
        return division_by_zero(lhs, rhs);
    }
    if (rhs.as_int() == -1) {
        return Value::integer(0);
    }
    return Value::integer(lhs.as_int() % rhs.as_int());
}

} // namespace codekata::lang
