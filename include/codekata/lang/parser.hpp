#pragma once

#include <codekata/common/expected.hpp>
#include <codekata/lang/ast.hpp>
#include <codekata/lang/fault.hpp>
#include <codekata/lang/token.hpp>
#include <codekata/lang/value.hpp>

#include <cstddef>
#include <string_view>
#include <vector>

namespace codekata::lang {

/// Deepest expression nesting the parser accepts
inline constexpr std::size_t MAX_NESTING_DEPTH = 200;

Expected<Program, Fault> parse(const std::vector<Token>& tokens);

/// tokenize + parse
Expected<Program, Fault> parse(std::string_view source);

/// Parses a constant expression: scalars, and lists, tuples and maps of constants.
/// Used for expectations written by lesson authors, e.g. ``[1, 2, 3]`` or ``{:ok, "x"}``.
Expected<Value, Fault> parse_literal(std::string_view text);

} // namespace codekata::lang
