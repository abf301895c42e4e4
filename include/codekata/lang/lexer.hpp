#pragma once

#include <codekata/common/expected.hpp>
#include <codekata/lang/fault.hpp>
#include <codekata/lang/token.hpp>

#include <string_view>
#include <vector>

namespace codekata::lang {

/// Splits Kata source into tokens. The result always ends with an EndOfInput token.
/// Fails with a Syntax fault on unterminated strings or characters outside the language.
Expected<std::vector<Token>, Fault> tokenize(std::string_view source);

} // namespace codekata::lang
