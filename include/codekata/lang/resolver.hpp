#pragma once

#include <codekata/common/expected.hpp>
#include <codekata/lang/ast.hpp>
#include <codekata/lang/fault.hpp>

namespace codekata::lang {

/// Static checks run before evaluation; every failure is a Compile fault.
///
///  - ``def`` only at the top level, each name defined once
///  - no duplicate parameter names
///  - every variable is assigned (or is a parameter / named function) before it is read.
///    Named functions see only their parameters and other named functions;
///    ``fn`` closures additionally see what was assigned before them.
///
/// Calls through a bare name are resolved at runtime instead, so that builtins and
/// named functions can be called before any check knows about them.
Expected<void, Fault> resolve(const Program& program);

} // namespace codekata::lang
