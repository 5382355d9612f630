#ifndef EXECUTOR_CODE_PREPARER_HPP
#define EXECUTOR_CODE_PREPARER_HPP

#include <string>

#include "absl/strings/string_view.h"

namespace executor {

// Returns true if line (without indentation) looks like a bare expression
// whose value is worth printing: not a statement, not an assignment, not a
// print call, with balanced brackets.
bool IsExpressionLine(absl::string_view line);

// If the last non-empty line of code is a bare expression, replaces it with
// an assignment to _result followed by print(_result), keeping its
// indentation, like an interactive interpreter would show its value.
// Otherwise returns code unchanged.
std::string PrepareCode(const std::string& code);

}  // namespace executor

#endif
