#include "executor/code_preparer.hpp"

#include <algorithm>
#include <vector>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"

namespace executor {

namespace {

const constexpr char* kStatementPrefixes[] = {
    "import ", "from ",  "def ",     "class ",   "if ",     "elif ",
    "else:",   "for ",   "while ",   "try:",     "except",  "finally:",
    "with ",   "return", "yield",    "break",    "continue", "pass",
    "raise",   "del ",   "global ",  "nonlocal ", "assert ", "async ",
    "await ",  "@",      "#",
};

// Scans the parts of line outside string literals. Returns false if the line
// contains an assignment, an annotation or a statement separator at bracket
// depth 0, or if its brackets are not balanced.
bool IsSingleExpression(absl::string_view line) {
  int depth = 0;
  char quote = 0;
  for (size_t i = 0; i < line.size(); i++) {
    char c = line[i];
    if (quote) {
      if (c == '\\') {
        i++;
      } else if (c == quote) {
        quote = 0;
      }
      continue;
    }
    switch (c) {
      case '\'':
      case '"':
        quote = c;
        break;
      case '#':
        return depth == 0;
      case '(':
      case '[':
      case '{':
        depth++;
        break;
      case ')':
      case ']':
      case '}':
        if (--depth < 0) return false;
        break;
      case ';':
      case ':':
        if (depth == 0) return false;
        break;
      case '=': {
        if (depth != 0) break;
        char prev = i > 0 ? line[i - 1] : 0;
        char next = i + 1 < line.size() ? line[i + 1] : 0;
        if (next == '=') {
          i++;
          break;
        }
        if (prev == '!' || prev == '<' || prev == '>') break;
        return false;
      }
      default:
        break;
    }
  }
  return depth == 0 && quote == 0;
}

// True if text, the code before a line, leaves that line inside a bracket,
// inside a triple quoted string or after a backslash continuation.
bool EndsInsideStatement(absl::string_view text) {
  int depth = 0;
  char quote = 0;
  bool triple = false;
  bool continued = false;
  for (size_t i = 0; i < text.size(); i++) {
    char c = text[i];
    continued = false;
    if (quote) {
      if (c == '\\') {
        i++;
      } else if (triple && text.substr(i, 3) == std::string(3, quote)) {
        quote = 0;
        i += 2;
      } else if (!triple && (c == quote || c == '\n')) {
        quote = 0;
      }
      continue;
    }
    switch (c) {
      case '#':
        i = std::min(text.find('\n', i), text.size()) - 1;
        break;
      case '\'':
      case '"':
        quote = c;
        triple = text.substr(i, 3) == std::string(3, c);
        if (triple) i += 2;
        break;
      case '(':
      case '[':
      case '{':
        depth++;
        break;
      case ')':
      case ']':
      case '}':
        if (depth > 0) depth--;
        break;
      case '\\':
        continued = i + 1 == text.size() || text[i + 1] == '\n';
        if (continued) i++;
        break;
      default:
        break;
    }
  }
  return depth > 0 || quote != 0 || continued;
}

}  // namespace

bool IsExpressionLine(absl::string_view line) {
  line = absl::StripAsciiWhitespace(line);
  if (line.empty()) return false;
  if (absl::StrContains(absl::AsciiStrToLower(line), "print(")) return false;
  for (const char* prefix : kStatementPrefixes) {
    if (absl::StartsWith(line, prefix)) return false;
  }
  if (line == "else" || line == "try" || line.back() == '\\') return false;
  return IsSingleExpression(line);
}

std::string PrepareCode(const std::string& code) {
  std::vector<std::string> lines = absl::StrSplit(code, '\n');
  size_t last = lines.size();
  while (last > 0 &&
         absl::StripAsciiWhitespace(lines[last - 1]).empty()) {
    last--;
  }
  if (last == 0) return code;
  const std::string& line = lines[last - 1];
  if (!IsExpressionLine(line)) return code;
  if (EndsInsideStatement(
          absl::StrJoin(lines.begin(), lines.begin() + last - 1, "\n"))) {
    return code;
  }

  size_t indent_size = line.find_first_not_of(" \t");
  std::string indent = line.substr(0, indent_size);
  std::string expression(absl::StripAsciiWhitespace(line));
  lines.resize(last - 1);
  lines.push_back(absl::StrCat(indent, "_result = ", expression));
  lines.push_back(absl::StrCat(indent, "print(_result)"));
  return absl::StrJoin(lines, "\n");
}

}  // namespace executor
