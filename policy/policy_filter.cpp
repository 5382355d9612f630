#include "policy/policy_filter.hpp"

#include <stdexcept>

#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "util/file.hpp"
#include "util/flags.hpp"

namespace {

const constexpr char* kDefaultCategory = "forbidden";

// Non-ASCII bytes are treated as identifier characters, since Python accepts
// unicode identifiers.
bool IsIdentStart(char c) {
  return absl::ascii_isalpha(c) || c == '_' ||
         static_cast<unsigned char>(c) >= 0x80;
}

bool IsIdentChar(char c) { return IsIdentStart(c) || absl::ascii_isdigit(c); }

bool IsBlank(char c) { return c == ' ' || c == '\t'; }

size_t IdentEnd(const std::string& code, size_t pos) {
  while (pos < code.size() && IsIdentChar(code[pos])) pos++;
  return pos;
}

std::vector<std::string> SplitPattern(const std::string& pattern) {
  std::vector<std::string> parts = absl::StrSplit(pattern, '.');
  for (const std::string& part : parts) {
    if (part.empty() || !IsIdentStart(part[0]) ||
        IdentEnd(part, 0) != part.size()) {
      throw std::invalid_argument("Invalid forbidden token: " + pattern);
    }
  }
  return parts;
}

}  // namespace

namespace policy {

const std::vector<Rule>& DefaultRules() {
  static const std::vector<Rule> rules = {
      {"eval", "dynamic-evaluation"},   {"exec", "dynamic-evaluation"},
      {"compile", "dynamic-evaluation"}, {"__import__", "dynamic-import"},
      {"subprocess", "process-spawning"}, {"os.system", "process-spawning"},
      {"os.popen", "process-spawning"},  {"open", "file-access"},
  };
  return rules;
}

Rule ParseRule(const std::string& entry) {
  std::vector<std::string> fields =
      absl::StrSplit(entry, absl::MaxSplits('=', 1));
  Rule rule;
  rule.pattern = std::string(absl::StripAsciiWhitespace(fields[0]));
  rule.category = fields.size() > 1
                      ? std::string(absl::StripAsciiWhitespace(fields[1]))
                      : kDefaultCategory;
  if (rule.category.empty()) rule.category = kDefaultCategory;
  SplitPattern(rule.pattern);
  return rule;
}

std::vector<Rule> RulesFromFlags() {
  std::vector<Rule> rules;
  if (!FLAGS_forbidden_tokens_file.empty()) {
    std::string content = util::File::Read(FLAGS_forbidden_tokens_file);
    for (absl::string_view line : absl::StrSplit(content, '\n')) {
      line = absl::StripAsciiWhitespace(line);
      if (line.empty() || line[0] == '#') continue;
      rules.push_back(ParseRule(std::string(line)));
    }
  }
  for (absl::string_view entry :
       absl::StrSplit(FLAGS_forbidden_tokens, ',', absl::SkipWhitespace())) {
    rules.push_back(ParseRule(std::string(entry)));
  }
  if (rules.empty() && FLAGS_forbidden_tokens_file.empty()) {
    rules = DefaultRules();
  }
  return rules;
}

std::string Describe(const proto::PolicyViolation& violation) {
  if (violation.kind() == proto::CODE_TOO_LARGE) {
    return absl::StrCat("code too large: ", violation.size(),
                        " bytes, the limit is ", violation.max_size());
  }
  return absl::StrCat("forbidden construct '", violation.token(), "' (",
                      violation.category(), ") at line ", violation.line(),
                      ", column ", violation.column());
}

PolicyFilter::PolicyFilter(std::vector<Rule> rules, int64_t max_code_bytes)
    : rules_(std::move(rules)), max_code_bytes_(max_code_bytes) {
  for (size_t i = 0; i < rules_.size(); i++) {
    parts_.push_back(SplitPattern(rules_[i].pattern));
    by_first_[parts_.back()[0]].push_back(i);
  }
}

bool PolicyFilter::MatchRest(const std::string& code, size_t ident_end,
                             const std::vector<std::string>& parts) {
  size_t pos = ident_end;
  for (size_t i = 1; i < parts.size(); i++) {
    while (pos < code.size() && IsBlank(code[pos])) pos++;
    if (pos >= code.size() || code[pos] != '.') return false;
    pos++;
    while (pos < code.size() && IsBlank(code[pos])) pos++;
    size_t end = IdentEnd(code, pos);
    if (code.compare(pos, end - pos, parts[i]) != 0) return false;
    pos = end;
  }
  return true;
}

bool PolicyFilter::Check(const std::string& code,
                         proto::PolicyViolation* violation) const {
  if (max_code_bytes_ > 0 &&
      code.size() > static_cast<uint64_t>(max_code_bytes_)) {
    violation->Clear();
    violation->set_kind(proto::CODE_TOO_LARGE);
    violation->set_size(code.size());
    violation->set_max_size(max_code_bytes_);
    return false;
  }
  int64_t line = 1;
  size_t line_start = 0;
  size_t pos = 0;
  while (pos < code.size()) {
    char c = code[pos];
    if (c == '\n') {
      line++;
      line_start = ++pos;
      continue;
    }
    if (!IsIdentChar(c)) {
      pos++;
      continue;
    }
    // Numbers such as 1e5 or 0x_ff are skipped as a whole.
    size_t end = IdentEnd(code, pos);
    if (IsIdentStart(c)) {
      auto candidates = by_first_.find(code.substr(pos, end - pos));
      if (candidates != by_first_.end()) {
        for (size_t rule : candidates->second) {
          if (!MatchRest(code, end, parts_[rule])) continue;
          violation->Clear();
          violation->set_kind(proto::FORBIDDEN_TOKEN);
          violation->set_token(rules_[rule].pattern);
          violation->set_category(rules_[rule].category);
          violation->set_offset(pos);
          violation->set_line(line);
          violation->set_column(pos - line_start + 1);
          return false;
        }
      }
    }
    pos = end;
  }
  return true;
}

}  // namespace policy
