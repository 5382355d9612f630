#ifndef POLICY_POLICY_FILTER_HPP
#define POLICY_POLICY_FILTER_HPP

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "proto/codebox.pb.h"

namespace policy {

// A forbidden construct: an identifier ("eval") or a dotted path of
// identifiers ("os.system"), and the kind of capability it gives access to.
struct Rule {
  std::string pattern;
  std::string category;
};

// eval, exec, compile, __import__, subprocess, os.system, os.popen, open.
const std::vector<Rule>& DefaultRules();

// Parses "pattern" or "pattern=category". Throws std::invalid_argument if the
// pattern is not a dotted identifier path.
Rule ParseRule(const std::string& entry);

// Rules from --forbidden_tokens_file and --forbidden_tokens, or the default
// ones if neither is set.
std::vector<Rule> RulesFromFlags();

// Human readable description of a violation.
std::string Describe(const proto::PolicyViolation& violation);

// Lexical filter run on the source before anything is spawned. Patterns are
// matched on whole identifiers, anywhere in the text (strings and comments
// included), so the filter is deterministic and linear in the source size.
// It is a courtesy check: code that builds names at runtime goes through.
class PolicyFilter {
 public:
  // A max_code_bytes of 0 disables the size check.
  PolicyFilter(std::vector<Rule> rules, int64_t max_code_bytes);

  // Returns true if the code is accepted. Otherwise fills violation with the
  // first forbidden construct found, or with the size violation.
  bool Check(const std::string& code, proto::PolicyViolation* violation) const;

  const std::vector<Rule>& Rules() const { return rules_; }
  int64_t MaxCodeBytes() const { return max_code_bytes_; }

 private:
  // Checks whether the identifiers following the one that ends at
  // ident_end are parts[1..], separated by dots.
  static bool MatchRest(const std::string& code, size_t ident_end,
                        const std::vector<std::string>& parts);

  std::vector<Rule> rules_;
  std::vector<std::vector<std::string>> parts_;
  // First identifier of a pattern -> indices in rules_.
  std::unordered_map<std::string, std::vector<size_t>> by_first_;
  int64_t max_code_bytes_;
};

}  // namespace policy

#endif
