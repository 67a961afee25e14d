#include "language_match_data.h"
#include "debug_utils-inl.h"

namespace langmatch {

bool LanguageMatchData::Validate(std::string* error) const {
  bool has_fallback = false;

  for (size_t i = 0; i < rules.size(); ++i) {
    const MatchRule& rule = rules[i];
    if (rule.distance < 0 || rule.distance > 100) {
      *error = SPrintF("rule #%u (%s) has a distance outside 0..100", i, rule);
      return false;
    }
    for (const TagPattern* pattern : {&rule.desired, &rule.supported}) {
      for (const std::string& name : pattern->ReferencedVariables()) {
        if (variables.find(name) == variables.end()) {
          *error = SPrintF(
              "rule #%u (%s) references undefined variable $%s", i, rule, name);
          return false;
        }
      }
    }
    if (rule.desired.IsUniversal() && rule.supported.IsUniversal())
      has_fallback = true;
  }

  if (!has_fallback) {
    *error = "no universal fallback rule (*_*_* -> *_*_*)";
    return false;
  }
  return true;
}

}  // namespace langmatch
