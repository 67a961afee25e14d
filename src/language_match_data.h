#ifndef SRC_LANGUAGE_MATCH_DATA_H_
#define SRC_LANGUAGE_MATCH_DATA_H_

#include "match_rule.h"

#include <string>
#include <vector>

namespace langmatch {

// The contents of a CLDR <languageMatches> element, as loaded from the data
// source and before any locale is maximized.
struct LanguageMatchData {
  // Tags from <paradigmLocales locales="...">, in data order.
  std::vector<std::string> paradigm_locales;
  VariableTable variables;
  // In data order. Earlier rules take precedence.
  std::vector<MatchRule> rules;

  // Checks the integrity constraints the distance computation relies on:
  // every referenced variable is defined, every distance is within 0..100
  // and at least one rule is a universal fallback. On failure returns false
  // and describes the first problem in `*error`.
  bool Validate(std::string* error) const;
};

}  // namespace langmatch

#endif  // SRC_LANGUAGE_MATCH_DATA_H_
