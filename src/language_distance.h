#ifndef SRC_LANGUAGE_DISTANCE_H_
#define SRC_LANGUAGE_DISTANCE_H_

#include "language_id.h"
#include "match_rule.h"

#include <unordered_set>
#include <vector>

namespace langmatch {

using ParadigmSet = std::unordered_set<LanguageId, LanguageId::Hash>;

// Scores two maximized language identifiers against an ordered CLDR rule
// table. Immutable once constructed.
//
// The score is computed in three passes: region, then script, then language.
// A pass only contributes when its subtag differs, and each pass works on
// copies with the subtags of the previous passes removed, so later passes
// see `en-Latn` and then `en` rather than `en-Latn-US`. Each contribution is
// the distance of the first matching rule times ten, minus one when exactly
// one side of the comparison is a paradigm locale. A contribution never drops
// below zero.
class LanguageDistance {
 public:
  // `rules` must contain a universal fallback rule and reference only
  // variables defined in `variables`; see LanguageMatchData::Validate().
  LanguageDistance(std::vector<MatchRule> rules,
                   VariableTable variables,
                   ParadigmSet paradigm_locales);

  LanguageDistance(const LanguageDistance&) = delete;
  LanguageDistance& operator=(const LanguageDistance&) = delete;

  // Both identifiers must be maximized.
  int Distance(const LanguageId& desired, const LanguageId& supported) const;

  // Distance of the first rule matching the pair, scaled and adjusted for
  // paradigm locales.
  int Lookup(const LanguageId& desired, const LanguageId& supported) const;

  bool IsParadigm(const LanguageId& id) const {
    return paradigm_locales_.find(id) != paradigm_locales_.end();
  }

 private:
  const std::vector<MatchRule> rules_;
  const VariableTable variables_;
  const ParadigmSet paradigm_locales_;
};

}  // namespace langmatch

#endif  // SRC_LANGUAGE_DISTANCE_H_
