#ifndef SRC_LANGUAGE_MATCHER_H_
#define SRC_LANGUAGE_MATCHER_H_

#include "language_distance.h"
#include "language_id.h"
#include "language_match_data.h"
#include "likely_subtags.h"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace langmatch {

// Distances at or above this value mean "no acceptable association".
constexpr int kNoMatchDistance = 1000;

struct LanguageMatchResult {
  // Points into the candidate list passed to BestMatch().
  const LanguageId* supported;
  size_t index;
  int distance;
};

// Computes CLDR language distances between possibly partial identifiers and
// picks the closest supported locale for a desired one. Every query maximizes
// scratch copies of its arguments, the caller's values are never modified.
//
// Instances are immutable and may be shared across threads.
class LanguageMatcher {
 public:
  // Builds a matcher from already loaded rule data. Returns nullptr and sets
  // `*error` if the data fails validation or a paradigm locale cannot be
  // parsed or maximized.
  static std::unique_ptr<LanguageMatcher> New(
      LanguageMatchData data,
      std::shared_ptr<const LikelySubtags> likely_subtags,
      std::string* error);

  // Loads CLDR languageInfo.xml from `language_info_path` and maximizes with
  // ICU.
  static std::unique_ptr<LanguageMatcher> New(
      const std::string& language_info_path, std::string* error);

  // Same as above with DefaultLanguageInfoPath().
  static std::unique_ptr<LanguageMatcher> New(std::string* error);

  // LANGMATCH_LANGUAGE_INFO if set, otherwise the languageInfo.xml this
  // library was built with.
  static std::string DefaultLanguageInfoPath();

  LanguageMatcher(const LanguageMatcher&) = delete;
  LanguageMatcher& operator=(const LanguageMatcher&) = delete;

  // Some CLDR rules are one-way, so the argument order matters.
  int Distance(const LanguageId& desired, const LanguageId& supported) const;

  // Returns the first candidate with the smallest distance to `desired`, or
  // std::nullopt if there are no candidates or none is closer than
  // kNoMatchDistance.
  std::optional<LanguageMatchResult> BestMatch(
      const LanguageId& desired,
      const std::vector<LanguageId>& candidates) const;

  const LanguageDistance& language_distance() const { return distance_; }

 private:
  LanguageMatcher(std::vector<MatchRule> rules,
                  VariableTable variables,
                  ParadigmSet paradigm_locales,
                  std::shared_ptr<const LikelySubtags> likely_subtags);

  LanguageId Maximize(const LanguageId& id) const;

  const std::shared_ptr<const LikelySubtags> likely_subtags_;
  const LanguageDistance distance_;
};

}  // namespace langmatch

#endif  // SRC_LANGUAGE_MATCHER_H_
