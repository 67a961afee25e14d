#include "language_distance.h"
#include "debug_utils-inl.h"

namespace langmatch {

LanguageDistance::LanguageDistance(std::vector<MatchRule> rules,
                                   VariableTable variables,
                                   ParadigmSet paradigm_locales)
    : rules_(std::move(rules)),
      variables_(std::move(variables)),
      paradigm_locales_(std::move(paradigm_locales)) {}

int LanguageDistance::Distance(const LanguageId& desired,
                               const LanguageId& supported) const {
  CHECK(desired.is_maximized());
  CHECK(supported.is_maximized());

  int distance = 0;

  if (desired.region != supported.region)
    distance += Lookup(desired, supported);
  const LanguageId desired_script = desired.WithoutRegion();
  const LanguageId supported_script = supported.WithoutRegion();

  if (desired_script.script != supported_script.script)
    distance += Lookup(desired_script, supported_script);
  const LanguageId desired_language = desired_script.WithoutScript();
  const LanguageId supported_language = supported_script.WithoutScript();

  if (desired_language.language != supported_language.language)
    distance += Lookup(desired_language, supported_language);

  return distance;
}

int LanguageDistance::Lookup(const LanguageId& desired,
                             const LanguageId& supported) const {
  for (size_t i = 0; i < rules_.size(); ++i) {
    const MatchRule& rule = rules_[i];
    if (!rule.Matches(desired, supported, variables_)) continue;

    int distance = rule.distance * 10;
    if (distance > 0 && IsParadigm(desired) != IsParadigm(supported))
      distance -= 1;

    per_process::Debug(DebugCategory::LANGUAGE_MATCHER,
                       "%s / %s: rule #%u %s => %d\n",
                       desired,
                       supported,
                       i,
                       rule,
                       distance);
    return distance;
  }
  UNREACHABLE("no language matching rule applies");
}

}  // namespace langmatch
