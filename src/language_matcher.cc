#include "language_matcher.h"
#include "debug_utils-inl.h"
#include "language_info_parser.h"

#ifndef LANGMATCH_DEFAULT_LANGUAGE_INFO
#define LANGMATCH_DEFAULT_LANGUAGE_INFO "languageInfo.xml"
#endif

namespace langmatch {

LanguageMatcher::LanguageMatcher(
    std::vector<MatchRule> rules,
    VariableTable variables,
    ParadigmSet paradigm_locales,
    std::shared_ptr<const LikelySubtags> likely_subtags)
    : likely_subtags_(std::move(likely_subtags)),
      distance_(std::move(rules),
                std::move(variables),
                std::move(paradigm_locales)) {}

std::unique_ptr<LanguageMatcher> LanguageMatcher::New(
    LanguageMatchData data,
    std::shared_ptr<const LikelySubtags> likely_subtags,
    std::string* error) {
  CHECK_NOT_NULL(likely_subtags);

  if (!data.Validate(error)) {
    per_process::Debug(DebugCategory::LANGUAGE_MATCHER,
                       "rejecting language match data: %s\n",
                       *error);
    return nullptr;
  }

  ParadigmSet paradigm_locales;
  for (const std::string& tag : data.paradigm_locales) {
    std::optional<LanguageId> id = LanguageId::Parse(tag);
    if (!id.has_value()) {
      *error = SPrintF("invalid paradigm locale '%s'", tag);
      return nullptr;
    }
    LanguageId maximized = likely_subtags->Maximize(*id);
    if (!maximized.is_maximized()) {
      *error = SPrintF("cannot maximize paradigm locale '%s'", tag);
      return nullptr;
    }
    paradigm_locales.insert(std::move(maximized));
  }

  return std::unique_ptr<LanguageMatcher>(
      new LanguageMatcher(std::move(data.rules),
                          std::move(data.variables),
                          std::move(paradigm_locales),
                          std::move(likely_subtags)));
}

std::unique_ptr<LanguageMatcher> LanguageMatcher::New(
    const std::string& language_info_path, std::string* error) {
  LanguageInfoParser parser;
  if (parser.ParsePath(language_info_path) != LanguageInfoParser::Valid) {
    *error = parser.error();
    return nullptr;
  }
  return New(parser.TakeData(), std::make_shared<IcuLikelySubtags>(), error);
}

std::unique_ptr<LanguageMatcher> LanguageMatcher::New(std::string* error) {
  return New(DefaultLanguageInfoPath(), error);
}

std::string LanguageMatcher::DefaultLanguageInfoPath() {
  return GetEnvVar("LANGMATCH_LANGUAGE_INFO")
      .value_or(LANGMATCH_DEFAULT_LANGUAGE_INFO);
}

LanguageId LanguageMatcher::Maximize(const LanguageId& id) const {
  LanguageId maximized = likely_subtags_->Maximize(id);
  CHECK(maximized.is_maximized());
  return maximized;
}

int LanguageMatcher::Distance(const LanguageId& desired,
                              const LanguageId& supported) const {
  return distance_.Distance(Maximize(desired), Maximize(supported));
}

std::optional<LanguageMatchResult> LanguageMatcher::BestMatch(
    const LanguageId& desired,
    const std::vector<LanguageId>& candidates) const {
  const LanguageId max_desired = Maximize(desired);

  std::optional<LanguageMatchResult> best;
  for (size_t i = 0; i < candidates.size(); ++i) {
    int distance = distance_.Distance(max_desired, Maximize(candidates[i]));
    if (!best.has_value() || distance < best->distance)
      best = LanguageMatchResult{&candidates[i], i, distance};
  }

  if (best.has_value() && best->distance >= kNoMatchDistance) {
    per_process::Debug(DebugCategory::LANGUAGE_MATCHER,
                       "best candidate %s for %s is too far (%d)\n",
                       *best->supported,
                       desired,
                       best->distance);
    return std::nullopt;
  }
  return best;
}

}  // namespace langmatch
