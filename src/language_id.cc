#include "language_id.h"
#include "debug_utils-inl.h"

#include <unicode/utypes.h>

#include <algorithm>
#include <functional>

namespace langmatch {

std::optional<LanguageId> LanguageId::Parse(std::string_view tag) {
  std::string bcp47(tag);
  std::replace(bcp47.begin(), bcp47.end(), '_', '-');
  if (bcp47.empty()) return std::nullopt;

  UErrorCode status = U_ZERO_ERROR;
  icu::Locale locale = icu::Locale::forLanguageTag(bcp47, status);
  if (U_FAILURE(status) || locale.isBogus()) {
    per_process::Debug(DebugCategory::LIKELY_SUBTAGS,
                       "cannot parse language tag '%s': %s\n",
                       bcp47,
                       u_errorName(status));
    return std::nullopt;
  }

  // ICU drops `und` and anything it cannot place, so an empty language is
  // only acceptable when the tag spelled out `und`.
  std::string lower = ToLower(bcp47);
  if (*locale.getLanguage() == '\0' && lower != "und" &&
      !lower.starts_with("und-")) {
    per_process::Debug(DebugCategory::LIKELY_SUBTAGS,
                       "language tag '%s' has no language subtag\n",
                       bcp47);
    return std::nullopt;
  }

  return FromIcuLocale(locale);
}

LanguageId LanguageId::FromIcuLocale(const icu::Locale& locale) {
  LanguageId id;
  // ICU represents the root language `und` as an empty language subtag.
  id.language = *locale.getLanguage() != '\0' ? locale.getLanguage() : "und";
  if (*locale.getScript() != '\0') id.script = locale.getScript();
  if (*locale.getCountry() != '\0') id.region = locale.getCountry();
  return id;
}

std::string LanguageId::ToString() const {
  std::string out = language;
  if (script.has_value()) out += "-" + *script;
  if (region.has_value()) out += "-" + *region;
  return out;
}

size_t LanguageId::Hash::operator()(const LanguageId& id) const {
  std::hash<std::string> hasher;
  size_t h = hasher(id.language);
  // An absent subtag hashes differently from an empty one.
  h = h * 31 + (id.script.has_value() ? hasher(*id.script) + 1 : 0);
  h = h * 31 + (id.region.has_value() ? hasher(*id.region) + 1 : 0);
  return h;
}

}  // namespace langmatch
