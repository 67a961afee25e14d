#include "likely_subtags.h"
#include "debug_utils-inl.h"

#include <unicode/locid.h>
#include <unicode/utypes.h>

namespace langmatch {

namespace {

// CLDR codes for an unknown script and region.
constexpr const char* kUnknownScript = "Zzzz";
constexpr const char* kUnknownRegion = "ZZ";

LanguageId FillUnknown(LanguageId id) {
  if (!id.script.has_value()) id.script = kUnknownScript;
  if (!id.region.has_value()) id.region = kUnknownRegion;
  return id;
}

}  // anonymous namespace

LanguageId IcuLikelySubtags::Maximize(const LanguageId& id) const {
  UErrorCode status = U_ZERO_ERROR;
  icu::Locale locale = icu::Locale::forLanguageTag(id.ToString(), status);
  if (U_SUCCESS(status)) locale.addLikelySubtags(status);
  if (U_FAILURE(status)) {
    per_process::Debug(DebugCategory::LIKELY_SUBTAGS,
                       "cannot maximize %s: %s\n",
                       id,
                       u_errorName(status));
    return FillUnknown(id);
  }

  // ICU leaves subtags it has no data for empty.
  LanguageId result = FillUnknown(LanguageId::FromIcuLocale(locale));

  per_process::Debug(DebugCategory::LIKELY_SUBTAGS,
                     "maximized %s to %s\n",
                     id,
                     result);
  return result;
}

}  // namespace langmatch
