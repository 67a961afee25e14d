#ifndef SRC_LANGUAGE_ID_H_
#define SRC_LANGUAGE_ID_H_

#include <unicode/locid.h>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace langmatch {

// A language identifier reduced to the three subtags that take part in
// language matching. Variants and extensions are not represented.
struct LanguageId {
  std::string language;
  std::optional<std::string> script;
  std::optional<std::string> region;

  // Parses a BCP 47 tag. Both '-' and '_' are accepted as separators, so the
  // CLDR spelling `en_GB` parses as well. Returns std::nullopt when the tag is
  // not well-formed.
  static std::optional<LanguageId> Parse(std::string_view tag);
  static LanguageId FromIcuLocale(const icu::Locale& locale);

  // True when both script and region are present.
  bool is_maximized() const { return script.has_value() && region.has_value(); }

  LanguageId WithoutRegion() const { return {language, script, std::nullopt}; }
  LanguageId WithoutScript() const { return {language, std::nullopt, region}; }

  // Formats as `language[-Script][-REGION]`.
  std::string ToString() const;

  bool operator==(const LanguageId& other) const = default;

  struct Hash {
    size_t operator()(const LanguageId& id) const;
  };
};

}  // namespace langmatch

#endif  // SRC_LANGUAGE_ID_H_
