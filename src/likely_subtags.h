#ifndef SRC_LIKELY_SUBTAGS_H_
#define SRC_LIKELY_SUBTAGS_H_

#include "language_id.h"

namespace langmatch {

// Fills in the script and region of a partial language identifier using
// likely-subtag inference ("maximization"). Implementations must be safe for
// concurrent use from several threads once constructed.
class LikelySubtags {
 public:
  LikelySubtags() = default;
  virtual ~LikelySubtags() = default;

  LikelySubtags(const LikelySubtags&) = delete;
  LikelySubtags& operator=(const LikelySubtags&) = delete;

  // Returns the maximized form of `id`. The result is expected to carry both
  // a script and a region; callers CHECK that postcondition.
  virtual LanguageId Maximize(const LanguageId& id) const = 0;
};

// LikelySubtags backed by ICU's likely-subtags data
// (icu::Locale::addLikelySubtags).
// Uses ICU's copy of the CLDR likely subtags. Subtags ICU cannot supply are
// set to the unknown codes `Zzzz` and `ZZ`.
class IcuLikelySubtags final : public LikelySubtags {
 public:
  LanguageId Maximize(const LanguageId& id) const override;
};

}  // namespace langmatch

#endif  // SRC_LIKELY_SUBTAGS_H_
