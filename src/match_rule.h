#ifndef SRC_MATCH_RULE_H_
#define SRC_MATCH_RULE_H_

#include "language_id.h"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <variant>
#include <vector>

namespace langmatch {

// Variable name (without the leading '$') to the set of subtags it stands for.
using VariableTable =
    std::unordered_map<std::string, std::unordered_set<std::string>>;

// One slot of a CLDR languageMatch pattern, e.g. `en`, `$enUS`, `$!enUS` or
// `*`.
class SubtagPattern {
 public:
  struct Literal {
    std::string value;
  };
  struct VariableRef {
    std::string name;
  };
  struct VariableExcludedRef {
    std::string name;
  };
  struct Any {};
  using Value = std::variant<Literal, VariableRef, VariableExcludedRef, Any>;

  explicit SubtagPattern(Value value) : value_(std::move(value)) {}

  // `*` is Any, `$!name` is VariableExcludedRef, `$name` is VariableRef and
  // anything else is a Literal. Returns std::nullopt for an empty slot or a
  // variable reference without a name.
  static std::optional<SubtagPattern> Parse(std::string_view text);

  // Matches against a present subtag. Referenced variables must exist in
  // `variables`.
  bool Matches(std::string_view subtag, const VariableTable& variables) const;

  bool is_any() const { return std::holds_alternative<Any>(value_); }
  // The referenced variable, or nullptr for Literal and Any.
  const std::string* variable_name() const;
  const Value& value() const { return value_; }

  std::string ToString() const;

  bool operator==(const SubtagPattern& other) const;

 private:
  Value value_;
};

// Matches an optional pattern against an optional subtag. An absent pattern
// only matches an absent subtag; Any matches presence and absence alike.
bool MatchesSubtag(const std::optional<SubtagPattern>& pattern,
                   const std::optional<std::string>& subtag,
                   const VariableTable& variables);

// A `_`-separated pattern such as `zh_Hant_$cnsar` with a mandatory language
// slot and optional script and region slots.
struct TagPattern {
  SubtagPattern language;
  std::optional<SubtagPattern> script;
  std::optional<SubtagPattern> region;

  // Returns std::nullopt for an empty pattern, an empty slot, or more than
  // three slots.
  static std::optional<TagPattern> Parse(std::string_view text);

  bool Matches(const LanguageId& id, const VariableTable& variables) const;

  // True when all three slots are present and Any (`*_*_*`). Such a pattern
  // matches every identifier, whichever of its subtags have been cleared.
  bool IsUniversal() const;

  // Names of all variables referenced by this pattern.
  std::vector<std::string> ReferencedVariables() const;

  std::string ToString() const;
};

struct MatchRule {
  TagPattern desired;
  TagPattern supported;
  int distance;  // 0..100
  bool oneway = false;

  // Tests `desired`/`supported` against the rule, and in swapped order unless
  // the rule is one-way.
  bool Matches(const LanguageId& desired,
               const LanguageId& supported,
               const VariableTable& variables) const;

  std::string ToString() const;
};

}  // namespace langmatch

#endif  // SRC_MATCH_RULE_H_
