#include "match_rule.h"
#include "debug_utils-inl.h"
#include "util.h"

namespace langmatch {

namespace {

// helper type for the visitor
template <class... Ts>
struct overloads : Ts... { using Ts::operator()...; };

bool Contains(const VariableTable& variables,
              const std::string& name,
              std::string_view subtag) {
  auto it = variables.find(name);
  // Undefined variables are rejected when the rule table is loaded.
  CHECK(it != variables.end());
  return it->second.find(std::string(subtag)) != it->second.end();
}

}  // anonymous namespace

std::optional<SubtagPattern> SubtagPattern::Parse(std::string_view text) {
  if (text.empty()) return std::nullopt;
  if (text == "*") return SubtagPattern(Any{});
  if (text.starts_with("$!")) {
    if (text.size() == 2) return std::nullopt;
    return SubtagPattern(VariableExcludedRef{std::string(text.substr(2))});
  }
  if (text.starts_with('$')) {
    if (text.size() == 1) return std::nullopt;
    return SubtagPattern(VariableRef{std::string(text.substr(1))});
  }
  return SubtagPattern(Literal{std::string(text)});
}

bool SubtagPattern::Matches(std::string_view subtag,
                            const VariableTable& variables) const {
  return std::visit(
      overloads{
          [&](const Literal& literal) { return literal.value == subtag; },
          [&](const VariableRef& ref) {
            return Contains(variables, ref.name, subtag);
          },
          [&](const VariableExcludedRef& ref) {
            return !Contains(variables, ref.name, subtag);
          },
          [](const Any&) { return true; },
      },
      value_);
}

const std::string* SubtagPattern::variable_name() const {
  if (auto* ref = std::get_if<VariableRef>(&value_)) return &ref->name;
  if (auto* ref = std::get_if<VariableExcludedRef>(&value_)) return &ref->name;
  return nullptr;
}

std::string SubtagPattern::ToString() const {
  return std::visit(
      overloads{
          [](const Literal& literal) { return literal.value; },
          [](const VariableRef& ref) { return "$" + ref.name; },
          [](const VariableExcludedRef& ref) { return "$!" + ref.name; },
          [](const Any&) { return std::string("*"); },
      },
      value_);
}

bool SubtagPattern::operator==(const SubtagPattern& other) const {
  return value_.index() == other.value_.index() &&
         ToString() == other.ToString();
}

bool MatchesSubtag(const std::optional<SubtagPattern>& pattern,
                   const std::optional<std::string>& subtag,
                   const VariableTable& variables) {
  if (!pattern.has_value()) return !subtag.has_value();
  if (pattern->is_any()) return true;
  if (!subtag.has_value()) return false;
  return pattern->Matches(*subtag, variables);
}

std::optional<TagPattern> TagPattern::Parse(std::string_view text) {
  std::vector<std::string_view> slots = SplitString(text, '_');
  if (slots.size() > 3) return std::nullopt;

  std::optional<SubtagPattern> language = SubtagPattern::Parse(slots[0]);
  if (!language.has_value()) return std::nullopt;

  TagPattern pattern{std::move(*language), std::nullopt, std::nullopt};
  if (slots.size() > 1) {
    pattern.script = SubtagPattern::Parse(slots[1]);
    if (!pattern.script.has_value()) return std::nullopt;
  }
  if (slots.size() > 2) {
    pattern.region = SubtagPattern::Parse(slots[2]);
    if (!pattern.region.has_value()) return std::nullopt;
  }
  return pattern;
}

bool TagPattern::Matches(const LanguageId& id,
                         const VariableTable& variables) const {
  return language.Matches(id.language, variables) &&
         MatchesSubtag(script, id.script, variables) &&
         MatchesSubtag(region, id.region, variables);
}

bool TagPattern::IsUniversal() const {
  return language.is_any() && script.has_value() && script->is_any() &&
         region.has_value() && region->is_any();
}

std::vector<std::string> TagPattern::ReferencedVariables() const {
  std::vector<std::string> names;
  for (const SubtagPattern* slot :
       {&language,
        script.has_value() ? &*script : nullptr,
        region.has_value() ? &*region : nullptr}) {
    if (slot == nullptr) continue;
    if (const std::string* name = slot->variable_name()) names.push_back(*name);
  }
  return names;
}

std::string TagPattern::ToString() const {
  std::string out = language.ToString();
  if (script.has_value()) out += "_" + script->ToString();
  if (region.has_value()) out += "_" + region->ToString();
  return out;
}

bool MatchRule::Matches(const LanguageId& desired_id,
                        const LanguageId& supported_id,
                        const VariableTable& variables) const {
  if (desired.Matches(desired_id, variables) &&
      supported.Matches(supported_id, variables)) {
    return true;
  }
  return !oneway && supported.Matches(desired_id, variables) &&
         desired.Matches(supported_id, variables);
}

std::string MatchRule::ToString() const {
  return SPrintF("%s -> %s (%d%s)",
                 desired,
                 supported,
                 distance,
                 oneway ? ", oneway" : "");
}

}  // namespace langmatch
