#include "gtest/gtest.h"
#include "langmatch_test_fixture.h"
#include "match_rule.h"

using langmatch::MatchesSubtag;
using langmatch::MatchRule;
using langmatch::SubtagPattern;
using langmatch::TagPattern;
using langmatch::VariableTable;

namespace {

const VariableTable kVariables = {
    {"enUS", {"US", "CA", "PR"}},
    {"cnsar", {"HK", "MO"}},
};

SubtagPattern Pattern(const char* text) {
  std::optional<SubtagPattern> pattern = SubtagPattern::Parse(text);
  EXPECT_TRUE(pattern.has_value()) << text;
  return *pattern;
}

TagPattern Tag(const char* text) {
  std::optional<TagPattern> pattern = TagPattern::Parse(text);
  EXPECT_TRUE(pattern.has_value()) << text;
  return *pattern;
}

}  // namespace

TEST(SubtagPatternTest, Parse) {
  EXPECT_TRUE(std::holds_alternative<SubtagPattern::Any>(Pattern("*").value()));
  EXPECT_EQ(std::get<SubtagPattern::Literal>(Pattern("en").value()).value,
            "en");
  EXPECT_EQ(std::get<SubtagPattern::VariableRef>(Pattern("$enUS").value()).name,
            "enUS");
  EXPECT_EQ(std::get<SubtagPattern::VariableExcludedRef>(
                Pattern("$!enUS").value()).name,
            "enUS");

  EXPECT_FALSE(SubtagPattern::Parse("").has_value());
  EXPECT_FALSE(SubtagPattern::Parse("$").has_value());
  EXPECT_FALSE(SubtagPattern::Parse("$!").has_value());
}

TEST(SubtagPatternTest, ToString) {
  for (const char* text : {"*", "zh", "$cnsar", "$!cnsar"})
    EXPECT_EQ(Pattern(text).ToString(), text);
}

TEST(SubtagPatternTest, Literal) {
  EXPECT_TRUE(Pattern("GB").Matches("GB", kVariables));
  EXPECT_FALSE(Pattern("GB").Matches("US", kVariables));
  // Subtags are already normalized, comparison is exact.
  EXPECT_FALSE(Pattern("GB").Matches("gb", kVariables));
}

TEST(SubtagPatternTest, Variables) {
  EXPECT_TRUE(Pattern("$enUS").Matches("CA", kVariables));
  EXPECT_FALSE(Pattern("$enUS").Matches("GB", kVariables));
  EXPECT_FALSE(Pattern("$!enUS").Matches("CA", kVariables));
  EXPECT_TRUE(Pattern("$!enUS").Matches("GB", kVariables));
}

TEST(SubtagPatternTest, OptionalSlots) {
  const std::optional<std::string> absent;
  const std::optional<std::string> present = "Latn";
  const std::optional<SubtagPattern> no_pattern;

  EXPECT_TRUE(MatchesSubtag(no_pattern, absent, kVariables));
  EXPECT_FALSE(MatchesSubtag(no_pattern, present, kVariables));
  EXPECT_TRUE(MatchesSubtag(Pattern("*"), absent, kVariables));
  EXPECT_TRUE(MatchesSubtag(Pattern("*"), present, kVariables));
  EXPECT_FALSE(MatchesSubtag(Pattern("Latn"), absent, kVariables));
  EXPECT_FALSE(MatchesSubtag(Pattern("$!enUS"), absent, kVariables));
  EXPECT_TRUE(MatchesSubtag(Pattern("Latn"), present, kVariables));
}

TEST(TagPatternTest, Parse) {
  TagPattern pattern = Tag("zh_Hant_$cnsar");
  EXPECT_EQ(pattern.language.ToString(), "zh");
  ASSERT_TRUE(pattern.script.has_value());
  EXPECT_EQ(pattern.script->ToString(), "Hant");
  ASSERT_TRUE(pattern.region.has_value());
  EXPECT_EQ(pattern.region->ToString(), "$cnsar");
  EXPECT_EQ(pattern.ToString(), "zh_Hant_$cnsar");

  TagPattern language_only = Tag("*");
  EXPECT_FALSE(language_only.script.has_value());
  EXPECT_FALSE(language_only.region.has_value());

  EXPECT_FALSE(TagPattern::Parse("").has_value());
  EXPECT_FALSE(TagPattern::Parse("en__US").has_value());
  EXPECT_FALSE(TagPattern::Parse("en_Latn_US_x").has_value());
}

TEST(TagPatternTest, Matches) {
  EXPECT_TRUE(Tag("en_*_$enUS").Matches(Id("en", "Latn", "CA"), kVariables));
  EXPECT_FALSE(Tag("en_*_$enUS").Matches(Id("en", "Latn", "GB"), kVariables));
  EXPECT_FALSE(Tag("en_*_$enUS").Matches(Id("fr", "Latn", "CA"), kVariables));

  // A pattern without a region slot only matches identifiers whose region
  // has been cleared.
  EXPECT_TRUE(Tag("zh_Hans").Matches(Id("zh", "Hans"), kVariables));
  EXPECT_FALSE(Tag("zh_Hans").Matches(Id("zh", "Hans", "CN"), kVariables));
  EXPECT_FALSE(Tag("*").Matches(Id("zh", "Hans"), kVariables));
  EXPECT_TRUE(Tag("*").Matches(Id("zh"), kVariables));
}

TEST(TagPatternTest, Universal) {
  EXPECT_TRUE(Tag("*_*_*").IsUniversal());
  EXPECT_FALSE(Tag("*_*").IsUniversal());
  EXPECT_FALSE(Tag("*").IsUniversal());
  EXPECT_FALSE(Tag("en_*_*").IsUniversal());

  for (const auto& id : {Id("en", "Latn", "US"), Id("en", "Latn"), Id("en")})
    EXPECT_TRUE(Tag("*_*_*").Matches(id, kVariables)) << id.ToString();
}

TEST(TagPatternTest, ReferencedVariables) {
  EXPECT_EQ(Tag("en_*_$!enUS").ReferencedVariables(),
            std::vector<std::string>{"enUS"});
  EXPECT_TRUE(Tag("en_Latn_US").ReferencedVariables().empty());
}

TEST(MatchRuleTest, Symmetric) {
  MatchRule rule{Tag("en_*_$!enUS"), Tag("en_*_GB"), 3, false};
  EXPECT_TRUE(
      rule.Matches(Id("en", "Latn", "IE"), Id("en", "Latn", "GB"), kVariables));
  EXPECT_TRUE(
      rule.Matches(Id("en", "Latn", "GB"), Id("en", "Latn", "IE"), kVariables));
  EXPECT_FALSE(
      rule.Matches(Id("en", "Latn", "US"), Id("en", "Latn", "GB"), kVariables));
}

TEST(MatchRuleTest, OneWay) {
  MatchRule rule{Tag("zh_Hans"), Tag("zh_Hant"), 15, true};
  EXPECT_TRUE(rule.Matches(Id("zh", "Hans"), Id("zh", "Hant"), kVariables));
  EXPECT_FALSE(rule.Matches(Id("zh", "Hant"), Id("zh", "Hans"), kVariables));
}

TEST(MatchRuleTest, ToString) {
  MatchRule rule{Tag("zh_Hans"), Tag("zh_Hant"), 15, true};
  EXPECT_EQ(rule.ToString(), "zh_Hans -> zh_Hant (15, oneway)");
  MatchRule symmetric{Tag("*"), Tag("*"), 80, false};
  EXPECT_EQ(symmetric.ToString(), "* -> * (80)");
}
