#include <cstdlib>
#include <string>
#include <string_view>
#include <vector>

#include "debug_utils-inl.h"
#include "gtest/gtest.h"
#include "util.h"

#include <uv.h>

using langmatch::DebugCategory;
using langmatch::EnabledDebugList;
using langmatch::GetEnvVar;
using langmatch::OnScopeLeave;
using langmatch::ReadFileSync;
using langmatch::SplitString;
using langmatch::SPrintF;
using langmatch::ToLower;
using langmatch::TrimSpaces;

TEST(UtilTest, ToLower) {
  EXPECT_EQ(ToLower("zh-Hant"), "zh-hant");
  EXPECT_EQ(ToLower("LANGUAGE_INFO"), "language_info");
  EXPECT_EQ(ToLower("en_419"), "en_419");
  EXPECT_EQ(ToLower(""), "");
}

TEST(UtilTest, SplitString) {
  EXPECT_EQ(SplitString("en en_GB es", ' '),
            (std::vector<std::string_view>{"en", "en_GB", "es"}));
  EXPECT_EQ(SplitString("en__US", '_'),
            (std::vector<std::string_view>{"en", "", "US"}));
  EXPECT_EQ(SplitString("  en  es ", ' ', true),
            (std::vector<std::string_view>{"en", "es"}));
  EXPECT_EQ(SplitString("", ' '), (std::vector<std::string_view>{""}));
  EXPECT_TRUE(SplitString("", ' ', true).empty());
}

TEST(UtilTest, TrimSpaces) {
  EXPECT_EQ(TrimSpaces("  US \t"), "US");
  EXPECT_EQ(TrimSpaces("\nAS+CA\r\n"), "AS+CA");
  EXPECT_EQ(TrimSpaces("   "), "");
  EXPECT_EQ(TrimSpaces(""), "");
}

TEST(UtilTest, OnScopeLeave) {
  int calls = 0;
  {
    auto on_scope_leave = OnScopeLeave([&]() { calls++; });
    EXPECT_EQ(calls, 0);
  }
  EXPECT_EQ(calls, 1);

  {
    auto first = OnScopeLeave([&]() { calls++; });
    auto second = std::move(first);
  }
  // A moved-from guard does not run the callback again.
  EXPECT_EQ(calls, 2);
}

TEST(UtilTest, ReadFileSync) {
  std::string content;
  ASSERT_EQ(ReadFileSync(&content, LANGMATCH_TEST_LANGUAGE_INFO), 0);
  EXPECT_EQ(content.rfind("<?xml", 0), 0u);
  EXPECT_NE(content.find("<languageMatches"), std::string::npos);

  EXPECT_EQ(ReadFileSync(&content, "/nonexistent/languageInfo.xml"),
            UV_ENOENT);
}

TEST(UtilTest, GetEnvVar) {
  ASSERT_EQ(setenv("LANGMATCH_TEST_VAR", "zh-Hant", 1), 0);
  EXPECT_EQ(GetEnvVar("LANGMATCH_TEST_VAR"), "zh-Hant");

  std::string long_value(1024, 'x');
  ASSERT_EQ(setenv("LANGMATCH_TEST_VAR", long_value.c_str(), 1), 0);
  EXPECT_EQ(GetEnvVar("LANGMATCH_TEST_VAR"), long_value);

  ASSERT_EQ(unsetenv("LANGMATCH_TEST_VAR"), 0);
  EXPECT_FALSE(GetEnvVar("LANGMATCH_TEST_VAR").has_value());
}

TEST(UtilTest, SPrintF) {
  // %d, %u and %s all do the same thing. The actual C++ type is used to infer
  // the right representation.
  EXPECT_EQ(SPrintF("%s", false), "false");
  EXPECT_EQ(SPrintF("%d", true), "true");
  EXPECT_EQ(SPrintF("%d", -1339), "-1339");
  EXPECT_EQ(SPrintF("%u", size_t{1000}), "1000");
  EXPECT_EQ(SPrintF("%zu", size_t{7}), "7");

  const std::string tag = "zh-Hant";
  const std::string_view region = "TW";
  EXPECT_EQ(SPrintF("%s-%s", tag, region), "zh-Hant-TW");
  EXPECT_EQ(SPrintF("%s %s", "en", tag), "en zh-Hant");
  const char* missing = nullptr;
  EXPECT_EQ(SPrintF("%s", missing), "(null)");
  EXPECT_EQ(SPrintF("[%% %s %%]", tag), "[% zh-Hant %]");
  EXPECT_EQ(SPrintF("no arguments"), "no arguments");

  struct HasToString {
    std::string ToString() const {
      return "en-Latn-US";
    }
  };
  EXPECT_EQ(SPrintF("best: %s", HasToString{}), "best: en-Latn-US");
}

TEST(DebugUtilsTest, EnabledDebugListDefaultsOff) {
  EnabledDebugList list;
  EXPECT_FALSE(list.enabled(DebugCategory::LANGUAGE_INFO));
  EXPECT_FALSE(list.enabled(DebugCategory::LIKELY_SUBTAGS));
  EXPECT_FALSE(list.enabled(DebugCategory::LANGUAGE_MATCHER));

  list.Parse("");
  EXPECT_FALSE(list.enabled(DebugCategory::LANGUAGE_INFO));
}

TEST(DebugUtilsTest, EnabledDebugListParse) {
  EnabledDebugList list;
  list.Parse("likely_subtags");
  EXPECT_FALSE(list.enabled(DebugCategory::LANGUAGE_INFO));
  EXPECT_TRUE(list.enabled(DebugCategory::LIKELY_SUBTAGS));
  EXPECT_FALSE(list.enabled(DebugCategory::LANGUAGE_MATCHER));
}

TEST(DebugUtilsTest, EnabledDebugListParseIsCaseInsensitive) {
  EnabledDebugList list;
  list.Parse("Language_Matcher");
  EXPECT_TRUE(list.enabled(DebugCategory::LANGUAGE_MATCHER));
  EXPECT_FALSE(list.enabled(DebugCategory::LANGUAGE_INFO));
}

TEST(DebugUtilsTest, EnabledDebugListParsePrefix) {
  // A partial name enables every category containing it.
  EnabledDebugList list;
  list.Parse("language");
  EXPECT_TRUE(list.enabled(DebugCategory::LANGUAGE_INFO));
  EXPECT_FALSE(list.enabled(DebugCategory::LIKELY_SUBTAGS));
  EXPECT_TRUE(list.enabled(DebugCategory::LANGUAGE_MATCHER));
}

TEST(DebugUtilsTest, EnabledDebugListParseList) {
  EnabledDebugList list;
  list.Parse("unknown,language_info,likely_subtags");
  EXPECT_TRUE(list.enabled(DebugCategory::LANGUAGE_INFO));
  EXPECT_TRUE(list.enabled(DebugCategory::LIKELY_SUBTAGS));
  EXPECT_FALSE(list.enabled(DebugCategory::LANGUAGE_MATCHER));
}

TEST(DebugUtilsTest, EnabledDebugListParseEnvironment) {
  ASSERT_EQ(setenv("LANGMATCH_DEBUG_NATIVE", "language_info", 1), 0);
  EnabledDebugList list;
  list.Parse();
  ASSERT_EQ(unsetenv("LANGMATCH_DEBUG_NATIVE"), 0);
  EXPECT_TRUE(list.enabled(DebugCategory::LANGUAGE_INFO));
  EXPECT_FALSE(list.enabled(DebugCategory::LANGUAGE_MATCHER));
}
