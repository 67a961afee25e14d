#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "langmatch_options.h"

using langmatch::CliOptions;
using langmatch::ParseArgs;

class OptionsTest : public ::testing::Test {
 protected:
  void Parse(std::vector<std::string> args) {
    args.insert(args.begin(), "langmatch");
    options_ = CliOptions();
    errors_.clear();
    ParseArgs(args, &options_, &errors_);
  }

  CliOptions options_;
  std::vector<std::string> errors_;
};

TEST_F(OptionsTest, Distance) {
  Parse({"distance", "zh-HK", "zh-MO"});
  EXPECT_TRUE(errors_.empty());
  EXPECT_EQ(options_.command, CliOptions::Command::kDistance);
  EXPECT_EQ(options_.locales, (std::vector<std::string>{"zh-HK", "zh-MO"}));
  EXPECT_TRUE(options_.language_info.empty());
}

TEST_F(OptionsTest, Best) {
  Parse({"best", "zh-CN", "en", "ja", "zh-Hans"});
  EXPECT_TRUE(errors_.empty());
  EXPECT_EQ(options_.command, CliOptions::Command::kBest);
  EXPECT_EQ(options_.locales,
            (std::vector<std::string>{"zh-CN", "en", "ja", "zh-Hans"}));

  // No candidates is allowed and prints "none".
  Parse({"best", "zh-CN"});
  EXPECT_TRUE(errors_.empty());
}

TEST_F(OptionsTest, LanguageInfo) {
  Parse({"--language-info=/data/languageInfo.xml", "distance", "en", "fr"});
  EXPECT_TRUE(errors_.empty());
  EXPECT_EQ(options_.language_info, "/data/languageInfo.xml");

  Parse({"distance", "--language-info", "/data/li.xml", "en", "fr"});
  EXPECT_TRUE(errors_.empty());
  EXPECT_EQ(options_.language_info, "/data/li.xml");
  EXPECT_EQ(options_.locales, (std::vector<std::string>{"en", "fr"}));
}

TEST_F(OptionsTest, LanguageInfoRequiresArgument) {
  Parse({"distance", "en", "fr", "--language-info"});
  EXPECT_EQ(errors_,
            (std::vector<std::string>{"--language-info requires an argument"}));

  Parse({"--language-info=", "distance", "en", "fr"});
  EXPECT_EQ(errors_,
            (std::vector<std::string>{"--language-info requires an argument"}));
}

TEST_F(OptionsTest, HelpAndVersion) {
  Parse({"--help"});
  EXPECT_TRUE(errors_.empty());
  EXPECT_TRUE(options_.print_help);

  Parse({"-v"});
  EXPECT_TRUE(errors_.empty());
  EXPECT_TRUE(options_.print_version);
}

TEST_F(OptionsTest, DoubleDash) {
  // "-" alone is not an option either.
  Parse({"distance", "--", "-x", "-"});
  EXPECT_TRUE(errors_.empty());
  EXPECT_EQ(options_.locales, (std::vector<std::string>{"-x", "-"}));
}

TEST_F(OptionsTest, Errors) {
  Parse({});
  EXPECT_EQ(errors_, (std::vector<std::string>{"missing command"}));

  Parse({"--frobnicate", "distance", "en", "fr"});
  EXPECT_EQ(errors_, (std::vector<std::string>{"bad option: --frobnicate"}));

  Parse({"match", "en", "fr"});
  EXPECT_EQ(errors_, (std::vector<std::string>{"unknown command: match"}));

  Parse({"distance", "en"});
  EXPECT_EQ(errors_,
            (std::vector<std::string>{"distance expects exactly two locales"}));

  Parse({"distance", "en", "fr", "de"});
  EXPECT_EQ(errors_,
            (std::vector<std::string>{"distance expects exactly two locales"}));

  Parse({"best"});
  EXPECT_EQ(errors_,
            (std::vector<std::string>{"best expects a desired locale"}));
}
