#include "debug_utils-inl.h"
#include "langmatch_exit_code.h"
#include "langmatch_options.h"
#include "langmatch_version.h"
#include "language_matcher.h"

#include <cstdio>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace langmatch {
namespace {

std::optional<LanguageId> ParseLocale(const std::string& tag) {
  std::optional<LanguageId> id = LanguageId::Parse(tag);
  if (!id.has_value())
    FPrintF(stderr, "langmatch: invalid language tag: %s\n", tag);
  return id;
}

ExitCode Run(const CliOptions& options) {
  std::string path = options.language_info.empty()
                         ? LanguageMatcher::DefaultLanguageInfoPath()
                         : options.language_info;
  std::string error;
  std::unique_ptr<LanguageMatcher> matcher = LanguageMatcher::New(path, &error);
  if (!matcher) {
    FPrintF(stderr, "langmatch: %s: %s\n", path, error);
    return ExitCode::kGenericUserError;
  }

  std::vector<LanguageId> locales;
  for (const std::string& tag : options.locales) {
    std::optional<LanguageId> id = ParseLocale(tag);
    if (!id.has_value()) return ExitCode::kInvalidCommandLineArgument;
    locales.push_back(std::move(*id));
  }

  if (options.command == CliOptions::Command::kDistance) {
    FPrintF(stdout, "%d\n", matcher->Distance(locales[0], locales[1]));
    return ExitCode::kNoFailure;
  }

  const LanguageId desired = locales.front();
  locales.erase(locales.begin());
  std::optional<LanguageMatchResult> result =
      matcher->BestMatch(desired, locales);
  if (!result.has_value()) {
    FPrintF(stdout, "none\n");
  } else {
    FPrintF(stdout,
            "%s %d\n",
            options.locales[result->index + 1],
            result->distance);
  }
  return ExitCode::kNoFailure;
}

}  // anonymous namespace
}  // namespace langmatch

int main(int argc, char** argv) {
  using langmatch::CliOptions;
  using langmatch::ExitCode;

  langmatch::per_process::enabled_debug_list.Parse();

  std::vector<std::string> args(argv, argv + argc);
  std::vector<std::string> errors;
  CliOptions options;
  langmatch::ParseArgs(args, &options, &errors);

  if (!errors.empty()) {
    for (const std::string& error : errors)
      langmatch::FPrintF(stderr, "langmatch: %s\n", error);
    langmatch::FPrintF(stderr, "%s", langmatch::kUsage);
    return static_cast<int>(ExitCode::kInvalidCommandLineArgument);
  }
  if (options.print_help) {
    langmatch::FPrintF(stdout, "%s", langmatch::kUsage);
    return static_cast<int>(ExitCode::kNoFailure);
  }
  if (options.print_version) {
    langmatch::FPrintF(stdout, "%s\n", LANGMATCH_VERSION);
    return static_cast<int>(ExitCode::kNoFailure);
  }

  return static_cast<int>(langmatch::Run(options));
}
