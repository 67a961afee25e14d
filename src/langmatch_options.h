#ifndef SRC_LANGMATCH_OPTIONS_H_
#define SRC_LANGMATCH_OPTIONS_H_

#include <string>
#include <vector>

namespace langmatch {

class CliOptions {
 public:
  enum class Command { kNone, kDistance, kBest };

  Command command = Command::kNone;
  // Path given with --language-info. Empty means
  // LanguageMatcher::DefaultLanguageInfoPath().
  std::string language_info;
  bool print_help = false;
  bool print_version = false;
  // Locale tags following the command: desired first, then the supported
  // locale(s).
  std::vector<std::string> locales;
};

// Parses `args` (including args[0], the executable name) into `*options`.
// Problems are appended to `*errors`; the caller should not proceed if any
// were reported.
void ParseArgs(const std::vector<std::string>& args,
               CliOptions* options,
               std::vector<std::string>* errors);

extern const char* const kUsage;

}  // namespace langmatch

#endif  // SRC_LANGMATCH_OPTIONS_H_
