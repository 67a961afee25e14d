#include "langmatch_options.h"
#include "debug_utils-inl.h"

#include <cstring>

namespace langmatch {

const char* const kUsage =
    "Usage: langmatch [options] distance <desired> <supported>\n"
    "       langmatch [options] best <desired> <candidate>...\n"
    "\n"
    "Options:\n"
    "  --language-info=<path>  CLDR languageInfo.xml to load\n"
    "                          (default: $LANGMATCH_LANGUAGE_INFO or the\n"
    "                          built-in data file)\n"
    "  -h, --help              print this message\n"
    "  -v, --version           print the version\n"
    "\n"
    "Environment:\n"
    "  LANGMATCH_DEBUG_NATIVE  comma-separated debug categories\n"
    "                          (language_info, likely_subtags,\n"
    "                          language_matcher)\n";

void ParseArgs(const std::vector<std::string>& args,
               CliOptions* options,
               std::vector<std::string>* errors) {
  bool options_done = false;

  for (size_t i = 1; i < args.size(); ++i) {
    const std::string& arg = args[i];

    if (!options_done && arg.size() > 1 && arg[0] == '-') {
      if (arg == "--") {
        options_done = true;
      } else if (arg == "-h" || arg == "--help") {
        options->print_help = true;
      } else if (arg == "-v" || arg == "--version") {
        options->print_version = true;
      } else if (arg.starts_with("--language-info=")) {
        options->language_info = arg.substr(strlen("--language-info="));
        if (options->language_info.empty())
          errors->push_back("--language-info requires an argument");
      } else if (arg == "--language-info") {
        if (i + 1 == args.size()) {
          errors->push_back("--language-info requires an argument");
        } else {
          options->language_info = args[++i];
        }
      } else {
        errors->push_back(SPrintF("bad option: %s", arg));
      }
      continue;
    }

    if (options->command == CliOptions::Command::kNone) {
      if (arg == "distance") {
        options->command = CliOptions::Command::kDistance;
      } else if (arg == "best") {
        options->command = CliOptions::Command::kBest;
      } else {
        errors->push_back(SPrintF("unknown command: %s", arg));
        return;
      }
      continue;
    }

    options->locales.push_back(arg);
  }

  if (options->print_help || options->print_version) return;

  switch (options->command) {
    case CliOptions::Command::kNone:
      errors->push_back("missing command");
      break;
    case CliOptions::Command::kDistance:
      if (options->locales.size() != 2)
        errors->push_back("distance expects exactly two locales");
      break;
    case CliOptions::Command::kBest:
      if (options->locales.empty())
        errors->push_back("best expects a desired locale");
      break;
  }
}

}  // namespace langmatch
