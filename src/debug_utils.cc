#include "debug_utils-inl.h"  // NOLINT(build/include)
#include "util.h"

namespace langmatch {
namespace per_process {
EnabledDebugList enabled_debug_list;
}

void EnabledDebugList::Parse() {
  Parse(GetEnvVar("LANGMATCH_DEBUG_NATIVE").value_or(""));
}

void EnabledDebugList::Parse(const std::string& cats) {
  std::string debug_categories = cats;
  while (!debug_categories.empty()) {
    std::string::size_type comma_pos = debug_categories.find(',');
    std::string wanted = ToLower(debug_categories.substr(0, comma_pos));

#define V(name)                                                                \
  {                                                                            \
    static const std::string available_category = ToLower(#name);             \
    if (available_category.find(wanted) != std::string::npos)                  \
      set_enabled(DebugCategory::name);                                        \
  }

    DEBUG_CATEGORY_NAMES(V)
#undef V

    if (comma_pos == std::string::npos) break;
    // Use everything after the `,` as the list for the next iteration.
    debug_categories = debug_categories.substr(comma_pos + 1);
  }
}

void FWrite(FILE* file, const std::string& str) {
  // The return value is ignored because there's no good way to handle it.
  fwrite(str.data(), str.size(), 1, file);
}

}  // namespace langmatch
