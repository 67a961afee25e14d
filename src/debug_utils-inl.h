#ifndef SRC_DEBUG_UTILS_INL_H_
#define SRC_DEBUG_UTILS_INL_H_

#include "debug_utils.h"
#include "util.h"

#include <concepts>
#include <type_traits>

namespace langmatch {

template <typename T>
concept StringConvertible = requires(const T& a) {
  { a.ToString() } -> std::convertible_to<std::string>;
};

struct ToStringHelper {
  template <typename T>
    requires StringConvertible<T>
  static std::string Convert(const T& value) {
    return value.ToString();
  }
  template <typename T>
    requires std::is_arithmetic_v<T>
  static std::string Convert(const T& value) {
    return std::to_string(value);
  }
  static std::string_view Convert(const char* value) {
    return value != nullptr ? value : "(null)";
  }
  static std::string_view Convert(const std::string& value) { return value; }
  static std::string_view Convert(std::string_view value) { return value; }
  static std::string_view Convert(bool value) {
    return value ? "true" : "false";
  }
};

inline std::string SPrintFImpl(std::string_view format) {
  auto offset = format.find('%');
  if (offset == std::string_view::npos) return std::string(format);
  // Only '%%' is allowed once the arguments are used up.
  CHECK_LT(offset + 1, format.size());
  CHECK_EQ(format[offset + 1], '%');

  return std::string(format.substr(0, offset + 1)) +
         SPrintFImpl(format.substr(offset + 2));
}

template <typename Arg, typename... Args>
std::string COLD_NOINLINE SPrintFImpl(  // NOLINT(runtime/string)
    std::string_view format,
    Arg&& arg,
    Args&&... args) {
  auto offset = format.find('%');
  CHECK_NE(offset, std::string_view::npos);  // Too many arguments.
  std::string ret(format.substr(0, offset));
  // Size modifiers carry no information here; the argument type decides.
  while (++offset < format.size() &&
         (format[offset] == 'l' || format[offset] == 'z')) {
  }
  switch (offset == format.size() ? '\0' : format[offset]) {
    case '%':
      return ret + '%' +
             SPrintFImpl(format.substr(offset + 1),
                         std::forward<Arg>(arg),
                         std::forward<Args>(args)...);
    case 'd':
    case 'i':
    case 'u':
    case 's':
      ret += ToStringHelper::Convert(arg);
      break;
    default:
      UNREACHABLE("unsupported SPrintF conversion");
  }
  return ret +
         SPrintFImpl(format.substr(offset + 1), std::forward<Args>(args)...);
}

template <typename... Args>
std::string COLD_NOINLINE SPrintF(  // NOLINT(runtime/string)
    std::string_view format,
    Args&&... args) {
  return SPrintFImpl(format, std::forward<Args>(args)...);
}

template <typename... Args>
void COLD_NOINLINE FPrintF(FILE* file,
                           std::string_view format,
                           Args&&... args) {
  FWrite(file, SPrintF(format, std::forward<Args>(args)...));
}

namespace per_process {

template <typename... Args>
inline void FORCE_INLINE Debug(DebugCategory cat,
                               const char* format,
                               Args&&... args) {
  if (!enabled_debug_list.enabled(cat)) [[likely]]
    return;
  FPrintF(stderr, format, std::forward<Args>(args)...);
}

}  // namespace per_process
}  // namespace langmatch

#endif  // SRC_DEBUG_UTILS_INL_H_
