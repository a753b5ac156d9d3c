// Rendering of list elements for the textual forms of LinkedList.

#ifndef COWLIST_PRINTER_HPP
#define COWLIST_PRINTER_HPP

#include <concepts>
#include <cstdlib>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <typeinfo>

#include "absl/cleanup/cleanup.h"
#include "absl/strings/str_format.h"

#if defined(__clang__) || defined(__GNUC__)
#include <cxxabi.h>
#endif

namespace cowlist {
namespace internal {

// The readable name of T, used for elements that have no printer. Falls back
// to the implementation's raw name when it cannot be demangled.
template <class T>
std::string_view TypeName() {
  static const std::string name = [] {
    char const* raw_name = typeid(T).name();
#if defined(__clang__) || defined(__GNUC__)
    int status = 0;
    char* demangled = abi::__cxa_demangle(raw_name, nullptr, nullptr, &status);
    auto release = absl::Cleanup([demangled] { std::free(demangled); });
    if (status == 0) return std::string(demangled);
#endif
    return std::string(raw_name);
  }();
  return name;
}

template <class T>
concept OstreamPrintable = requires(T const& t, std::ostream& os) {
  { os << t } -> std::same_as<std::ostream&>;
};

// Appends the rendering of `value` to `out`. Types with an operator<< are
// printed through it; anything else prints as a placeholder naming the type.
template <class T>
void AppendElement(std::string* out, T const& value) {
  if constexpr (OstreamPrintable<T>) {
    std::ostringstream ss;
    ss << value;
    out->append(ss.str());
  } else {
    absl::StrAppendFormat(out, "<%s value>", TypeName<T>());
  }
}

template <class T>
void AppendElement(std::string* out, std::optional<T> const& value) {
  if (value.has_value()) {
    AppendElement(out, value.value());
  } else {
    out->append("nullopt");
  }
}

template <class T>
std::string ElementToString(T const& value) {
  std::string out;
  AppendElement(&out, value);
  return out;
}

}  // namespace internal
}  // namespace cowlist

#endif
