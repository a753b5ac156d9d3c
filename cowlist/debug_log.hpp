#ifndef COWLIST_DEBUG_LOG_HPP
#define COWLIST_DEBUG_LOG_HPP

#include <cstdio>
#include <source_location>

#include "absl/strings/str_format.h"

namespace cowlist {

// Enables or disables logging of copy-on-write clones. Off by default.
void SetCowTraceEnabled(bool enabled);
bool CowTraceEnabled();

namespace internal {

template <class... Args>
void DebugPrintImpl(std::source_location source_loc,
                    absl::FormatSpec<Args...> const& spec,
                    Args const&... args) {
  absl::FPrintF(stderr, "%s:%d: ", source_loc.file_name(), source_loc.line());
  absl::FPrintF(stderr, spec, args...);
  absl::FPrintF(stderr, "\n");
}

}  // namespace internal
}  // namespace cowlist

#define COWLIST_DEBUG_PRINT(...) \
  ::cowlist::internal::DebugPrintImpl(std::source_location::current(), __VA_ARGS__)

#define COWLIST_COW_TRACE(...)         \
  do {                                 \
    if (::cowlist::CowTraceEnabled()) { \
      COWLIST_DEBUG_PRINT(__VA_ARGS__); \
    }                                  \
  } while (0)

#endif
