// Macros for propagating absl::Status values out of status-returning code.
//
// Modeled on the status macros in the Google Protobuf libraries:
//
// https://github.com/protocolbuffers/protobuf/blob/main/src/google/protobuf/stubs/status_macros.h
//
// This is under the BSD License. See the above link for the license.

#ifndef COWLIST_STATUS_MACROS_HPP
#define COWLIST_STATUS_MACROS_HPP

#include <utility>

#define COWLIST_STATUS_CONCAT_INNER_(x, y) x##y
#define COWLIST_STATUS_CONCAT_(x, y) COWLIST_STATUS_CONCAT_INNER_(x, y)

#define COWLIST_RETURN_IF_ERROR(expr) \
  do {                                \
    auto _cowlist_status = (expr);    \
    if (!_cowlist_status.ok()) {      \
      return _cowlist_status;         \
    }                                 \
  } while (0)

#define COWLIST_ASSIGN_OR_RETURN_IMPL_(statusor, lhs, rexpr) \
  auto statusor = (rexpr);                                   \
  if (!statusor.ok()) return std::move(statusor).status();   \
  lhs = std::move(statusor).value()

#define COWLIST_ASSIGN_OR_RETURN(lhs, rexpr)                                \
  COWLIST_ASSIGN_OR_RETURN_IMPL_(                                           \
      COWLIST_STATUS_CONCAT_(_cowlist_status_or_value, __LINE__), lhs, \
      rexpr)

#endif
