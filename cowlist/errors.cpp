#include "cowlist/errors.hpp"

#include <cstddef>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

#include "absl/status/status.h"
#include "absl/strings/str_format.h"
#include "absl/strings/string_view.h"

namespace cowlist {

std::string_view ListErrorKindName(ListErrorKind kind) {
  switch (kind) {
    case ListErrorKind::kOutOfRange:
      return "out-of-range";
    case ListErrorKind::kEmptyContainer:
      return "empty-container";
    case ListErrorKind::kForeignIndex:
      return "foreign-index";
  }
  throw std::logic_error("Unknown ListErrorKind");
}

std::ostream& operator<<(std::ostream& os, ListErrorKind kind) {
  return os << ListErrorKindName(kind);
}

ListError::ListError(ListErrorKind kind, std::string_view message)
    : std::logic_error(
          absl::StrFormat("%s: %s", ListErrorKindName(kind), message)),
      kind_(kind),
      message_(message) {}

absl::Status ListError::ToStatus() const {
  switch (kind_) {
    case ListErrorKind::kOutOfRange:
      return OutOfRangeListError(message_);
    case ListErrorKind::kEmptyContainer:
      return EmptyContainerListError(message_);
    case ListErrorKind::kForeignIndex:
      return ForeignIndexListError(message_);
  }
  throw std::logic_error("Unknown ListErrorKind");
}

absl::Status OutOfRangeListError(std::string_view message) {
  return absl::OutOfRangeError(
      absl::string_view(message.data(), message.size()));
}

absl::Status EmptyContainerListError(std::string_view message) {
  return absl::FailedPreconditionError(
      absl::string_view(message.data(), message.size()));
}

absl::Status ForeignIndexListError(std::string_view message) {
  return absl::InvalidArgumentError(
      absl::string_view(message.data(), message.size()));
}

ListErrorKind ListErrorKindOf(absl::Status const& status) {
  switch (status.code()) {
    case absl::StatusCode::kFailedPrecondition:
      return ListErrorKind::kEmptyContainer;
    case absl::StatusCode::kInvalidArgument:
      return ListErrorKind::kForeignIndex;
    default:
      return ListErrorKind::kOutOfRange;
  }
}

absl::Status CheckElementPosition(std::ptrdiff_t position, std::size_t count) {
  if (position < 0 || static_cast<std::size_t>(position) >= count) {
    return OutOfRangeListError(absl::StrFormat(
        "Position %d is not an element position of a list of %d elements",
        position, count));
  }
  return absl::OkStatus();
}

absl::Status CheckInsertPosition(std::ptrdiff_t position, std::size_t count) {
  if (position < 0 || static_cast<std::size_t>(position) > count) {
    return OutOfRangeListError(absl::StrFormat(
        "Position %d is outside of [0, %d]", position, count));
  }
  return absl::OkStatus();
}

absl::Status CheckRange(std::ptrdiff_t lower, std::ptrdiff_t upper,
                        std::size_t count) {
  if (lower < 0) {
    return OutOfRangeListError(
        absl::StrFormat("Lower bound %d cannot be negative", lower));
  }
  if (upper < lower) {
    return OutOfRangeListError(absl::StrFormat(
        "Upper bound %d is below lower bound %d", upper, lower));
  }
  if (static_cast<std::size_t>(upper) > count) {
    return OutOfRangeListError(absl::StrFormat(
        "Upper bound %d is past the end of a list of %d elements", upper,
        count));
  }
  return absl::OkStatus();
}

absl::Status CheckNotEmpty(std::size_t count) {
  if (count == 0) {
    return EmptyContainerListError("Cannot remove from an empty list");
  }
  return absl::OkStatus();
}

void ThrowListError(absl::Status const& status) {
  if (status.ok()) {
    throw std::logic_error("ThrowListError called with an OK status");
  }
  throw ListError(
      ListErrorKindOf(status),
      std::string_view(status.message().data(), status.message().size()));
}

}  // namespace cowlist
