#ifndef COWLIST_ERRORS_HPP
#define COWLIST_ERRORS_HPP

#include <cstddef>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

#include "absl/status/status.h"

namespace cowlist {

enum class ListErrorKind {
  // A position or range argument violates its bounds.
  kOutOfRange,
  // An unconditional removal was attempted on an empty list.
  kEmptyContainer,
  // An index was presented to a list (or list generation) that did not
  // issue it.
  kForeignIndex,
};

std::string_view ListErrorKindName(ListErrorKind kind);
std::ostream& operator<<(std::ostream& os, ListErrorKind kind);

// Thrown for precondition violations on LinkedList operations.
//
// These are programmer errors. Every check runs before the list is touched,
// so a caught ListError always leaves the list as it was.
class ListError : public std::logic_error {
 public:
  ListError(ListErrorKind kind, std::string_view message);

  ListErrorKind kind() const { return kind_; }

  // The same error expressed as a status, with the code used by the
  // Check* functions below.
  absl::Status ToStatus() const;

  // The message without the kind prefix that what() carries.
  std::string const& message() const { return message_; }

 private:
  ListErrorKind kind_;
  std::string message_;
};

absl::Status OutOfRangeListError(std::string_view message);
absl::Status EmptyContainerListError(std::string_view message);
absl::Status ForeignIndexListError(std::string_view message);

// Maps a status produced by the Check* functions back to its kind. Returns
// kOutOfRange for codes that none of the checks produce.
ListErrorKind ListErrorKindOf(absl::Status const& status);

// Bounds checks shared by the integer and index based entry points.
//
// Positions are signed so that negative arguments reach the check instead of
// wrapping around.

// 0 <= position < count
absl::Status CheckElementPosition(std::ptrdiff_t position, std::size_t count);
// 0 <= position <= count
absl::Status CheckInsertPosition(std::ptrdiff_t position, std::size_t count);
// 0 <= lower <= upper <= count
absl::Status CheckRange(std::ptrdiff_t lower, std::ptrdiff_t upper,
                        std::size_t count);
absl::Status CheckNotEmpty(std::size_t count);

// Throws a ListError for a non-OK status.
[[noreturn]] void ThrowListError(absl::Status const& status);

inline void ThrowIfError(absl::Status const& status) {
  if (!status.ok()) {
    ThrowListError(status);
  }
}

}  // namespace cowlist

#endif
