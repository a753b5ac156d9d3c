#ifndef COWLIST_TESTING_STATUS_MATCHERS_HPP
#define COWLIST_TESTING_STATUS_MATCHERS_HPP

#include <ostream>
#include <string>
#include <type_traits>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "cowlist/status_macros.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace cowlist::matchers {

namespace internal {

inline absl::Status const& GetStatus(absl::Status const& status) {
  return status;
}

template <class T>
absl::Status const& GetStatus(absl::StatusOr<T> const& status_or) {
  return status_or.status();
}

template <class ValueMatcher>
class IsOkAndHoldsMatcher {
 public:
  explicit IsOkAndHoldsMatcher(ValueMatcher const& value_matcher)
      : value_matcher_(value_matcher) {}

  template <class StatusType>
  operator ::testing::Matcher<StatusType>() const {
    return ::testing::Matcher<StatusType>(
        new Impl<StatusType>(value_matcher_));
  }

 private:
  template <class StatusType>
  class Impl : public ::testing::MatcherInterface<StatusType> {
   public:
    using ValueType = typename std::decay_t<StatusType>::value_type;
    explicit Impl(ValueMatcher const& value_matcher)
        : value_matcher_(::testing::MatcherCast<ValueType const&>(
              value_matcher)) {}

    void DescribeTo(std::ostream* os) const override {
      *os << "is OK and holds a value that ";
      value_matcher_.DescribeTo(os);
    }

    void DescribeNegationTo(std::ostream* os) const override {
      *os << "is not OK or holds a value that ";
      value_matcher_.DescribeNegationTo(os);
    }

    bool MatchAndExplain(
        StatusType const& status_or,
        ::testing::MatchResultListener* listener) const override {
      if (!status_or.ok()) {
        *listener << "which is not OK: " << status_or.status();
        return false;
      }
      *listener << "whose value ";
      return value_matcher_.MatchAndExplain(status_or.value(), listener);
    }

   private:
    ::testing::Matcher<ValueType const&> value_matcher_;
  };

  ValueMatcher const value_matcher_;
};

class IsOkImpl {
 public:
  void DescribeTo(std::ostream* os) const { *os << "is OK"; }
  void DescribeNegationTo(std::ostream* os) const { *os << "is not OK"; }

  template <class T>
  bool MatchAndExplain(T const& value,
                       ::testing::MatchResultListener* listener) const {
    if (!value.ok()) {
      *listener << "which is not OK: " << GetStatus(value);
      return false;
    }
    return true;
  }
};

class StatusIsImpl {
 public:
  StatusIsImpl(absl::StatusCode code,
               ::testing::Matcher<std::string> message_matcher)
      : code_(code), message_matcher_(std::move(message_matcher)) {}

  void DescribeTo(std::ostream* os) const {
    *os << "has code " << absl::StatusCodeToString(code_)
        << " and a message that ";
    message_matcher_.DescribeTo(os);
  }

  void DescribeNegationTo(std::ostream* os) const {
    *os << "does not have code " << absl::StatusCodeToString(code_)
        << " or has a message that ";
    message_matcher_.DescribeNegationTo(os);
  }

  template <class T>
  bool MatchAndExplain(T const& value,
                       ::testing::MatchResultListener* listener) const {
    auto const& status = GetStatus(value);
    if (status.code() != code_) {
      *listener << "whose code is " << absl::StatusCodeToString(status.code());
      return false;
    }
    *listener << "whose message ";
    return message_matcher_.MatchAndExplain(std::string(status.message()),
                                            listener);
  }

 private:
  absl::StatusCode code_;
  ::testing::Matcher<std::string> message_matcher_;
};

}  // namespace internal

inline ::testing::PolymorphicMatcher<internal::IsOkImpl> IsOk() {
  return ::testing::MakePolymorphicMatcher(internal::IsOkImpl());
}

inline ::testing::PolymorphicMatcher<internal::StatusIsImpl> StatusIs(
    absl::StatusCode code,
    ::testing::Matcher<std::string> message = ::testing::_) {
  return ::testing::MakePolymorphicMatcher(
      internal::StatusIsImpl(code, std::move(message)));
}

template <class ValueMatcher>
internal::IsOkAndHoldsMatcher<std::decay_t<ValueMatcher>> IsOkAndHolds(
    ValueMatcher&& matcher) {
  return internal::IsOkAndHoldsMatcher<std::decay_t<ValueMatcher>>(
      std::forward<ValueMatcher>(matcher));
}

}  // namespace cowlist::matchers

#define ASSERT_OK(x) ASSERT_THAT(x, ::cowlist::matchers::IsOk())
#define EXPECT_OK(x) EXPECT_THAT(x, ::cowlist::matchers::IsOk())

#define COWLIST_ASSERT_OK_AND_ASSIGN_IMPL_(statusor, lhs, rexpr) \
  auto statusor = (rexpr);                                       \
  ASSERT_OK(statusor);                                           \
  lhs = std::move(statusor).value()

#define ASSERT_OK_AND_ASSIGN(lhs, rexpr)                                  \
  COWLIST_ASSERT_OK_AND_ASSIGN_IMPL_(                                     \
      COWLIST_STATUS_CONCAT_(_cowlist_assert_status_or, __LINE__), lhs, \
      rexpr)

#endif
