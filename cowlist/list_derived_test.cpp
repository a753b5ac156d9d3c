#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "absl/strings/str_cat.h"
#include "cowlist/list.hpp"
#include "cowlist/testing/list_matchers.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace cowlist {
namespace {

using ::cowlist::matchers::HasValidLinks;
using ::testing::ElementsAre;
using ::testing::IsEmpty;

TEST(DerivedOpsTest, Map) {
  LinkedList<int> list = {1, 2, 3};
  LinkedList<std::string> mapped =
      list.map([](int x) { return absl::StrCat("#", x); });
  EXPECT_THAT(mapped, ElementsAre("#1", "#2", "#3"));
  EXPECT_THAT(list, ElementsAre(1, 2, 3));
}

TEST(DerivedOpsTest, Filter) {
  LinkedList<int> list = {1, 2, 3, 4, 5, 6};
  auto evens = list.filter([](int x) { return x % 2 == 0; });
  EXPECT_THAT(evens, ElementsAre(2, 4, 6));
  EXPECT_THAT(list.filter([](int) { return false; }), IsEmpty());
}

TEST(DerivedOpsTest, CompactMap) {
  LinkedList<std::string> list = {"1", "x", "3"};
  auto numbers = list.compact_map([](std::string const& s) -> std::optional<int> {
    if (s == "x") return std::nullopt;
    return std::stoi(s);
  });
  EXPECT_THAT(numbers, ElementsAre(1, 3));
}

TEST(DerivedOpsTest, Reduce) {
  LinkedList<int> list = {1, 2, 3, 4};
  EXPECT_EQ(list.reduce(0, [](int acc, int x) { return acc + x; }), 10);
  EXPECT_EQ(LinkedList<int>().reduce(7, [](int acc, int x) { return acc * x; }),
            7);

  auto joined = list.reduce(std::string(), [](std::string acc, int x) {
    return absl::StrCat(acc, x);
  });
  EXPECT_EQ(joined, "1234");
}

TEST(DerivedOpsTest, CallableErrorsPropagate) {
  LinkedList<int> list = {1, 2, 3};
  auto fail_on_two = [](int x) {
    if (x == 2) throw std::invalid_argument("two");
    return x;
  };
  EXPECT_THROW(list.map(fail_on_two), std::invalid_argument);
  EXPECT_THROW(list.filter([&](int x) { return fail_on_two(x) > 0; }),
               std::invalid_argument);
  EXPECT_THROW(list.compact_map([&](int x) -> std::optional<int> {
    return fail_on_two(x);
  }),
               std::invalid_argument);
  EXPECT_THROW(
      list.reduce(0, [&](int acc, int x) { return acc + fail_on_two(x); }),
      std::invalid_argument);
  EXPECT_THAT(list, ElementsAre(1, 2, 3));
}

TEST(DerivedOpsTest, ReverseTwiceIsIdentity) {
  LinkedList<int> list = {1, 2, 3, 4};
  list.reverse();
  EXPECT_THAT(list, ElementsAre(4, 3, 2, 1));
  EXPECT_EQ(list.first(), 4);
  EXPECT_EQ(list.last(), 1);
  EXPECT_THAT(list, HasValidLinks());
  list.reverse();
  EXPECT_THAT(list, ElementsAre(1, 2, 3, 4));
  EXPECT_THAT(list, HasValidLinks());
}

TEST(DerivedOpsTest, ReverseSmallLists) {
  LinkedList<int> empty;
  empty.reverse();
  EXPECT_THAT(empty, IsEmpty());
  EXPECT_THAT(empty, HasValidLinks());

  LinkedList<int> single = {1};
  single.reverse();
  EXPECT_THAT(single, ElementsAre(1));
  EXPECT_THAT(single, HasValidLinks());
}

TEST(DerivedOpsTest, ReverseOnSharedChain) {
  LinkedList<int> list = {1, 2, 3};
  auto copy = list;
  list.reverse();
  EXPECT_THAT(list, ElementsAre(3, 2, 1));
  EXPECT_THAT(copy, ElementsAre(1, 2, 3));
}

TEST(DerivedOpsTest, ReversedTwiceIsIdentity) {
  LinkedList<int> const list = {1, 2, 3};
  auto once = list.reversed();
  auto twice = once.reversed();
  EXPECT_THAT(once, ElementsAre(3, 2, 1));
  EXPECT_THAT(twice, ElementsAre(1, 2, 3));
  EXPECT_THAT(list, ElementsAre(1, 2, 3));
  EXPECT_THAT(once, HasValidLinks());
}

}  // namespace
}  // namespace cowlist
