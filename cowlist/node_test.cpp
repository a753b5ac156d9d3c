#include "cowlist/node.hpp"

#include <memory>
#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace cowlist::internal {
namespace {

using ::testing::ElementsAre;

template <class T>
std::vector<T> Forward(Chain<T> const& chain) {
  std::vector<T> values;
  for (auto const* node = chain.head.get(); node; node = node->next.get()) {
    values.push_back(node->value);
  }
  return values;
}

template <class T>
std::vector<T> Backward(Chain<T> const& chain) {
  std::vector<T> values;
  for (auto const* node = chain.tail; node; node = node->previous) {
    values.push_back(node->value);
  }
  return values;
}

TEST(ChainTest, FromRangeLinksBothWays) {
  auto chain = Chain<std::string>::FromRange(
      std::vector<std::string>{"a", "b", "c"});
  EXPECT_EQ(chain.count, 3);
  EXPECT_THAT(Forward(chain), ElementsAre("a", "b", "c"));
  EXPECT_THAT(Backward(chain), ElementsAre("c", "b", "a"));
  EXPECT_EQ(chain.head->previous, nullptr);
  EXPECT_EQ(chain.tail->next, nullptr);
}

TEST(ChainTest, EmptyRange) {
  auto chain = Chain<int>::FromRange(std::vector<int>{});
  EXPECT_EQ(chain.count, 0);
  EXPECT_EQ(chain.head, nullptr);
  EXPECT_EQ(chain.tail, nullptr);
}

TEST(ChainTest, CloneIsIndependent) {
  auto original = Chain<int>::FromRange(std::vector<int>{1, 2, 3});
  auto clone = Chain<int>::Clone(original.head.get());
  EXPECT_EQ(clone.count, 3);
  EXPECT_NE(clone.head, original.head);
  EXPECT_NE(clone.tail, original.tail);

  clone.head->value = 10;
  EXPECT_THAT(Forward(original), ElementsAre(1, 2, 3));
  EXPECT_THAT(Forward(clone), ElementsAre(10, 2, 3));
  EXPECT_THAT(Backward(clone), ElementsAre(3, 2, 10));
}

TEST(ChainTest, CloneOfNothing) {
  auto clone = Chain<int>::Clone(nullptr);
  EXPECT_EQ(clone.count, 0);
  EXPECT_EQ(clone.head, nullptr);
}

TEST(NodeTest, DroppingHeadReleasesWholeChain) {
  auto chain = Chain<int>::FromRange(std::vector<int>{1, 2, 3});
  std::weak_ptr<Node<int>> last = chain.head->next->next;
  chain.head.reset();
  EXPECT_TRUE(last.expired());
}

TEST(NodeTest, DroppingHeadKeepsSharedSuffix) {
  auto chain = Chain<int>::FromRange(std::vector<int>{1, 2, 3});
  std::shared_ptr<Node<int>> suffix = chain.head->next;
  chain.head.reset();
  ASSERT_NE(suffix, nullptr);
  EXPECT_EQ(suffix->value, 2);
  ASSERT_NE(suffix->next, nullptr);
  EXPECT_EQ(suffix->next->value, 3);
}

TEST(NodeTest, LongChainTearsDownWithoutRecursion) {
  Chain<int> chain;
  for (int i = 0; i < 1000000; ++i) {
    chain.PushBack(MakeNode<int>(i));
  }
  EXPECT_EQ(chain.count, 1000000);
  chain.head.reset();
}

}  // namespace
}  // namespace cowlist::internal
