#ifndef COWLIST_LIST_HPP
#define COWLIST_LIST_HPP

#include <algorithm>
#include <atomic>
#include <compare>
#include <concepts>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <optional>
#include <ostream>
#include <ranges>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/hash/hash.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "cowlist/debug_log.hpp"
#include "cowlist/errors.hpp"
#include "cowlist/identifiable.hpp"
#include "cowlist/identity_token.hpp"
#include "cowlist/node.hpp"
#include "cowlist/printer.hpp"
#include "cowlist/status_macros.hpp"

namespace cowlist {

namespace internal {

template <class T>
struct OptionalTraits : std::false_type {};

template <class T>
struct OptionalTraits<std::optional<T>> : std::true_type {
  using ValueType = T;
};

template <class T>
concept IsOptional = OptionalTraits<std::remove_cvref_t<T>>::value;

}  // namespace internal

// A doubly-linked list with value semantics.
//
// Copying a LinkedList is O(1): the copy shares the chain of nodes with the
// original. The first mutation through either handle clones the chain, so
// neither handle ever observes the other's changes.
//
// Positions can be named by integers or by Index values. An Index is stamped
// with the identity of the list that produced it, and is rejected by any
// other list, and by the same list after a copy-on-write clone.
//
// Precondition violations (bad positions, foreign indices, removing from an
// empty list) throw ListError before the list is modified. The Try* methods
// report the same conditions as statuses instead.
//
// A single LinkedList is not synchronized. Distinct copies may be used from
// different threads concurrently.
template <class T>
class LinkedList {
  using Node = internal::Node<T>;
  using Chain = internal::Chain<T>;

 public:
  using value_type = T;
  using size_type = std::size_t;
  using difference_type = std::ptrdiff_t;
  using reference = T const&;
  using const_reference = T const&;

  // Forward iterator over the values of a list.
  //
  // Iterators hold a plain pointer to the current node. Mutating the list
  // they came from while they are in use is not supported; mutating a copy of
  // that list is always safe.
  class const_iterator {
   public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = T;
    using difference_type = std::ptrdiff_t;
    using pointer = T const*;
    using reference = T const&;

    const_iterator() = default;

    reference operator*() const { return node_->value; }
    pointer operator->() const { return &node_->value; }

    const_iterator& operator++() {
      node_ = node_->next.get();
      return *this;
    }

    const_iterator operator++(int) {
      auto copy = *this;
      ++*this;
      return copy;
    }

    bool operator==(const_iterator const& other) const = default;

   private:
    friend class LinkedList;

    explicit const_iterator(Node const* node) : node_(node) {}

    Node const* node_ = nullptr;
  };

  using iterator = const_iterator;

  // A position in a particular generation of a particular list.
  //
  // Indices never keep a list or its nodes alive. They compare by position.
  class Index {
   public:
    Index() = default;

    difference_type position() const { return position_; }

    bool operator==(Index const& other) const {
      return position_ == other.position_;
    }

    std::strong_ordering operator<=>(Index const& other) const {
      return position_ <=> other.position_;
    }

   private:
    friend class LinkedList;

    Index(std::weak_ptr<IdentityToken const> owner, std::weak_ptr<Node> node,
          difference_type position)
        : owner_(std::move(owner)),
          node_(std::move(node)),
          position_(position) {}

    std::weak_ptr<IdentityToken const> owner_;
    // Empty for the past-the-end position.
    std::weak_ptr<Node> node_;
    difference_type position_ = 0;
  };

  LinkedList() : token_(IdentityToken::Create()) {}

  LinkedList(std::initializer_list<T> values) : LinkedList() {
    Adopt(Chain::FromRange(values));
  }

  template <std::ranges::input_range R>
    requires(!std::same_as<std::remove_cvref_t<R>, LinkedList> &&
             std::constructible_from<T, std::ranges::range_reference_t<R>>)
  explicit LinkedList(R&& values) : LinkedList() {
    Adopt(Chain::FromRange(std::forward<R>(values)));
  }

  // Copies share the chain and the identity of the source.
  LinkedList(LinkedList const&) = default;
  LinkedList& operator=(LinkedList const&) = default;

  // The moved-from list is left empty and without an identity. It accepts
  // no index until its next mutation gives it a fresh one.
  LinkedList(LinkedList&& other) noexcept
      : head_(std::move(other.head_)),
        tail_(std::exchange(other.tail_, nullptr)),
        count_(std::exchange(other.count_, 0)),
        token_(std::move(other.token_)) {}

  LinkedList& operator=(LinkedList&& other) noexcept {
    if (this != &other) {
      head_ = std::move(other.head_);
      tail_ = std::exchange(other.tail_, nullptr);
      count_ = std::exchange(other.count_, 0);
      token_ = std::move(other.token_);
    }
    return *this;
  }

  ~LinkedList() = default;

  // -- Size and end access --

  size_type size() const { return count_; }
  bool empty() const { return count_ == 0; }

  std::optional<T> first() const {
    if (!head_) return std::nullopt;
    return head_->value;
  }

  std::optional<T> last() const {
    if (!tail_) return std::nullopt;
    return tail_->value;
  }

  // -- Positional access --

  T const& operator[](difference_type position) const {
    ThrowIfError(CheckElementPosition(position, count_));
    return NodeAt(position)->value;
  }

  // Returns the value at `position`, or nullopt if there is none.
  std::optional<T> get(difference_type position) const {
    if (!CheckElementPosition(position, count_).ok()) {
      return std::nullopt;
    }
    return NodeAt(position)->value;
  }

  void set(difference_type position, T value) {
    ThrowIfError(CheckElementPosition(position, count_));
    EnsureUnique();
    NodeAt(position)->value = std::move(value);
  }

  // A new list holding the values in [from, to).
  LinkedList sublist(difference_type from, difference_type to) const {
    ThrowIfError(CheckRange(from, to, count_));
    LinkedList result;
    auto const* node = NodeAt(from);
    for (auto i = from; i < to; ++i) {
      result.append(node->value);
      node = node->next.get();
    }
    return result;
  }

  // -- Insertion --

  void append(T value) {
    auto node = internal::MakeNode<T>(std::move(value));
    EnsureUnique();
    LinkBefore(nullptr, std::move(node));
  }

  void prepend(T value) {
    auto node = internal::MakeNode<T>(std::move(value));
    EnsureUnique();
    LinkBefore(head_.get(), std::move(node));
  }

  template <std::ranges::input_range R>
  void append_all(R&& values) {
    auto end = static_cast<difference_type>(count_);
    ReplaceChecked(end, end, std::forward<R>(values));
  }

  template <std::ranges::input_range R>
  void prepend_all(R&& values) {
    ReplaceChecked(0, 0, std::forward<R>(values));
  }

  void insert(difference_type position, T value) {
    ThrowIfError(CheckInsertPosition(position, count_));
    InsertChecked(position, std::move(value));
  }

  void insert(Index const& index, T value) {
    ThrowIfError(CheckIndexOwner(index));
    insert(index.position_, std::move(value));
  }

  template <std::ranges::input_range R>
  void insert_all(difference_type position, R&& values) {
    ThrowIfError(CheckInsertPosition(position, count_));
    ReplaceChecked(position, position, std::forward<R>(values));
  }

  // -- Removal --

  T remove(difference_type position) {
    ThrowIfError(CheckElementPosition(position, count_));
    return RemoveChecked(position);
  }

  T remove(Index const& index) {
    auto node = ResolveElement(index);
    ThrowIfError(node.status());
    return std::move(Unlink(Follow(*node))->value);
  }

  T remove_first() {
    ThrowIfError(CheckNotEmpty(count_));
    return RemoveChecked(0);
  }

  T remove_last() {
    ThrowIfError(CheckNotEmpty(count_));
    return RemoveChecked(static_cast<difference_type>(count_) - 1);
  }

  std::optional<T> pop_first() {
    if (empty()) return std::nullopt;
    return remove_first();
  }

  std::optional<T> pop_last() {
    if (empty()) return std::nullopt;
    return remove_last();
  }

  // Drops the chain. Indices issued before the call are no longer accepted.
  void remove_all() {
    auto fresh_token = IdentityToken::Create();
    head_.reset();
    tail_ = nullptr;
    count_ = 0;
    token_ = std::move(fresh_token);
  }

  void remove_subrange(difference_type lower, difference_type upper) {
    ThrowIfError(CheckRange(lower, upper, count_));
    EnsureUnique();
    Splice(lower, upper, Chain());
  }

  void remove_subrange(Index const& lower, Index const& upper) {
    ThrowIfError(CheckIndexOwner(lower));
    ThrowIfError(CheckIndexOwner(upper));
    remove_subrange(lower.position_, upper.position_);
  }

  // -- Range replacement --

  // Replaces the values in [lower, upper) with `values`.
  //
  // The replacement is read in full before the list is touched, so `values`
  // may be this list itself. Replacing the whole list with another
  // LinkedList shares that list's chain instead of copying it.
  template <std::ranges::input_range R>
  void replace_subrange(difference_type lower, difference_type upper,
                        R&& values) {
    ThrowIfError(CheckRange(lower, upper, count_));
    ReplaceChecked(lower, upper, std::forward<R>(values));
  }

  template <std::ranges::input_range R>
  void replace_subrange(Index const& lower, Index const& upper, R&& values) {
    ThrowIfError(CheckIndexOwner(lower));
    ThrowIfError(CheckIndexOwner(upper));
    replace_subrange(lower.position_, upper.position_,
                     std::forward<R>(values));
  }

  // -- Status returning forms --

  absl::Status TryInsert(difference_type position, T value) {
    COWLIST_RETURN_IF_ERROR(CheckInsertPosition(position, count_));
    InsertChecked(position, std::move(value));
    return absl::OkStatus();
  }

  absl::StatusOr<T> TryRemove(difference_type position) {
    COWLIST_RETURN_IF_ERROR(CheckElementPosition(position, count_));
    return RemoveChecked(position);
  }

  absl::StatusOr<T> TryRemoveFirst() {
    COWLIST_RETURN_IF_ERROR(CheckNotEmpty(count_));
    return RemoveChecked(0);
  }

  template <std::ranges::input_range R>
  absl::Status TryReplaceSubrange(difference_type lower, difference_type upper,
                                  R&& values) {
    COWLIST_RETURN_IF_ERROR(CheckRange(lower, upper, count_));
    ReplaceChecked(lower, upper, std::forward<R>(values));
    return absl::OkStatus();
  }

  // -- Indices --

  Index start_index() const { return IndexOf(head_.get(), 0); }

  Index end_index() const {
    return Index(token_, {}, static_cast<difference_type>(count_));
  }

  // Equivalent to advancing start_index() `position` times.
  Index index_at(difference_type position) const {
    ThrowIfError(CheckInsertPosition(position, count_));
    return IndexOf(NodeAt(position), position);
  }

  Index index_after(Index const& index) const {
    ThrowIfError(CheckIndexOwner(index));
    if (static_cast<size_type>(index.position_) >= count_) {
      ThrowListError(OutOfRangeListError("Cannot advance past the end index"));
    }
    auto node = ResolveElement(index);
    ThrowIfError(node.status());
    return IndexOf((*node)->next.get(), index.position_ + 1);
  }

  Index index_before(Index const& index) const {
    ThrowIfError(CheckIndexOwner(index));
    if (index.position_ <= 0) {
      ThrowListError(
          OutOfRangeListError("Cannot retreat before the start index"));
    }
    ThrowIfError(CheckInsertPosition(index.position_, count_));
    if (static_cast<size_type>(index.position_) == count_) {
      return IndexOf(tail_, index.position_ - 1);
    }
    auto node = ResolveElement(index);
    ThrowIfError(node.status());
    return IndexOf((*node)->previous, index.position_ - 1);
  }

  T const& operator[](Index const& index) const {
    auto node = ResolveElement(index);
    ThrowIfError(node.status());
    return (*node)->value;
  }

  void set(Index const& index, T value) {
    auto node = ResolveElement(index);
    ThrowIfError(node.status());
    Follow(*node)->value = std::move(value);
  }

  void swap_at(Index const& i, Index const& j) {
    auto node_i = ResolveElement(i);
    ThrowIfError(node_i.status());
    auto node_j = ResolveElement(j);
    ThrowIfError(node_j.status());
    if (i.position_ == j.position_) return;

    auto rank_i = RankInChain(*node_i);
    ThrowIfError(rank_i.status());
    auto rank_j = RankInChain(*node_j);
    ThrowIfError(rank_j.status());
    Node* a = *node_i;
    Node* b = *node_j;
    if (EnsureUnique()) {
      a = NodeAt(*rank_i);
      b = NodeAt(*rank_j);
    }
    using std::swap;
    swap(a->value, b->value);
  }

  // -- Iteration --

  const_iterator begin() const { return const_iterator(head_.get()); }
  const_iterator end() const { return const_iterator(); }
  const_iterator cbegin() const { return begin(); }
  const_iterator cend() const { return end(); }

  // The values in order, for handing to an external encoder.
  std::vector<T> ToVector() const { return std::vector<T>(begin(), end()); }

  // -- Reordering --

  void reverse() {
    EnsureUnique();
    Node* old_head = head_.get();
    std::shared_ptr<Node> reversed;
    auto current = std::move(head_);
    while (current) {
      auto next = std::move(current->next);
      current->previous = next.get();
      current->next = std::move(reversed);
      reversed = std::move(current);
      current = std::move(next);
    }
    head_ = std::move(reversed);
    tail_ = old_head;
  }

  LinkedList reversed() const {
    LinkedList result;
    for (auto const* node = tail_; node; node = node->previous) {
      result.append(node->value);
    }
    return result;
  }

  // -- Derived lists --

  template <class F>
    requires std::invocable<F&, T const&>
  auto map(F&& transform) const
      -> LinkedList<std::remove_cvref_t<std::invoke_result_t<F&, T const&>>> {
    LinkedList<std::remove_cvref_t<std::invoke_result_t<F&, T const&>>> result;
    for (auto const& value : *this) {
      result.append(std::invoke(transform, value));
    }
    return result;
  }

  template <class F>
    requires std::predicate<F&, T const&>
  LinkedList filter(F&& predicate) const {
    LinkedList result;
    for (auto const& value : *this) {
      if (std::invoke(predicate, value)) {
        result.append(value);
      }
    }
    return result;
  }

  // Keeps the engaged results of `transform`.
  template <class F>
    requires std::invocable<F&, T const&> &&
             internal::IsOptional<std::invoke_result_t<F&, T const&>>
  auto compact_map(F&& transform) const {
    using Result = typename internal::OptionalTraits<
        std::remove_cvref_t<std::invoke_result_t<F&, T const&>>>::ValueType;
    LinkedList<Result> result;
    for (auto const& value : *this) {
      auto transformed = std::invoke(transform, value);
      if (transformed.has_value()) {
        result.append(std::move(transformed).value());
      }
    }
    return result;
  }

  template <class Acc, class F>
    requires std::invocable<F&, Acc, T const&>
  Acc reduce(Acc initial, F&& combine) const {
    for (auto const& value : *this) {
      initial = std::invoke(combine, std::move(initial), value);
    }
    return initial;
  }

  // -- Identity-keyed operations --

  template <class U = T>
    requires Identifiable<U>
  std::optional<T> first_with_id(IdOf<U> const& id) const {
    for (auto const& value : *this) {
      if (value.id() == id) return value;
    }
    return std::nullopt;
  }

  template <class U = T>
    requires Identifiable<U>
  std::vector<T> all_with_id(IdOf<U> const& id) const {
    std::vector<T> results;
    for (auto const& value : *this) {
      if (value.id() == id) {
        results.push_back(value);
      }
    }
    return results;
  }

  template <class U = T>
    requires Identifiable<U>
  bool contains_id(IdOf<U> const& id) const {
    return FindById(id).node != nullptr;
  }

  template <class U = T>
    requires Identifiable<U>
  std::optional<T> remove_first_with_id(IdOf<U> const& id) {
    auto found = FindById(id);
    if (!found.node) return std::nullopt;
    Node* target = EnsureUnique() ? NodeAt(found.position) : found.node;
    return std::move(Unlink(target)->value);
  }

  // Removes every value with the given id, returning them in order.
  template <class U = T>
    requires Identifiable<U>
  std::vector<T> remove_all_with_id(IdOf<U> const& id) {
    std::vector<T> removed;
    if (!FindById(id).node) return removed;

    EnsureUnique();
    Node* node = head_.get();
    while (node) {
      Node* next = node->next.get();
      if (node->value.id() == id) {
        removed.push_back(std::move(Unlink(node)->value));
      }
      node = next;
    }
    return removed;
  }

  // Replaces the first value with the given id by `transform(value)`.
  // Returns false if there is no such value. The list is unchanged if
  // `transform` throws.
  template <class F, class U = T>
    requires Identifiable<U> && std::invocable<F&, T const&>
  bool update_first_with_id(IdOf<U> const& id, F&& transform) {
    auto found = FindById(id);
    if (!found.node) return false;
    T updated = std::invoke(transform, std::as_const(found.node->value));
    Node* target = EnsureUnique() ? NodeAt(found.position) : found.node;
    target->value = std::move(updated);
    return true;
  }

  template <class U = T>
    requires Identifiable<U>
  LinkedList filtered_by_ids(absl::flat_hash_set<IdOf<U>> const& ids) const {
    LinkedList result;
    for (auto const& value : *this) {
      if (ids.contains(value.id())) {
        result.append(value);
      }
    }
    return result;
  }

  // Maps each id to the last value carrying it.
  template <class U = T>
    requires Identifiable<U>
  absl::flat_hash_map<IdOf<U>, T> indexed_by_id() const {
    absl::flat_hash_map<IdOf<U>, T> result;
    for (auto const& value : *this) {
      result.insert_or_assign(value.id(), value);
    }
    return result;
  }

  template <class U = T>
    requires Identifiable<U>
  absl::flat_hash_map<IdOf<U>, std::vector<T>> grouped_by_id() const {
    absl::flat_hash_map<IdOf<U>, std::vector<T>> result;
    for (auto const& value : *this) {
      result[value.id()].push_back(value);
    }
    return result;
  }

  // -- Diagnostics --

  // Verifies the structural invariants of the chain.
  absl::Status CheckInvariants() const {
    if (!head_ != !tail_ || !head_ != (count_ == 0)) {
      return absl::InternalError(absl::StrFormat(
          "Head, tail and count disagree: head=%p tail=%p count=%d",
          head_.get(), tail_, count_));
    }
    if (head_ && head_->previous) {
      return absl::InternalError("Head has a predecessor");
    }
    size_type forward = 0;
    Node const* last = nullptr;
    for (auto const* node = head_.get(); node; node = node->next.get()) {
      if (node->previous != last) {
        return absl::InternalError(absl::StrFormat(
            "Back link of node %d does not name its predecessor", forward));
      }
      last = node;
      ++forward;
    }
    if (last != tail_) {
      return absl::InternalError("Forward walk does not end at the tail");
    }
    if (forward != count_) {
      return absl::InternalError(absl::StrFormat(
          "Forward walk visits %d nodes, count is %d", forward, count_));
    }
    size_type backward = 0;
    for (auto const* node = tail_; node; node = node->previous) {
      ++backward;
    }
    if (backward != count_) {
      return absl::InternalError(absl::StrFormat(
          "Backward walk visits %d nodes, count is %d", backward, count_));
    }
    return absl::OkStatus();
  }

  // "LinkedList(1, 2, 3)"
  std::string ToString() const {
    std::string out = "LinkedList(";
    bool first_value = true;
    for (auto const& value : *this) {
      if (!first_value) {
        out.append(", ");
      }
      internal::AppendElement(&out, value);
      first_value = false;
    }
    out.append(")");
    return out;
  }

  // One value per line, preceded by the count.
  std::string DebugString() const {
    if (empty()) {
      return "LinkedList(empty)";
    }
    std::string out = absl::StrFormat("LinkedList(count: %d) {", count_);
    for (auto const& value : *this) {
      out.append("\n  ");
      internal::AppendElement(&out, value);
    }
    out.append("\n}");
    return out;
  }

  friend bool operator==(LinkedList const& lhs, LinkedList const& rhs)
    requires std::equality_comparable<T>
  {
    if (lhs.count_ != rhs.count_) return false;
    if (lhs.head_ == rhs.head_) return true;
    return std::ranges::equal(lhs, rhs);
  }

  template <class H>
  friend H AbslHashValue(H h, LinkedList const& list) {
    for (auto const& value : list) {
      h = H::combine(std::move(h), value);
    }
    return H::combine(std::move(h), list.count_);
  }

  friend std::ostream& operator<<(std::ostream& os, LinkedList const& list) {
    return os << list.ToString();
  }

 private:
  struct FoundNode {
    Node* node = nullptr;
    difference_type position = 0;
  };

  // Takes ownership of a freshly built chain. Only valid on an empty list.
  void Adopt(Chain chain) {
    head_ = std::move(chain.head);
    tail_ = chain.tail;
    count_ = chain.count;
  }

  bool IsUniquelyOwned() const {
    if (head_.use_count() != 1) return false;
    // Pairs with the release in the reference count decrement of any copy
    // that has just let go of this chain.
    std::atomic_thread_fence(std::memory_order_acquire);
    return true;
  }

  // Clones the chain if another list shares it. Returns true if it did, in
  // which case all node pointers taken before the call refer to the old
  // chain.
  //
  // Copies of an empty list share a token but no chain. Whichever of them is
  // mutated first takes a fresh token here, so the two never accept each
  // other's indices.
  bool EnsureUnique() {
    if (!head_ || IsUniquelyOwned()) {
      if (!token_ || token_.use_count() > 1) {
        token_ = IdentityToken::Create();
      }
      return false;
    }

    auto clone = Chain::Clone(head_.get());
    auto fresh_token = IdentityToken::Create();
    COWLIST_COW_TRACE("cloning shared chain of %d nodes (generation %d -> %d)",
                      count_, token_->generation(), fresh_token->generation());
    head_ = std::move(clone.head);
    tail_ = clone.tail;
    token_ = std::move(fresh_token);
    return true;
  }

  // Makes the chain unique and returns the node that takes the place of
  // `node` in it.
  Node* Follow(Node* node) {
    auto rank = RankInChain(node);
    ThrowIfError(rank.status());
    return EnsureUnique() ? NodeAt(*rank) : node;
  }

  // The position of `node`, which must be reachable from head_.
  absl::StatusOr<difference_type> RankInChain(Node const* node) const {
    difference_type rank = 0;
    auto const* first = node;
    for (; first->previous; first = first->previous) {
      ++rank;
    }
    if (first != head_.get()) {
      return ForeignIndexListError("Index refers to a node of another list");
    }
    return rank;
  }

  // The node at `position`, or nullptr for position == count_. Walks from
  // whichever end is closer.
  Node* NodeAt(difference_type position) const {
    auto target = static_cast<size_type>(position);
    if (target >= count_) return nullptr;
    if (target < count_ / 2) {
      auto* node = head_.get();
      for (size_type i = 0; i < target; ++i) {
        node = node->next.get();
      }
      return node;
    }
    auto* node = tail_;
    for (size_type i = count_ - 1; i > target; --i) {
      node = node->previous;
    }
    return node;
  }

  // The owning pointer that holds `node`.
  std::shared_ptr<Node> const& OwnerOf(Node const* node) const {
    return node->previous ? node->previous->next : head_;
  }

  Index IndexOf(Node const* node, difference_type position) const {
    if (!node) return Index(token_, {}, position);
    return Index(token_, OwnerOf(node), position);
  }

  absl::Status CheckIndexOwner(Index const& index) const {
    if (!token_ || index.owner_.lock() != token_) {
      return ForeignIndexListError(
          "Index was issued by another list or an earlier generation of "
          "this one");
    }
    return absl::OkStatus();
  }

  // The node named by an index that must denote an element.
  absl::StatusOr<Node*> ResolveElement(Index const& index) const {
    COWLIST_RETURN_IF_ERROR(CheckIndexOwner(index));
    COWLIST_RETURN_IF_ERROR(CheckElementPosition(index.position_, count_));
    auto node = index.node_.lock();
    if (!node) {
      return ForeignIndexListError(
          "Index refers to an element that is no longer in the list");
    }
    return node.get();
  }

  template <class Id>
  FoundNode FindById(Id const& id) const {
    difference_type position = 0;
    for (auto* node = head_.get(); node; node = node->next.get()) {
      if (node->value.id() == id) return {node, position};
      ++position;
    }
    return {};
  }

  // Links `node` in front of `next`, or at the tail if `next` is null.
  void LinkBefore(Node* next, std::shared_ptr<Node> node) {
    Node* prev = next ? next->previous : tail_;
    std::shared_ptr<Node>& slot = prev ? prev->next : head_;
    node->previous = prev;
    node->next = std::move(slot);
    if (next) {
      next->previous = node.get();
    } else {
      tail_ = node.get();
    }
    slot = std::move(node);
    ++count_;
  }

  // Detaches `node` from the chain and returns its owning pointer.
  std::shared_ptr<Node> Unlink(Node* node) {
    Node* prev = node->previous;
    std::shared_ptr<Node>& slot = prev ? prev->next : head_;
    auto detached = std::move(slot);
    slot = std::move(detached->next);
    if (slot) {
      slot->previous = prev;
    } else {
      tail_ = prev;
    }
    detached->previous = nullptr;
    --count_;
    return detached;
  }

  void InsertChecked(difference_type position, T value) {
    auto node = internal::MakeNode<T>(std::move(value));
    EnsureUnique();
    LinkBefore(NodeAt(position), std::move(node));
  }

  T RemoveChecked(difference_type position) {
    EnsureUnique();
    return std::move(Unlink(NodeAt(position))->value);
  }

  template <class R>
  void ReplaceChecked(difference_type lower, difference_type upper,
                      R&& values) {
    if constexpr (std::same_as<std::remove_cvref_t<R>, LinkedList>) {
      if (lower == 0 && static_cast<size_type>(upper) == count_) {
        *this = std::forward<R>(values);
        return;
      }
    }
    auto inserted = Chain::FromRange(std::forward<R>(values));
    EnsureUnique();
    Splice(lower, upper, std::move(inserted));
  }

  // Replaces the nodes in [lower, upper) with `inserted`. The range must be
  // valid and the chain uniquely owned.
  void Splice(difference_type lower, difference_type upper, Chain inserted) {
    Node* before = lower > 0 ? NodeAt(lower - 1) : nullptr;
    Node* after = NodeAt(upper);
    std::shared_ptr<Node>& slot = before ? before->next : head_;
    std::shared_ptr<Node> rest = after ? OwnerOf(after) : nullptr;

    if (inserted.head) {
      inserted.head->previous = before;
      inserted.tail->next = rest;
      if (after) {
        after->previous = inserted.tail;
      } else {
        tail_ = inserted.tail;
      }
      slot = std::move(inserted.head);
    } else {
      if (after) {
        after->previous = before;
      } else {
        tail_ = before;
      }
      slot = std::move(rest);
    }

    count_ = count_ - static_cast<size_type>(upper - lower) + inserted.count;
  }

  std::shared_ptr<Node> head_;
  // Owned by the chain.
  Node* tail_ = nullptr;
  size_type count_ = 0;
  std::shared_ptr<IdentityToken const> token_;
};

}  // namespace cowlist

template <class T>
struct std::hash<cowlist::LinkedList<T>> {
  std::size_t operator()(cowlist::LinkedList<T> const& list) const {
    return absl::Hash<cowlist::LinkedList<T>>{}(list);
  }
};

#endif
