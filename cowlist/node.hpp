#ifndef COWLIST_NODE_HPP
#define COWLIST_NODE_HPP

#include <cstddef>
#include <memory>
#include <ranges>
#include <utility>

namespace cowlist::internal {

// A single element of a list chain.
//
// Ownership runs forward only: each node owns its successor, and holds a
// plain pointer back to its predecessor. A chain is therefore owned entirely
// by whoever holds its head.
template <class T>
struct Node {
  template <class... Args>
  explicit Node(std::in_place_t, Args&&... args)
      : value(std::forward<Args>(args)...) {}

  Node(Node const&) = delete;
  Node& operator=(Node const&) = delete;

  ~Node();

  T value;
  std::shared_ptr<Node> next;
  Node* previous = nullptr;
};

template <class T>
Node<T>::~Node() {
  // Unroll the release of the rest of the chain, so that dropping a long
  // chain does not recurse once per node. The walk stops at the first node
  // that someone else still holds.
  auto node = std::move(next);
  while (node && node.use_count() == 1) {
    node = std::move(node->next);
  }
}

template <class T, class... Args>
std::shared_ptr<Node<T>> MakeNode(Args&&... args) {
  return std::make_shared<Node<T>>(std::in_place, std::forward<Args>(args)...);
}

// A free-standing run of linked nodes, not yet attached to a list.
template <class T>
struct Chain {
  std::shared_ptr<Node<T>> head;
  Node<T>* tail = nullptr;
  std::size_t count = 0;

  void PushBack(std::shared_ptr<Node<T>> node) {
    node->previous = tail;
    auto* raw = node.get();
    if (tail) {
      tail->next = std::move(node);
    } else {
      head = std::move(node);
    }
    tail = raw;
    ++count;
  }

  // Copies every node reachable from `source`, in order. Returns an empty
  // chain for a null source.
  static Chain Clone(Node<T> const* source) {
    Chain result;
    for (auto const* node = source; node; node = node->next.get()) {
      result.PushBack(MakeNode<T>(node->value));
    }
    return result;
  }

  // Builds a chain holding the values of `range`, in order.
  template <std::ranges::input_range R>
  static Chain FromRange(R&& range) {
    Chain result;
    for (auto&& value : range) {
      result.PushBack(MakeNode<T>(std::forward<decltype(value)>(value)));
    }
    return result;
  }
};

}  // namespace cowlist::internal

#endif
