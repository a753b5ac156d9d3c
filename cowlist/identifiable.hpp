#ifndef COWLIST_IDENTIFIABLE_HPP
#define COWLIST_IDENTIFIABLE_HPP

#include <concepts>
#include <type_traits>
#include <utility>

#include "absl/hash/hash.h"

namespace cowlist {

// An element type that exposes an identity through an `id()` accessor.
//
// The identity must be equality comparable and hashable with absl::Hash, as
// the identity-keyed operations of LinkedList build hash maps keyed on it.
template <class T>
concept Identifiable = requires(T const& value) {
  { value.id() };
  requires std::equality_comparable<std::remove_cvref_t<decltype(value.id())>>;
  requires std::is_default_constructible_v<
      absl::Hash<std::remove_cvref_t<decltype(value.id())>>>;
};

template <Identifiable T>
using IdOf = std::remove_cvref_t<decltype(std::declval<T const&>().id())>;

}  // namespace cowlist

#endif
