#ifndef COWLIST_IDENTITY_TOKEN_HPP
#define COWLIST_IDENTITY_TOKEN_HPP

#include <cstdint>
#include <memory>

namespace cowlist {

// A marker that stamps one generation of one list instance.
//
// Tokens are only ever compared by address. The generation number is unique
// per process and exists so that diagnostics can tell tokens apart; it plays
// no part in index validation.
class IdentityToken {
 public:
  // Allocates a fresh token with the next generation number.
  static std::shared_ptr<IdentityToken const> Create();

  IdentityToken(IdentityToken const&) = delete;
  IdentityToken& operator=(IdentityToken const&) = delete;

  std::uint64_t generation() const { return generation_; }

 private:
  explicit IdentityToken(std::uint64_t generation) : generation_(generation) {}

  std::uint64_t generation_;
};

}  // namespace cowlist

#endif
