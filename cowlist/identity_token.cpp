#include "cowlist/identity_token.hpp"

#include <atomic>
#include <cstdint>
#include <memory>

namespace cowlist {

namespace {
std::atomic<std::uint64_t> next_generation{1};
}  // namespace

std::shared_ptr<IdentityToken const> IdentityToken::Create() {
  auto generation = next_generation.fetch_add(1, std::memory_order_relaxed);
  return std::shared_ptr<IdentityToken const>(new IdentityToken(generation));
}

}  // namespace cowlist
