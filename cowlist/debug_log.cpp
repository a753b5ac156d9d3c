#include "cowlist/debug_log.hpp"

#include <atomic>

namespace cowlist {

namespace {
std::atomic<bool> cow_trace_enabled{false};
}  // namespace

void SetCowTraceEnabled(bool enabled) {
  cow_trace_enabled.store(enabled, std::memory_order_relaxed);
}

bool CowTraceEnabled() {
  return cow_trace_enabled.load(std::memory_order_relaxed);
}

}  // namespace cowlist
