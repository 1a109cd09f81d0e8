#include "core/ledger/clock.hpp"

namespace petchain {

bool ManualClock::advance_to(Height target) {
  Height current = height_.load();
  while (current <= target) {
    if (height_.compare_exchange_weak(current, target)) {
      return true;
    }
  }
  return false;
}

Height ManualClock::tick() {
  return height_.fetch_add(1) + 1;
}

}  // namespace petchain
