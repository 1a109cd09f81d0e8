#pragma once

#include <atomic>

#include "core/model/types.hpp"

namespace petchain {

class Clock {
public:
  virtual ~Clock() = default;

  [[nodiscard]] virtual Height now() const = 0;
};

// Height set by whoever authors blocks. Never moves backwards.
class ManualClock final : public Clock {
public:
  explicit ManualClock(Height start = 0) : height_(start) {}

  [[nodiscard]] Height now() const override { return height_.load(); }

  // Returns false, leaving the clock untouched, when target is behind now().
  bool advance_to(Height target);
  Height tick();

private:
  std::atomic<Height> height_;
};

}  // namespace petchain
