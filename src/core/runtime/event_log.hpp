#pragma once

#include <cstddef>
#include <functional>
#include <mutex>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"

namespace petchain {

// Append-only record of successful dispatches, in dispatch order.
// No filtering happens here; consumers scan what they need.
class EventLog {
public:
  using Observer = std::function<void(const EventRecord&)>;

  // Stamps the sequence number and returns it.
  std::uint64_t append(EventRecord record);

  [[nodiscard]] std::vector<EventRecord> all() const;
  [[nodiscard]] std::vector<EventRecord> recent(std::size_t window) const;
  [[nodiscard]] std::vector<EventRecord> in_block(std::string_view block_hash) const;
  [[nodiscard]] std::size_t size() const;

  // Observers run on the appending thread after the log lock is released.
  void subscribe(Observer observer);

private:
  mutable std::mutex mutex_;
  std::vector<EventRecord> records_;
  std::vector<Observer> observers_;
  std::uint64_t next_sequence_ = 1;
};

}  // namespace petchain
