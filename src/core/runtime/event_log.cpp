#include "core/runtime/event_log.hpp"

#include <algorithm>
#include <iterator>

namespace petchain {

std::uint64_t EventLog::append(EventRecord record) {
  std::vector<Observer> observers;
  EventRecord appended;
  {
    std::lock_guard lock(mutex_);
    record.sequence = next_sequence_++;
    records_.push_back(std::move(record));
    appended = records_.back();
    observers = observers_;
  }

  for (const auto& observer : observers) {
    observer(appended);
  }
  return appended.sequence;
}

std::vector<EventRecord> EventLog::all() const {
  std::lock_guard lock(mutex_);
  return records_;
}

std::vector<EventRecord> EventLog::recent(std::size_t window) const {
  std::lock_guard lock(mutex_);
  const std::size_t count = std::min(window, records_.size());
  return {records_.end() - static_cast<std::ptrdiff_t>(count), records_.end()};
}

std::vector<EventRecord> EventLog::in_block(std::string_view block_hash) const {
  std::vector<EventRecord> out;
  std::lock_guard lock(mutex_);
  std::ranges::copy_if(records_, std::back_inserter(out), [block_hash](const EventRecord& record) {
    return record.block.hash == block_hash;
  });
  return out;
}

std::size_t EventLog::size() const {
  std::lock_guard lock(mutex_);
  return records_.size();
}

void EventLog::subscribe(Observer observer) {
  if (!observer) {
    return;
  }
  std::lock_guard lock(mutex_);
  observers_.push_back(std::move(observer));
}

}  // namespace petchain
