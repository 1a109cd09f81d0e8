#pragma once

#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "core/model/types.hpp"

namespace petchain {

// Ownership index and activity clock. Pure data access: the dispatcher owns
// every rule about who may hold what.
class LedgerStore {
public:
  [[nodiscard]] std::optional<PetRecord> get(const AccountId& account) const;
  [[nodiscard]] bool contains(const AccountId& account) const;
  void put(const AccountId& account, PetRecord record);
  void remove(const AccountId& account);
  // Re-homes a record in one step: readers never see it under both accounts
  // or under neither. False, with nothing changed, when `from` holds no
  // record or `to` already holds one.
  bool move(const AccountId& from, const AccountId& to);

  // 0 for a pet that was never fed.
  [[nodiscard]] Height feed_time_of(PetId id) const;
  void set_feed_time(PetId id, Height height);
  // Absent, not 0, for a pet that never slept.
  [[nodiscard]] std::optional<Height> sleep_time_of(PetId id) const;
  void set_sleep_time(PetId id, Height height);

  [[nodiscard]] std::size_t owner_count() const;
  [[nodiscard]] std::vector<std::pair<AccountId, PetRecord>> owners() const;
  [[nodiscard]] std::string state_root() const;

private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<AccountId, PetRecord> pets_by_owner_;
  std::unordered_map<PetId, Height> last_feed_;
  std::unordered_map<PetId, Height> last_sleep_;
};

}  // namespace petchain
