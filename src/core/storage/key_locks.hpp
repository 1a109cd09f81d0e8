#pragma once

#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "core/model/types.hpp"

namespace petchain {

// Per-account and per-pet-id mutual exclusion for hosts that dispatch
// commands concurrently. Lock order is fixed: accounts in sorted order, then
// pet ids in sorted order. A guard never takes an account after a pet id.
class KeyLockTable {
public:
  class Guard {
  public:
    Guard() = default;
    Guard(Guard&&) noexcept = default;
    Guard& operator=(Guard&&) noexcept = default;
    Guard(const Guard&) = delete;
    Guard& operator=(const Guard&) = delete;

  private:
    friend class KeyLockTable;
    std::vector<std::unique_lock<std::mutex>> locks_;
    bool pets_locked_ = false;
  };

  [[nodiscard]] Guard lock_accounts(std::vector<AccountId> accounts);
  // Extends a guard with pet id locks; may be called once per guard.
  void lock_pets(Guard& guard, std::vector<PetId> ids);

  [[nodiscard]] std::size_t account_slots() const;

private:
  std::mutex& account_mutex(const AccountId& account);
  std::mutex& pet_mutex(PetId id);

  mutable std::mutex table_mutex_;
  std::unordered_map<AccountId, std::unique_ptr<std::mutex>> account_locks_;
  std::unordered_map<PetId, std::unique_ptr<std::mutex>> pet_locks_;
};

}  // namespace petchain
