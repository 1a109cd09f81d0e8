#include "core/storage/key_locks.hpp"

#include <algorithm>

namespace petchain {

KeyLockTable::Guard KeyLockTable::lock_accounts(std::vector<AccountId> accounts) {
  std::ranges::sort(accounts);
  const auto [first, last] = std::ranges::unique(accounts);
  accounts.erase(first, last);

  Guard guard;
  guard.locks_.reserve(accounts.size() + 1U);
  for (const auto& account : accounts) {
    guard.locks_.emplace_back(account_mutex(account));
  }
  return guard;
}

void KeyLockTable::lock_pets(Guard& guard, std::vector<PetId> ids) {
  if (guard.pets_locked_) {
    return;
  }
  std::ranges::sort(ids);
  const auto [first, last] = std::ranges::unique(ids);
  ids.erase(first, last);

  for (const PetId id : ids) {
    guard.locks_.emplace_back(pet_mutex(id));
  }
  guard.pets_locked_ = true;
}

std::size_t KeyLockTable::account_slots() const {
  std::lock_guard lock(table_mutex_);
  return account_locks_.size();
}

std::mutex& KeyLockTable::account_mutex(const AccountId& account) {
  std::lock_guard lock(table_mutex_);
  auto& slot = account_locks_[account];
  if (!slot) {
    slot = std::make_unique<std::mutex>();
  }
  return *slot;
}

std::mutex& KeyLockTable::pet_mutex(PetId id) {
  std::lock_guard lock(table_mutex_);
  auto& slot = pet_locks_[id];
  if (!slot) {
    slot = std::make_unique<std::mutex>();
  }
  return *slot;
}

}  // namespace petchain
