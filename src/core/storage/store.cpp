#include "core/storage/store.hpp"

#include <algorithm>
#include <map>
#include <mutex>

#include "core/model/codec.hpp"
#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"

namespace petchain {

std::optional<PetRecord> LedgerStore::get(const AccountId& account) const {
  std::shared_lock lock(mutex_);
  const auto it = pets_by_owner_.find(account);
  if (it == pets_by_owner_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool LedgerStore::contains(const AccountId& account) const {
  std::shared_lock lock(mutex_);
  return pets_by_owner_.contains(account);
}

void LedgerStore::put(const AccountId& account, PetRecord record) {
  std::unique_lock lock(mutex_);
  pets_by_owner_.insert_or_assign(account, std::move(record));
}

void LedgerStore::remove(const AccountId& account) {
  std::unique_lock lock(mutex_);
  pets_by_owner_.erase(account);
}

bool LedgerStore::move(const AccountId& from, const AccountId& to) {
  std::unique_lock lock(mutex_);
  const auto it = pets_by_owner_.find(from);
  if (it == pets_by_owner_.end() || pets_by_owner_.contains(to)) {
    return false;
  }
  PetRecord record = std::move(it->second);
  pets_by_owner_.erase(it);
  pets_by_owner_.emplace(to, std::move(record));
  return true;
}

Height LedgerStore::feed_time_of(PetId id) const {
  std::shared_lock lock(mutex_);
  const auto it = last_feed_.find(id);
  return it == last_feed_.end() ? Height{0} : it->second;
}

void LedgerStore::set_feed_time(PetId id, Height height) {
  std::unique_lock lock(mutex_);
  last_feed_.insert_or_assign(id, height);
}

std::optional<Height> LedgerStore::sleep_time_of(PetId id) const {
  std::shared_lock lock(mutex_);
  const auto it = last_sleep_.find(id);
  if (it == last_sleep_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void LedgerStore::set_sleep_time(PetId id, Height height) {
  std::unique_lock lock(mutex_);
  last_sleep_.insert_or_assign(id, height);
}

std::size_t LedgerStore::owner_count() const {
  std::shared_lock lock(mutex_);
  return pets_by_owner_.size();
}

std::vector<std::pair<AccountId, PetRecord>> LedgerStore::owners() const {
  std::vector<std::pair<AccountId, PetRecord>> out;
  {
    std::shared_lock lock(mutex_);
    out.assign(pets_by_owner_.begin(), pets_by_owner_.end());
  }
  std::ranges::sort(out, {}, &std::pair<AccountId, PetRecord>::first);
  return out;
}

std::string LedgerStore::state_root() const {
  std::string material;
  {
    std::shared_lock lock(mutex_);
    const std::map<AccountId, PetRecord> sorted_owners(pets_by_owner_.begin(), pets_by_owner_.end());
    const std::map<PetId, Height> sorted_feed(last_feed_.begin(), last_feed_.end());
    const std::map<PetId, Height> sorted_sleep(last_sleep_.begin(), last_sleep_.end());

    for (const auto& [owner, record] : sorted_owners) {
      material += util::canonical_join({
          {"owner", owner.value},
          {"id", std::to_string(record.id)},
          {"name", record.name},
          {"species", std::string{to_string(record.species)}},
      });
    }
    for (const auto& [id, height] : sorted_feed) {
      material += "feed:" + std::to_string(id) + "=" + std::to_string(height) + "\n";
    }
    for (const auto& [id, height] : sorted_sleep) {
      material += "sleep:" + std::to_string(id) + "=" + std::to_string(height) + "\n";
    }
  }
  return util::sha256_hex(material);
}

}  // namespace petchain
