#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "core/ledger/clock.hpp"
#include "core/model/types.hpp"
#include "core/runtime/event_log.hpp"
#include "core/storage/key_locks.hpp"
#include "core/storage/store.hpp"

namespace petchain {

struct DispatchResult {
  std::optional<DispatchError> error;
  std::optional<Event> event;

  [[nodiscard]] bool ok() const { return !error.has_value(); }

  static DispatchResult success(Event e) { return {std::nullopt, std::move(e)}; }
  static DispatchResult failure(DispatchError e) { return {e, std::nullopt}; }
};

// Where the call sits in the chain; stamped onto the emitted event record.
struct ExtrinsicContext {
  BlockRef block;
  std::uint32_t index = 0;
  std::string tx_hash;
};

class Dispatcher {
public:
  // With a lock table, dispatch may be called from several threads.
  Dispatcher(LedgerStore& store, const Clock& clock, EventLog& events, KeyLockTable* locks = nullptr);

  // Either every write of the call lands and one event is appended, or
  // nothing changes and the error is returned.
  DispatchResult dispatch(const AccountId& sender, const Call& call, const ExtrinsicContext& context = {});

  // Validation path only; never writes.
  [[nodiscard]] std::optional<DispatchError> check(const AccountId& sender, const Call& call) const;

private:
  DispatchResult apply(const AccountId& sender, const MintCall& call, const ExtrinsicContext& context);
  DispatchResult apply(const AccountId& sender, const TransferCall& call, const ExtrinsicContext& context);
  DispatchResult apply(const AccountId& sender, const FeedCall& call, const ExtrinsicContext& context);
  DispatchResult apply(const AccountId& sender, const SleepCall& call, const ExtrinsicContext& context);

  DispatchResult emit(Event event, const ExtrinsicContext& context, Height height);
  void lock_pet(KeyLockTable::Guard& guard, PetId id);

  LedgerStore& store_;
  const Clock& clock_;
  EventLog& events_;
  KeyLockTable* locks_;
};

}  // namespace petchain
