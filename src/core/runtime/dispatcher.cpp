#include "core/runtime/dispatcher.hpp"

#include "core/model/codec.hpp"
#include "core/util/log.hpp"

namespace petchain {
namespace {

constexpr std::string_view kComponent = "dispatcher";

DispatchResult reject(const AccountId& sender, std::string_view call, DispatchError error) {
  if (log::enabled(log::Level::Debug)) {
    log::debug(kComponent, std::string{call} + " from " + sender.value.substr(0, 12) + " rejected: " +
                               std::string{to_string(error)});
  }
  return DispatchResult::failure(error);
}

}  // namespace

Dispatcher::Dispatcher(LedgerStore& store, const Clock& clock, EventLog& events, KeyLockTable* locks)
    : store_(store), clock_(clock), events_(events), locks_(locks) {}

DispatchResult Dispatcher::dispatch(const AccountId& sender, const Call& call,
                                    const ExtrinsicContext& context) {
  return std::visit([&](const auto& c) { return apply(sender, c, context); }, call);
}

std::optional<DispatchError> Dispatcher::check(const AccountId& sender, const Call& call) const {
  return std::visit(overloaded{
                        [&](const MintCall&) -> std::optional<DispatchError> {
                          if (store_.contains(sender)) {
                            return DispatchError::AccountAlreadyHasPet;
                          }
                          return std::nullopt;
                        },
                        [&](const TransferCall& c) -> std::optional<DispatchError> {
                          if (!store_.contains(sender)) {
                            return DispatchError::AccountHasNoPet;
                          }
                          if (store_.contains(c.receiver)) {
                            return DispatchError::AccountAlreadyHasPet;
                          }
                          return std::nullopt;
                        },
                        [&](const auto&) -> std::optional<DispatchError> {
                          if (!store_.contains(sender)) {
                            return DispatchError::AccountHasNoPet;
                          }
                          return std::nullopt;
                        },
                    },
                    call);
}

DispatchResult Dispatcher::apply(const AccountId& sender, const MintCall& call,
                                 const ExtrinsicContext& context) {
  KeyLockTable::Guard guard;
  if (locks_ != nullptr) {
    guard = locks_->lock_accounts({sender});
    lock_pet(guard, call.id);
  }

  if (store_.contains(sender)) {
    return reject(sender, "mint", DispatchError::AccountAlreadyHasPet);
  }

  // Pet ids are chosen by the minter and may repeat across accounts.
  const Height height = clock_.now();
  store_.put(sender, PetRecord{.id = call.id, .name = call.name, .species = call.species});
  return emit(PetMinted{.owner = sender, .pet_id = call.id}, context, height);
}

DispatchResult Dispatcher::apply(const AccountId& sender, const TransferCall& call,
                                 const ExtrinsicContext& context) {
  KeyLockTable::Guard guard;
  if (locks_ != nullptr) {
    guard = locks_->lock_accounts({sender, call.receiver});
  }

  const auto record = store_.get(sender);
  if (!record.has_value()) {
    return reject(sender, "transfer", DispatchError::AccountHasNoPet);
  }
  if (store_.contains(call.receiver)) {
    return reject(sender, "transfer", DispatchError::AccountAlreadyHasPet);
  }
  lock_pet(guard, record->id);

  const Height height = clock_.now();
  if (!store_.move(sender, call.receiver)) {
    return reject(sender, "transfer", DispatchError::AccountAlreadyHasPet);
  }
  return emit(PetTransferred{.from = sender, .to = call.receiver, .pet_id = record->id}, context, height);
}

DispatchResult Dispatcher::apply(const AccountId& sender, const FeedCall&,
                                 const ExtrinsicContext& context) {
  KeyLockTable::Guard guard;
  if (locks_ != nullptr) {
    guard = locks_->lock_accounts({sender});
  }

  const auto record = store_.get(sender);
  if (!record.has_value()) {
    return reject(sender, "feed", DispatchError::AccountHasNoPet);
  }
  lock_pet(guard, record->id);

  const Height height = clock_.now();
  store_.set_feed_time(record->id, height);
  return emit(PetFed{.owner = sender, .pet_id = record->id}, context, height);
}

DispatchResult Dispatcher::apply(const AccountId& sender, const SleepCall&,
                                 const ExtrinsicContext& context) {
  KeyLockTable::Guard guard;
  if (locks_ != nullptr) {
    guard = locks_->lock_accounts({sender});
  }

  const auto record = store_.get(sender);
  if (!record.has_value()) {
    return reject(sender, "sleep", DispatchError::AccountHasNoPet);
  }
  lock_pet(guard, record->id);

  const Height height = clock_.now();
  store_.set_sleep_time(record->id, height);
  return emit(PetSlept{.owner = sender, .pet_id = record->id}, context, height);
}

DispatchResult Dispatcher::emit(Event event, const ExtrinsicContext& context, Height height) {
  events_.append(EventRecord{
      .sequence = 0,
      .block = context.block,
      .extrinsic_index = context.index,
      .tx_hash = context.tx_hash,
      .height = height,
      .event = event,
  });
  return DispatchResult::success(std::move(event));
}

void Dispatcher::lock_pet(KeyLockTable::Guard& guard, PetId id) {
  if (locks_ != nullptr) {
    locks_->lock_pets(guard, {id});
  }
}

}  // namespace petchain
