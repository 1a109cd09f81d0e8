#include "core/service/pet_service.hpp"

#include <cstdint>
#include <utility>

#include "core/model/codec.hpp"
#include "core/util/log.hpp"

namespace petchain {
namespace {

constexpr std::string_view kComponent = "service";

WatchOutcome not_submitted(OutcomeKind kind, std::string detail) {
  return WatchOutcome{.kind = kind, .detail = std::move(detail)};
}

}  // namespace

Result PetService::init(ITransport& transport, const ChainConfig& config, std::string_view phrase) {
  if (config.chain_id.empty()) {
    return Result::failure("Init failed: chain id is required.");
  }
  if (config.name_limit == 0) {
    return Result::failure("Init failed: name limit must be positive.");
  }

  auto client = std::make_unique<SubmissionClient>(transport, config);
  const Result signer = client->use_signer(phrase);
  if (!signer.ok) {
    return signer;
  }

  transport_ = &transport;
  config_ = config;
  client_ = std::move(client);
  return Result::success("Pet service ready.", client_->account().value);
}

WatchOutcome PetService::mint(std::string name, Species species, PetId id) {
  return execute(MintCall{.name = std::move(name), .species = species, .id = id});
}

WatchOutcome PetService::transfer(const AccountId& receiver) {
  return execute(TransferCall{.receiver = receiver});
}

WatchOutcome PetService::feed() {
  return execute(FeedCall{});
}

WatchOutcome PetService::sleep() {
  return execute(SleepCall{});
}

WatchOutcome PetService::execute(const Call& call) {
  if (!ready()) {
    return not_submitted(OutcomeKind::Error, "Pet service is not initialized.");
  }
  TxProgress progress;
  SubmitFailure failure = SubmitFailure::None;
  const Result submitted = client_->submit(call, progress, failure);
  if (!submitted.ok) {
    // Only a call the codec refuses counts as a validation rejection.
    return not_submitted(failure == SubmitFailure::InvalidCall ? OutcomeKind::Invalid : OutcomeKind::Error,
                         submitted.message);
  }
  return watch(call, progress);
}

Result PetService::submit(const Call& call, TxProgress& progress) {
  if (!ready()) {
    return Result::failure("Pet service is not initialized.");
  }
  return client_->submit(call, progress);
}

WatchOutcome PetService::watch(const Call& call, TxProgress& progress) const {
  if (transport_ == nullptr) {
    return not_submitted(OutcomeKind::Error, "Pet service is not initialized.");
  }
  ConfirmationWatcher watcher(*transport_, expected_event_for(call), progress.tx_hash());
  const WatchOutcome outcome = watcher.run(progress, watch_timeout());
  if (outcome.indeterminate()) {
    log::warn(kComponent, std::string{call_name(call)} + " outcome unknown: " + describe(outcome));
  }
  return outcome;
}

std::future<WatchOutcome> PetService::watch_async(const Call& call, TxProgress progress) const {
  if (transport_ == nullptr) {
    std::promise<WatchOutcome> failed;
    failed.set_value(not_submitted(OutcomeKind::Error, "Pet service is not initialized."));
    return failed.get_future();
  }
  return petchain::watch_async(*transport_, expected_event_for(call), std::move(progress), watch_timeout());
}

WatchOutcome PetService::retry(const Call& call) {
  if (!ready()) {
    return not_submitted(OutcomeKind::Error, "Pet service is not initialized.");
  }

  if (std::holds_alternative<MintCall>(call) || std::holds_alternative<TransferCall>(call)) {
    if (const auto error = transport_->dry_run(account(), call)) {
      log::info(kComponent, std::string{call_name(call)} + " retry refused: " + std::string{to_string(*error)});
      return WatchOutcome{
          .kind = OutcomeKind::DispatchFailed,
          .dispatch_error = error,
          .detail = "refused before resubmission",
      };
    }
  }
  return execute(call);
}

AccountId PetService::account() const {
  return client_ ? client_->account() : AccountId{};
}

std::optional<PetRecord> PetService::my_pet() const {
  return pet_of(account());
}

std::optional<PetRecord> PetService::pet_of(const AccountId& account) const {
  if (transport_ == nullptr || account.empty()) {
    return std::nullopt;
  }
  return transport_->query_pet(account);
}

std::optional<Height> PetService::last_fed() const {
  const auto pet = my_pet();
  if (!pet.has_value()) {
    return std::nullopt;
  }
  return transport_->query_feed_time(pet->id);
}

std::optional<Height> PetService::last_slept() const {
  const auto pet = my_pet();
  if (!pet.has_value()) {
    return std::nullopt;
  }
  return transport_->query_sleep_time(pet->id);
}

std::chrono::milliseconds PetService::watch_timeout() const {
  return std::chrono::milliseconds(static_cast<std::int64_t>(config_.watch_timeout_ms));
}

}  // namespace petchain
