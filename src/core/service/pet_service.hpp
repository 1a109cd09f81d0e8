#pragma once

#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "core/client/confirmation_watcher.hpp"
#include "core/client/submission_client.hpp"
#include "core/model/types.hpp"
#include "core/transport/transport.hpp"

namespace petchain {

// One signer's session against a transport. The blocking commands submit and
// then watch until the outcome is known; they need a transport that keeps
// producing blocks (background authoring) or they end Indeterminate.
class PetService {
public:
  // Empty phrase generates a fresh key pair.
  Result init(ITransport& transport, const ChainConfig& config, std::string_view phrase);

  WatchOutcome mint(std::string name, Species species, PetId id);
  WatchOutcome transfer(const AccountId& receiver);
  WatchOutcome feed();
  WatchOutcome sleep();
  WatchOutcome execute(const Call& call);

  Result submit(const Call& call, TxProgress& progress);
  [[nodiscard]] WatchOutcome watch(const Call& call, TxProgress& progress) const;
  [[nodiscard]] std::future<WatchOutcome> watch_async(const Call& call, TxProgress progress) const;

  // Mint and Transfer are re-checked against current state first, so a
  // retry after an Indeterminate outcome cannot apply twice.
  WatchOutcome retry(const Call& call);

  [[nodiscard]] bool ready() const { return client_ != nullptr && client_->ready(); }
  [[nodiscard]] AccountId account() const;
  [[nodiscard]] std::optional<PetRecord> my_pet() const;
  [[nodiscard]] std::optional<PetRecord> pet_of(const AccountId& account) const;
  // nullopt without a pet; 0 for a pet never fed.
  [[nodiscard]] std::optional<Height> last_fed() const;
  [[nodiscard]] std::optional<Height> last_slept() const;

private:
  [[nodiscard]] std::chrono::milliseconds watch_timeout() const;

  ITransport* transport_ = nullptr;
  ChainConfig config_;
  std::unique_ptr<SubmissionClient> client_;
};

}  // namespace petchain
