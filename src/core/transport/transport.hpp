#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "core/model/types.hpp"

namespace petchain {

// Producer/consumer queue of status updates for one submitted transaction.
// The producer closes it after a terminal status (or on shutdown); the
// consumer cancels it when it stops watching.
class StatusChannel {
public:
  // False when the channel is closed or cancelled; the status is discarded.
  bool push(TxStatus status);
  void close();
  void cancel();

  [[nodiscard]] bool closed() const;

  // nullopt when the wait elapses or the channel is closed and drained.
  std::optional<TxStatus> next(std::chrono::milliseconds timeout);

private:
  mutable std::mutex mutex_;
  std::condition_variable ready_;
  std::deque<TxStatus> queue_;
  bool closed_ = false;
  bool cancelled_ = false;
};

// Lazy single-pass view of one submission's status updates. Not restartable:
// retrying requires a new submission. Dropping it cancels the channel, which
// stops delivery but never undoes what the ledger already applied.
class TxProgress {
public:
  TxProgress() = default;
  TxProgress(std::string tx_hash, std::shared_ptr<StatusChannel> channel);
  ~TxProgress();

  TxProgress(TxProgress&& other) noexcept = default;
  TxProgress& operator=(TxProgress&& other) noexcept;
  TxProgress(const TxProgress&) = delete;
  TxProgress& operator=(const TxProgress&) = delete;

  std::optional<TxStatus> next(std::chrono::milliseconds timeout);

  // True once the producer closed the stream and every update was consumed.
  [[nodiscard]] bool ended() const;
  [[nodiscard]] bool valid() const { return channel_ != nullptr; }
  [[nodiscard]] const std::string& tx_hash() const { return tx_hash_; }

  void cancel();

private:
  std::string tx_hash_;
  std::shared_ptr<StatusChannel> channel_;
  bool drained_ = false;
};

// Read side the confirmation watcher needs once a block is final.
class BlockEventSource {
public:
  virtual ~BlockEventSource() = default;

  [[nodiscard]] virtual std::optional<BlockEvents> fetch_block_events(const BlockRef& block) const = 0;
};

class ITransport : public BlockEventSource {
public:
  virtual TxProgress submit_and_watch(const SignedEnvelope& envelope) = 0;

  [[nodiscard]] virtual std::uint64_t account_nonce(const AccountId& account) const = 0;
  [[nodiscard]] virtual std::optional<PetRecord> query_pet(const AccountId& account) const = 0;
  [[nodiscard]] virtual Height query_feed_time(PetId id) const = 0;
  [[nodiscard]] virtual std::optional<Height> query_sleep_time(PetId id) const = 0;
  // Runs the validation path against current state without submitting.
  [[nodiscard]] virtual std::optional<DispatchError> dry_run(const AccountId& signer,
                                                             const Call& call) const = 0;
};

}  // namespace petchain
