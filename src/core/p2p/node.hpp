#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "core/ledger/clock.hpp"
#include "core/model/types.hpp"
#include "core/runtime/dispatcher.hpp"
#include "core/runtime/event_log.hpp"
#include "core/storage/store.hpp"
#include "core/transport/transport.hpp"

namespace petchain {

// In-process stand-in for the consensus layer: verifies envelopes, pools
// them, authors blocks (one height per block), and finalizes blocks once
// finality_depth blocks sit on top of them. All mutation is serialized by
// one mutex, so the dispatcher only ever sees one call at a time.
class LocalNode final : public ITransport {
public:
  LocalNode();
  ~LocalNode() override;

  LocalNode(const LocalNode&) = delete;
  LocalNode& operator=(const LocalNode&) = delete;

  Result start(const ChainConfig& config);
  // Closes every open status channel without a terminal status.
  void stop();
  Result start_authoring(std::chrono::milliseconds interval);

  TxProgress submit_and_watch(const SignedEnvelope& envelope) override;
  [[nodiscard]] std::optional<BlockEvents> fetch_block_events(const BlockRef& block) const override;
  // Next nonce the pool accepts, counting pooled transactions.
  [[nodiscard]] std::uint64_t account_nonce(const AccountId& account) const override;
  [[nodiscard]] std::optional<PetRecord> query_pet(const AccountId& account) const override;
  [[nodiscard]] Height query_feed_time(PetId id) const override;
  [[nodiscard]] std::optional<Height> query_sleep_time(PetId id) const override;
  [[nodiscard]] std::optional<DispatchError> dry_run(const AccountId& signer,
                                                     const Call& call) const override;

  std::optional<BlockRef> produce_block();

  [[nodiscard]] bool running() const;
  [[nodiscard]] BlockRef best_block() const;
  [[nodiscard]] BlockRef finalized_block() const;
  [[nodiscard]] NodeStatusReport status() const;
  [[nodiscard]] ChainConfig config() const;

  // Observers registered here run while the node lock is held and must not
  // call back into the node.
  [[nodiscard]] EventLog& events() { return events_; }
  [[nodiscard]] const EventLog& events() const { return events_; }

private:
  struct PooledTx {
    std::string tx_hash;
    AccountId signer;
    std::uint64_t nonce = 0;
    Call call;
    std::shared_ptr<StatusChannel> channel;
  };

  struct BlockRecord {
    BlockRef ref;
    std::string parent_hash;
    std::int64_t authored_unix = 0;
    std::vector<ExtrinsicReceipt> receipts;
    std::vector<std::pair<std::string, std::shared_ptr<StatusChannel>>> watchers;
    bool finalized = false;
  };

  TxProgress reject(std::shared_ptr<StatusChannel> channel, std::string tx_hash, TxStatus status);
  void drop(PooledTx& tx, std::string reason);
  void finalize_locked();
  void authoring_loop(std::chrono::milliseconds interval);
  [[nodiscard]] std::uint64_t chain_nonce_locked(const AccountId& account) const;
  [[nodiscard]] std::uint64_t expected_nonce_locked(const AccountId& account) const;

  mutable std::mutex mutex_;
  ChainConfig config_;
  bool running_ = false;

  ManualClock clock_;
  LedgerStore store_;
  EventLog events_;
  Dispatcher dispatcher_;

  std::deque<PooledTx> pool_;
  std::vector<BlockRecord> blocks_;
  std::uint64_t finalized_number_ = 0;
  std::unordered_map<AccountId, std::uint64_t> nonces_;
  std::unordered_set<std::string> known_tx_;
  std::uint64_t dropped_count_ = 0;
  std::uint64_t invalid_count_ = 0;

  bool authoring_ = false;
  std::condition_variable author_wake_;
  std::thread author_thread_;
};

}  // namespace petchain
