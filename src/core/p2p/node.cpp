#include "core/p2p/node.hpp"

#include <algorithm>
#include <string_view>

#include "core/crypto/crypto.hpp"
#include "core/model/app_meta.hpp"
#include "core/model/codec.hpp"
#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"
#include "core/util/log.hpp"

namespace petchain {
namespace {

constexpr std::string_view kComponent = "node";

std::string short_hash(std::string_view hash) {
  return std::string{hash.substr(0, 12)};
}

std::string block_hash(std::string_view parent_hash, std::uint64_t number,
                       const std::vector<std::string>& tx_hashes) {
  std::string joined;
  for (const auto& tx_hash : tx_hashes) {
    if (!joined.empty()) {
      joined.push_back(',');
    }
    joined += tx_hash;
  }
  return util::sha256_hex(util::canonical_join({
      {"number", std::to_string(number)},
      {"parent", std::string{parent_hash}},
      {"txs", joined},
  }));
}

}  // namespace

LocalNode::LocalNode() : dispatcher_(store_, clock_, events_) {}

LocalNode::~LocalNode() {
  stop();
}

Result LocalNode::start(const ChainConfig& config) {
  if (config.chain_id.empty()) {
    return Result::failure("Node start failed: chain id is empty.");
  }
  if (config.max_block_extrinsics == 0 || config.pool_capacity == 0) {
    return Result::failure("Node start failed: pool capacity and block size must be positive.");
  }

  const Result sodium = CryptoEngine::initialize_library();
  if (!sodium.ok) {
    return sodium;
  }

  std::lock_guard lock(mutex_);
  if (running_) {
    return Result::failure("Node start failed: already running.");
  }
  config_ = config;

  if (blocks_.empty()) {
    const std::string genesis_hash = block_hash(kGenesisParentHash, kGenesisBlockNumber, {});
    blocks_.push_back(BlockRecord{
        .ref = BlockRef{.number = kGenesisBlockNumber, .hash = genesis_hash},
        .parent_hash = std::string{kGenesisParentHash},
        .authored_unix = util::unix_timestamp_now(),
        .receipts = {},
        .watchers = {},
        .finalized = true,
    });
    finalized_number_ = kGenesisBlockNumber;
  }

  running_ = true;
  log::info(kComponent, "started chain " + config_.chain_id + " at block #" +
                            std::to_string(blocks_.back().ref.number));
  return Result::success("Node started.");
}

void LocalNode::stop() {
  {
    std::lock_guard lock(mutex_);
    if (!running_) {
      return;
    }
    running_ = false;
    authoring_ = false;

    std::size_t abandoned = 0;
    for (auto& tx : pool_) {
      known_tx_.erase(tx.tx_hash);
      tx.channel->close();
      ++abandoned;
    }
    pool_.clear();
    for (auto& block : blocks_) {
      for (auto& [tx_hash, channel] : block.watchers) {
        channel->close();
        ++abandoned;
      }
      block.watchers.clear();
    }
    log::info(kComponent, "stopped; closed " + std::to_string(abandoned) + " open watcher(s)");
  }

  author_wake_.notify_all();
  if (author_thread_.joinable()) {
    author_thread_.join();
  }
}

Result LocalNode::start_authoring(std::chrono::milliseconds interval) {
  if (interval.count() <= 0) {
    return Result::failure("Authoring interval must be positive.");
  }

  std::lock_guard lock(mutex_);
  if (!running_) {
    return Result::failure("Cannot author blocks: node is not running.");
  }
  if (authoring_) {
    return Result::failure("Block authoring already running.");
  }
  if (author_thread_.joinable()) {
    author_thread_.join();
  }

  authoring_ = true;
  author_thread_ = std::thread([this, interval] { authoring_loop(interval); });
  log::debug(kComponent, "authoring every " + std::to_string(interval.count()) + "ms");
  return Result::success("Block authoring started.");
}

void LocalNode::authoring_loop(std::chrono::milliseconds interval) {
  std::unique_lock lock(mutex_);
  while (authoring_) {
    if (author_wake_.wait_for(lock, interval, [this] { return !authoring_; })) {
      break;
    }
    lock.unlock();
    (void)produce_block();
    lock.lock();
  }
}

TxProgress LocalNode::reject(std::shared_ptr<StatusChannel> channel, std::string tx_hash,
                             TxStatus status) {
  if (std::holds_alternative<TxInvalid>(status)) {
    ++invalid_count_;
  }
  log::info(kComponent, "rejected " + short_hash(tx_hash) + ": " + describe(status));
  channel->push(std::move(status));
  channel->close();
  return TxProgress{std::move(tx_hash), std::move(channel)};
}

void LocalNode::drop(PooledTx& tx, std::string reason) {
  ++dropped_count_;
  known_tx_.erase(tx.tx_hash);
  log::warn(kComponent, "dropped " + short_hash(tx.tx_hash) + ": " + reason);
  tx.channel->push(TxDropped{.reason = std::move(reason)});
  tx.channel->close();
}

TxProgress LocalNode::submit_and_watch(const SignedEnvelope& envelope) {
  auto channel = std::make_shared<StatusChannel>();
  std::string tx_hash = transaction_hash(envelope);

  std::lock_guard lock(mutex_);
  if (!running_) {
    return reject(std::move(channel), std::move(tx_hash), TxError{.detail = "node is not running"});
  }
  if (envelope.chain_id != config_.chain_id) {
    return reject(std::move(channel), std::move(tx_hash),
                  TxInvalid{.reason = "envelope targets chain '" + envelope.chain_id + "'"});
  }
  if (envelope.signer.empty() ||
      !CryptoEngine::verify(signing_payload(envelope), envelope.signature, envelope.signer.value)) {
    return reject(std::move(channel), std::move(tx_hash), TxInvalid{.reason = "bad signature"});
  }

  Call call;
  std::string reason;
  switch (decode_call(envelope.call_payload, config_.name_limit, call, reason)) {
    case DecodeFailure::None:
      break;
    case DecodeFailure::Malformed:
      return reject(std::move(channel), std::move(tx_hash), TxError{.detail = reason});
    case DecodeFailure::NameTooLong:
      return reject(std::move(channel), std::move(tx_hash), TxInvalid{.reason = reason});
  }

  const std::uint64_t expected = expected_nonce_locked(envelope.signer);
  if (envelope.nonce != expected) {
    return reject(std::move(channel), std::move(tx_hash),
                  TxInvalid{.reason = (envelope.nonce < expected ? "stale nonce " : "future nonce ") +
                                      std::to_string(envelope.nonce) + ", expected " +
                                      std::to_string(expected)});
  }
  if (known_tx_.contains(tx_hash)) {
    return reject(std::move(channel), std::move(tx_hash),
                  TxInvalid{.reason = "transaction already imported"});
  }

  if (pool_.size() >= config_.pool_capacity) {
    drop(pool_.front(), "evicted: pool is full");
    pool_.pop_front();
  }

  known_tx_.insert(tx_hash);
  channel->push(TxReady{});
  pool_.push_back(PooledTx{
      .tx_hash = tx_hash,
      .signer = envelope.signer,
      .nonce = envelope.nonce,
      .call = std::move(call),
      .channel = channel,
  });
  log::debug(kComponent, "pooled " + short_hash(tx_hash) + " (" +
                             std::string{call_name(pool_.back().call)} + ", nonce " +
                             std::to_string(envelope.nonce) + ")");
  return TxProgress{std::move(tx_hash), std::move(channel)};
}

std::optional<BlockRef> LocalNode::produce_block() {
  std::lock_guard lock(mutex_);
  if (!running_) {
    return std::nullopt;
  }

  const std::size_t take = std::min(pool_.size(), config_.max_block_extrinsics);
  std::vector<PooledTx> batch;
  batch.reserve(take);
  for (std::size_t i = 0; i < take; ++i) {
    batch.push_back(std::move(pool_.front()));
    pool_.pop_front();
  }

  // A pooled tx whose predecessor was evicted can no longer apply in order.
  std::unordered_map<AccountId, std::uint64_t> next_nonce;
  std::vector<PooledTx> included;
  std::vector<std::string> tx_hashes;
  for (auto& tx : batch) {
    auto [it, inserted] = next_nonce.try_emplace(tx.signer, 0);
    if (inserted) {
      it->second = chain_nonce_locked(tx.signer);
    }
    if (tx.nonce != it->second) {
      drop(tx, "nonce " + std::to_string(tx.nonce) + " no longer valid, expected " +
                   std::to_string(it->second));
      continue;
    }
    ++it->second;
    tx_hashes.push_back(tx.tx_hash);
    included.push_back(std::move(tx));
  }

  const BlockRecord& parent = blocks_.back();
  BlockRecord block;
  block.parent_hash = parent.ref.hash;
  block.ref.number = parent.ref.number + 1;
  block.ref.hash = block_hash(block.parent_hash, block.ref.number, tx_hashes);
  block.authored_unix = util::unix_timestamp_now();

  if (!clock_.advance_to(block.ref.number)) {
    log::error(kComponent, "clock is ahead of block #" + std::to_string(block.ref.number));
  }

  std::size_t failed = 0;
  for (std::uint32_t index = 0; index < included.size(); ++index) {
    PooledTx& tx = included[index];
    ++nonces_[tx.signer];
    const DispatchResult result = dispatcher_.dispatch(
        tx.signer, tx.call,
        ExtrinsicContext{.block = block.ref, .index = index, .tx_hash = tx.tx_hash});
    if (!result.ok()) {
      ++failed;
    }
    block.receipts.push_back(ExtrinsicReceipt{.index = index, .tx_hash = tx.tx_hash, .error = result.error});

    // A cancelled watcher stops receiving updates; the dispatch above stands.
    if (tx.channel->push(TxInBlock{.block = block.ref})) {
      block.watchers.emplace_back(tx.tx_hash, tx.channel);
    }
  }

  const BlockRef ref = block.ref;
  blocks_.push_back(std::move(block));
  log::info(kComponent, "authored block #" + std::to_string(ref.number) + " " + short_hash(ref.hash) +
                            " with " + std::to_string(included.size()) + " extrinsic(s), " +
                            std::to_string(failed) + " failed");

  finalize_locked();
  return ref;
}

void LocalNode::finalize_locked() {
  const std::uint64_t best = blocks_.back().ref.number;
  if (best < config_.finality_depth) {
    return;
  }
  const std::uint64_t target = best - config_.finality_depth;

  // Block numbers index blocks_ directly.
  for (std::uint64_t number = finalized_number_ + 1; number <= target; ++number) {
    BlockRecord& block = blocks_[number];
    block.finalized = true;
    // Included nonces are spent, so a replay now fails the nonce check.
    for (const auto& receipt : block.receipts) {
      known_tx_.erase(receipt.tx_hash);
    }
    for (auto& [tx_hash, channel] : block.watchers) {
      channel->push(TxFinalized{.block = block.ref});
      channel->close();
    }
    block.watchers.clear();
    finalized_number_ = number;
    log::debug(kComponent, "finalized block #" + std::to_string(number));
  }
}

std::uint64_t LocalNode::chain_nonce_locked(const AccountId& account) const {
  const auto it = nonces_.find(account);
  return it == nonces_.end() ? 0 : it->second;
}

std::uint64_t LocalNode::expected_nonce_locked(const AccountId& account) const {
  const auto pooled = std::ranges::count_if(pool_, [&](const PooledTx& tx) { return tx.signer == account; });
  return chain_nonce_locked(account) + static_cast<std::uint64_t>(pooled);
}

std::optional<BlockEvents> LocalNode::fetch_block_events(const BlockRef& block) const {
  std::lock_guard lock(mutex_);
  if (block.number >= blocks_.size()) {
    return std::nullopt;
  }
  const BlockRecord& record = blocks_[block.number];
  if (record.ref.hash != block.hash) {
    return std::nullopt;
  }
  return BlockEvents{
      .block = record.ref,
      .finalized = record.finalized,
      .receipts = record.receipts,
      .events = events_.in_block(record.ref.hash),
  };
}

std::uint64_t LocalNode::account_nonce(const AccountId& account) const {
  std::lock_guard lock(mutex_);
  return expected_nonce_locked(account);
}

std::optional<PetRecord> LocalNode::query_pet(const AccountId& account) const {
  std::lock_guard lock(mutex_);
  return store_.get(account);
}

Height LocalNode::query_feed_time(PetId id) const {
  std::lock_guard lock(mutex_);
  return store_.feed_time_of(id);
}

std::optional<Height> LocalNode::query_sleep_time(PetId id) const {
  std::lock_guard lock(mutex_);
  return store_.sleep_time_of(id);
}

std::optional<DispatchError> LocalNode::dry_run(const AccountId& signer, const Call& call) const {
  std::lock_guard lock(mutex_);
  return dispatcher_.check(signer, call);
}

bool LocalNode::running() const {
  std::lock_guard lock(mutex_);
  return running_;
}

BlockRef LocalNode::best_block() const {
  std::lock_guard lock(mutex_);
  return blocks_.empty() ? BlockRef{} : blocks_.back().ref;
}

BlockRef LocalNode::finalized_block() const {
  std::lock_guard lock(mutex_);
  return blocks_.empty() ? BlockRef{} : blocks_[finalized_number_].ref;
}

ChainConfig LocalNode::config() const {
  std::lock_guard lock(mutex_);
  return config_;
}

NodeStatusReport LocalNode::status() const {
  std::lock_guard lock(mutex_);
  std::size_t open_watchers = pool_.size();
  for (const auto& block : blocks_) {
    open_watchers += block.watchers.size();
  }
  return NodeStatusReport{
      .running = running_,
      .authoring = authoring_,
      .chain_id = config_.chain_id,
      .best_block = blocks_.empty() ? BlockRef{} : blocks_.back().ref,
      .finalized_block = blocks_.empty() ? BlockRef{} : blocks_[finalized_number_].ref,
      .height = clock_.now(),
      .pool_size = pool_.size(),
      .pet_count = store_.owner_count(),
      .event_count = events_.size(),
      .open_watchers = open_watchers,
      .tracked_tx_count = known_tx_.size(),
      .dropped_count = dropped_count_,
      .invalid_count = invalid_count_,
      .state_root = store_.state_root(),
  };
}

}  // namespace petchain
