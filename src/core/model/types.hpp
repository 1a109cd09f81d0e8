#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace petchain {

struct Result {
  bool ok = false;
  std::string message;
  std::string data;

  static Result success(std::string msg = {}, std::string payload = {}) {
    return {true, std::move(msg), std::move(payload)};
  }

  static Result failure(std::string msg) {
    return {false, std::move(msg), {}};
  }
};

using PetId = std::uint32_t;
using Height = std::uint64_t;

struct AccountId {
  std::string value;

  [[nodiscard]] bool empty() const { return value.empty(); }
  auto operator<=>(const AccountId&) const = default;
};

enum class Species {
  Turtle,
  Snake,
  Rabbit,
};

struct PetRecord {
  PetId id = 0;
  std::string name;
  Species species = Species::Turtle;

  bool operator==(const PetRecord&) const = default;
};

// Calls. The signer is not part of the call; it arrives with the envelope.
struct MintCall {
  std::string name;
  Species species = Species::Turtle;
  PetId id = 0;
};

struct TransferCall {
  AccountId receiver;
};

struct FeedCall {};
struct SleepCall {};

using Call = std::variant<MintCall, TransferCall, FeedCall, SleepCall>;

struct PetMinted {
  AccountId owner;
  PetId pet_id = 0;

  bool operator==(const PetMinted&) const = default;
};

struct PetTransferred {
  AccountId from;
  AccountId to;
  PetId pet_id = 0;

  bool operator==(const PetTransferred&) const = default;
};

struct PetFed {
  AccountId owner;
  PetId pet_id = 0;

  bool operator==(const PetFed&) const = default;
};

struct PetSlept {
  AccountId owner;
  PetId pet_id = 0;

  bool operator==(const PetSlept&) const = default;
};

using Event = std::variant<PetMinted, PetTransferred, PetFed, PetSlept>;

// Index-aligned with the Event alternatives.
enum class EventKind : std::size_t {
  PetMinted = 0,
  PetTransferred = 1,
  PetFed = 2,
  PetSlept = 3,
};

enum class DispatchError {
  AccountAlreadyHasPet,
  AccountHasNoPet,
};

struct BlockRef {
  std::uint64_t number = 0;
  std::string hash;

  bool operator==(const BlockRef&) const = default;
};

struct EventRecord {
  std::uint64_t sequence = 0;
  BlockRef block;
  std::uint32_t extrinsic_index = 0;
  std::string tx_hash;
  Height height = 0;
  Event event;
};

struct ExtrinsicReceipt {
  std::uint32_t index = 0;
  std::string tx_hash;
  std::optional<DispatchError> error;
};

struct BlockEvents {
  BlockRef block;
  bool finalized = false;
  std::vector<ExtrinsicReceipt> receipts;
  std::vector<EventRecord> events;
};

struct SignedEnvelope {
  AccountId signer;
  std::uint64_t nonce = 0;
  std::string chain_id;
  std::string call_payload;
  std::string signature;
};

struct TxReady {};

struct TxInBlock {
  BlockRef block;
};

struct TxFinalized {
  BlockRef block;
};

struct TxDropped {
  std::string reason;
};

struct TxInvalid {
  std::string reason;
};

struct TxError {
  std::string detail;
};

using TxStatus = std::variant<TxReady, TxInBlock, TxFinalized, TxDropped, TxInvalid, TxError>;

struct ChainConfig {
  std::string chain_id = "petchain-dev";
  std::size_t name_limit = 32;
  std::uint64_t finality_depth = 2;
  std::size_t pool_capacity = 256;
  std::size_t max_block_extrinsics = 64;
  std::uint64_t block_interval_ms = 250;
  std::uint64_t watch_timeout_ms = 30000;
  std::string log_level = "info";
};

struct NodeStatusReport {
  bool running = false;
  bool authoring = false;
  std::string chain_id;
  BlockRef best_block;
  BlockRef finalized_block;
  Height height = 0;
  std::size_t pool_size = 0;
  std::size_t pet_count = 0;
  std::size_t event_count = 0;
  std::size_t open_watchers = 0;
  // Hashes still held for duplicate detection: pooled or not yet final.
  std::size_t tracked_tx_count = 0;
  std::uint64_t dropped_count = 0;
  std::uint64_t invalid_count = 0;
  std::string state_root;
};

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}  // namespace petchain

template <>
struct std::hash<petchain::AccountId> {
  std::size_t operator()(const petchain::AccountId& account) const noexcept {
    return std::hash<std::string>{}(account.value);
  }
};
