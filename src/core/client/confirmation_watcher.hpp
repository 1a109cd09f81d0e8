#pragma once

#include <chrono>
#include <future>
#include <optional>
#include <string>
#include <string_view>

#include "core/model/types.hpp"
#include "core/transport/transport.hpp"

namespace petchain {

enum class WatchPhase {
  Waiting,
  InPool,
  InBlock,
  Resolved,
};

enum class OutcomeKind {
  Finalized,
  NoMatchingEvent,
  DispatchFailed,
  Dropped,
  Invalid,
  Error,
  Indeterminate,
};

struct WatchOutcome {
  OutcomeKind kind = OutcomeKind::Indeterminate;
  std::optional<BlockRef> block;
  std::optional<EventRecord> event;
  std::optional<DispatchError> dispatch_error;
  std::string detail;

  // Finalized with the expected event: the effect is applied.
  [[nodiscard]] bool ok() const { return kind == OutcomeKind::Finalized; }
  // Known not applied.
  [[nodiscard]] bool rejected() const {
    return kind == OutcomeKind::DispatchFailed || kind == OutcomeKind::Dropped ||
           kind == OutcomeKind::Invalid || kind == OutcomeKind::Error;
  }
  // Unknown; the ledger has to be queried again.
  [[nodiscard]] bool indeterminate() const {
    return kind == OutcomeKind::NoMatchingEvent || kind == OutcomeKind::Indeterminate;
  }
};

std::string_view to_string(OutcomeKind kind);
std::string describe(const WatchOutcome& outcome);

// Consumes one submission's status updates and resolves to exactly one
// outcome. Ready and InBlock only move the phase; the event is trusted once
// its block is final. Never retries.
class ConfirmationWatcher {
public:
  // An empty tx_hash matches the first event of the expected kind in the block.
  ConfirmationWatcher(const BlockEventSource& source, EventKind expected, std::string tx_hash);

  // Returns the outcome when this status resolves the watch; later statuses
  // are ignored.
  std::optional<WatchOutcome> observe(const TxStatus& status);
  // The sequence ended without a terminal status.
  WatchOutcome stream_ended(std::string detail);

  // Pulls from progress until resolved. timeout bounds each wait.
  WatchOutcome run(TxProgress& progress, std::chrono::milliseconds timeout);

  [[nodiscard]] WatchPhase phase() const { return phase_; }
  [[nodiscard]] const std::optional<WatchOutcome>& outcome() const { return outcome_; }
  [[nodiscard]] const std::optional<BlockRef>& last_block() const { return last_block_; }

private:
  WatchOutcome on_finalized(const BlockRef& block);
  WatchOutcome resolve(WatchOutcome outcome);

  const BlockEventSource& source_;
  EventKind expected_;
  std::string tx_hash_;
  WatchPhase phase_ = WatchPhase::Waiting;
  std::optional<BlockRef> last_block_;
  std::optional<WatchOutcome> outcome_;
};

// Runs a watcher on its own thread. source must outlive the future.
std::future<WatchOutcome> watch_async(const BlockEventSource& source, EventKind expected, TxProgress progress,
                                      std::chrono::milliseconds timeout);

}  // namespace petchain
