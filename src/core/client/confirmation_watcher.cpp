#include "core/client/confirmation_watcher.hpp"

#include <utility>

#include "core/model/codec.hpp"
#include "core/util/log.hpp"

namespace petchain {
namespace {

constexpr std::string_view kComponent = "watcher";

std::string block_label(const BlockRef& block) {
  return "#" + std::to_string(block.number) + " " + block.hash.substr(0, 12);
}

}  // namespace

std::string_view to_string(OutcomeKind kind) {
  switch (kind) {
    case OutcomeKind::Finalized:
      return "finalized";
    case OutcomeKind::NoMatchingEvent:
      return "no-matching-event";
    case OutcomeKind::DispatchFailed:
      return "dispatch-failed";
    case OutcomeKind::Dropped:
      return "dropped";
    case OutcomeKind::Invalid:
      return "invalid";
    case OutcomeKind::Error:
      return "error";
    case OutcomeKind::Indeterminate:
      return "indeterminate";
  }
  return "unknown";
}

std::string describe(const WatchOutcome& outcome) {
  std::string text{to_string(outcome.kind)};
  if (outcome.block.has_value()) {
    text += " in block " + block_label(*outcome.block);
  }
  if (outcome.event.has_value()) {
    text += ": " + describe(outcome.event->event);
  }
  if (outcome.dispatch_error.has_value()) {
    text += ": " + std::string{to_string(*outcome.dispatch_error)};
  }
  if (!outcome.detail.empty()) {
    text += " (" + outcome.detail + ")";
  }
  return text;
}

ConfirmationWatcher::ConfirmationWatcher(const BlockEventSource& source, EventKind expected, std::string tx_hash)
    : source_(source), expected_(expected), tx_hash_(std::move(tx_hash)) {}

std::optional<WatchOutcome> ConfirmationWatcher::observe(const TxStatus& status) {
  if (phase_ == WatchPhase::Resolved) {
    return std::nullopt;
  }
  if (log::enabled(log::Level::Trace)) {
    log::trace(kComponent, (tx_hash_.empty() ? std::string{to_string(expected_)} : tx_hash_.substr(0, 12)) +
                               " status " + describe(status));
  }

  return std::visit(
      overloaded{
          [&](const TxReady&) -> std::optional<WatchOutcome> {
            if (phase_ == WatchPhase::Waiting) {
              phase_ = WatchPhase::InPool;
            }
            return std::nullopt;
          },
          [&](const TxInBlock& s) -> std::optional<WatchOutcome> {
            phase_ = WatchPhase::InBlock;
            last_block_ = s.block;
            return std::nullopt;
          },
          [&](const TxFinalized& s) -> std::optional<WatchOutcome> { return on_finalized(s.block); },
          [&](const TxDropped& s) -> std::optional<WatchOutcome> {
            return resolve(WatchOutcome{.kind = OutcomeKind::Dropped, .detail = s.reason});
          },
          [&](const TxInvalid& s) -> std::optional<WatchOutcome> {
            return resolve(WatchOutcome{.kind = OutcomeKind::Invalid, .detail = s.reason});
          },
          [&](const TxError& s) -> std::optional<WatchOutcome> {
            return resolve(WatchOutcome{.kind = OutcomeKind::Error, .detail = s.detail});
          },
      },
      status);
}

WatchOutcome ConfirmationWatcher::on_finalized(const BlockRef& block) {
  last_block_ = block;
  const auto contents = source_.fetch_block_events(block);
  if (!contents.has_value()) {
    return resolve(WatchOutcome{
        .kind = OutcomeKind::Indeterminate,
        .block = block,
        .detail = "events of block " + block_label(block) + " unavailable",
    });
  }

  if (!tx_hash_.empty()) {
    for (const auto& receipt : contents->receipts) {
      if (receipt.tx_hash == tx_hash_ && receipt.error.has_value()) {
        return resolve(WatchOutcome{
            .kind = OutcomeKind::DispatchFailed,
            .block = block,
            .dispatch_error = receipt.error,
        });
      }
    }
  }

  for (const auto& record : contents->events) {
    if (event_kind(record.event) != expected_) {
      continue;
    }
    if (!tx_hash_.empty() && record.tx_hash != tx_hash_) {
      continue;
    }
    return resolve(WatchOutcome{.kind = OutcomeKind::Finalized, .block = block, .event = record});
  }

  return resolve(WatchOutcome{
      .kind = OutcomeKind::NoMatchingEvent,
      .block = block,
      .detail = "no " + std::string{to_string(expected_)} + " event in finalized block",
  });
}

WatchOutcome ConfirmationWatcher::stream_ended(std::string detail) {
  if (outcome_.has_value()) {
    return *outcome_;
  }
  if (last_block_.has_value() && detail.empty()) {
    detail = "last seen in block " + block_label(*last_block_);
  }
  return resolve(WatchOutcome{.kind = OutcomeKind::Indeterminate, .block = last_block_, .detail = std::move(detail)});
}

WatchOutcome ConfirmationWatcher::run(TxProgress& progress, std::chrono::milliseconds timeout) {
  while (!outcome_.has_value()) {
    const auto status = progress.next(timeout);
    if (!status.has_value()) {
      return stream_ended(progress.ended() ? "status stream ended before a terminal status"
                                           : "no status update within " + std::to_string(timeout.count()) + "ms");
    }
    if (auto resolved = observe(*status)) {
      return *resolved;
    }
  }
  return *outcome_;
}

WatchOutcome ConfirmationWatcher::resolve(WatchOutcome outcome) {
  phase_ = WatchPhase::Resolved;
  outcome_ = outcome;
  if (log::enabled(log::Level::Debug)) {
    const std::string subject = tx_hash_.empty() ? std::string{to_string(expected_)} : tx_hash_.substr(0, 12);
    log::debug(kComponent, subject + " resolved " + describe(outcome));
  }
  return outcome;
}

std::future<WatchOutcome> watch_async(const BlockEventSource& source, EventKind expected, TxProgress progress,
                                      std::chrono::milliseconds timeout) {
  return std::async(std::launch::async, [&source, expected, timeout, progress = std::move(progress)]() mutable {
    ConfirmationWatcher watcher(source, expected, progress.tx_hash());
    return watcher.run(progress, timeout);
  });
}

}  // namespace petchain
