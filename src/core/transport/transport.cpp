#include "core/transport/transport.hpp"

#include <utility>

namespace petchain {

bool StatusChannel::push(TxStatus status) {
  {
    std::lock_guard lock(mutex_);
    if (closed_ || cancelled_) {
      return false;
    }
    queue_.push_back(std::move(status));
  }
  ready_.notify_all();
  return true;
}

void StatusChannel::close() {
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
  }
  ready_.notify_all();
}

void StatusChannel::cancel() {
  {
    std::lock_guard lock(mutex_);
    cancelled_ = true;
    queue_.clear();
  }
  ready_.notify_all();
}

bool StatusChannel::closed() const {
  std::lock_guard lock(mutex_);
  return closed_;
}

std::optional<TxStatus> StatusChannel::next(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  ready_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_ || cancelled_; });
  if (queue_.empty()) {
    return std::nullopt;
  }
  TxStatus status = std::move(queue_.front());
  queue_.pop_front();
  return status;
}

TxProgress::TxProgress(std::string tx_hash, std::shared_ptr<StatusChannel> channel)
    : tx_hash_(std::move(tx_hash)), channel_(std::move(channel)) {}

TxProgress::~TxProgress() {
  cancel();
}

TxProgress& TxProgress::operator=(TxProgress&& other) noexcept {
  if (this != &other) {
    cancel();
    tx_hash_ = std::move(other.tx_hash_);
    channel_ = std::move(other.channel_);
    drained_ = other.drained_;
  }
  return *this;
}

std::optional<TxStatus> TxProgress::next(std::chrono::milliseconds timeout) {
  if (!channel_ || drained_) {
    return std::nullopt;
  }
  auto status = channel_->next(timeout);
  if (!status.has_value() && channel_->closed()) {
    drained_ = true;
  }
  return status;
}

bool TxProgress::ended() const {
  return !channel_ || drained_;
}

void TxProgress::cancel() {
  if (channel_) {
    channel_->cancel();
    channel_.reset();
  }
}

}  // namespace petchain
