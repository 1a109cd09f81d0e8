#pragma once

#include <mutex>
#include <string_view>

#include "core/crypto/crypto.hpp"
#include "core/model/types.hpp"
#include "core/transport/transport.hpp"

namespace petchain {

// Why a submission never reached the transport.
enum class SubmitFailure {
  None,
  // The codec refused the call itself (over-long name, empty receiver).
  InvalidCall,
  // No signer, or signing failed.
  ClientError,
};

// Turns a call into a signed envelope for one signer and hands it to the
// transport. Submissions from one client are serialized so nonces stay
// contiguous.
class SubmissionClient {
public:
  SubmissionClient(ITransport& transport, ChainConfig config);

  // Empty phrase generates a fresh key pair.
  Result use_signer(std::string_view phrase);

  [[nodiscard]] bool ready() const { return crypto_.ready(); }
  [[nodiscard]] const AccountId& account() const { return crypto_.identity().account; }
  [[nodiscard]] const ChainConfig& config() const { return config_; }
  [[nodiscard]] ITransport& transport() const { return transport_; }

  // Encodes and signs without submitting; data holds the transaction hash.
  Result build_envelope(const Call& call, SignedEnvelope& out);

  // On success progress holds the status sequence and data the tx hash.
  // A call the codec refuses never reaches the transport.
  Result submit(const Call& call, TxProgress& progress);
  Result submit(const Call& call, TxProgress& progress, SubmitFailure& failure);

private:
  Result build_locked(const Call& call, SignedEnvelope& out, SubmitFailure& failure);

  ITransport& transport_;
  ChainConfig config_;
  CryptoEngine crypto_;
  std::mutex mutex_;
};

}  // namespace petchain
