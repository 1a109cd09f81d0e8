#include "core/client/submission_client.hpp"

#include <utility>

#include "core/model/codec.hpp"
#include "core/util/log.hpp"

namespace petchain {
namespace {

constexpr std::string_view kComponent = "client";

}  // namespace

SubmissionClient::SubmissionClient(ITransport& transport, ChainConfig config)
    : transport_(transport), config_(std::move(config)) {}

Result SubmissionClient::use_signer(std::string_view phrase) {
  std::lock_guard lock(mutex_);
  const Result identity = phrase.empty() ? crypto_.generate_identity() : crypto_.identity_from_phrase(phrase);
  if (!identity.ok) {
    return identity;
  }
  log::debug(kComponent, "signing as " + crypto_.identity().account.value.substr(0, 12));
  return identity;
}

Result SubmissionClient::build_envelope(const Call& call, SignedEnvelope& out) {
  std::lock_guard lock(mutex_);
  SubmitFailure failure = SubmitFailure::None;
  return build_locked(call, out, failure);
}

Result SubmissionClient::build_locked(const Call& call, SignedEnvelope& out, SubmitFailure& failure) {
  if (!crypto_.ready()) {
    failure = SubmitFailure::ClientError;
    return Result::failure("Submit failed: no signer selected.");
  }

  const Result encoded = encode_call(call, config_.name_limit);
  if (!encoded.ok) {
    failure = SubmitFailure::InvalidCall;
    return encoded;
  }

  SignedEnvelope envelope{
      .signer = crypto_.identity().account,
      .nonce = transport_.account_nonce(crypto_.identity().account),
      .chain_id = config_.chain_id,
      .call_payload = encoded.data,
      .signature = {},
  };
  envelope.signature = crypto_.sign(signing_payload(envelope));
  if (envelope.signature.empty()) {
    failure = SubmitFailure::ClientError;
    return Result::failure("Submit failed: signing failed.");
  }

  std::string tx_hash = transaction_hash(envelope);
  out = std::move(envelope);
  return Result::success("Envelope signed.", std::move(tx_hash));
}

Result SubmissionClient::submit(const Call& call, TxProgress& progress) {
  SubmitFailure failure = SubmitFailure::None;
  return submit(call, progress, failure);
}

Result SubmissionClient::submit(const Call& call, TxProgress& progress, SubmitFailure& failure) {
  std::lock_guard lock(mutex_);
  failure = SubmitFailure::None;
  SignedEnvelope envelope;
  const Result built = build_locked(call, envelope, failure);
  if (!built.ok) {
    log::warn(kComponent, std::string{call_name(call)} + " not submitted: " + built.message);
    return built;
  }

  progress = transport_.submit_and_watch(envelope);
  log::info(kComponent, "submitted " + std::string{call_name(call)} + " " + built.data.substr(0, 12) +
                            " nonce " + std::to_string(envelope.nonce));
  return Result::success("Submitted.", built.data);
}

}  // namespace petchain
