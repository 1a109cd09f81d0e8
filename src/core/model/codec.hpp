#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "core/model/types.hpp"

namespace petchain {

std::string_view to_string(Species species);
std::optional<Species> species_from_string(std::string_view text);

std::string_view to_string(DispatchError error);
std::string_view to_string(EventKind kind);

[[nodiscard]] EventKind event_kind(const Event& event);
[[nodiscard]] EventKind expected_event_for(const Call& call);
[[nodiscard]] std::string_view call_name(const Call& call);
[[nodiscard]] PetId event_pet_id(const Event& event);

std::string describe(const Event& event);
std::string describe(const TxStatus& status);

// Canonical call payload. Fails when a Mint name exceeds name_limit bytes;
// data holds the payload on success.
Result encode_call(const Call& call, std::size_t name_limit);
// Malformed payloads and over-long names are reported separately so the node
// can map them to Error and Invalid.
enum class DecodeFailure {
  None,
  Malformed,
  NameTooLong,
};
DecodeFailure decode_call(std::string_view payload, std::size_t name_limit, Call& out,
                          std::string& reason);

// Bytes covered by the envelope signature.
std::string signing_payload(const SignedEnvelope& envelope);
std::string transaction_hash(const SignedEnvelope& envelope);

}  // namespace petchain
