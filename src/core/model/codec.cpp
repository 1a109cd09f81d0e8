#include "core/model/codec.hpp"

#include <limits>

#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"

namespace petchain {
namespace {

constexpr std::string_view kCallMint = "mint";
constexpr std::string_view kCallTransfer = "transfer";
constexpr std::string_view kCallFeed = "feed";
constexpr std::string_view kCallSleep = "sleep";

std::string short_account(const AccountId& account) {
  return account.value.size() > 12 ? account.value.substr(0, 12) : account.value;
}

std::string block_label(const BlockRef& block) {
  return "#" + std::to_string(block.number) + " " + block.hash.substr(0, 12);
}

}  // namespace

std::string_view to_string(Species species) {
  switch (species) {
    case Species::Turtle:
      return "Turtle";
    case Species::Snake:
      return "Snake";
    case Species::Rabbit:
      return "Rabbit";
  }
  return "Turtle";
}

std::optional<Species> species_from_string(std::string_view text) {
  const std::string lowered = util::lowercase_copy(text);
  if (lowered == "turtle") {
    return Species::Turtle;
  }
  if (lowered == "snake") {
    return Species::Snake;
  }
  if (lowered == "rabbit") {
    return Species::Rabbit;
  }
  return std::nullopt;
}

std::string_view to_string(DispatchError error) {
  switch (error) {
    case DispatchError::AccountAlreadyHasPet:
      return "AccountAlreadyHasPet";
    case DispatchError::AccountHasNoPet:
      return "AccountHasNoPet";
  }
  return "AccountHasNoPet";
}

std::string_view to_string(EventKind kind) {
  switch (kind) {
    case EventKind::PetMinted:
      return "PetMinted";
    case EventKind::PetTransferred:
      return "PetTransferred";
    case EventKind::PetFed:
      return "PetFed";
    case EventKind::PetSlept:
      return "PetSlept";
  }
  return "PetMinted";
}

EventKind event_kind(const Event& event) {
  return static_cast<EventKind>(event.index());
}

EventKind expected_event_for(const Call& call) {
  return std::visit(overloaded{
                        [](const MintCall&) { return EventKind::PetMinted; },
                        [](const TransferCall&) { return EventKind::PetTransferred; },
                        [](const FeedCall&) { return EventKind::PetFed; },
                        [](const SleepCall&) { return EventKind::PetSlept; },
                    },
                    call);
}

std::string_view call_name(const Call& call) {
  return std::visit(overloaded{
                        [](const MintCall&) { return kCallMint; },
                        [](const TransferCall&) { return kCallTransfer; },
                        [](const FeedCall&) { return kCallFeed; },
                        [](const SleepCall&) { return kCallSleep; },
                    },
                    call);
}

PetId event_pet_id(const Event& event) {
  return std::visit([](const auto& e) { return e.pet_id; }, event);
}

std::string describe(const Event& event) {
  return std::visit(
      overloaded{
          [](const PetMinted& e) {
            return "PetMinted(owner=" + short_account(e.owner) + ", pet=" + std::to_string(e.pet_id) + ")";
          },
          [](const PetTransferred& e) {
            return "PetTransferred(from=" + short_account(e.from) + ", to=" + short_account(e.to) +
                   ", pet=" + std::to_string(e.pet_id) + ")";
          },
          [](const PetFed& e) {
            return "PetFed(owner=" + short_account(e.owner) + ", pet=" + std::to_string(e.pet_id) + ")";
          },
          [](const PetSlept& e) {
            return "PetSlept(owner=" + short_account(e.owner) + ", pet=" + std::to_string(e.pet_id) + ")";
          },
      },
      event);
}

std::string describe(const TxStatus& status) {
  return std::visit(overloaded{
                        [](const TxReady&) { return std::string{"Ready"}; },
                        [](const TxInBlock& s) { return "InBlock(" + block_label(s.block) + ")"; },
                        [](const TxFinalized& s) { return "Finalized(" + block_label(s.block) + ")"; },
                        [](const TxDropped& s) { return "Dropped(" + s.reason + ")"; },
                        [](const TxInvalid& s) { return "Invalid(" + s.reason + ")"; },
                        [](const TxError& s) { return "Error(" + s.detail + ")"; },
                    },
                    status);
}

Result encode_call(const Call& call, std::size_t name_limit) {
  std::vector<std::pair<std::string, std::string>> fields;
  fields.emplace_back("call", std::string{call_name(call)});

  if (const auto* mint = std::get_if<MintCall>(&call)) {
    if (mint->name.size() > name_limit) {
      return Result::failure("Pet name exceeds " + std::to_string(name_limit) + " bytes.");
    }
    fields.emplace_back("name", mint->name);
    fields.emplace_back("species", std::string{to_string(mint->species)});
    fields.emplace_back("id", std::to_string(mint->id));
  } else if (const auto* transfer = std::get_if<TransferCall>(&call)) {
    if (transfer->receiver.empty()) {
      return Result::failure("Transfer receiver is empty.");
    }
    fields.emplace_back("receiver", transfer->receiver.value);
  }

  return Result::success({}, util::canonical_join(std::move(fields)));
}

DecodeFailure decode_call(std::string_view payload, std::size_t name_limit, Call& out,
                          std::string& reason) {
  const auto fields = util::parse_canonical_map(payload);
  const auto call_it = fields.find("call");
  if (call_it == fields.end()) {
    reason = "call payload has no call field";
    return DecodeFailure::Malformed;
  }

  const std::string& name = call_it->second;
  if (name == kCallMint) {
    if (!fields.contains("name") || !fields.contains("species") || !fields.contains("id")) {
      reason = "mint payload is missing fields";
      return DecodeFailure::Malformed;
    }
    const auto species = species_from_string(fields.at("species"));
    std::uint64_t id = 0;
    if (!species.has_value() || !util::parse_uint64(fields.at("id"), id) ||
        id > std::numeric_limits<PetId>::max()) {
      reason = "mint payload has an invalid species or id";
      return DecodeFailure::Malformed;
    }
    if (fields.at("name").size() > name_limit) {
      reason = "pet name exceeds " + std::to_string(name_limit) + " bytes";
      return DecodeFailure::NameTooLong;
    }
    out = MintCall{.name = fields.at("name"), .species = *species, .id = static_cast<PetId>(id)};
    return DecodeFailure::None;
  }
  if (name == kCallTransfer) {
    const auto receiver_it = fields.find("receiver");
    if (receiver_it == fields.end() || receiver_it->second.empty()) {
      reason = "transfer payload has no receiver";
      return DecodeFailure::Malformed;
    }
    out = TransferCall{.receiver = AccountId{receiver_it->second}};
    return DecodeFailure::None;
  }
  if (name == kCallFeed) {
    out = FeedCall{};
    return DecodeFailure::None;
  }
  if (name == kCallSleep) {
    out = SleepCall{};
    return DecodeFailure::None;
  }

  reason = "unknown call '" + name + "'";
  return DecodeFailure::Malformed;
}

std::string signing_payload(const SignedEnvelope& envelope) {
  return util::canonical_join({
      {"call", envelope.call_payload},
      {"chain_id", envelope.chain_id},
      {"nonce", std::to_string(envelope.nonce)},
      {"signer", envelope.signer.value},
  });
}

std::string transaction_hash(const SignedEnvelope& envelope) {
  return util::sha256_hex(signing_payload(envelope) + envelope.signature);
}

}  // namespace petchain
