#pragma once

#include <string>
#include <string_view>

#include "core/model/types.hpp"

namespace petchain {

struct IdentityKeyPair {
  std::string public_key;   // hex, doubles as the account id
  std::string private_key;  // hex
  AccountId account;
};

class CryptoEngine {
public:
  // Safe to call repeatedly; libsodium keeps its own once-flag.
  static Result initialize_library();

  Result generate_identity();
  // Deterministic development identity, e.g. "//Alice".
  Result identity_from_phrase(std::string_view phrase);

  [[nodiscard]] bool ready() const { return ready_; }
  [[nodiscard]] const IdentityKeyPair& identity() const { return identity_; }

  [[nodiscard]] std::string sign(std::string_view payload) const;
  [[nodiscard]] static bool verify(std::string_view payload, std::string_view signature,
                                   std::string_view public_key);

  [[nodiscard]] static AccountId account_for_phrase(std::string_view phrase);

private:
  Result adopt_seed(std::string_view seed);

  IdentityKeyPair identity_;
  bool ready_ = false;
};

}  // namespace petchain
