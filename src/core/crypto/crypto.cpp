#include "core/crypto/crypto.hpp"

#include <array>

#include <sodium.h>

#include "core/util/canonical.hpp"

namespace petchain {
namespace {

constexpr std::string_view kPhraseDomain = "petchain-dev-seed:";

std::string as_string(const unsigned char* data, std::size_t size) {
  return std::string{reinterpret_cast<const char*>(data), size};
}

}  // namespace

Result CryptoEngine::initialize_library() {
  if (sodium_init() < 0) {
    return Result::failure("libsodium initialization failed.");
  }
  return Result::success();
}

Result CryptoEngine::generate_identity() {
  const Result init = initialize_library();
  if (!init.ok) {
    return init;
  }

  std::array<unsigned char, crypto_sign_SEEDBYTES> seed{};
  randombytes_buf(seed.data(), seed.size());
  const Result adopted = adopt_seed(as_string(seed.data(), seed.size()));
  sodium_memzero(seed.data(), seed.size());
  return adopted;
}

Result CryptoEngine::identity_from_phrase(std::string_view phrase) {
  if (phrase.empty()) {
    return Result::failure("Identity phrase is empty.");
  }
  const Result init = initialize_library();
  if (!init.ok) {
    return init;
  }

  const std::string material = std::string{kPhraseDomain} + std::string{phrase};
  std::array<unsigned char, crypto_sign_SEEDBYTES> seed{};
  crypto_generichash(seed.data(), seed.size(), reinterpret_cast<const unsigned char*>(material.data()),
                     static_cast<unsigned long long>(material.size()), nullptr, 0);
  const Result adopted = adopt_seed(as_string(seed.data(), seed.size()));
  sodium_memzero(seed.data(), seed.size());
  return adopted;
}

Result CryptoEngine::adopt_seed(std::string_view seed) {
  if (seed.size() != crypto_sign_SEEDBYTES) {
    return Result::failure("Identity seed has the wrong length.");
  }

  std::array<unsigned char, crypto_sign_PUBLICKEYBYTES> public_key{};
  std::array<unsigned char, crypto_sign_SECRETKEYBYTES> private_key{};
  if (crypto_sign_seed_keypair(public_key.data(), private_key.data(),
                               reinterpret_cast<const unsigned char*>(seed.data())) != 0) {
    return Result::failure("Ed25519 key derivation failed.");
  }

  identity_.public_key = util::to_hex(as_string(public_key.data(), public_key.size()));
  identity_.private_key = util::to_hex(as_string(private_key.data(), private_key.size()));
  identity_.account.value = identity_.public_key;
  sodium_memzero(private_key.data(), private_key.size());
  ready_ = true;
  return Result::success("Identity ready.", identity_.account.value);
}

std::string CryptoEngine::sign(std::string_view payload) const {
  if (!ready_) {
    return {};
  }

  const std::string private_key = util::from_hex(identity_.private_key);
  if (private_key.size() != crypto_sign_SECRETKEYBYTES) {
    return {};
  }

  std::array<unsigned char, crypto_sign_BYTES> signature{};
  crypto_sign_detached(signature.data(), nullptr, reinterpret_cast<const unsigned char*>(payload.data()),
                       static_cast<unsigned long long>(payload.size()),
                       reinterpret_cast<const unsigned char*>(private_key.data()));
  return util::to_hex(as_string(signature.data(), signature.size()));
}

bool CryptoEngine::verify(std::string_view payload, std::string_view signature,
                          std::string_view public_key) {
  const std::string sig_bytes = util::from_hex(signature);
  const std::string public_key_bytes = util::from_hex(public_key);
  if (sig_bytes.size() != crypto_sign_BYTES || public_key_bytes.size() != crypto_sign_PUBLICKEYBYTES) {
    return false;
  }

  return crypto_sign_verify_detached(reinterpret_cast<const unsigned char*>(sig_bytes.data()),
                                     reinterpret_cast<const unsigned char*>(payload.data()),
                                     static_cast<unsigned long long>(payload.size()),
                                     reinterpret_cast<const unsigned char*>(public_key_bytes.data())) == 0;
}

AccountId CryptoEngine::account_for_phrase(std::string_view phrase) {
  CryptoEngine engine;
  if (!engine.identity_from_phrase(phrase).ok) {
    return {};
  }
  return engine.identity().account;
}

}  // namespace petchain
