#include "core/util/hash.hpp"

#include <array>

#include <sodium.h>

#include "core/util/canonical.hpp"

namespace petchain::util {

std::string sha256_hex(std::string_view payload) {
  std::array<unsigned char, crypto_hash_sha256_BYTES> digest{};
  crypto_hash_sha256(digest.data(), reinterpret_cast<const unsigned char*>(payload.data()),
                     static_cast<unsigned long long>(payload.size()));
  return to_hex(std::string_view{reinterpret_cast<const char*>(digest.data()), digest.size()});
}

}  // namespace petchain::util
