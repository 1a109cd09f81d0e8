#pragma once

#include <string>
#include <string_view>

namespace petchain::util {

// libsodium must be initialised (CryptoEngine::initialize_library or LocalNode::start) first.
std::string sha256_hex(std::string_view payload);

}  // namespace petchain::util
