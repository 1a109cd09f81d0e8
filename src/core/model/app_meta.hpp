#pragma once

#include <cstdint>
#include <string_view>

#ifndef PETCHAIN_APP_VERSION
#define PETCHAIN_APP_VERSION "0.3.0"
#endif

#ifndef PETCHAIN_BUILD_RELEASE
#define PETCHAIN_BUILD_RELEASE "Ledger Core"
#endif

namespace petchain {

inline constexpr std::string_view kAppDisplayName = "SuperPet::Pet Ledger";
inline constexpr std::string_view kDevPhrasePrefix = "//";
inline constexpr std::uint64_t kGenesisBlockNumber = 0;
inline constexpr std::string_view kGenesisParentHash =
    "0000000000000000000000000000000000000000000000000000000000000000";
inline constexpr std::string_view kAppVersion = PETCHAIN_APP_VERSION;
inline constexpr std::string_view kBuildRelease = PETCHAIN_BUILD_RELEASE;

}  // namespace petchain
