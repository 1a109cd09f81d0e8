#pragma once

#include <string>
#include <string_view>

#include "core/model/types.hpp"

namespace petchain {

// key=value lines; '#' starts a comment line. Keys not listed in ChainConfig
// are rejected. out is only written on success.
Result load_chain_config(std::string_view path, ChainConfig& out);
Result parse_chain_config(std::string_view text, ChainConfig& out);

std::string render_chain_config(const ChainConfig& config);

}  // namespace petchain
