#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace petchain::util {

std::int64_t unix_timestamp_now();

std::string lowercase_copy(std::string_view value);
std::string trim_copy(std::string_view value);

// key=value lines sorted by key; '\n' and '\\' in values are escaped.
std::string canonical_join(std::vector<std::pair<std::string, std::string>> fields);
std::unordered_map<std::string, std::string> parse_canonical_map(std::string_view payload);

std::string to_hex(std::string_view bytes);
// Empty on odd length or non-hex input.
std::string from_hex(std::string_view hex);

bool parse_uint64(std::string_view text, std::uint64_t& out);

}  // namespace petchain::util
