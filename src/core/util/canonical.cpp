#include "core/util/canonical.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cctype>
#include <iterator>
#include <ranges>
#include <system_error>

namespace petchain::util {
namespace {

int from_hex_digit(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

}  // namespace

std::int64_t unix_timestamp_now() {
  const auto now = std::chrono::system_clock::now();
  return std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
}

std::string lowercase_copy(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  std::ranges::transform(value, std::back_inserter(out), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

std::string trim_copy(std::string_view value) {
  const auto not_space = [](unsigned char c) { return std::isspace(c) == 0; };
  const auto begin = std::ranges::find_if(value, not_space);
  if (begin == value.end()) {
    return {};
  }
  const auto last = std::ranges::find_if(value | std::views::reverse, not_space);
  const auto end = last.base();
  return std::string{begin, end};
}

std::string canonical_join(std::vector<std::pair<std::string, std::string>> fields) {
  std::ranges::sort(fields, {}, &std::pair<std::string, std::string>::first);

  std::string payload;
  for (const auto& [key, value] : fields) {
    payload.append(key);
    payload.push_back('=');
    for (char c : value) {
      switch (c) {
        case '\n':
          payload.append("\\n");
          break;
        case '\\':
          payload.append("\\\\");
          break;
        default:
          payload.push_back(c);
      }
    }
    payload.push_back('\n');
  }
  return payload;
}

std::unordered_map<std::string, std::string> parse_canonical_map(std::string_view payload) {
  std::unordered_map<std::string, std::string> parsed;

  std::string key;
  std::string value;
  bool in_value = false;
  bool escaping = false;

  const auto flush = [&] {
    if (in_value && !key.empty()) {
      parsed.insert_or_assign(key, value);
    }
    key.clear();
    value.clear();
    in_value = false;
  };

  for (char c : payload) {
    if (!in_value) {
      if (c == '=') {
        in_value = true;
      } else if (c == '\n') {
        key.clear();
      } else {
        key.push_back(c);
      }
      continue;
    }

    if (escaping) {
      value.push_back(c == 'n' ? '\n' : c);
      escaping = false;
    } else if (c == '\\') {
      escaping = true;
    } else if (c == '\n') {
      flush();
    } else {
      value.push_back(c);
    }
  }
  flush();

  return parsed;
}

std::string to_hex(std::string_view bytes) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2U);
  for (unsigned char c : bytes) {
    out.push_back(kHex[(c >> 4U) & 0x0FU]);
    out.push_back(kHex[c & 0x0FU]);
  }
  return out;
}

std::string from_hex(std::string_view hex) {
  if ((hex.size() % 2U) != 0U) {
    return {};
  }

  std::string out;
  out.reserve(hex.size() / 2U);
  for (std::size_t i = 0; i < hex.size(); i += 2U) {
    const int hi = from_hex_digit(hex[i]);
    const int lo = from_hex_digit(hex[i + 1U]);
    if (hi < 0 || lo < 0) {
      return {};
    }
    out.push_back(static_cast<char>((hi << 4U) | lo));
  }
  return out;
}

bool parse_uint64(std::string_view text, std::uint64_t& out) {
  if (text.empty()) {
    return false;
  }
  std::uint64_t value = 0;
  const auto result = std::from_chars(text.data(), text.data() + text.size(), value);
  if (result.ec != std::errc() || result.ptr != text.data() + text.size()) {
    return false;
  }
  out = value;
  return true;
}

}  // namespace petchain::util
