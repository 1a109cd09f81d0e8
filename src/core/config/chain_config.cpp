#include "core/config/chain_config.hpp"

#include <cstdint>
#include <fstream>
#include <sstream>
#include <utility>

#include "core/util/canonical.hpp"
#include "core/util/log.hpp"

namespace petchain {
namespace {

bool is_comment_or_empty(std::string_view line) {
  return line.empty() || line.front() == '#';
}

Result read_positive(std::string_view key, std::string_view value, std::uint64_t& out) {
  std::uint64_t parsed = 0;
  if (!util::parse_uint64(value, parsed)) {
    return Result::failure("Config value for " + std::string{key} + " is not a number: " + std::string{value});
  }
  if (parsed == 0) {
    return Result::failure("Config value for " + std::string{key} + " must be positive.");
  }
  out = parsed;
  return Result::success();
}

Result read_number(std::string_view key, std::string_view value, std::uint64_t& out) {
  if (!util::parse_uint64(value, out)) {
    return Result::failure("Config value for " + std::string{key} + " is not a number: " + std::string{value});
  }
  return Result::success();
}

Result apply_entry(std::string_view key, std::string_view value, ChainConfig& config) {
  std::uint64_t number = 0;
  if (key == "chain_id") {
    if (value.empty()) {
      return Result::failure("Config value for chain_id is empty.");
    }
    config.chain_id = std::string{value};
    return Result::success();
  }
  if (key == "name_limit" || key == "pool_capacity" || key == "max_block_extrinsics") {
    const Result read = read_positive(key, value, number);
    if (!read.ok) {
      return read;
    }
    if (key == "name_limit") {
      config.name_limit = static_cast<std::size_t>(number);
    } else if (key == "pool_capacity") {
      config.pool_capacity = static_cast<std::size_t>(number);
    } else {
      config.max_block_extrinsics = static_cast<std::size_t>(number);
    }
    return Result::success();
  }
  if (key == "finality_depth") {
    return read_number(key, value, config.finality_depth);
  }
  if (key == "block_interval_ms") {
    return read_positive(key, value, config.block_interval_ms);
  }
  if (key == "watch_timeout_ms") {
    return read_positive(key, value, config.watch_timeout_ms);
  }
  if (key == "log_level") {
    log::Level level = log::Level::Info;
    if (!log::parse_level(value, level)) {
      return Result::failure("Unknown log level: " + std::string{value});
    }
    config.log_level = util::lowercase_copy(value);
    return Result::success();
  }
  return Result::failure("Unknown config key: " + std::string{key});
}

}  // namespace

Result parse_chain_config(std::string_view text, ChainConfig& out) {
  ChainConfig config = out;
  std::istringstream in{std::string{text}};
  std::string line;
  std::size_t line_number = 0;
  while (std::getline(in, line)) {
    ++line_number;
    const std::string trimmed = util::trim_copy(line);
    if (is_comment_or_empty(trimmed)) {
      continue;
    }

    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      return Result::failure("Config line " + std::to_string(line_number) + " has no '=': " + trimmed);
    }
    const std::string key = util::trim_copy(std::string_view{trimmed}.substr(0, eq));
    const std::string value = util::trim_copy(std::string_view{trimmed}.substr(eq + 1));
    const Result applied = apply_entry(key, value, config);
    if (!applied.ok) {
      return Result::failure("Config line " + std::to_string(line_number) + ": " + applied.message);
    }
  }

  out = std::move(config);
  return Result::success("Config parsed.");
}

Result load_chain_config(std::string_view path, ChainConfig& out) {
  if (path.empty()) {
    return Result::failure("Config load failed: empty path.");
  }

  std::ifstream in{std::string{path}};
  if (!in) {
    return Result::failure("Config load failed: cannot open " + std::string{path});
  }
  std::ostringstream contents;
  contents << in.rdbuf();
  const Result parsed = parse_chain_config(contents.str(), out);
  if (!parsed.ok) {
    return parsed;
  }
  return Result::success("Loaded config from " + std::string{path});
}

std::string render_chain_config(const ChainConfig& config) {
  std::ostringstream out;
  out << "chain_id=" << config.chain_id << '\n'
      << "name_limit=" << config.name_limit << '\n'
      << "finality_depth=" << config.finality_depth << '\n'
      << "pool_capacity=" << config.pool_capacity << '\n'
      << "max_block_extrinsics=" << config.max_block_extrinsics << '\n'
      << "block_interval_ms=" << config.block_interval_ms << '\n'
      << "watch_timeout_ms=" << config.watch_timeout_ms << '\n'
      << "log_level=" << config.log_level << '\n';
  return out.str();
}

}  // namespace petchain
