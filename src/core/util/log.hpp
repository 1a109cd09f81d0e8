#pragma once

#include <cstdint>
#include <cstdio>
#include <string_view>

namespace petchain::log {

enum class Level : std::uint8_t {
  Error = 0,
  Warn = 1,
  Info = 2,
  Debug = 3,
  Trace = 4,
  Off = 255,
};

const char* level_name(Level level) noexcept;
bool parse_level(std::string_view text, Level& out);

void set_level(Level level);
[[nodiscard]] Level level();
[[nodiscard]] bool enabled(Level level);

// Sink is not owned. nullptr restores stderr.
void set_sink(std::FILE* sink);

void write(Level level, std::string_view component, std::string_view message);

inline void error(std::string_view component, std::string_view message) {
  write(Level::Error, component, message);
}
inline void warn(std::string_view component, std::string_view message) {
  write(Level::Warn, component, message);
}
inline void info(std::string_view component, std::string_view message) {
  write(Level::Info, component, message);
}
inline void debug(std::string_view component, std::string_view message) {
  write(Level::Debug, component, message);
}
inline void trace(std::string_view component, std::string_view message) {
  write(Level::Trace, component, message);
}

}  // namespace petchain::log
