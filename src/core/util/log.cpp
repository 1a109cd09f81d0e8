#include "core/util/log.hpp"

#include <atomic>
#include <mutex>

#include "core/util/canonical.hpp"

namespace petchain::log {
namespace {

struct LogState {
  std::mutex mutex;
  std::FILE* sink = nullptr;
  std::atomic<Level> level{Level::Info};
};

LogState& state() {
  static LogState instance;
  return instance;
}

}  // namespace

const char* level_name(Level level) noexcept {
  switch (level) {
    case Level::Error:
      return "ERROR";
    case Level::Warn:
      return "WARN";
    case Level::Info:
      return "INFO";
    case Level::Debug:
      return "DEBUG";
    case Level::Trace:
      return "TRACE";
    case Level::Off:
      return "OFF";
  }
  return "UNKNOWN";
}

bool parse_level(std::string_view text, Level& out) {
  const std::string lowered = util::lowercase_copy(util::trim_copy(text));
  if (lowered == "error") {
    out = Level::Error;
  } else if (lowered == "warn" || lowered == "warning") {
    out = Level::Warn;
  } else if (lowered == "info") {
    out = Level::Info;
  } else if (lowered == "debug") {
    out = Level::Debug;
  } else if (lowered == "trace") {
    out = Level::Trace;
  } else if (lowered == "off" || lowered == "none") {
    out = Level::Off;
  } else {
    return false;
  }
  return true;
}

void set_level(Level level) {
  state().level.store(level);
}

Level level() {
  return state().level.load();
}

bool enabled(Level msg_level) {
  const Level configured = level();
  if (configured == Level::Off || msg_level == Level::Off) {
    return false;
  }
  return static_cast<std::uint8_t>(msg_level) <= static_cast<std::uint8_t>(configured);
}

void set_sink(std::FILE* sink) {
  std::lock_guard lock(state().mutex);
  state().sink = sink;
}

void write(Level msg_level, std::string_view component, std::string_view message) {
  if (!enabled(msg_level)) {
    return;
  }

  auto& s = state();
  std::lock_guard lock(s.mutex);
  std::FILE* out = s.sink != nullptr ? s.sink : stderr;
  std::fprintf(out, "[%lld] %-5s %.*s: %.*s\n", static_cast<long long>(util::unix_timestamp_now()),
               level_name(msg_level), static_cast<int>(component.size()), component.data(),
               static_cast<int>(message.size()), message.data());
  std::fflush(out);
}

}  // namespace petchain::log
