#include <tanksim/log.hpp>
#include <atomic>
#include <cstdio>
#include <mutex>
#include <string>
#include <utility>

namespace tanksim {

namespace {

std::atomic<LogLevel> g_level{LogLevel::Info};
std::mutex g_sink_mutex;
LogSink g_sink;

void stderr_sink(LogLevel level, std::string_view subsystem, std::string_view message) {
  const std::string tag(subsystem);
  std::fprintf(stderr, "[%-7s] [%-10s] %.*s\n", log_level_name(level), tag.c_str(),
               static_cast<int>(message.size()), message.data());
}

} // namespace

void set_log_level(LogLevel level) { g_level.store(level, std::memory_order_relaxed); }

LogLevel log_level() { return g_level.load(std::memory_order_relaxed); }

void set_log_sink(LogSink sink) {
  std::lock_guard<std::mutex> lk(g_sink_mutex);
  g_sink = std::move(sink);
}

const char* log_level_name(LogLevel level) {
  switch (level) {
    case LogLevel::Error:   return "ERROR";
    case LogLevel::Warning: return "WARNING";
    case LogLevel::Info:    return "INFO";
    case LogLevel::Debug:   return "DEBUG";
  }
  return "UNKNOWN";
}

void log_message(LogLevel level, std::string_view subsystem, std::string_view message) {
  if (level != LogLevel::Error && level > log_level()) return;

  std::lock_guard<std::mutex> lk(g_sink_mutex);
  if (g_sink) {
    g_sink(level, subsystem, message);
  } else {
    stderr_sink(level, subsystem, message);
  }
}

} // namespace tanksim
