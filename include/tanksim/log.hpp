#pragma once
#include <functional>
#include <string_view>

namespace tanksim {

// Higher values include lower ones. Errors are never filtered.
enum class LogLevel : int {
  Error = 0,
  Warning = 1,
  Info = 2,
  Debug = 3,
};

// Subsystem tags used by the library itself.
inline constexpr std::string_view kLogGrid = "Grid";
inline constexpr std::string_view kLogState = "State";
inline constexpr std::string_view kLogConfig = "Config";
inline constexpr std::string_view kLogSim = "Sim";

using LogSink = std::function<void(LogLevel level, std::string_view subsystem, std::string_view message)>;

void set_log_level(LogLevel level);
LogLevel log_level();

// Replaces the active sink. An empty function restores the default stderr sink:
//   [WARNING] [State     ] bad header
void set_log_sink(LogSink sink);

const char* log_level_name(LogLevel level);

void log_message(LogLevel level, std::string_view subsystem, std::string_view message);

inline void log_error(std::string_view subsystem, std::string_view message) {
  log_message(LogLevel::Error, subsystem, message);
}
inline void log_warning(std::string_view subsystem, std::string_view message) {
  log_message(LogLevel::Warning, subsystem, message);
}
inline void log_info(std::string_view subsystem, std::string_view message) {
  log_message(LogLevel::Info, subsystem, message);
}
inline void log_debug(std::string_view subsystem, std::string_view message) {
  log_message(LogLevel::Debug, subsystem, message);
}

} // namespace tanksim
