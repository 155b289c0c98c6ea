#include <catch2/catch_test_macros.hpp>
#include <sstream>
#include <string>
#include <vector>

#include <tanksim/log.hpp>
#include <tanksim/state_io.hpp>

using namespace tanksim;

namespace {

struct Captured {
  LogLevel level;
  std::string subsystem;
  std::string message;
};

// Installs a capturing sink for the lifetime of the object.
struct SinkGuard {
  std::vector<Captured> lines;
  LogLevel saved = log_level();

  SinkGuard() {
    set_log_sink([this](LogLevel level, std::string_view subsystem, std::string_view message) {
      lines.push_back(Captured{level, std::string(subsystem), std::string(message)});
    });
  }
  ~SinkGuard() {
    set_log_sink({});
    set_log_level(saved);
  }
};

} // namespace

TEST_CASE("log level filters everything but errors") {
  SinkGuard guard;
  set_log_level(LogLevel::Warning);

  log_debug(kLogSim, "hidden");
  log_info(kLogSim, "hidden too");
  log_warning(kLogSim, "shown");
  REQUIRE(guard.lines.size() == 1);
  REQUIRE(guard.lines[0].level == LogLevel::Warning);
  REQUIRE(guard.lines[0].subsystem == "Sim");
  REQUIRE(guard.lines[0].message == "shown");

  set_log_level(LogLevel::Error);
  log_warning(kLogSim, "hidden");
  log_error(kLogSim, "always");
  REQUIRE(guard.lines.size() == 2);
  REQUIRE(guard.lines[1].level == LogLevel::Error);

  set_log_level(LogLevel::Debug);
  log_debug(kLogGrid, "verbose");
  REQUIRE(guard.lines.size() == 3);
  REQUIRE(guard.lines[2].subsystem == "Grid");
}

TEST_CASE("level names") {
  REQUIRE(std::string(log_level_name(LogLevel::Error)) == "ERROR");
  REQUIRE(std::string(log_level_name(LogLevel::Warning)) == "WARNING");
  REQUIRE(std::string(log_level_name(LogLevel::Info)) == "INFO");
  REQUIRE(std::string(log_level_name(LogLevel::Debug)) == "DEBUG");
}

TEST_CASE("rejected state input is reported with its line") {
  SinkGuard guard;
  set_log_level(LogLevel::Warning);

  std::istringstream in("tanksim-state 1\ntime 0\nseed oops\n");
  REQUIRE_FALSE(read_state(in).has_value());
  REQUIRE(guard.lines.size() == 1);
  REQUIRE(guard.lines[0].subsystem == "State");
  REQUIRE(guard.lines[0].message.find("line 3") != std::string::npos);
}
