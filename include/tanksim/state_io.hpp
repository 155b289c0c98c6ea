#pragma once
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <tanksim/state.hpp>

namespace tanksim {

// Line-oriented text encoding of a SimState. Scalars are written in their
// exact decimal form, so a round trip reproduces the state bit for bit.
//
//   tanksim-state 1
//   time 12
//   seed 42
//   tanks 1
//   tank <id> <px> <py> <vx> <vy> <angle> <turret> <health> <team> <pc> <sp> <n> <stack...> <m> <memory...>
//   bullets 1
//   bullet <id> <px> <py> <vx> <vy>
//
// Always written in the classic locale; the stream's own locale is restored
// afterwards.
void write_state(std::ostream& out, const SimState& state);
std::string state_to_string(const SimState& state);

// Strict reader for the form above. Returns nullopt (and logs a warning
// naming the offending line) on anything else.
std::optional<SimState> read_state(std::istream& in);

// File wrappers. save_state returns false when the file cannot be written.
bool save_state(const std::string& path, const SimState& state);
std::optional<SimState> load_state(const std::string& path);

// FNV-1a (64-bit) over the encoding; equal states hash equally on every platform.
std::uint64_t state_hash(const SimState& state);

} // namespace tanksim
