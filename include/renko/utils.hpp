#pragma once
#include <string>
#include <vector>
#include "types.hpp"

namespace renko {

// "YYYY-MM-DD[ T]HH:MM:SS[.fff][Z|+HH:MM]" (UTC unless an offset is given)
// or a numeric epoch in seconds. Throws std::invalid_argument.
long long parse_timestamp_ms(const std::string& text);

// "YYYY-MM-DDTHH:MM:SS", with ".mmm" appended when the millis are non-zero.
std::string format_timestamp_iso(long long ms);

// Epoch seconds beyond this do not fit in milliseconds as long long.
constexpr double kMaxEpochSeconds = 9.2e15;

// Throws std::invalid_argument outside +-kMaxEpochSeconds.
long long epoch_seconds_to_ms(double seconds);

std::string candles_to_csv(const std::vector<Candle>& candles);
std::string bricks_to_csv(const std::vector<RenkoBrick>& bricks);

std::string trim(const std::string& input);
std::string lowercase(std::string input);

} // namespace renko
