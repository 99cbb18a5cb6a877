#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace renko {

// Timestamps are milliseconds since the Unix epoch, UTC.
struct Tick {
    long long time;
    std::optional<double> price;
    std::optional<long long> size;
};

struct Candle {
    long long time; // bucket end
    double open, high, low, close, volume;
};

struct RenkoBrick {
    long long brick_time;
    double value;
    double size;
    double open, high, low, close;
    int dir;
};

enum class BrickStrategy {
    Atr,
    Statistical,
};

struct PipelineConfig {
    long long bucket_width_seconds = 60;
    int atr_lookback = 14;
    BrickStrategy brick_strategy = BrickStrategy::Atr;
    long long cache_ttl_seconds = 300;
    double brick_padding = 0.1;
    double min_brick_size = 0.01;
};

struct BrickSizeEstimate {
    double value;
    BrickStrategy strategy;
    bool fallback = false;           // ATR was requested but did not produce the size
    bool substituted_minimum = false; // both strategies failed, min_brick_size used
    std::string fallback_reason;
};

// Everything the pipeline produced for one source; stored whole in the cache.
struct RenkoResult {
    std::string source;
    std::string source_path;
    std::size_t original_rows = 0;
    std::size_t ohlc_bars = 0;
    BrickSizeEstimate brick_size{0.0, BrickStrategy::Atr};
    std::vector<RenkoBrick> bricks;
    double compute_seconds = 0.0;
};

std::string to_string(BrickStrategy strategy);
BrickStrategy parse_brick_strategy(const std::string& name);

} // namespace renko
