#pragma once
#include <vector>
#include "types.hpp"

namespace renko {

// Close-only Renko walk: a brick forms whenever a bar close is at least one
// brick size away from the last brick value. Intrabar highs and lows do not
// trigger bricks.
class RenkoBuilder {
public:
    explicit RenkoBuilder(double brick_size);

    // Emits floor(|close - last value| / brick size) bricks. Throws
    // RenkoError(DegenerateSeries) when a brick would not move the value.
    void addClose(long long timestamp, double close);
    void buildFromOHLC(const std::vector<Candle>& candles);

    // Raw value/size/dir series; open/high/low/close are left zero.
    const std::vector<RenkoBrick>& getRenkoBricks() const { return bricks_; }

private:
    double brick_size_;
    bool anchored_ = false;
    double last_value_ = 0.0;
    std::vector<RenkoBrick> bricks_;

    void push(long long timestamp, int dir);
};

// Fills open/high/low/close from value and size: open is the previous
// brick's value (value - size for the first), high/low are padded by
// padding * size.
void synthesize_ohlc(std::vector<RenkoBrick>& bricks, double padding);

// Throws RenkoError(NoBricksFormed) when the series never moves a full brick.
std::vector<RenkoBrick> build_renko(
    const std::vector<Candle>& candles,
    double brick_size,
    double padding = 0.1
);

} // namespace renko
