#include "../include/renko/renko.hpp"
#include "../include/renko/errors.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace renko {

RenkoBuilder::RenkoBuilder(double brick_size)
    : brick_size_(brick_size) {
    if (!std::isfinite(brick_size) || brick_size <= 0.0) {
        throw std::invalid_argument("Brick size must be positive");
    }
}

void RenkoBuilder::push(long long timestamp, int dir) {
    RenkoBrick b{};
    b.brick_time = timestamp;
    b.value = last_value_ + dir * brick_size_;
    if (b.value == last_value_) {
        std::ostringstream msg;
        msg << "Brick size " << brick_size_ << " is below the price resolution at " << last_value_;
        throw RenkoError(ErrorKind::DegenerateSeries, msg.str());
    }
    b.size = brick_size_;
    b.dir = dir;
    bricks_.push_back(b);
    last_value_ = b.value;
}

void RenkoBuilder::addClose(long long timestamp, double close) {
    if (!anchored_) {
        last_value_ = close;
        anchored_ = true;
        return;
    }

    double diff = close - last_value_;
    double steps = std::floor(std::abs(diff) / brick_size_);
    int dir = diff > 0 ? +1 : -1;
    for (double i = 0; i < steps; ++i) {
        push(timestamp, dir);
    }
}

void RenkoBuilder::buildFromOHLC(const std::vector<Candle>& candles) {
    bricks_.clear();
    anchored_ = false;
    for (const auto& candle : candles) {
        addClose(candle.time, candle.close);
    }
}

void synthesize_ohlc(std::vector<RenkoBrick>& bricks, double padding) {
    for (std::size_t i = 0; i < bricks.size(); ++i) {
        auto& b = bricks[i];
        b.open = (i == 0) ? b.value - b.size : bricks[i - 1].value;
        b.close = b.value;
        b.high = std::max(b.open, b.close) + padding * b.size;
        b.low = std::min(b.open, b.close) - padding * b.size;
    }
}

std::vector<RenkoBrick> build_renko(
    const std::vector<Candle>& candles,
    double brick_size,
    double padding
) {
    RenkoBuilder builder(brick_size);
    builder.buildFromOHLC(candles);
    std::vector<RenkoBrick> rows = builder.getRenkoBricks();
    synthesize_ohlc(rows, padding);

    if (rows.empty()) {
        std::ostringstream msg;
        msg << "No Renko bricks formed from " << candles.size()
            << " bars with brick size " << brick_size;
        throw RenkoError(ErrorKind::NoBricksFormed, msg.str());
    }
    return rows;
}

} // namespace renko
