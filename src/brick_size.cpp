#include "../include/renko/brick_size.hpp"
#include "../include/renko/errors.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace renko {

static double true_range(const Candle& c, double prev_close) {
    return std::max({c.high - c.low,
                     std::abs(c.high - prev_close),
                     std::abs(c.low - prev_close)});
}

double atr_brick_size(const std::vector<Candle>& candles, int lookback) {
    if (lookback <= 0) {
        throw std::invalid_argument("ATR lookback must be positive");
    }
    if (candles.size() < 2) {
        throw RenkoError(ErrorKind::InsufficientData,
                         "ATR needs at least 2 bars, have " + std::to_string(candles.size()));
    }
    std::size_t n = candles.size();
    std::size_t window = std::min(static_cast<std::size_t>(lookback), n - 1);

    double sum = 0.0;
    for (std::size_t i = n - window; i < n; ++i) {
        sum += true_range(candles[i], candles[i - 1].close);
    }
    double atr = sum / static_cast<double>(window);
    if (!std::isfinite(atr) || atr <= 0.0) {
        throw RenkoError(ErrorKind::DegenerateSeries,
                         "ATR over the last " + std::to_string(window) + " bars is zero");
    }
    return atr;
}

double statistical_brick_size(const std::vector<Candle>& candles) {
    if (candles.empty()) {
        throw RenkoError(ErrorKind::InsufficientData, "No bars to size bricks from");
    }
    double mean = 0.0;
    for (const auto& c : candles) mean += c.close;
    mean /= static_cast<double>(candles.size());

    double var = 0.0;
    for (const auto& c : candles) var += (c.close - mean) * (c.close - mean);
    var /= static_cast<double>(candles.size());

    double size = 0.5 * std::sqrt(var);
    if (!std::isfinite(size) || size <= 0.0) {
        throw RenkoError(ErrorKind::DegenerateSeries,
                         "Close prices have zero variance over " + std::to_string(candles.size()) + " bars");
    }
    return size;
}

BrickSizeEstimate estimate_brick_size(
    const std::vector<Candle>& candles,
    const PipelineConfig& config
) {
    BrickSizeEstimate est{0.0, config.brick_strategy};

    if (config.brick_strategy == BrickStrategy::Atr) {
        try {
            est.value = atr_brick_size(candles, config.atr_lookback);
            return est;
        } catch (const RenkoError& e) {
            est.fallback = true;
            est.fallback_reason = std::string("atr: ") + e.what();
        }
    }

    est.strategy = BrickStrategy::Statistical;
    try {
        est.value = statistical_brick_size(candles);
    } catch (const RenkoError& e) {
        if (e.kind() != ErrorKind::DegenerateSeries) throw;
        est.value = config.min_brick_size;
        est.substituted_minimum = true;
        if (!est.fallback_reason.empty()) est.fallback_reason += "; ";
        est.fallback_reason += std::string("statistical: ") + e.what();
    }
    return est;
}

} // namespace renko
