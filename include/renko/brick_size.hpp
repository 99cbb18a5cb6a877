#pragma once
#include <vector>
#include "types.hpp"

namespace renko {

// Mean true range over the last min(lookback, n - 1) bars.
// Throws RenkoError(InsufficientData) with fewer than two bars.
double atr_brick_size(const std::vector<Candle>& candles, int lookback);

// Half the population standard deviation of closes.
// Throws RenkoError(DegenerateSeries) when that is not positive.
double statistical_brick_size(const std::vector<Candle>& candles);

BrickSizeEstimate estimate_brick_size(
    const std::vector<Candle>& candles,
    const PipelineConfig& config
);

} // namespace renko
