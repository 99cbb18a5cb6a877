#pragma once
#include <vector>
#include "types.hpp"

namespace renko {

// Groups ticks into right-closed, right-labeled buckets of bucket_width_ms.
// Empty buckets are skipped. Input need not be sorted.
std::vector<Candle> resample_ohlc(
    const std::vector<Tick>& ticks,
    long long bucket_width_ms
);

// Label of the bucket (end - width, end] containing ts.
long long bucket_end(long long ts, long long bucket_width_ms);

} // namespace renko
