#include "../include/renko/resampler.hpp"
#include "../include/renko/errors.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace renko {

long long bucket_end(long long ts, long long bucket_width_ms) {
    // ceil division that also holds for pre-epoch timestamps
    long long q = ts / bucket_width_ms;
    long long r = ts % bucket_width_ms;
    if (r > 0) ++q;
    return q * bucket_width_ms;
}

static void validate_tick(const Tick& t, std::size_t index) {
    if (!t.price) {
        throw RenkoError(ErrorKind::InvalidRecord,
                         "Tick " + std::to_string(index) + " has no price");
    }
    double p = *t.price;
    if (!std::isfinite(p) || p <= 0.0) {
        throw RenkoError(ErrorKind::InvalidRecord,
                         "Tick " + std::to_string(index) + " has non-positive price " + std::to_string(p));
    }
    if (t.size && *t.size < 0) {
        throw RenkoError(ErrorKind::InvalidRecord,
                         "Tick " + std::to_string(index) + " has negative size");
    }
}

std::vector<Candle> resample_ohlc(
    const std::vector<Tick>& ticks,
    long long bucket_width_ms
) {
    if (bucket_width_ms <= 0) {
        throw std::invalid_argument("Bucket width must be positive");
    }
    std::vector<Candle> rows;
    if (ticks.empty()) return rows;

    for (std::size_t i = 0; i < ticks.size(); ++i) validate_tick(ticks[i], i);

    // Work on a copy; stable so equal timestamps keep their arrival order.
    std::vector<Tick> sorted = ticks;
    std::stable_sort(sorted.begin(), sorted.end(), [](const Tick& a, const Tick& b) {
        return a.time < b.time;
    });

    for (const auto& t : sorted) {
        long long label = bucket_end(t.time, bucket_width_ms);
        double price = *t.price;
        double size = static_cast<double>(t.size.value_or(1));

        if (rows.empty() || rows.back().time != label) {
            rows.push_back({label, price, price, price, price, size});
            continue;
        }
        Candle& c = rows.back();
        c.high = std::max(c.high, price);
        c.low = std::min(c.low, price);
        c.close = price;
        c.volume += size;
    }
    return rows;
}

} // namespace renko
