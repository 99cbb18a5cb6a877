#pragma once
#include <atomic>
#include <memory>
#include <string>
#include "result_cache.hpp"
#include "tick_loader.hpp"
#include "types.hpp"

namespace renko {

struct LoadResponse {
    std::shared_ptr<const CacheEntry> entry;
    bool cache_hit = false;
    double cache_age_seconds = 0.0;
    double processing_seconds = 0.0;
};

// Per-request pipeline: load -> resample -> size -> build -> cache.
// Errors from any stage propagate unchanged; the only recovery is the
// ATR -> statistical brick size fallback, recorded in the result.
class RenkoService {
public:
    RenkoService(const TickLoader& loader, ResultCache& cache,
                 PipelineConfig config, std::string output_dir = "");

    LoadResponse load(const std::string& source, bool force_refresh = false);

    // Runs the pipeline without consulting the cache.
    RenkoResult compute(const std::string& source);

    const PipelineConfig& config() const { return config_; }
    std::size_t computations() const { return computations_.load(); }

private:
    const TickLoader& loader_;
    ResultCache& cache_;
    PipelineConfig config_;
    std::string output_dir_;
    std::atomic<std::size_t> computations_{0};

    void export_ohlc(const std::string& source, const std::vector<Candle>& candles) const;
};

} // namespace renko
