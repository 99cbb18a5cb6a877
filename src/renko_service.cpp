#include "../include/renko/renko_service.hpp"
#include "../include/renko/brick_size.hpp"
#include "../include/renko/errors.hpp"
#include "../include/renko/renko.hpp"
#include "../include/renko/resampler.hpp"
#include "../include/renko/utils.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <utility>

namespace fs = std::filesystem;

namespace renko {

RenkoService::RenkoService(const TickLoader& loader, ResultCache& cache,
                           PipelineConfig config, std::string output_dir)
    : loader_(loader), cache_(cache), config_(config), output_dir_(std::move(output_dir)) {}

void RenkoService::export_ohlc(const std::string& source, const std::vector<Candle>& candles) const {
    fs::create_directories(output_dir_);
    fs::path out = fs::path(output_dir_) / (source + "_ohlc.csv");
    std::ostringstream tmp_name;
    tmp_name << out.filename().string() << ".tmp." << std::this_thread::get_id();
    fs::path tmp = out.parent_path() / tmp_name.str();

    {
        std::ofstream file(tmp);
        if (!file) {
            throw std::runtime_error("Failed to open " + tmp.string() + " for writing");
        }
        file << candles_to_csv(candles);
        file.close();
        if (!file) {
            fs::remove(tmp);
            throw std::runtime_error("Failed to write " + tmp.string());
        }
    }
    fs::rename(tmp, out);
}

RenkoResult RenkoService::compute(const std::string& source) {
    auto start = std::chrono::steady_clock::now();
    ++computations_;

    LoadedTicks loaded = loader_.load(source);

    auto candles = resample_ohlc(loaded.ticks, config_.bucket_width_seconds * 1000);
    if (candles.empty()) {
        throw RenkoError(ErrorKind::InsufficientData,
                         "No data remained after resampling " + loaded.path);
    }

    RenkoResult result;
    result.source = loaded.source;
    result.source_path = loaded.path;
    result.original_rows = loaded.ticks.size();
    result.ohlc_bars = candles.size();
    result.brick_size = estimate_brick_size(candles, config_);
    result.bricks = build_renko(candles, result.brick_size.value, config_.brick_padding);

    if (!output_dir_.empty()) export_ohlc(loaded.source, candles);

    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
    result.compute_seconds = elapsed.count();
    return result;
}

LoadResponse RenkoService::load(const std::string& source, bool force_refresh) {
    auto start = std::chrono::steady_clock::now();
    std::string key = trim(source);
    if (force_refresh) cache_.invalidate(key);

    auto lookup = cache_.get_or_compute(key, [this, &key]() { return compute(key); });

    LoadResponse response;
    response.entry = lookup.entry;
    response.cache_hit = lookup.hit;
    response.cache_age_seconds = lookup.age_seconds;
    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
    response.processing_seconds = elapsed.count();
    return response;
}

} // namespace renko
