#include "../include/renko/serialization.hpp"
#include "../include/renko/utils.hpp"
#include <chrono>
#include <cmath>

namespace renko {

static double round_to(double v, int digits) {
    double scale = std::pow(10.0, digits);
    return std::round(v * scale) / scale;
}

json bricks_to_json(const std::vector<RenkoBrick>& bricks) {
    json rows = json::array();
    for (const auto& b : bricks) {
        rows.push_back({
            {"date", format_timestamp_iso(b.brick_time)},
            {"open", b.open},
            {"high", b.high},
            {"low", b.low},
            {"close", b.close}
        });
    }
    return rows;
}

json load_response_to_json(const LoadResponse& response) {
    const RenkoResult& r = response.entry->result;
    json out = {
        {"renko", bricks_to_json(r.bricks)},
        {"filename", r.source},
        {"original_rows", r.original_rows},
        {"ohlc_bars", r.ohlc_bars},
        {"renko_bars", r.bricks.size()},
        {"brick_size", r.brick_size.value},
        {"brick_strategy", to_string(r.brick_size.strategy)},
        {"cache_hit", response.cache_hit},
        {"cache_age_seconds", round_to(response.cache_age_seconds, 3)},
        {"processing_time", round_to(response.processing_seconds, 3)},
        {"compute_time", round_to(r.compute_seconds, 3)},
        {"source", "Real Tick Data"}
    };
    if (r.brick_size.fallback || r.brick_size.substituted_minimum) {
        out["fallback_reason"] = r.brick_size.fallback_reason;
        out["min_brick_size_substituted"] = r.brick_size.substituted_minimum;
    }
    return out;
}

json cache_info_to_json(const std::vector<CacheInfo>& rows) {
    json files = json::object();
    for (const auto& row : rows) {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            row.cached_at.time_since_epoch()).count();
        files[row.key] = {
            {"cached_at", format_timestamp_iso(ms)},
            {"age_seconds", round_to(row.age_seconds, 3)},
            {"bars_count", row.brick_count},
            {"original_rows", row.original_rows},
            {"file_path", row.source_path}
        };
    }
    return {
        {"cached_files", files},
        {"total_cached", rows.size()}
    };
}

json error_to_json(const RenkoError& error) {
    return {
        {"error", error.what()},
        {"kind", to_string(error.kind())}
    };
}

int http_status_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::SourceNotFound: return 404;
        case ErrorKind::UnsupportedFormat: return 415;
        case ErrorKind::MissingRequiredField:
        case ErrorKind::InvalidRecord:
        case ErrorKind::InsufficientData:
        case ErrorKind::DegenerateSeries:
        case ErrorKind::NoBricksFormed:
            return 422;
    }
    return 500;
}

} // namespace renko
