#include "../include/renko/config.hpp"
#include <fstream>
#include <stdexcept>

namespace renko {

void validate(const ServerConfig& config) {
    const auto& p = config.pipeline;
    if (config.port <= 0 || config.port > 65535) {
        throw std::invalid_argument("port must be in 1..65535");
    }
    if (config.threads <= 0) throw std::invalid_argument("threads must be positive");
    if (p.bucket_width_seconds <= 0) throw std::invalid_argument("bucket_width_seconds must be positive");
    if (p.atr_lookback <= 0) throw std::invalid_argument("atr_lookback must be positive");
    if (p.cache_ttl_seconds < 0) throw std::invalid_argument("cache_ttl_seconds must not be negative");
    if (p.brick_padding < 0.0 || p.brick_padding >= 1.0) {
        throw std::invalid_argument("brick_padding must be in [0, 1)");
    }
    if (!(p.min_brick_size > 0.0)) throw std::invalid_argument("min_brick_size must be positive");
}

ServerConfig config_from_json(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Configuration must be a JSON object");
    }
    ServerConfig config;
    try {
        if (j.contains("port"))
            config.port = j["port"].get<int>();
        if (j.contains("threads"))
            config.threads = j["threads"].get<int>();
        if (j.contains("data_dir"))
            config.data_dir = j["data_dir"].get<std::string>();
        if (j.contains("output_dir"))
            config.output_dir = j["output_dir"].get<std::string>();
        if (j.contains("bucket_width_seconds"))
            config.pipeline.bucket_width_seconds = j["bucket_width_seconds"].get<long long>();
        if (j.contains("atr_lookback"))
            config.pipeline.atr_lookback = j["atr_lookback"].get<int>();
        if (j.contains("brick_strategy"))
            config.pipeline.brick_strategy = parse_brick_strategy(j["brick_strategy"].get<std::string>());
        if (j.contains("cache_ttl_seconds"))
            config.pipeline.cache_ttl_seconds = j["cache_ttl_seconds"].get<long long>();
        if (j.contains("brick_padding"))
            config.pipeline.brick_padding = j["brick_padding"].get<double>();
        if (j.contains("min_brick_size"))
            config.pipeline.min_brick_size = j["min_brick_size"].get<double>();
    } catch (const json::type_error& e) {
        throw std::invalid_argument(std::string("Bad configuration value: ") + e.what());
    }
    validate(config);
    return config;
}

ServerConfig load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::invalid_argument("Cannot open config file " + path);
    }
    json j;
    try {
        j = json::parse(in);
    } catch (const json::parse_error& e) {
        throw std::invalid_argument("Config " + path + " is not valid JSON: " + e.what());
    }
    return config_from_json(j);
}

json config_to_json(const ServerConfig& config) {
    return {
        {"port", config.port},
        {"threads", config.threads},
        {"data_dir", config.data_dir},
        {"output_dir", config.output_dir},
        {"bucket_width_seconds", config.pipeline.bucket_width_seconds},
        {"atr_lookback", config.pipeline.atr_lookback},
        {"brick_strategy", to_string(config.pipeline.brick_strategy)},
        {"cache_ttl_seconds", config.pipeline.cache_ttl_seconds},
        {"brick_padding", config.pipeline.brick_padding},
        {"min_brick_size", config.pipeline.min_brick_size}
    };
}

} // namespace renko
