#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include "types.hpp"

namespace renko {

using json = nlohmann::json;

struct ServerConfig {
    int port = 5000;
    int threads = 4;
    std::string data_dir = "data/tick/";
    std::string output_dir = "data/output/ohlc/";
    PipelineConfig pipeline;
};

// Missing keys keep their defaults. Throws std::invalid_argument on bad values.
ServerConfig config_from_json(const json& j);
ServerConfig load_config(const std::string& path);
json config_to_json(const ServerConfig& config);

void validate(const ServerConfig& config);

} // namespace renko
