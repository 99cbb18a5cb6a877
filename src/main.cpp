#include <pistache/endpoint.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <iostream>
#include <memory>
#include "../include/renko/chart_api.hpp"
#include "../include/renko/config.hpp"
#include "../include/renko/renko_service.hpp"
#include "../include/renko/result_cache.hpp"
#include "../include/renko/tick_loader.hpp"

using namespace Pistache;
using namespace renko;

int main(int argc, char* argv[]) {
    ServerConfig config;
    try {
        if (argc > 1) config = load_config(argv[1]);
    } catch (const std::exception& e) {
        std::cerr << "[server] " << e.what() << std::endl;
        return 1;
    }

    std::error_code ec;
    if (!std::filesystem::exists(config.data_dir, ec)) {
        std::cout << "[server] Data folder does not exist, creating " << config.data_dir << std::endl;
        std::filesystem::create_directories(config.data_dir, ec);
        if (ec) {
            std::cerr << "[server] Cannot create " << config.data_dir << ": " << ec.message() << std::endl;
        }
    }

    FileTickLoader loader(config.data_dir);
    ResultCache cache(std::chrono::seconds(config.pipeline.cache_ttl_seconds));
    RenkoService service(loader, cache, config.pipeline, config.output_dir);

    auto files = loader.scan_available_files();
    std::cout << "[server] Found " << files.size() << " data files in " << config.data_dir << std::endl;

    Address addr(Ipv4::any(), Port(static_cast<uint16_t>(config.port)));
    ChartAPI api(addr, std::make_unique<ChartController>(service, loader, cache, config));

    try {
        api.init(static_cast<size_t>(config.threads));
    } catch (const std::exception& e) {
        std::cerr << "[server] Failed to initialise endpoint: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "Renko chart API running on http://localhost:" << config.port << "\n"
              << "  POST /api/load-file\n"
              << "  GET  /api/list-files\n"
              << "  GET  /api/health\n"
              << "  GET  /api/cache-info\n"
              << "  POST /api/cache/invalidate\n"
              << "  GET  /api/export/:filename\n"
              << "  brick strategy: " << to_string(config.pipeline.brick_strategy)
              << " (atr_lookback " << config.pipeline.atr_lookback << ")" << std::endl;

    try {
        api.start();
    } catch (const std::exception& e) {
        std::cerr << "[server] Failed to start server: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "[server] Shutting down. Final stats: "
              << api.controller().stats().to_json().dump() << std::endl;
    std::cout << "[server] Cached files:";
    for (const auto& row : cache.inspect()) std::cout << " " << row.key;
    std::cout << std::endl;
    api.stop();
    return 0;
}
