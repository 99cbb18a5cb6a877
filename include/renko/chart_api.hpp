#pragma once
#include <pistache/endpoint.h>
#include <pistache/http.h>
#include <pistache/net.h>
#include <pistache/router.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include "config.hpp"
#include "renko_service.hpp"
#include "result_cache.hpp"
#include "tick_loader.hpp"

namespace renko {

using namespace Pistache;
using json = nlohmann::json;

struct RequestStats {
    std::chrono::system_clock::time_point start_time = std::chrono::system_clock::now();
    std::atomic<std::size_t> requests_served{0};
    std::atomic<std::size_t> files_processed{0};
    std::atomic<std::size_t> errors{0};

    json to_json() const;
};

class ChartController {
public:
    ChartController(RenkoService& service, const FileTickLoader& loader,
                    ResultCache& cache, const ServerConfig& config);

    void setupRoutes(Rest::Router& router);

    // API endpoints
    void index(const Rest::Request& request, Http::ResponseWriter response);
    void loadFile(const Rest::Request& request, Http::ResponseWriter response);
    void listFiles(const Rest::Request& request, Http::ResponseWriter response);
    void health(const Rest::Request& request, Http::ResponseWriter response);
    void cacheInfo(const Rest::Request& request, Http::ResponseWriter response);
    void invalidateCache(const Rest::Request& request, Http::ResponseWriter response);
    void exportBricks(const Rest::Request& request, Http::ResponseWriter response);

    const RequestStats& stats() const { return stats_; }

private:
    RenkoService& service_;
    const FileTickLoader& loader_;
    ResultCache& cache_;
    const ServerConfig& config_;
    RequestStats stats_;

    std::string uptime() const;
};

class ChartAPI {
public:
    ChartAPI(Address addr, std::unique_ptr<ChartController> controller);
    void init(size_t thr = 2);
    void start();
    void stop();

    const ChartController& controller() const { return *controller_; }

private:
    std::shared_ptr<Http::Endpoint> httpEndpoint_;
    Rest::Router router_;
    std::unique_ptr<ChartController> controller_;
};

} // namespace renko
