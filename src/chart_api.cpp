#include "../include/renko/chart_api.hpp"
#include "../include/renko/errors.hpp"
#include "../include/renko/serialization.hpp"
#include "../include/renko/utils.hpp"
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace renko {

static void send_json(Http::ResponseWriter& response, Http::Code code, const json& body) {
    response.headers().add<Http::Header::ContentType>(MIME(Application, Json));
    response.send(code, body.dump());
}

static std::string now_iso() {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return format_timestamp_iso(ms);
}

json RequestStats::to_json() const {
    return {
        {"requests_served", requests_served.load()},
        {"files_processed", files_processed.load()},
        {"errors", errors.load()}
    };
}

// -------- ChartController --------

ChartController::ChartController(RenkoService& service, const FileTickLoader& loader,
                                 ResultCache& cache, const ServerConfig& config)
    : service_(service), loader_(loader), cache_(cache), config_(config) {}

void ChartController::setupRoutes(Rest::Router& router) {
    using namespace Rest;

    Routes::Get(router, "/", Routes::bind(&ChartController::index, this));
    Routes::Post(router, "/api/load-file", Routes::bind(&ChartController::loadFile, this));
    Routes::Get(router, "/api/list-files", Routes::bind(&ChartController::listFiles, this));
    Routes::Get(router, "/api/health", Routes::bind(&ChartController::health, this));
    Routes::Get(router, "/api/cache-info", Routes::bind(&ChartController::cacheInfo, this));
    Routes::Post(router, "/api/cache/invalidate", Routes::bind(&ChartController::invalidateCache, this));
    Routes::Get(router, "/api/export/:filename", Routes::bind(&ChartController::exportBricks, this));
}

std::string ChartController::uptime() const {
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now() - stats_.start_time).count();
    std::ostringstream oss;
    oss << secs / 3600 << ":"
        << std::setw(2) << std::setfill('0') << (secs / 60) % 60 << ":"
        << std::setw(2) << std::setfill('0') << secs % 60;
    return oss.str();
}

void ChartController::index(const Rest::Request&, Http::ResponseWriter response) {
    json info = {
        {"message", "Renko Chart API"},
        {"endpoints", {
            {"POST /api/load-file", "Build (or reuse) the Renko chart for a tick file"},
            {"GET /api/list-files", "List tick files in the data folder"},
            {"GET /api/health", "Health check"},
            {"GET /api/cache-info", "Cached results"},
            {"POST /api/cache/invalidate", "Drop one cached file, or all"},
            {"GET /api/export/:filename", "Cached bricks as CSV"}
        }}
    };
    send_json(response, Http::Code::Ok, info);
}

void ChartController::loadFile(const Rest::Request& request, Http::ResponseWriter response) {
    ++stats_.requests_served;
    std::string filename;
    bool force_refresh = false;

    try {
        json body = json::parse(request.body());
        if (!body.is_object() || !body.contains("filename") || !body["filename"].is_string()) {
            send_json(response, Http::Code::Bad_Request, {{"error", "Filename is required"}});
            return;
        }
        filename = trim(body["filename"].get<std::string>());
        if (body.contains("force_refresh")) force_refresh = body["force_refresh"].get<bool>();
    } catch (const json::exception& e) {
        send_json(response, Http::Code::Bad_Request, {{"error", std::string("Invalid request body: ") + e.what()}});
        return;
    }
    if (filename.empty()) {
        send_json(response, Http::Code::Bad_Request, {{"error", "Filename cannot be empty"}});
        return;
    }

    std::cout << "[api] load-file " << filename << (force_refresh ? " (force refresh)" : "") << std::endl;

    try {
        auto result = service_.load(filename, force_refresh);
        if (!result.cache_hit) ++stats_.files_processed;

        const auto& brick_size = result.entry->result.brick_size;
        if (!result.cache_hit && (brick_size.fallback || brick_size.substituted_minimum)) {
            std::cout << "[api] " << filename << ": brick size fell back to "
                      << to_string(brick_size.strategy) << " = " << brick_size.value
                      << " (" << brick_size.fallback_reason << ")" << std::endl;
        }

        json body = load_response_to_json(result);
        body["stats"] = stats_.to_json();
        body["stats"]["server_uptime"] = uptime();

        std::cout << "[api] " << filename << ": " << result.entry->result.bricks.size() << " bricks "
                  << (result.cache_hit ? "from cache" : "computed") << " in "
                  << result.processing_seconds << "s" << std::endl;
        send_json(response, Http::Code::Ok, body);

    } catch (const RenkoError& e) {
        ++stats_.errors;
        std::cerr << "[api] " << filename << ": " << to_string(e.kind()) << ": " << e.what() << std::endl;
        json body = error_to_json(e);
        body["filename"] = filename;
        if (e.kind() == ErrorKind::SourceNotFound) {
            body["suggestion"] = "Check filename and ensure file exists in " + loader_.data_dir();
            body["available_files"] = loader_.scan_available_files();
        }
        send_json(response, static_cast<Http::Code>(http_status_for(e.kind())), body);

    } catch (const std::exception& e) {
        ++stats_.errors;
        std::cerr << "[api] Error processing file " << filename << ": " << e.what() << std::endl;
        send_json(response, Http::Code::Internal_Server_Error, {
            {"error", e.what()},
            {"filename", filename},
            {"details", "Check server logs for more information"}
        });
    }
}

void ChartController::listFiles(const Rest::Request&, Http::ResponseWriter response) {
    auto files = loader_.scan_available_files();
    send_json(response, Http::Code::Ok, {
        {"files", files},
        {"count", files.size()},
        {"folder", loader_.data_dir()},
        {"supported_formats", supported_extensions()}
    });
}

void ChartController::health(const Rest::Request&, Http::ResponseWriter response) {
    std::error_code ec;
    bool folder_exists = std::filesystem::is_directory(loader_.data_dir(), ec);
    auto files = folder_exists ? loader_.scan_available_files() : std::vector<std::string>{};

    json status = {
        {"status", "healthy"},
        {"timestamp", now_iso()},
        {"server", {
            {"port", config_.port},
            {"threads", config_.threads},
            {"uptime", uptime()}
        }},
        {"data", {
            {"folder_exists", folder_exists},
            {"folder_path", loader_.data_dir()},
            {"available_files", files.size()},
            {"cached_files", cache_.size()},
            {"tracked_keys", cache_.tracked_keys()},
            {"supported_formats", supported_extensions()}
        }},
        {"stats", stats_.to_json()},
        {"config", config_to_json(config_)}
    };
    if (!folder_exists) {
        status["status"] = "warning";
        status["warnings"] = {"Data folder does not exist"};
    } else if (files.empty()) {
        status["status"] = "warning";
        status["warnings"] = {"No data files found"};
    }
    send_json(response, Http::Code::Ok, status);
}

void ChartController::cacheInfo(const Rest::Request&, Http::ResponseWriter response) {
    json body = cache_info_to_json(cache_.inspect());
    body["ttl_seconds"] = cache_.ttl().count();
    body["cache_folder"] = config_.output_dir;
    send_json(response, Http::Code::Ok, body);
}

void ChartController::invalidateCache(const Rest::Request& request, Http::ResponseWriter response) {
    std::string filename;
    try {
        if (!request.body().empty()) {
            json body = json::parse(request.body());
            if (body.contains("filename")) filename = trim(body["filename"].get<std::string>());
        }
    } catch (const json::exception& e) {
        send_json(response, Http::Code::Bad_Request, {{"error", std::string("Invalid request body: ") + e.what()}});
        return;
    }

    std::size_t evicted = filename.empty() ? cache_.invalidate_all()
                                           : (cache_.invalidate(filename) ? 1 : 0);
    std::cout << "[api] cache invalidate " << (filename.empty() ? "<all>" : filename)
              << ": " << evicted << " evicted" << std::endl;
    send_json(response, Http::Code::Ok, {{"success", true}, {"evicted", evicted}});
}

void ChartController::exportBricks(const Rest::Request& request, Http::ResponseWriter response) {
    auto filename = request.param(":filename").as<std::string>();
    try {
        auto result = service_.load(filename);
        response.headers().add<Http::Header::ContentType>(MIME(Text, Plain));
        response.send(Http::Code::Ok, bricks_to_csv(result.entry->result.bricks));
    } catch (const RenkoError& e) {
        ++stats_.errors;
        std::cerr << "[api] export " << filename << ": " << e.what() << std::endl;
        send_json(response, static_cast<Http::Code>(http_status_for(e.kind())), error_to_json(e));
    } catch (const std::exception& e) {
        ++stats_.errors;
        std::cerr << "[api] export " << filename << ": " << e.what() << std::endl;
        send_json(response, Http::Code::Internal_Server_Error, {{"error", e.what()}});
    }
}

// -------- ChartAPI --------

ChartAPI::ChartAPI(Address addr, std::unique_ptr<ChartController> controller)
    : httpEndpoint_(std::make_shared<Http::Endpoint>(addr)), controller_(std::move(controller)) {}

void ChartAPI::init(size_t thr) {
    auto opts = Http::Endpoint::options()
        .threads(thr)
        .flags(Tcp::Options::InstallSignalHandler);
    httpEndpoint_->init(opts);
    controller_->setupRoutes(router_);
}

void ChartAPI::start() {
    httpEndpoint_->setHandler(router_.handler());
    httpEndpoint_->serve();
}

void ChartAPI::stop() {
    httpEndpoint_->shutdown();
}

} // namespace renko
