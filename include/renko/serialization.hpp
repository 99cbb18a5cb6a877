#pragma once
#include <nlohmann/json.hpp>
#include <vector>
#include "errors.hpp"
#include "renko_service.hpp"
#include "result_cache.hpp"
#include "types.hpp"

namespace renko {

using json = nlohmann::json;

// [{date, open, high, low, close}] as the chart front end consumes it.
json bricks_to_json(const std::vector<RenkoBrick>& bricks);

json load_response_to_json(const LoadResponse& response);

json cache_info_to_json(const std::vector<CacheInfo>& rows);

json error_to_json(const RenkoError& error);

// HTTP status the API answers with for each error kind.
int http_status_for(ErrorKind kind);

} // namespace renko
