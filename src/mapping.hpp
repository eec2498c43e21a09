#pragma once

#include "models.hpp"

#include <nlohmann/json.hpp>
#include <vector>

namespace cmdb_fetch {

/// Parse an ESB response body into an ApiResponse.
/// Throws std::runtime_error if the body is not a JSON object.
ApiResponse parseApiResponse(const nlohmann::json& responseBody);

/// Default item extractor: the `data.info` array of a list API.
/// Throws std::runtime_error if it is missing or not an array.
std::vector<Record> extractInfo(const ApiResponse& response);

/// Default count extractor: the `data.count` field of a list API.
/// Throws std::runtime_error if it is missing, not an integer, negative or
/// too large for an int.
int extractCount(const ApiResponse& response);

/// Reshape one `list_biz_hosts_topo` record into a HostTopo.
/// Throws std::runtime_error if the record is not an object.
HostTopo parseHostTopo(const Record& record);

} // namespace cmdb_fetch
