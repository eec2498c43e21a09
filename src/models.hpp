#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cmdb_fetch {

/// One CMDB record as returned by the API (a host, a business, ...).
using Record = nlohmann::json;

/// One page of a paginated request: `limit` records starting at `start`.
struct PageWindow {
    int start = 0;
    int limit = 0;

    bool operator==(const PageWindow& other) const {
        return start == other.start && limit == other.limit;
    }
};

/// ESB response envelope: {"result", "code", "message", "request_id", "data"}.
struct ApiResponse {
    bool           result = false;
    int            code   = 0;
    std::string    message;
    std::string    requestId;
    nlohmann::json data;   // null when the call failed
};

struct TopoSet {
    std::int64_t id = 0;   // bk_set_id
    std::string  name;     // bk_set_name
};

struct TopoModule {
    std::int64_t id = 0;   // bk_module_id
    std::string  name;     // bk_module_name
};

/// A host together with the sets and modules it belongs to.
struct HostTopo {
    nlohmann::json          host;
    std::vector<TopoModule> modules;
    std::vector<TopoSet>    sets;
};

/// Outcome of notify-receiver resolution; `data` is a comma-joined name list.
struct NotifyResult {
    bool                       result = false;
    std::string                message;
    std::optional<std::string> data;
};

void to_json(nlohmann::json& j, const PageWindow& w);
void to_json(nlohmann::json& j, const ApiResponse& r);
void to_json(nlohmann::json& j, const TopoSet& s);
void to_json(nlohmann::json& j, const TopoModule& m);
void to_json(nlohmann::json& j, const HostTopo& h);
void to_json(nlohmann::json& j, const NotifyResult& r);

} // namespace cmdb_fetch
