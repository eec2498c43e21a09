#include "mapping.hpp"

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

namespace cmdb_fetch {

// ---------------------------------------------------------------------------
// Envelope
// ---------------------------------------------------------------------------

ApiResponse parseApiResponse(const nlohmann::json& responseBody) {
    if (!responseBody.is_object()) {
        throw std::runtime_error("Response body is not a JSON object");
    }

    ApiResponse r;
    r.result = responseBody.value("result", false);

    // The gateway reports codes as integers, some components as strings.
    if (responseBody.contains("code")) {
        const auto& code = responseBody["code"];
        if (code.is_number_integer()) {
            r.code = code.get<int>();
        } else if (code.is_string()) {
            try {
                r.code = std::stoi(code.get<std::string>());
            } catch (const std::exception&) {
                r.code = -1;
            }
        }
    }

    if (responseBody.contains("message") && responseBody["message"].is_string()) {
        r.message = responseBody["message"].get<std::string>();
    }
    if (responseBody.contains("request_id") && responseBody["request_id"].is_string()) {
        r.requestId = responseBody["request_id"].get<std::string>();
    }
    if (responseBody.contains("data")) {
        r.data = responseBody["data"];
    }
    return r;
}

std::vector<Record> extractInfo(const ApiResponse& response) {
    if (!response.data.is_object() || !response.data.contains("info")) {
        throw std::runtime_error("Response missing 'data.info' field");
    }
    const auto& info = response.data["info"];
    if (!info.is_array()) {
        throw std::runtime_error("Response field 'data.info' is not an array");
    }
    return std::vector<Record>(info.begin(), info.end());
}

int extractCount(const ApiResponse& response) {
    if (!response.data.is_object() || !response.data.contains("count")) {
        throw std::runtime_error("Response missing 'data.count' field");
    }
    const auto& count = response.data["count"];
    if (!count.is_number_integer()) {
        throw std::runtime_error("Response field 'data.count' is not an integer");
    }
    const auto value = count.get<std::int64_t>();
    if (value < 0 || value > std::numeric_limits<int>::max()) {
        throw std::runtime_error("Response field 'data.count' is out of range: " +
                                 std::to_string(value));
    }
    return static_cast<int>(value);
}

// ---------------------------------------------------------------------------
// Host topology
// ---------------------------------------------------------------------------

HostTopo parseHostTopo(const Record& record) {
    if (!record.is_object()) {
        throw std::runtime_error("Host topo record is not a JSON object");
    }

    HostTopo topo;
    topo.host = record.value("host", nlohmann::json::object());

    if (!record.contains("topo") || !record["topo"].is_array()) {
        return topo;
    }

    for (const auto& parentSet : record["topo"]) {
        if (!parentSet.is_object()) continue;

        TopoSet set;
        set.id   = parentSet.value("bk_set_id", std::int64_t{0});
        set.name = parentSet.value("bk_set_name", "");
        topo.sets.push_back(set);

        if (!parentSet.contains("module") || !parentSet["module"].is_array()) {
            continue;
        }
        for (const auto& parentModule : parentSet["module"]) {
            if (!parentModule.is_object()) continue;

            TopoModule module;
            module.id   = parentModule.value("bk_module_id", std::int64_t{0});
            module.name = parentModule.value("bk_module_name", "");
            topo.modules.push_back(module);
        }
    }
    return topo;
}

// ---------------------------------------------------------------------------
// Serialization
// ---------------------------------------------------------------------------

void to_json(nlohmann::json& j, const PageWindow& w) {
    j = {{"start", w.start}, {"limit", w.limit}};
}

void to_json(nlohmann::json& j, const ApiResponse& r) {
    j = {
        {"result", r.result},
        {"code", r.code},
        {"message", r.message},
        {"request_id", r.requestId},
        {"data", r.data}
    };
}

void to_json(nlohmann::json& j, const TopoSet& s) {
    j = {{"bk_set_id", s.id}, {"bk_set_name", s.name}};
}

void to_json(nlohmann::json& j, const TopoModule& m) {
    j = {{"bk_module_id", m.id}, {"bk_module_name", m.name}};
}

void to_json(nlohmann::json& j, const HostTopo& h) {
    j = {{"host", h.host}, {"module", h.modules}, {"set", h.sets}};
}

void to_json(nlohmann::json& j, const NotifyResult& r) {
    j = {{"result", r.result}, {"message", r.message}};
    j["data"] = r.data ? nlohmann::json(*r.data) : nlohmann::json(nullptr);
}

} // namespace cmdb_fetch
