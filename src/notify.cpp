#include "notify.hpp"
#include "api_methods.hpp"
#include "util.hpp"

#include <optional>
#include <set>
#include <utility>

namespace cmdb_fetch {

std::string formatApiError(const std::string& system,
                           const std::string& apiName,
                           const nlohmann::json& kwargs,
                           const ApiResponse& result) {
    return system + " API " + apiName + " call failed, kwargs: " +
           dumpForLog(kwargs) + ", result: " + dumpForLog(nlohmann::json(result));
}

NotifyResult resolveNotifyReceivers(CmdbClient& client,
                                    std::int64_t bizCcId,
                                    const std::string& supplierAccount,
                                    const std::vector<std::string>& receiverGroups,
                                    const std::string& moreReceiver,
                                    std::ostream& log) {
    const auto moreReceivers = splitAndTrim(moreReceiver);

    if (receiverGroups.empty()) {
        return NotifyResult{true, "success", joinStrings(moreReceivers)};
    }

    const std::string apiName = "cc." + api::kSearchBusiness;
    const nlohmann::json kwargs = {
        {"bk_supplier_account", supplierAccount},
        {"condition", {{"bk_biz_id", bizCcId}}}
    };

    ApiResponse ccResult;
    try {
        ccResult = client.call(api::kSearchBusiness, kwargs);
    } catch (const std::exception& e) {
        const std::string message = "CMDB API " + apiName + " call failed, kwargs: " +
                                    dumpForLog(kwargs) + ", error: " + e.what();
        log << "[Notify] " << message << "\n";
        return NotifyResult{false, message, std::nullopt};
    }

    if (!ccResult.result) {
        const std::string message = formatApiError("CMDB", apiName, kwargs, ccResult);
        log << "[Notify] " << message << "\n";
        return NotifyResult{false, message, std::nullopt};
    }

    const bool hasBusinessList = ccResult.data.is_object() &&
                                 ccResult.data.contains("count") &&
                                 ccResult.data["count"].is_number_integer() &&
                                 ccResult.data.contains("info") &&
                                 ccResult.data["info"].is_array();
    const std::int64_t bizCount =
        hasBusinessList ? ccResult.data["count"].get<std::int64_t>() : -1;

    if (bizCount != 1 || ccResult.data["info"].empty()) {
        log << "[Notify] " << formatApiError("CMDB", apiName, kwargs, ccResult) << "\n";
        return NotifyResult{
            false,
            "business is not unique in CMDB, biz id: " + std::to_string(bizCcId) +
                ", returned count: " + std::to_string(bizCount),
            std::nullopt};
    }

    const auto& bizData = ccResult.data["info"][0];
    std::set<std::string> receivers;

    for (const auto& group : receiverGroups) {
        auto role = api::kRoleFieldByGroup.find(group);
        if (role == api::kRoleFieldByGroup.end()) {
            const std::string message = "unknown receiver group: " + group;
            log << "[Notify] " << message << "\n";
            return NotifyResult{false, message, std::nullopt};
        }

        if (!bizData.contains(role->second) || !bizData[role->second].is_string()) {
            continue;
        }
        for (auto& name : splitAndTrim(bizData[role->second].get<std::string>())) {
            receivers.insert(std::move(name));
        }
    }

    if (!moreReceiver.empty()) {
        receivers.insert(moreReceivers.begin(), moreReceivers.end());
    }
    receivers.erase(std::string());

    return NotifyResult{true, "success",
                        joinStrings(std::vector<std::string>(receivers.begin(),
                                                             receivers.end()))};
}

NotifyResult resolveNotifyReceivers(CmdbClient& client,
                                    std::int64_t bizCcId,
                                    const std::string& supplierAccount,
                                    const std::string& receiverGroups,
                                    const std::string& moreReceiver,
                                    std::ostream& log) {
    std::vector<std::string> groups;
    if (!receiverGroups.empty()) {
        for (auto& group : splitAndTrim(receiverGroups)) {
            if (!group.empty()) groups.push_back(std::move(group));
        }
    }
    return resolveNotifyReceivers(client, bizCcId, supplierAccount, groups,
                                  moreReceiver, log);
}

} // namespace cmdb_fetch
