#include "host_query.hpp"
#include "api_methods.hpp"
#include "mapping.hpp"

namespace cmdb_fetch {

nlohmann::json buildHostQueryParams(const HostQuery& query) {
    nlohmann::json params = {
        {"bk_biz_id", query.bizId},
        {"bk_supplier_account", query.supplierAccount},
        {"fields", query.fields}
    };

    if (!query.ipList.empty()) {
        params["host_property_filter"] = {
            {"condition", "AND"},
            {"rules", nlohmann::json::array({
                {{"field", "bk_host_innerip"}, {"operator", "in"}, {"value", query.ipList}}
            })}
        };
    }
    return params;
}

std::vector<HostTopo> fetchBusinessHostTopo(CmdbClient& client,
                                            const BatchRequester& requester,
                                            const HostQuery& query) {
    const auto records = requester.fetchAll(client.bind(api::kListBizHostsTopo),
                                            buildHostQueryParams(query));

    std::vector<HostTopo> hosts;
    hosts.reserve(records.size());
    for (const auto& record : records) {
        hosts.push_back(parseHostTopo(record));
    }
    return hosts;
}

std::vector<Record> fetchBusinessHosts(CmdbClient& client,
                                       const BatchRequester& requester,
                                       const HostQuery& query) {
    return requester.fetchAll(client.bind(api::kListBizHosts),
                              buildHostQueryParams(query));
}

} // namespace cmdb_fetch
