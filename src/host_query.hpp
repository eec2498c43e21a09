#pragma once

#include "batch_request.hpp"
#include "cmdb_client.hpp"
#include "models.hpp"

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace cmdb_fetch {

/// Which hosts of a business to list and which host fields to return.
struct HostQuery {
    std::int64_t             bizId = 0;
    std::string              supplierAccount = "0";
    std::vector<std::string> fields;    // empty: the API's default field set
    std::vector<std::string> ipList;    // empty: every host of the business
};

/// Fixed params shared by the host list APIs. A non-empty ipList becomes a
/// `host_property_filter` rule on bk_host_innerip.
nlohmann::json buildHostQueryParams(const HostQuery& query);

/// All hosts of the business with the sets and modules they belong to.
/// Empty when the business has no hosts or a request failed (see the log).
std::vector<HostTopo> fetchBusinessHostTopo(CmdbClient& client,
                                            const BatchRequester& requester,
                                            const HostQuery& query);

/// All hosts of the business as raw records.
std::vector<Record> fetchBusinessHosts(CmdbClient& client,
                                       const BatchRequester& requester,
                                       const HostQuery& query);

} // namespace cmdb_fetch
