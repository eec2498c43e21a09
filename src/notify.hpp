#pragma once

#include "cmdb_client.hpp"
#include "models.hpp"

#include <nlohmann/json.hpp>
#include <cstdint>
#include <iostream>
#include <ostream>
#include <string>
#include <vector>

namespace cmdb_fetch {

/// Resolve the final notification receivers of a business.
///
/// Each receiver group (Maintainers, ProductPm, Developer, Tester) is looked
/// up on the business through `cc.search_business`; the members are merged
/// with @p moreReceiver (comma-separated), deduplicated and sorted. Without
/// receiver groups no call is made and @p moreReceiver is returned as is.
/// Failures are logged to @p log and reported through NotifyResult.
NotifyResult resolveNotifyReceivers(CmdbClient& client,
                                    std::int64_t bizCcId,
                                    const std::string& supplierAccount,
                                    const std::vector<std::string>& receiverGroups,
                                    const std::string& moreReceiver,
                                    std::ostream& log = std::cerr);

/// Same, with the groups given as one comma-separated string.
NotifyResult resolveNotifyReceivers(CmdbClient& client,
                                    std::int64_t bizCcId,
                                    const std::string& supplierAccount,
                                    const std::string& receiverGroups,
                                    const std::string& moreReceiver,
                                    std::ostream& log = std::cerr);

/// "<system> API <api> call failed, kwargs: ..., result: ..." for log lines.
std::string formatApiError(const std::string& system,
                           const std::string& apiName,
                           const nlohmann::json& kwargs,
                           const ApiResponse& result);

} // namespace cmdb_fetch
