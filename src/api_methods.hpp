#pragma once

#include <map>
#include <string>

namespace cmdb_fetch {
namespace api {

/// Hosts of a business with their set / module topology. Paginated.
inline const std::string kListBizHostsTopo = "list_biz_hosts_topo";

/// Hosts of a business. Paginated.
inline const std::string kListBizHosts = "list_biz_hosts";

/// Business lookup by condition; returns {count, info}.
inline const std::string kSearchBusiness = "search_business";

/// Receiver group -> business field holding the comma-separated members.
inline const std::map<std::string, std::string> kRoleFieldByGroup = {
    {"Maintainers", "bk_biz_maintainer"},
    {"ProductPm",   "bk_biz_productor"},
    {"Developer",   "bk_biz_developer"},
    {"Tester",      "bk_biz_tester"},
};

} // namespace api
} // namespace cmdb_fetch
