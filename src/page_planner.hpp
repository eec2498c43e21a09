#pragma once

#include "models.hpp"

#include <vector>

namespace cmdb_fetch {

/// Default number of records requested per page.
inline constexpr int kDefaultPageLimit = 500;

/// Split [0, count) into consecutive windows of @p limit records.
/// Every window asks for the full @p limit; the service truncates the last one.
/// A non-positive @p count yields no windows.
/// Throws std::invalid_argument if @p limit is not positive.
std::vector<PageWindow> planPages(int count, int limit = kDefaultPageLimit);

} // namespace cmdb_fetch
