#include "page_planner.hpp"

#include <stdexcept>
#include <string>

namespace cmdb_fetch {

std::vector<PageWindow> planPages(int count, int limit) {
    if (limit <= 0) {
        throw std::invalid_argument("Page limit must be positive, got " +
                                    std::to_string(limit));
    }

    std::vector<PageWindow> windows;
    if (count <= 0) {
        return windows;
    }

    windows.reserve(static_cast<std::size_t>(count / limit + 1));
    // start is widened so a count close to INT_MAX cannot overflow the loop.
    for (long long start = 0; start < count; start += limit) {
        windows.push_back(PageWindow{static_cast<int>(start), limit});
    }
    return windows;
}

} // namespace cmdb_fetch
