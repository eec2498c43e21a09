#pragma once

#include "models.hpp"
#include "page_planner.hpp"
#include "worker_pool.hpp"

#include <nlohmann/json.hpp>
#include <cstddef>
#include <functional>
#include <future>
#include <iostream>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace cmdb_fetch {

/// A remote list API that accepts a `page` object in its params.
/// `invoke` is called concurrently from worker threads.
struct RemoteCall {
    std::string path;   // identity used in log lines, e.g. "cc.list_biz_hosts"
    std::function<ApiResponse(const nlohmann::json& params)> invoke;
};

using ItemExtractor  = std::function<std::vector<Record>(const ApiResponse&)>;
using CountExtractor = std::function<int(const ApiResponse&)>;

/// Settings shared by every aggregation of one BatchRequester.
struct FetchContext {
    std::ostream* log          = &std::cerr;
    int           defaultLimit = kDefaultPageLimit;
    std::size_t   poolSize     = WorkerPool::defaultThreadCount();
    bool          verbose      = false;
};

/// Per-call overrides; unset members fall back to the context / defaults.
struct BatchOptions {
    std::optional<int> limit;
    ItemExtractor      getData;    // default: extractInfo
    CountExtractor     getCount;   // default: extractCount
};

/// Copy of @p fixedParams with `page = {start, limit}` set from @p window.
nlohmann::json buildPageParams(const nlohmann::json& fixedParams,
                               const PageWindow& window);

/// Fetches every record of a paginated API concurrently.
///
/// A single probe request learns the total count, the range is split into
/// windows and all windows are fetched on the worker pool. Once every window
/// has completed the pages are merged in window order. Any failed request
/// (probe or page) is logged and yields an empty result; an API with zero
/// records also yields an empty result, without logging.
class BatchRequester {
public:
    /// @throws std::invalid_argument on a null log stream, a non-positive
    ///         default limit or a zero pool size.
    explicit BatchRequester(const FetchContext& context = FetchContext{});

    std::vector<Record> fetchAll(const RemoteCall& call,
                                 const nlohmann::json& params) const;

    /// @throws std::invalid_argument if the limit is not positive, @p params
    ///         is not an object or @p call has no invoke function. Remote
    ///         failures never throw.
    std::vector<Record> fetchAll(const RemoteCall& call,
                                 const nlohmann::json& params,
                                 const BatchOptions& options) const;

    const FetchContext& context() const { return mContext; }

private:
    /// One submitted window: its request params and pending response.
    struct PageTask {
        nlohmann::json           params;
        std::future<ApiResponse> result;
    };

    FetchContext       mContext;
    mutable WorkerPool mPool;
    mutable std::mutex mLogMutex;

    std::optional<int> probeCount(const RemoteCall& call,
                                  const nlohmann::json& params,
                                  const CountExtractor& getCount) const;

    std::vector<PageTask> dispatch(const RemoteCall& call,
                                   const nlohmann::json& params,
                                   const std::vector<PageWindow>& windows) const;

    void logLine(const std::string& line) const;
};

} // namespace cmdb_fetch
