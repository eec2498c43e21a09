#include "batch_request.hpp"
#include "mapping.hpp"
#include "util.hpp"

#include <iterator>
#include <stdexcept>
#include <utility>

namespace cmdb_fetch {

namespace {

const FetchContext& checkedContext(const FetchContext& context) {
    if (context.log == nullptr) {
        throw std::invalid_argument("FetchContext.log must not be null");
    }
    if (context.defaultLimit <= 0) {
        throw std::invalid_argument("FetchContext.defaultLimit must be positive");
    }
    return context;
}

} // namespace

nlohmann::json buildPageParams(const nlohmann::json& fixedParams,
                               const PageWindow& window) {
    nlohmann::json params = fixedParams.is_null() ? nlohmann::json::object()
                                                  : fixedParams;
    params["page"] = {{"start", window.start}, {"limit", window.limit}};
    return params;
}

BatchRequester::BatchRequester(const FetchContext& context)
    : mContext(checkedContext(context))
    , mPool(mContext.poolSize) {}

// ---------------------------------------------------------------------------
// Public: aggregated fetch
// ---------------------------------------------------------------------------

std::vector<Record> BatchRequester::fetchAll(const RemoteCall& call,
                                             const nlohmann::json& params) const {
    return fetchAll(call, params, BatchOptions{});
}

std::vector<Record> BatchRequester::fetchAll(const RemoteCall& call,
                                             const nlohmann::json& params,
                                             const BatchOptions& options) const {
    const int limit = options.limit.value_or(mContext.defaultLimit);
    if (limit <= 0) {
        throw std::invalid_argument("Page limit must be positive, got " +
                                    std::to_string(limit));
    }
    if (!params.is_null() && !params.is_object()) {
        throw std::invalid_argument("Request params must be a JSON object");
    }
    if (!call.invoke) {
        throw std::invalid_argument("RemoteCall '" + call.path +
                                    "' has no invoke function");
    }

    ItemExtractor  getData  = options.getData;
    CountExtractor getCount = options.getCount;
    if (!getData)  getData  = extractInfo;
    if (!getCount) getCount = extractCount;

    // --- probe ---
    const auto count = probeCount(call, params, getCount);
    if (!count) {
        return {};
    }

    // --- plan ---
    const auto windows = planPages(*count, limit);

    if (mContext.verbose) {
        logLine("[BatchRequester] " + call.path + ": count=" +
                std::to_string(*count) + ", pages=" +
                std::to_string(windows.size()) + ", limit=" +
                std::to_string(limit));
    }

    if (windows.empty()) {
        return {};
    }

    // --- dispatch + drain ---
    auto tasks = dispatch(call, params, windows);
    for (auto& task : tasks) {
        task.result.wait();
    }

    // --- merge, in window order ---
    std::vector<Record> data;
    for (auto& task : tasks) {
        ApiResponse response;
        try {
            response = task.result.get();
        } catch (const std::exception& e) {
            logLine("[BatchRequester] " + call.path +
                    " request error, params: " + dumpForLog(task.params) +
                    ", error: " + e.what());
            return {};
        }

        if (!response.result) {
            logLine("[BatchRequester] " + call.path +
                    " request error, params: " + dumpForLog(task.params) +
                    ", result: " + dumpForLog(nlohmann::json(response)));
            return {};
        }

        std::vector<Record> items;
        try {
            items = getData(response);
        } catch (const std::exception& e) {
            logLine("[BatchRequester] " + call.path +
                    " malformed page, params: " + dumpForLog(task.params) +
                    ", result: " + dumpForLog(nlohmann::json(response)) +
                    ", error: " + e.what());
            return {};
        }

        data.insert(data.end(),
                    std::make_move_iterator(items.begin()),
                    std::make_move_iterator(items.end()));
    }

    return data;
}

// ---------------------------------------------------------------------------
// Private
// ---------------------------------------------------------------------------

std::optional<int> BatchRequester::probeCount(const RemoteCall& call,
                                              const nlohmann::json& params,
                                              const CountExtractor& getCount) const {
    const auto probeParams = buildPageParams(params, PageWindow{0, 1});

    ApiResponse response;
    try {
        response = call.invoke(probeParams);
    } catch (const std::exception& e) {
        logLine("[BatchRequester] " + call.path +
                " count request error, params: " + dumpForLog(probeParams) +
                ", error: " + e.what());
        return std::nullopt;
    }

    if (!response.result) {
        logLine("[BatchRequester] " + call.path +
                " count request error, result: " +
                dumpForLog(nlohmann::json(response)));
        return std::nullopt;
    }

    try {
        return getCount(response);
    } catch (const std::exception& e) {
        logLine("[BatchRequester] " + call.path +
                " malformed count result: " +
                dumpForLog(nlohmann::json(response)) + ", error: " + e.what());
        return std::nullopt;
    }
}

std::vector<BatchRequester::PageTask>
BatchRequester::dispatch(const RemoteCall& call,
                         const nlohmann::json& params,
                         const std::vector<PageWindow>& windows) const {
    std::vector<PageTask> tasks;
    tasks.reserve(windows.size());

    for (const auto& window : windows) {
        PageTask task;
        task.params = buildPageParams(params, window);
        // Workers own copies so nothing they touch lives on this stack frame.
        task.result = mPool.submit(
            [invoke = call.invoke, requestParams = task.params] {
                return invoke(requestParams);
            });
        tasks.push_back(std::move(task));
    }
    return tasks;
}

void BatchRequester::logLine(const std::string& line) const {
    // Concurrent fetchAll calls share the log stream.
    std::lock_guard<std::mutex> lock(mLogMutex);
    *mContext.log << (line + "\n");
}

} // namespace cmdb_fetch
