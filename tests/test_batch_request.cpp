/// @file test_batch_request.cpp
/// Unit tests for batch_request.hpp: probe, fan-out, drain and ordered merge.

#include "batch_request.hpp"
#include "fake_cmdb.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace cmdb_fetch;
using namespace cmdb_fetch::fakes;
using json = nlohmann::json;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static FetchContext quietContext(std::ostream& log, std::size_t poolSize = 4) {
    FetchContext ctx;
    ctx.log      = &log;
    ctx.poolSize = poolSize;
    return ctx;
}

static std::vector<int> pageStarts(const std::vector<json>& calls) {
    // calls[0] is the probe.
    std::vector<int> starts;
    for (std::size_t i = 1; i < calls.size(); ++i) {
        starts.push_back(calls[i]["page"]["start"].get<int>());
    }
    std::sort(starts.begin(), starts.end());
    return starts;
}

static void expectSequentialIds(const std::vector<Record>& records, int total) {
    ASSERT_EQ(records.size(), static_cast<std::size_t>(total));
    for (int i = 0; i < total; ++i) {
        ASSERT_EQ(records[i]["id"].get<int>(), i) << "Record out of order at " << i;
    }
}

// ============================================================================
// Probe
// ============================================================================

TEST(BatchRequester, ZeroCountIssuesOnlyTheProbe) {
    std::ostringstream log;
    BatchRequester requester(quietContext(log));
    FakeListApi api(0);

    auto records = requester.fetchAll(api.remote(), json::object());

    EXPECT_TRUE(records.empty());
    ASSERT_EQ(api.callCount(), 1u);
    EXPECT_EQ(api.calls()[0]["page"], json({{"start", 0}, {"limit", 1}}));
    // A legitimate empty result is not an error.
    EXPECT_TRUE(log.str().empty());
}

TEST(BatchRequester, ProbeFailureSkipsAllPages) {
    std::ostringstream log;
    BatchRequester requester(quietContext(log));
    FakeListApi api(1200);
    api.failProbe();

    auto records = requester.fetchAll(api.remote("cc.list_biz_hosts"), json::object());

    EXPECT_TRUE(records.empty());
    EXPECT_EQ(api.callCount(), 1u);
    EXPECT_NE(log.str().find("[BatchRequester] cc.list_biz_hosts count request error"),
              std::string::npos) << log.str();
    EXPECT_NE(log.str().find("probe refused"), std::string::npos);
}

TEST(BatchRequester, ProbeExceptionIsLoggedNotThrown) {
    std::ostringstream log;
    BatchRequester requester(quietContext(log));
    FakeListApi api(10);
    api.throwOnProbe();

    std::vector<Record> records;
    EXPECT_NO_THROW(records = requester.fetchAll(api.remote(), json::object()));

    EXPECT_TRUE(records.empty());
    EXPECT_EQ(api.callCount(), 1u);
    EXPECT_NE(log.str().find("connection reset during probe"), std::string::npos);
}

TEST(BatchRequester, MalformedProbeResponseIsFailure) {
    std::ostringstream log;
    BatchRequester requester(quietContext(log));

    int calls = 0;
    RemoteCall remote{"cc.odd", [&calls](const json&) {
        ++calls;
        return makeSuccess({{"total", 5}});   // no data.count
    }};

    auto records = requester.fetchAll(remote, json::object());

    EXPECT_TRUE(records.empty());
    EXPECT_EQ(calls, 1);
    EXPECT_NE(log.str().find("malformed count result"), std::string::npos);
}

// ============================================================================
// Planning and merge
// ============================================================================

TEST(BatchRequester, ThreeWindowsFor1200RecordsAt500) {
    std::ostringstream log;
    BatchRequester requester(quietContext(log));
    FakeListApi api(1200);

    auto records = requester.fetchAll(api.remote(), json::object());

    const auto calls = api.calls();
    ASSERT_EQ(calls.size(), 4u);
    EXPECT_EQ(pageStarts(calls), (std::vector<int>{0, 500, 1000}));
    for (std::size_t i = 1; i < calls.size(); ++i) {
        EXPECT_EQ(calls[i]["page"]["limit"], 500);
    }
    expectSequentialIds(records, 1200);
}

TEST(BatchRequester, MergeFollowsWindowOrderNotCompletionOrder) {
    std::ostringstream log;
    BatchRequester requester(quietContext(log, 8));
    FakeListApi api(95);
    // Later windows finish first.
    api.setPageDelay([](int start) {
        return std::chrono::milliseconds(start == 0 ? 0 : (100 - start) / 2);
    });

    BatchOptions options;
    options.limit = 10;
    auto records = requester.fetchAll(api.remote(), json::object(), options);

    EXPECT_EQ(api.callCount(), 11u);
    expectSequentialIds(records, 95);
}

TEST(BatchRequester, OutputLengthIsSumOfPageSizes) {
    std::ostringstream log;
    BatchRequester requester(quietContext(log));
    FakeListApi api(1234);

    BatchOptions options;
    options.limit = 100;
    auto records = requester.fetchAll(api.remote(), json::object(), options);

    EXPECT_EQ(api.callCount(), 1u + 13u);
    expectSequentialIds(records, 1234);
}

TEST(BatchRequester, SingleWindowEndToEnd) {
    std::ostringstream log;
    BatchRequester requester(quietContext(log));
    FakeListApi api(3);

    auto records = requester.fetchAll(api.remote(), json::object());

    const auto calls = api.calls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[1]["page"], json({{"start", 0}, {"limit", 500}}));
    expectSequentialIds(records, 3);
}

TEST(BatchRequester, FixedParamsReachEveryRequest) {
    std::ostringstream log;
    BatchRequester requester(quietContext(log));
    FakeListApi api(250);

    json params = {{"bk_biz_id", 2}, {"fields", {"bk_host_id", "bk_host_innerip"}}};
    BatchOptions options;
    options.limit = 100;
    requester.fetchAll(api.remote(), params, options);

    const auto calls = api.calls();
    ASSERT_EQ(calls.size(), 4u);
    for (const auto& call : calls) {
        EXPECT_EQ(call["bk_biz_id"], 2);
        EXPECT_EQ(call["fields"], params["fields"]);
        EXPECT_TRUE(call.contains("page"));
    }
}

TEST(BatchRequester, RepeatedCallsYieldIdenticalOutput) {
    std::ostringstream log;
    BatchRequester requester(quietContext(log));
    FakeListApi api(777);
    api.setPageDelay([](int start) { return std::chrono::milliseconds(start % 7); });

    BatchOptions options;
    options.limit = 50;
    auto first = requester.fetchAll(api.remote(), json::object(), options);
    api.resetProbe();
    auto second = requester.fetchAll(api.remote(), json::object(), options);

    EXPECT_EQ(first.size(), 777u);
    EXPECT_EQ(first, second);
}

TEST(BatchRequester, CustomExtractors) {
    std::ostringstream log;
    BatchRequester requester(quietContext(log));

    RemoteCall remote{"cc.custom", [](const json& params) {
        const int start = params["page"]["start"];
        const int limit = params["page"]["limit"];
        json rows = json::array();
        for (int i = start; i < std::min(start + limit, 7); ++i) {
            rows.push_back("row-" + std::to_string(i));
        }
        return makeSuccess({{"total", 7}, {"rows", rows}});
    }};

    BatchOptions options;
    options.limit    = 3;
    options.getCount = [](const ApiResponse& r) { return r.data["total"].get<int>(); };
    options.getData  = [](const ApiResponse& r) {
        return std::vector<Record>(r.data["rows"].begin(), r.data["rows"].end());
    };

    auto records = requester.fetchAll(remote, json::object(), options);

    ASSERT_EQ(records.size(), 7u);
    EXPECT_EQ(records.front(), "row-0");
    EXPECT_EQ(records.back(), "row-6");
}

// ============================================================================
// Page failures
// ============================================================================

TEST(BatchRequester, OneFailedPageDiscardsEveryPage) {
    std::ostringstream log;
    BatchRequester requester(quietContext(log));
    FakeListApi api(2000);
    api.failPageAt(1000);

    auto records = requester.fetchAll(api.remote("cc.list_biz_hosts"), json::object());

    EXPECT_TRUE(records.empty());
    // No cancellation: every window was still requested.
    EXPECT_EQ(api.callCount(), 5u);
    const std::string text = log.str();
    EXPECT_NE(text.find("[BatchRequester] cc.list_biz_hosts request error"), std::string::npos) << text;
    EXPECT_NE(text.find("\"start\":1000"), std::string::npos) << text;
    EXPECT_NE(text.find("page refused"), std::string::npos) << text;
}

TEST(BatchRequester, LastPageFailureStillDiscardsEarlierPages) {
    std::ostringstream log;
    BatchRequester requester(quietContext(log));
    FakeListApi api(1500);
    api.failPageAt(1000);

    EXPECT_TRUE(requester.fetchAll(api.remote(), json::object()).empty());
}

TEST(BatchRequester, PageExceptionIsLoggedNotThrown) {
    std::ostringstream log;
    BatchRequester requester(quietContext(log));
    FakeListApi api(1200);
    api.throwOnPageAt(500);

    std::vector<Record> records;
    EXPECT_NO_THROW(records = requester.fetchAll(api.remote(), json::object()));

    EXPECT_TRUE(records.empty());
    EXPECT_NE(log.str().find("timeout on page 500"), std::string::npos);
}

TEST(BatchRequester, FailureIsReportedOnlyAfterEveryWindowCompleted) {
    std::ostringstream log;
    BatchRequester requester(quietContext(log, 4));

    std::atomic<bool> slowPageDone{false};
    RemoteCall remote{"cc.slow", [&slowPageDone](const json& params) {
        const int start = params["page"]["start"];
        const int limit = params["page"]["limit"];
        if (limit == 1) {
            return makeSuccess({{"count", 30}, {"info", json::array()}});
        }
        if (start == 0) {
            return makeFailure("first page refused");
        }
        if (start == 20) {
            std::this_thread::sleep_for(std::chrono::milliseconds(150));
            slowPageDone = true;
        }
        return makeSuccess({{"count", 30}, {"info", json::array({start})}});
    }};

    BatchOptions options;
    options.limit = 10;
    auto records = requester.fetchAll(remote, json::object(), options);

    EXPECT_TRUE(records.empty());
    EXPECT_TRUE(slowPageDone.load());
}

TEST(BatchRequester, MalformedPageIsFailure) {
    std::ostringstream log;
    BatchRequester requester(quietContext(log));

    RemoteCall remote{"cc.broken_page", [](const json& params) {
        if (params["page"]["limit"] == 1) {
            return makeSuccess({{"count", 2}, {"info", json::array()}});
        }
        return makeSuccess({{"count", 2}});   // no info
    }};

    EXPECT_TRUE(requester.fetchAll(remote, json::object()).empty());
    EXPECT_NE(log.str().find("malformed page"), std::string::npos);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST(BatchRequester, PoolSizeBoundsConcurrentRequests) {
    std::ostringstream log;
    BatchRequester requester(quietContext(log, 2));
    FakeListApi api(100);
    api.setPageDelay([](int) { return std::chrono::milliseconds(10); });

    BatchOptions options;
    options.limit = 10;
    auto records = requester.fetchAll(api.remote(), json::object(), options);

    expectSequentialIds(records, 100);
    EXPECT_LE(api.maxConcurrent(), 2);
}

TEST(BatchRequester, ConcurrentCallsShareThePool) {
    std::ostringstream log;
    BatchRequester requester(quietContext(log, 3));
    FakeListApi first(420);
    FakeListApi second(99);

    BatchOptions options;
    options.limit = 40;

    std::vector<Record> a;
    std::vector<Record> b;
    std::thread t1([&] { a = requester.fetchAll(first.remote(), json::object(), options); });
    std::thread t2([&] { b = requester.fetchAll(second.remote(), json::object(), options); });
    t1.join();
    t2.join();

    expectSequentialIds(a, 420);
    expectSequentialIds(b, 99);
}

TEST(BatchRequester, ConcurrentFailuresLogWholeLines) {
    std::ostringstream log;
    BatchRequester requester(quietContext(log, 2));
    RemoteCall refused{"cc.refused", [](const json&) {
        return makeFailure("gateway busy");
    }};

    constexpr int kCallsPerThread = 100;
    auto run = [&] {
        for (int i = 0; i < kCallsPerThread; ++i) {
            EXPECT_TRUE(requester.fetchAll(refused, json::object()).empty());
        }
    };
    std::thread t1(run);
    std::thread t2(run);
    t1.join();
    t2.join();

    std::istringstream lines(log.str());
    std::string line;
    int count = 0;
    while (std::getline(lines, line)) {
        ++count;
        EXPECT_EQ(line.rfind("[BatchRequester] cc.refused count request error", 0), 0u) << line;
        EXPECT_NE(line.find("gateway busy"), std::string::npos) << line;
    }
    EXPECT_EQ(count, 2 * kCallsPerThread);
}

TEST(BatchRequester, CountBeyondIntRangeIsLoggedAsMalformed) {
    std::ostringstream log;
    BatchRequester requester(quietContext(log));
    std::atomic<int> calls{0};
    RemoteCall huge{"cc.huge", [&calls](const json&) {
        ++calls;
        return makeSuccess({{"count", 3000000000LL}, {"info", json::array()}});
    }};

    EXPECT_TRUE(requester.fetchAll(huge, json::object()).empty());
    EXPECT_EQ(calls.load(), 1);
    EXPECT_NE(log.str().find("cc.huge malformed count result"), std::string::npos) << log.str();
}

// ============================================================================
// Arguments and context
// ============================================================================

TEST(BatchRequester, NonPositiveLimitThrowsBeforeAnyRequest) {
    std::ostringstream log;
    BatchRequester requester(quietContext(log));
    FakeListApi api(10);

    BatchOptions options;
    options.limit = 0;
    EXPECT_THROW(requester.fetchAll(api.remote(), json::object(), options),
                 std::invalid_argument);
    EXPECT_EQ(api.callCount(), 0u);
}

TEST(BatchRequester, NonObjectParamsThrow) {
    std::ostringstream log;
    BatchRequester requester(quietContext(log));
    FakeListApi api(10);

    EXPECT_THROW(requester.fetchAll(api.remote(), json::array({1, 2})),
                 std::invalid_argument);
    EXPECT_EQ(api.callCount(), 0u);
}

TEST(BatchRequester, MissingInvokeThrows) {
    std::ostringstream log;
    BatchRequester requester(quietContext(log));

    EXPECT_THROW(requester.fetchAll(RemoteCall{"cc.none", nullptr}, json::object()),
                 std::invalid_argument);
}

TEST(BatchRequester, InvalidContextIsRejected) {
    FetchContext noLog;
    noLog.log = nullptr;
    EXPECT_THROW(BatchRequester{noLog}, std::invalid_argument);

    FetchContext badLimit;
    badLimit.defaultLimit = -1;
    EXPECT_THROW(BatchRequester{badLimit}, std::invalid_argument);

    FetchContext noThreads;
    noThreads.poolSize = 0;
    EXPECT_THROW(BatchRequester{noThreads}, std::invalid_argument);
}

TEST(BatchRequester, ContextDefaultLimitIsUsed) {
    std::ostringstream log;
    FetchContext ctx = quietContext(log);
    ctx.defaultLimit = 25;
    BatchRequester requester(ctx);
    FakeListApi api(60);

    requester.fetchAll(api.remote(), json::object());

    EXPECT_EQ(pageStarts(api.calls()), (std::vector<int>{0, 25, 50}));
}

TEST(BatchRequester, VerboseLogsPlanSummary) {
    std::ostringstream log;
    FetchContext ctx = quietContext(log);
    ctx.verbose = true;
    BatchRequester requester(ctx);
    FakeListApi api(1200);

    requester.fetchAll(api.remote("cc.list_biz_hosts"), json::object());

    EXPECT_NE(log.str().find("[BatchRequester] cc.list_biz_hosts: count=1200, pages=3, limit=500"),
              std::string::npos) << log.str();
}

// ============================================================================
// buildPageParams
// ============================================================================

TEST(BuildPageParams, AddsPageToFixedParams) {
    json fixed = {{"bk_biz_id", 3}};
    auto params = buildPageParams(fixed, PageWindow{500, 500});

    EXPECT_EQ(params["bk_biz_id"], 3);
    EXPECT_EQ(params["page"], json({{"start", 500}, {"limit", 500}}));
    EXPECT_FALSE(fixed.contains("page"));
}

TEST(BuildPageParams, NullParamsBecomeObject) {
    auto params = buildPageParams(json(), PageWindow{0, 1});
    EXPECT_EQ(params, json({{"page", {{"start", 0}, {"limit", 1}}}}));
}

TEST(BuildPageParams, WindowOverridesCallerPage) {
    json fixed = {{"page", {{"start", 99}, {"limit", 99}, {"sort", "bk_host_id"}}}};
    auto params = buildPageParams(fixed, PageWindow{0, 500});
    EXPECT_EQ(params["page"], json({{"start", 0}, {"limit", 500}}));
}
