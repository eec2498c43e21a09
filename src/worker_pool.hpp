#pragma once

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <cstddef>
#include <future>
#include <memory>
#include <type_traits>
#include <utility>

namespace cmdb_fetch {

/// Fixed-size pool of worker threads backed by boost::asio::thread_pool.
/// The pool is long-lived and shared by successive batches; each submitted
/// task reports its result (or exception) through the returned future.
class WorkerPool {
public:
    /// @param threadCount  Number of worker threads; must be positive.
    /// @throws std::invalid_argument if @p threadCount is zero.
    explicit WorkerPool(std::size_t threadCount = defaultThreadCount());

    /// Runs every task already queued, then joins the threads.
    ~WorkerPool();

    WorkerPool(const WorkerPool&)            = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Queue @p fn for execution on a worker thread.
    template <typename Fn>
    std::future<std::invoke_result_t<std::decay_t<Fn>>> submit(Fn&& fn) {
        using Result = std::invoke_result_t<std::decay_t<Fn>>;

        // asio handlers must be copyable on older Boost releases.
        auto task = std::make_shared<std::packaged_task<Result()>>(
            std::forward<Fn>(fn));
        auto future = task->get_future();
        boost::asio::post(mPool, [task] { (*task)(); });
        return future;
    }

    std::size_t threadCount() const { return mThreadCount; }

    /// Hardware concurrency, or 4 when the platform cannot report it.
    static std::size_t defaultThreadCount();

private:
    std::size_t              mThreadCount;
    boost::asio::thread_pool mPool;
};

} // namespace cmdb_fetch
