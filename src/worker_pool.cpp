#include "worker_pool.hpp"

#include <stdexcept>
#include <thread>

namespace cmdb_fetch {

namespace {

std::size_t checkedThreadCount(std::size_t threadCount) {
    if (threadCount == 0) {
        throw std::invalid_argument("Worker pool needs at least one thread");
    }
    return threadCount;
}

} // namespace

WorkerPool::WorkerPool(std::size_t threadCount)
    : mThreadCount(checkedThreadCount(threadCount))
    , mPool(mThreadCount) {}

WorkerPool::~WorkerPool() {
    mPool.join();
}

std::size_t WorkerPool::defaultThreadCount() {
    const unsigned int hw = std::thread::hardware_concurrency();
    return hw == 0 ? 4 : static_cast<std::size_t>(hw);
}

} // namespace cmdb_fetch
