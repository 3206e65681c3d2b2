#pragma once
#include "include/crtmix.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace crtmix {

// Bounded pool of persistent worker threads. A batch of N independent work
// items is claimed item-by-item from a shared atomic cursor; the caller
// blocks until every item has finished.
class WorkerPool {
public:
    // workers == 0 selects default_worker_count(); more than kMaxWorkers
    // throws Error(UnsupportedParameter). A failed thread spawn joins the
    // threads already started and rethrows.
    explicit WorkerPool(uint32_t workers = 0);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Run task(i) for every i in [0, count). The first exception raised by a
    // task is rethrown here once the whole batch has drained.
    void run_batch(size_t count, const std::function<void(size_t)>& task);

    uint32_t size() const { return static_cast<uint32_t>(threads_.size()); }

    // available CPU parallelism minus one reserved core, at least one
    static uint32_t default_worker_count();

private:
    void loop();
    void shutdown();
    void drain();

    std::vector<std::thread> threads_;
    std::mutex batch_mtx_;            // one batch at a time
    std::mutex mtx_;
    std::condition_variable cv_;      // new batch or shutdown
    std::condition_variable done_cv_; // batch drained
    std::atomic<bool> running_{false};

    const std::function<void(size_t)>* task_ = nullptr;
    size_t count_ = 0;
    std::atomic<size_t> next_{0};
    size_t active_ = 0;
    uint64_t generation_ = 0;
    std::exception_ptr error_;
};

} // namespace crtmix
