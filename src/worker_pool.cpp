#include "worker_pool.hpp"
#include "include/effect_config.hpp"
#include <algorithm>
#include <iostream>
#include <string>

namespace crtmix {

uint32_t WorkerPool::default_worker_count() {
    unsigned hc = std::thread::hardware_concurrency();
    if (hc <= 1) return 1u;
    return std::min(static_cast<uint32_t>(hc - 1), kMaxWorkers);
}

WorkerPool::WorkerPool(uint32_t workers) {
    if (workers == 0) workers = default_worker_count();
    if (workers > kMaxWorkers) {
        throw Error(ErrorKind::UnsupportedParameter,
                    "worker count " + std::to_string(workers) + " above " + std::to_string(kMaxWorkers));
    }
    running_.store(true);
    threads_.reserve(workers);
    try {
        for (uint32_t i = 0; i < workers; ++i) {
            threads_.emplace_back(&WorkerPool::loop, this);
        }
    } catch (...) {
        // started workers must be joined before cv_ goes away
        shutdown();
        throw;
    }
    if (verbose()) std::cout << "[WorkerPool] STARTED workers=" << workers << "\n";
}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        running_.store(false);
    }
    cv_.notify_all();
    for (auto& th : threads_) {
        if (th.joinable()) th.join();
    }
}

void WorkerPool::run_batch(size_t count, const std::function<void(size_t)>& task) {
    if (count == 0) return;
    std::lock_guard<std::mutex> batch(batch_mtx_);

    {
        std::lock_guard<std::mutex> lk(mtx_);
        task_ = &task;
        count_ = count;
        next_.store(0, std::memory_order_relaxed);
        active_ = threads_.size();
        error_ = nullptr;
        ++generation_;
    }
    cv_.notify_all();

    std::exception_ptr err;
    {
        std::unique_lock<std::mutex> lk(mtx_);
        done_cv_.wait(lk, [&]{ return active_ == 0; });
        task_ = nullptr;
        err = error_;
        error_ = nullptr;
    }
    if (err) std::rethrow_exception(err);
}

void WorkerPool::drain() {
    for (;;) {
        size_t i = next_.fetch_add(1, std::memory_order_relaxed);
        if (i >= count_) return;
        try {
            (*task_)(i);
        } catch (...) {
            std::lock_guard<std::mutex> lk(mtx_);
            if (!error_) error_ = std::current_exception();
            // stop handing out further items of the failed batch
            next_.store(count_, std::memory_order_relaxed);
        }
    }
}

void WorkerPool::loop() {
    uint64_t seen = 0;
    while (true) {
        {
            std::unique_lock<std::mutex> lk(mtx_);
            cv_.wait(lk, [&]{ return !running_.load() || generation_ != seen; });
            if (!running_.load()) return;
            seen = generation_;
        }

        drain();

        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (--active_ == 0) done_cv_.notify_all();
        }
    }
}

} // namespace crtmix
