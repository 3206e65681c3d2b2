#include "worker_pool.hpp"
#include "include/effect_config.hpp"
#include <atomic>
#include <cassert>
#include <iostream>
#include <stdexcept>
#include <vector>

using namespace crtmix;

int main() {
    assert(WorkerPool::default_worker_count() >= 1);
    assert(WorkerPool::default_worker_count() <= kMaxWorkers);

    // oversized pools are refused before any thread starts
    bool refused = false;
    try {
        WorkerPool huge(kMaxWorkers + 1);
    } catch (const Error& e) {
        refused = e.kind() == ErrorKind::UnsupportedParameter;
    }
    assert(refused);

    {
        WorkerPool widest(kMaxWorkers);
        assert(widest.size() == kMaxWorkers);
    }

    WorkerPool pool(4);
    assert(pool.size() == 4);

    // every item runs exactly once
    const size_t items = 10000;
    std::vector<std::atomic<int>> hits(items);
    for (auto& h : hits) h.store(0);
    pool.run_batch(items, [&](size_t i) { hits[i].fetch_add(1, std::memory_order_relaxed); });
    for (size_t i = 0; i < items; ++i) assert(hits[i].load() == 1);

    // batches are reusable back to back
    std::atomic<size_t> total{0};
    for (int round = 0; round < 50; ++round) {
        pool.run_batch(100, [&](size_t i) { total.fetch_add(i, std::memory_order_relaxed); });
    }
    assert(total.load() == 50 * (99 * 100 / 2));

    pool.run_batch(0, [&](size_t) { assert(false); });

    // first failure surfaces to the caller
    bool caught = false;
    try {
        pool.run_batch(64, [&](size_t i) {
            if (i == 17) throw Error(ErrorKind::UnsupportedParameter, "item 17");
        });
    } catch (const Error& e) {
        caught = true;
        assert(e.kind() == ErrorKind::UnsupportedParameter);
    }
    assert(caught);

    // and the pool keeps working afterwards
    std::atomic<int> after{0};
    pool.run_batch(8, [&](size_t) { after.fetch_add(1); });
    assert(after.load() == 8);

    WorkerPool single(1);
    std::vector<int> order;
    single.run_batch(5, [&](size_t i) { order.push_back(static_cast<int>(i)); });
    assert((order == std::vector<int>{0, 1, 2, 3, 4}));

    std::cout << "WorkerPool test PASSED\n";
    return 0;
}
