#pragma once
#include "../../include/crtmix.hpp"
#include "../../include/effect_config.hpp"
#include "../../worker_pool.hpp"
#include <memory>

namespace crtmix {

// Fans an interval sort out across rows (columns when vertical) on a
// worker pool. Each work item reads a private copy of its row and writes
// only that row's slot of the output, so the result is identical for any
// worker count or completion order.
class ParallelSortEngine {
public:
  // workers == 0 selects WorkerPool::default_worker_count()
  explicit ParallelSortEngine(uint32_t workers = 0);
  ~ParallelSortEngine();

  PixelBuffer process(const PixelBuffer& src, const SortConfig& cfg);

  uint32_t workers() const { return pool_->size(); }

private:
  PixelBuffer sort_rows(const PixelBuffer& src, const SortConfig& cfg);

  std::unique_ptr<WorkerPool> pool_;
};

// Sort every pixel of the buffer as one sequence and reshape to the
// original dimensions. Direction and threshold play no part.
PixelBuffer sort_all_pixels(const PixelBuffer& src, SortKey key, bool reverse);

} // namespace crtmix
