#include "parallel_sort_engine.h"
#include "../microblocks/interval_partitioner.h"
#include "../microblocks/row_sorter.h"
#include "../../image_io.hpp"
#include <algorithm>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace crtmix {

ParallelSortEngine::ParallelSortEngine(uint32_t workers)
  : pool_(new WorkerPool(workers)) {}

ParallelSortEngine::~ParallelSortEngine() = default;

PixelBuffer ParallelSortEngine::process(const PixelBuffer& src, const SortConfig& cfg) {
  if (cfg.threshold < 0 || cfg.threshold > 255) {
    throw Error(ErrorKind::UnsupportedParameter,
                "sort threshold " + std::to_string(cfg.threshold) + " outside [0, 255]");
  }

  // sort-all always runs at full resolution
  if (cfg.sort_all) {
    if (verbose()) {
      std::cout << "[SortEngine] SORT_ALL pixels=" << src.size() << " key=" << to_string(cfg.key) << "\n";
    }
    return sort_all_pixels(src, cfg.key, cfg.reverse);
  }

  PixelBuffer work = cfg.preview ? downscale_to_fit(src, cfg.preview_max_dimension) : src;
  if (cfg.direction == SortDirection::Vertical) {
    return transpose(sort_rows(transpose(work), cfg));
  }
  return sort_rows(work, cfg);
}

PixelBuffer ParallelSortEngine::sort_rows(const PixelBuffer& src, const SortConfig& cfg) {
  PixelBuffer out = src;
  const int width = src.width();
  const IntervalPartitioner partitioner(cfg.threshold);

  if (verbose()) {
    std::cout << "[SortEngine] DISPATCH rows=" << src.height() << " width=" << width
              << " workers=" << pool_->size() << " key=" << to_string(cfg.key)
              << " direction=" << to_string(cfg.direction) << " threshold=" << cfg.threshold << "\n";
  }

  pool_->run_batch(static_cast<size_t>(src.height()), [&](size_t i) {
    const int y = static_cast<int>(i);
    std::vector<Rgb> row(src.row(y), src.row(y) + width);

    RowSorter sorter(cfg.key, cfg.reverse);
    std::vector<Interval> intervals;
    partitioner.process(row.data(), width, intervals);
    for (const Interval& iv : intervals) {
      sorter.process(row.data() + iv.start, row.data() + iv.end);
    }

    std::copy(row.begin(), row.end(), out.row(y));
  });
  return out;
}

PixelBuffer sort_all_pixels(const PixelBuffer& src, SortKey key, bool reverse) {
  std::vector<Rgb> flat = src.pixels();
  RowSorter sorter(key, reverse);
  sorter.process(flat.data(), flat.data() + flat.size());
  return PixelBuffer(src.width(), src.height(), std::move(flat));
}

} // namespace crtmix
