#include "row_sorter.h"
#include "color_metrics.h"
#include <algorithm>

namespace crtmix {

RowSorter::RowSorter(SortKey key, bool reverse) : key_(key), reverse_(reverse) {}

void RowSorter::process(Rgb* first, Rgb* last) const {
  if (last - first < 2) return;

  scratch_.clear();
  scratch_.reserve(static_cast<size_t>(last - first));
  for (Rgb* p = first; p != last; ++p) {
    scratch_.emplace_back(sort_key_value(*p, key_), *p);
  }

  if (reverse_) {
    std::stable_sort(scratch_.begin(), scratch_.end(),
                     [](const std::pair<double, Rgb>& a, const std::pair<double, Rgb>& b) {
                       return a.first > b.first;
                     });
  } else {
    std::stable_sort(scratch_.begin(), scratch_.end(),
                     [](const std::pair<double, Rgb>& a, const std::pair<double, Rgb>& b) {
                       return a.first < b.first;
                     });
  }

  Rgb* out = first;
  for (const auto& e : scratch_) *out++ = e.second;
}

} // namespace crtmix
