#pragma once
#include "../../include/crtmix.hpp"
#include "../../include/effect_config.hpp"
#include <utility>
#include <vector>

namespace crtmix {

// Orders a contiguous run of pixels by a sort key. Ties keep their input
// order, so identical inputs always give identical outputs.
class RowSorter {
public:
  RowSorter(SortKey key, bool reverse);
  ~RowSorter() = default;

  // in-place sort of [first, last)
  void process(Rgb* first, Rgb* last) const;

  SortKey key() const { return key_; }
  bool reverse() const { return reverse_; }

private:
  SortKey key_;
  bool reverse_;
  // scratch for decorated keys; a RowSorter is owned by one thread at a time
  mutable std::vector<std::pair<double, Rgb>> scratch_;
};

} // namespace crtmix
