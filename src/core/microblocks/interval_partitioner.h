#pragma once
#include "../../include/crtmix.hpp"
#include <vector>

namespace crtmix {

// Interval: half-open [start,end) offset range within one row
struct Interval {
  int start = 0;
  int end = 0;
  int length() const { return end - start; }
};

inline bool operator==(const Interval& a, const Interval& b) {
  return a.start == b.start && a.end == b.end;
}

// Splits a row into maximal runs of pixels with brightness >= threshold.
// Sub-threshold pixels separate runs and belong to none.
class IntervalPartitioner {
public:
  explicit IntervalPartitioner(int threshold);
  ~IntervalPartitioner() = default;

  std::vector<Interval> process(const Rgb* row, int length) const;
  void process(const Rgb* row, int length, std::vector<Interval>& out) const;

  int threshold() const { return threshold_; }

private:
  int threshold_;
};

} // namespace crtmix
