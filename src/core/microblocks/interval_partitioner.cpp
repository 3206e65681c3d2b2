#include "interval_partitioner.h"
#include "color_metrics.h"
#include <string>

namespace crtmix {

IntervalPartitioner::IntervalPartitioner(int threshold) : threshold_(threshold) {
  if (threshold < 0 || threshold > 255) {
    throw Error(ErrorKind::UnsupportedParameter,
                "threshold " + std::to_string(threshold) + " outside [0, 255]");
  }
}

std::vector<Interval> IntervalPartitioner::process(const Rgb* row, int length) const {
  std::vector<Interval> out;
  process(row, length, out);
  return out;
}

void IntervalPartitioner::process(const Rgb* row, int length, std::vector<Interval>& out) const {
  out.clear();
  int start = -1;
  for (int i = 0; i < length; ++i) {
    if (brightness(row[i]) < threshold_) {
      if (start >= 0) {
        out.push_back(Interval{start, i});
        start = -1;
      }
    } else if (start < 0) {
      start = i;
    }
  }
  // run reaching end-of-row needs no terminator
  if (start >= 0) out.push_back(Interval{start, length});
}

} // namespace crtmix
