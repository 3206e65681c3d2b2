#include "core/microblocks/interval_partitioner.h"
#include <cassert>
#include <iostream>
#include <vector>

using namespace crtmix;

static Rgb grey(uint8_t v) { return Rgb{v, v, v}; }

int main() {
  IntervalPartitioner p(100);

  std::vector<Rgb> row{grey(10), grey(200), grey(150), grey(5), grey(120), grey(130)};
  std::vector<Interval> iv = p.process(row.data(), static_cast<int>(row.size()));
  assert(iv.size() == 2);
  assert((iv[0] == Interval{1, 3}));
  // trailing run closed at end of row
  assert((iv[1] == Interval{4, 6}));
  assert(iv[1].length() == 2);

  // brightness == threshold is inclusive
  std::vector<Rgb> flat(7, grey(100));
  iv = p.process(flat.data(), 7);
  assert(iv.size() == 1 && (iv[0] == Interval{0, 7}));

  std::vector<Rgb> dark(5, grey(99));
  assert(p.process(dark.data(), 5).empty());
  assert(p.process(nullptr, 0).empty());

  IntervalPartitioner all(0);
  iv = all.process(dark.data(), 5);
  assert(iv.size() == 1 && iv[0].length() == 5);

  // out-vector overload reuses storage and clears stale entries
  std::vector<Interval> out{Interval{9, 9}};
  p.process(row.data(), 1, out);
  assert(out.empty());

  for (int bad : {-1, 256}) {
    bool caught = false;
    try {
      IntervalPartitioner x(bad);
    } catch (const Error& e) {
      caught = e.kind() == ErrorKind::UnsupportedParameter;
    }
    assert(caught);
  }

  std::cout << "IntervalPartitioner test PASSED\n";
  return 0;
}
