#include "core/microblocks/row_sorter.h"
#include <cassert>
#include <iostream>
#include <vector>

using namespace crtmix;

int main() {
  std::vector<Rgb> px{Rgb{50, 1, 0}, Rgb{10, 2, 0}, Rgb{50, 3, 0}, Rgb{30, 4, 0}};

  RowSorter by_red(SortKey::Red, false);
  std::vector<Rgb> a = px;
  by_red.process(a.data(), a.data() + a.size());
  // equal keys keep input order
  assert((a == std::vector<Rgb>{Rgb{10, 2, 0}, Rgb{30, 4, 0}, Rgb{50, 1, 0}, Rgb{50, 3, 0}}));

  RowSorter by_red_desc(SortKey::Red, true);
  std::vector<Rgb> d = px;
  by_red_desc.process(d.data(), d.data() + d.size());
  assert((d == std::vector<Rgb>{Rgb{50, 1, 0}, Rgb{50, 3, 0}, Rgb{30, 4, 0}, Rgb{10, 2, 0}}));

  // sub-range only
  std::vector<Rgb> part = px;
  by_red.process(part.data() + 1, part.data() + 3);
  assert(part[0] == px[0] && part[3] == px[3]);
  assert(part[1] == px[1] && part[2] == px[2]);

  RowSorter by_green(SortKey::Green, true);
  std::vector<Rgb> g = px;
  by_green.process(g.data(), g.data() + g.size());
  assert(g[0].g == 4 && g[3].g == 1);

  // trivial ranges untouched
  std::vector<Rgb> one{Rgb{1, 2, 3}};
  by_red.process(one.data(), one.data() + 1);
  by_red.process(one.data(), one.data());
  assert(one[0] == (Rgb{1, 2, 3}));

  assert(by_red.key() == SortKey::Red && !by_red.reverse());

  std::cout << "RowSorter test PASSED\n";
  return 0;
}
