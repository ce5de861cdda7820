#pragma once
#include <vector>

namespace darksim::stats {

// Equal-width 1D histogram: edges.size() == counts.size() + 1, or both empty.
struct Histogram1D {
  std::vector<double>    edges;
  std::vector<long long> counts;

  int  nbins() const { return static_cast<int>(counts.size()); }
  bool empty() const { return counts.empty(); }
  long long total() const;
};

} // namespace darksim::stats
