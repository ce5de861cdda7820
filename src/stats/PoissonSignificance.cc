#include "darksim/stats/PoissonSignificance.hh"

#include <cmath>
#include <limits>

namespace darksim::stats {

double SimplePoissonSignificance::Evaluate(double s, double b) const {
  if (s <= 0.0 && b <= 0.0) return 0.0;
  if (b <= 0.0) return std::numeric_limits<double>::infinity();
  const double denom = s + b;
  if (!(denom > 0.0)) return 0.0;
  return s / std::sqrt(denom);
}

double Significance(long long signal_count, long long background_count) {
  return SimplePoissonSignificance().Evaluate(static_cast<double>(signal_count),
                                              static_cast<double>(background_count));
}

} // namespace darksim::stats
