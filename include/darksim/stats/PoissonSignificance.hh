#pragma once

#include "darksim/stats/ISignificance.hh"

namespace darksim::stats {

/// Z = s / sqrt(s + b).
///
/// Simple Poisson approximation, not a profile-likelihood statistic: it
/// ignores background uncertainty and overstates Z for small counts.
/// Returns 0 for (0,0) and +inf for b == 0, s > 0.
double Significance(long long signal_count, long long background_count);

class SimplePoissonSignificance : public ISignificance {
public:
  double Evaluate(double signal, double background) const override;
  const char* Name() const override { return "simple"; }
};

} // namespace darksim::stats
