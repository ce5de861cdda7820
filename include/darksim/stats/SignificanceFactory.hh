#pragma once

#include <memory>

#include "darksim/stats/ISignificance.hh"
#include "darksim/stats/StatisticsConfig.hh"

namespace darksim::stats {

/**
 * Create the significance estimator named by StatisticsConfig::method.
 *
 *   "simple" (default, case-insensitive) -> SimplePoissonSignificance
 *   "asimov" | "plr"                     -> PoissonAsimovPLR
 *
 * Unknown names fall back to "simple" with a warning on stderr.
 */
std::unique_ptr<ISignificance> MakeSignificance(const StatisticsConfig& cfg);

} // namespace darksim::stats
