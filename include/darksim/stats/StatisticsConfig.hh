#pragma once

#include <string>

namespace darksim::stats {

/**
 * Options for derived metrics, read from the "statistics" block of the
 * run configuration.
 */
struct StatisticsConfig {
  std::string method = "simple";          ///< "simple" | "asimov"
  double discovery_threshold_sigma = 3.0; ///< discovery flag cut
  int    verbosity   = 0;                 ///< 0=silent, 1=summary, 2+=debug
};

} // namespace darksim::stats
