#include "darksim/stats/SignificanceFactory.hh"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <string>

#include "darksim/stats/PoissonAsimovPLR.hh"
#include "darksim/stats/PoissonSignificance.hh"

namespace darksim::stats {

namespace {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

} // namespace

std::unique_ptr<ISignificance> MakeSignificance(const StatisticsConfig& cfg) {
  const std::string name = to_lower(cfg.method);

  if (name == "simple" || name == "poisson" || name.empty()) {
    if (cfg.verbosity > 1) {
      std::cout << "[stats] Using simple Poisson significance (\"" << cfg.method << "\")\n";
    }
    return std::make_unique<SimplePoissonSignificance>();
  }

  if (name == "asimov" || name == "plr" || name == "poisson_plr") {
    if (cfg.verbosity > 1) {
      std::cout << "[stats] Using PoissonAsimovPLR significance (\"" << cfg.method << "\")\n";
    }
    return std::make_unique<PoissonAsimovPLR>();
  }

  std::cerr << "[stats] WARNING: unknown significance method=\"" << cfg.method
            << "\". Falling back to simple Poisson.\n";
  return std::make_unique<SimplePoissonSignificance>();
}

} // namespace darksim::stats
