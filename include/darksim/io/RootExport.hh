#pragma once
#include <memory>
#include <string>

#include "darksim/simulation/SimulationResult.hh"
#include "darksim/stats/Histogram.hh"

class TH1D;

namespace darksim {

// Variable-edge TH1D with the histogram counts; detached from gDirectory.
// Returns nullptr for an empty histogram.
std::unique_ptr<TH1D> ToTH1D(const stats::Histogram1D& h,
                             const std::string& name, const std::string& title);

// Writes energy_spectrum and temporal_distribution to a new ROOT file.
void WriteRootFile(const SimulationResult& r, const std::string& path);

} // namespace darksim
