#pragma once
#include <nlohmann/json.hpp>

#include "darksim/detector/DetectorConfiguration.hh"
#include "darksim/event/DetectionEvent.hh"
#include "darksim/simulation/SimulationHistory.hh"
#include "darksim/simulation/SimulationResult.hh"
#include "darksim/stats/Aggregator.hh"

namespace darksim {

// JSON views for the serving layer. Non-finite numbers (empty-run energy
// extrema, infinite significance) are written as null.
nlohmann::json ToJson(const DetectorConfiguration& cfg);
nlohmann::json ToJson(const DetectionEvent& ev);
nlohmann::json ToJson(const stats::RunStatistics& st);
nlohmann::json ToJson(const stats::Histogram1D& h, const char* edges_key = "bins");
nlohmann::json ToJson(const stats::DerivedMetrics& m);
nlohmann::json ToJson(const SimulationResult& r);
nlohmann::json ToJson(const HistoryEntry& e);

} // namespace darksim
