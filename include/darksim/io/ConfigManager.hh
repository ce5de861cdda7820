#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

#include "darksim/detector/DetectorConfiguration.hh"
#include "darksim/simulation/SimulationRun.hh"
#include "darksim/stats/StatisticsConfig.hh"

namespace darksim {

enum class BackgroundMode { Fixed, Poisson };

struct RunHeader {
  std::string    label;
  std::string    outdir = ".";
  long long      n_signal     = 50;
  long long      n_background = 1000;
  BackgroundMode background_mode = BackgroundMode::Fixed;
  std::size_t    history_capacity = 100;
  int            verbosity = 1;
};

// Reads a JSON run description:
//   run        { label, outdir, rng_seed, verbosity, n_signal, n_background,
//                shuffle, energy_bins, time_bins }
//   detector   { type, mass_kg, temperature_mK, exposure_days, threshold_keV?,
//                resolution?, background_rate?, efficiency?, efficiency_mid_keV?,
//                quenching_factor? }
//   halo       { wimp_mass_GeV, cross_section_cm2, v0_km_s, v_escape_km_s, rho_GeV_cm3 }
//   background { Emin_keV, Emax_keV, mode: "fixed" | "poisson" }
//   statistics { method, discovery_threshold_sigma }
// Missing optional keys keep their defaults. Malformed input throws
// ConfigurationError.
class ConfigManager {
public:
  explicit ConfigManager(std::string path = {});
  void parse();
  void parse(const nlohmann::json& j);

  const RunHeader&              run()        const noexcept { return run_; }
  const DetectorConfiguration&  detector()   const;
  const SimulationOptions&      options()    const noexcept { return options_; }
  const stats::StatisticsConfig& statistics() const noexcept { return stats_; }

private:
  std::string  path_;
  RunHeader    run_;
  std::unique_ptr<DetectorConfiguration> detector_;
  SimulationOptions       options_;
  stats::StatisticsConfig stats_;

  void parse_run_(const nlohmann::json& j);
  void parse_detector_(const nlohmann::json& j);
  void parse_halo_(const nlohmann::json& j);
  void parse_background_(const nlohmann::json& j);
  void parse_statistics_(const nlohmann::json& j);
};

} // namespace darksim
