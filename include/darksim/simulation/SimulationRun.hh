#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "darksim/detector/DetectorConfiguration.hh"
#include "darksim/event/EventCollection.hh"
#include "darksim/physics/Sampler.hh"
#include "darksim/simulation/SimulationResult.hh"

namespace darksim {

struct SimulationOptions {
  HaloModel     halo;
  EnergyRange   background_range{0.0, 100.0};  // keV
  double        detector_half_size_m = 1.0;     // interaction vertices in a cube
  bool          shuffle     = false;            // mix signal/background before ids
  std::uint64_t rng_seed    = 12345;
  int           energy_bins = 100;
  int           time_bins   = 50;
  int           verbosity   = 0;
};

// One Monte Carlo run for a fixed detector. Owns its random engine, reseeded
// from options.rng_seed at the start of every Run*, so results depend on the
// seed only. All input checks happen before the first draw; on any exception
// nothing from the partial run is kept.
class SimulationRun {
public:
  SimulationRun(DetectorConfiguration config, SimulationOptions options);

  // n_signal WIMP trials (only accepted ones are stored) and exactly
  // n_background background events.
  EventCollection Run(long long n_signal, long long n_background);

  // Background count drawn from Poisson(rate * mass * exposure).
  EventCollection RunExpectedBackground(long long n_signal);

  SimulationResult Summarize(const EventCollection& events,
                             long long n_signal, long long n_background) const;

  const DetectorConfiguration& config()  const noexcept { return cfg_; }
  const SimulationOptions&     options() const noexcept { return opt_; }

  // Of the most recent run; 0 before any signal trial.
  double mean_wimp_speed_m_s() const noexcept { return mean_speed_m_s_; }

private:
  struct Candidate {
    double         timestamp_s;
    double         true_energy_keV;
    double         observed_energy_keV;
    bool           is_signal;
    Vec3           position_m;
    nlohmann::json metadata;
  };

  void generate_signal_(long long n, std::vector<Candidate>& out);
  Candidate make_background_(double energy_keV);
  EventCollection finalize_(std::vector<Candidate>& cands);
  void log_run_(const char* what, long long n_signal, const EventCollection& ev) const;

  DetectorConfiguration cfg_;
  SimulationOptions     opt_;
  Rng                   rng_;
  double                mean_speed_m_s_ = 0.0;
};

// configure -> run -> aggregate in one call.
SimulationResult RunSimulation(const DetectorConfiguration& config,
                               long long n_signal, long long n_background,
                               const SimulationOptions& options = {});

} // namespace darksim
