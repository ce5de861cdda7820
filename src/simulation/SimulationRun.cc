#include "darksim/simulation/SimulationRun.hh"
#include "darksim/core/Errors.hh"
#include "darksim/event/Particle.hh"
#include "darksim/physics/Kinematics.hh"
#include "darksim/physics/PhysicalConstants.hh"
#include "darksim/response/DetectorResponse.hh"
#include "darksim/stats/Aggregator.hh"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

namespace darksim {

namespace {

constexpr std::size_t kMaxReserve = std::size_t(1) << 20;

void check_options(const SimulationOptions& o) {
  if (!(o.halo.wimp_mass_GeV > 0.0))
    throw ConfigurationError("wimp_mass_GeV must be > 0");
  if (!(o.halo.cross_section_cm2 >= 0.0))
    throw ConfigurationError("cross_section_cm2 must be >= 0");
  if (!(o.halo.v0_m_s > 0.0) || !(o.halo.v_escape_m_s > 0.0))
    throw ConfigurationError("v0 and v_escape must be > 0");
  if (!(o.halo.v_escape_m_s < phys::kSpeedOfLight_m_s))
    throw ConfigurationError("v_escape must be below the speed of light");
  if (!(o.halo.local_density_GeV_cm3 >= 0.0))
    throw ConfigurationError("local_density must be >= 0");
  if (!(o.background_range.min_keV >= 0.0) ||
      !(o.background_range.max_keV > o.background_range.min_keV))
    throw ConfigurationError("background energy range must satisfy 0 <= min < max");
  if (!(o.detector_half_size_m > 0.0))
    throw ConfigurationError("detector_half_size_m must be > 0");
  if (o.energy_bins < 1 || o.time_bins < 1)
    throw ConfigurationError("energy_bins and time_bins must be >= 1");
}

// Mean of |v| for an untruncated Maxwellian with per-axis sigma v0.
double maxwell_mean_speed(double v0) {
  return v0 * std::sqrt(8.0 / phys::kPi);
}

} // namespace

SimulationRun::SimulationRun(DetectorConfiguration config, SimulationOptions options)
  : cfg_(std::move(config)), opt_(std::move(options)), rng_(opt_.rng_seed)
{
  check_options(opt_);
}

void SimulationRun::generate_signal_(long long n, std::vector<Candidate>& out) {
  const double mchi     = opt_.halo.wimp_mass_GeV;
  const double mN       = cfg_.nucleus_mass_GeV();
  const double thr      = cfg_.threshold_keV();
  const double res      = cfg_.resolution();
  const double quench   = cfg_.quenching_factor();
  const auto&  eff      = cfg_.efficiency();

  double speed_sum = 0.0;
  for (long long i = 0; i < n; ++i) {
    const Vec3 v   = sampler::SampleGalacticVelocity(rng_, opt_.halo.v0_m_s, opt_.halo.v_escape_m_s);
    const Vec3 pos = sampler::SampleUniformPosition(rng_, opt_.detector_half_size_m);
    const double t = sampler::SampleEventTime_s(rng_, cfg_.exposure_days());
    const Particle wimp = Particle::FromVelocity(ParticleType::DarkMatter, v, pos, t,
                                                 "elastic_nuclear_recoil", mchi);
    const double speed = wimp.speed_m_s();
    speed_sum += speed;

    const double theta  = sampler::SampleScatteringAngle(rng_);
    const double Er_nr  = kinematics::RecoilEnergy_keV(mchi, speed, mN, theta);
    const double E_vis  = Er_nr * quench;

    const auto observed = response::Respond(rng_, E_vis, res, eff);
    if (!observed || *observed < thr) continue;

    nlohmann::json meta = {
      {"event_type",         ToString(wimp.type())},
      {"interaction",        wimp.interaction()},
      {"scattering_angle",   theta},
      {"wimp_mass_GeV",      mchi},
      {"wimp_velocity_m_s",  speed},
      {"recoil_energy_keV",  Er_nr},
    };
    out.push_back(Candidate{t, E_vis, *observed, true, pos, std::move(meta)});
  }
  mean_speed_m_s_ = (n > 0) ? speed_sum / static_cast<double>(n) : 0.0;
}

SimulationRun::Candidate SimulationRun::make_background_(double energy_keV) {
  const double t   = sampler::SampleEventTime_s(rng_, cfg_.exposure_days());
  const Vec3   pos = sampler::SampleUniformPosition(rng_, opt_.detector_half_size_m);

  // electron-recoil quantum: |p| = sqrt(T^2 + 2 T m)
  const double m   = RestMass_GeV(ParticleType::Background);
  const double T   = energy_keV / phys::kGeV_to_keV;
  const Vec3   p   = sampler::SampleSphericalMomentum(rng_, std::sqrt(T * T + 2.0 * T * m));
  const Particle quantum(ParticleType::Background, energy_keV, p, pos, t, "electron_recoil");

  const auto observed = response::Respond(rng_, energy_keV, cfg_.resolution(), cfg_.efficiency());

  nlohmann::json meta = {
    {"event_type",  ToString(quantum.type())},
    {"interaction", quantum.interaction()},
    {"detected",    observed.has_value()},
  };
  return Candidate{t, energy_keV, observed.value_or(energy_keV), false, pos, std::move(meta)};
}

EventCollection SimulationRun::finalize_(std::vector<Candidate>& cands) {
  if (opt_.shuffle) std::shuffle(cands.begin(), cands.end(), rng_);

  EventCollection events;
  events.Reserve(cands.size());
  std::uint64_t id = 0;
  for (auto& c : cands) {
    events.Add(DetectionEvent(id++, c.timestamp_s, c.true_energy_keV, c.observed_energy_keV,
                              c.is_signal, c.position_m, std::move(c.metadata)));
  }
  return events;
}

EventCollection SimulationRun::Run(long long n_signal, long long n_background) {
  if (n_signal < 0 || n_background < 0)
    throw ConfigurationError("event counts must be >= 0");

  rng_.seed(opt_.rng_seed);
  mean_speed_m_s_ = 0.0;

  std::vector<Candidate> cands;
  cands.reserve(std::min<std::size_t>(static_cast<std::size_t>(n_signal) +
                                      static_cast<std::size_t>(n_background), kMaxReserve));

  generate_signal_(n_signal, cands);
  for (long long i = 0; i < n_background; ++i) {
    const double E = sampler::SampleBackgroundEnergy(rng_, opt_.background_range);
    cands.push_back(make_background_(E));
  }

  auto events = finalize_(cands);
  log_run_("Run", n_signal, events);
  return events;
}

EventCollection SimulationRun::RunExpectedBackground(long long n_signal) {
  if (n_signal < 0) throw ConfigurationError("event counts must be >= 0");

  rng_.seed(opt_.rng_seed);
  mean_speed_m_s_ = 0.0;

  std::vector<Candidate> cands;
  cands.reserve(std::min<std::size_t>(static_cast<std::size_t>(n_signal), kMaxReserve));
  generate_signal_(n_signal, cands);

  const double mean_bkg = cfg_.background_rate_per_kg_day() * cfg_.exposure_kg_day();
  const auto energies = sampler::SampleBackgroundEnergies(rng_, opt_.background_range, mean_bkg);
  for (double E : energies) cands.push_back(make_background_(E));

  auto events = finalize_(cands);
  log_run_("RunExpectedBackground", n_signal, events);
  return events;
}

SimulationResult SimulationRun::Summarize(const EventCollection& events,
                                          long long n_signal, long long n_background) const {
  SimulationResult r(cfg_);
  r.halo                   = opt_.halo;
  r.n_signal_requested     = n_signal;
  r.n_background_requested = n_background;
  r.rng_seed               = opt_.rng_seed;

  r.statistics            = stats::ComputeStatistics(events, n_signal, cfg_.exposure_kg_day());
  r.energy_spectrum       = stats::EnergySpectrum(events, opt_.energy_bins);
  r.temporal_distribution = stats::TemporalDistribution(events, opt_.time_bins);

  r.mean_wimp_speed_m_s = (mean_speed_m_s_ > 0.0) ? mean_speed_m_s_
                                                  : maxwell_mean_speed(opt_.halo.v0_m_s);
  const double sigma_N = kinematics::DifferentialCrossSection(0.0, cfg_.A(), opt_.halo.cross_section_cm2);
  r.expected_signal_rate_per_day =
      kinematics::InteractionRate_per_day(sigma_N, r.mean_wimp_speed_m_s, cfg_.mass_kg(),
                                          cfg_.nucleus_mass_GeV(), opt_.halo.wimp_mass_GeV,
                                          opt_.halo.local_density_GeV_cm3);
  return r;
}

void SimulationRun::log_run_(const char* what, long long n_signal,
                             const EventCollection& ev) const {
  if (opt_.verbosity <= 0) return;
  std::cout << "[run] " << what << " detector=" << cfg_.kind_name()
            << " seed=" << opt_.rng_seed << "\n"
            << "  signal trials     : " << n_signal << "\n"
            << "  signal accepted   : " << ev.signal_count() << "\n"
            << "  background events : " << ev.background_count() << "\n";
  if (opt_.verbosity > 1)
    std::cout << "  <|v_chi|> [km/s]  : " << mean_speed_m_s_ * 1e-3 << "\n";
}

SimulationResult RunSimulation(const DetectorConfiguration& config,
                               long long n_signal, long long n_background,
                               const SimulationOptions& options) {
  SimulationRun run(config, options);
  const auto events = run.Run(n_signal, n_background);
  return run.Summarize(events, n_signal, n_background);
}

} // namespace darksim
