#pragma once
#include <array>
#include <random>
#include <vector>

namespace darksim {

using Vec3 = std::array<double, 3>;
using Rng  = std::mt19937_64;

struct EnergyRange {
  double min_keV = 0.0;
  double max_keV = 100.0;
};

namespace sampler {

// Upper bound on rejection-sampling attempts per velocity draw.
constexpr int kMaxVelocityTrials = 10000;

// Truncated Maxwell-Boltzmann: three N(0, v0) components, resampled while
// |v| >= v_escape. Velocities in m/s.
// Throws SamplingError if v0/v_escape are non-positive or the retry budget
// is exhausted.
Vec3 SampleGalacticVelocity(Rng& rng, double v0_m_s, double v_escape_m_s);

// Isotropic scattering: cos(theta) uniform on [-1,1]; returns theta in [0, pi].
double SampleScatteringAngle(Rng& rng);

// Poisson(rate_per_exposure) events with exponential energies
// (scale = width/3); draws outside [min,max] are dropped, not resampled,
// so the result may be shorter than the Poisson count.
std::vector<double> SampleBackgroundEnergies(Rng& rng, const EnergyRange& range,
                                             double rate_per_exposure);

// Single energy from the same exponential shape restricted to [min,max]
// (inverse CDF, no rejection loop).
double SampleBackgroundEnergy(Rng& rng, const EnergyRange& range);

// Isotropic direction scaled by magnitude.
Vec3 SampleSphericalMomentum(Rng& rng, double magnitude);

// Uniform point in the cube [-half, half]^3 (meters).
Vec3 SampleUniformPosition(Rng& rng, double half_size_m = 1.0);

// Uniform time in [0, exposure_days] converted to seconds.
double SampleEventTime_s(Rng& rng, double exposure_days);

} // namespace sampler
} // namespace darksim
