#include "darksim/physics/Sampler.hh"
#include "darksim/core/Errors.hh"
#include "darksim/physics/PhysicalConstants.hh"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace darksim::sampler {

Vec3 SampleGalacticVelocity(Rng& rng, double v0_m_s, double v_escape_m_s) {
  if (!(v0_m_s > 0.0) || !(v_escape_m_s > 0.0))
    throw SamplingError("SampleGalacticVelocity: v0 and v_escape must be > 0");

  std::normal_distribution<double> gaus(0.0, v0_m_s);
  const double vesc2 = v_escape_m_s * v_escape_m_s;

  for (int trial = 0; trial < kMaxVelocityTrials; ++trial) {
    Vec3 v{gaus(rng), gaus(rng), gaus(rng)};
    const double v2 = v[0]*v[0] + v[1]*v[1] + v[2]*v[2];
    if (v2 < vesc2) return v;
  }

  std::ostringstream os;
  os << "SampleGalacticVelocity: no draw below v_escape=" << v_escape_m_s
     << " m/s after " << kMaxVelocityTrials << " trials (v0=" << v0_m_s << " m/s)";
  throw SamplingError(os.str());
}

double SampleScatteringAngle(Rng& rng) {
  std::uniform_real_distribution<double> ucos(-1.0, 1.0);
  return std::acos(ucos(rng));
}

std::vector<double> SampleBackgroundEnergies(Rng& rng, const EnergyRange& range,
                                             double rate_per_exposure) {
  std::vector<double> out;
  const double width = range.max_keV - range.min_keV;
  if (!(rate_per_exposure > 0.0) || !(width > 0.0)) return out;

  std::poisson_distribution<long long> pois(rate_per_exposure);
  const long long n = pois(rng);

  const double scale = width / 3.0;
  std::exponential_distribution<double> expo(1.0 / scale);
  out.reserve(static_cast<size_t>(n));
  for (long long i = 0; i < n; ++i) {
    const double e = expo(rng);
    if (e >= range.min_keV && e <= range.max_keV) out.push_back(e);
  }
  return out;
}

double SampleBackgroundEnergy(Rng& rng, const EnergyRange& range) {
  const double width = range.max_keV - range.min_keV;
  if (!(width > 0.0)) return range.min_keV;

  // density ~ exp(-E/scale) on [min,max]
  const double scale = width / 3.0;
  const double a = std::exp(-range.min_keV / scale);
  const double b = std::exp(-range.max_keV / scale);
  std::uniform_real_distribution<double> uni(0.0, 1.0);
  const double u = uni(rng);
  const double e = -scale * std::log(a - u * (a - b));
  return std::min(std::max(e, range.min_keV), range.max_keV);
}

Vec3 SampleSphericalMomentum(Rng& rng, double magnitude) {
  std::uniform_real_distribution<double> ucos(-1.0, 1.0);
  std::uniform_real_distribution<double> uphi(0.0, 2.0 * phys::kPi);
  const double theta = std::acos(ucos(rng));
  const double phi   = uphi(rng);
  const double st = std::sin(theta);
  return {magnitude * st * std::cos(phi),
          magnitude * st * std::sin(phi),
          magnitude * std::cos(theta)};
}

Vec3 SampleUniformPosition(Rng& rng, double half_size_m) {
  std::uniform_real_distribution<double> uni(-half_size_m, half_size_m);
  return {uni(rng), uni(rng), uni(rng)};
}

double SampleEventTime_s(Rng& rng, double exposure_days) {
  if (!(exposure_days > 0.0)) return 0.0;
  std::uniform_real_distribution<double> uni(0.0, exposure_days);
  return uni(rng) * phys::kSecondsPerDay;
}

} // namespace darksim::sampler
