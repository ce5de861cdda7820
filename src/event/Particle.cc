#include "darksim/event/Particle.hh"
#include "darksim/core/Errors.hh"

#include <cmath>
#include <utility>

namespace darksim {

std::string ToString(ParticleType type) {
  switch (type) {
    case ParticleType::DarkMatter: return "dark_matter";
    case ParticleType::Background: return "background";
    case ParticleType::CosmicRay:  return "cosmic_ray";
    case ParticleType::Neutrino:   return "neutrino";
  }
  return "unknown";
}

double RestMass_GeV(ParticleType type, double wimp_mass_GeV) {
  switch (type) {
    case ParticleType::DarkMatter: return wimp_mass_GeV;
    case ParticleType::Background: return phys::kElectronMass_GeV;
    case ParticleType::CosmicRay:  return phys::kMuonMass_GeV;
    case ParticleType::Neutrino:   return 0.0;
  }
  return 0.0;
}

Vec3 MakeVec3(const std::vector<double>& v, const char* what) {
  if (v.size() != 3)
    throw ConfigurationError(std::string(what) + " must have exactly 3 components, got "
                             + std::to_string(v.size()));
  return {v[0], v[1], v[2]};
}

double Norm(const Vec3& v) {
  return std::sqrt(v[0]*v[0] + v[1]*v[1] + v[2]*v[2]);
}

Particle::Particle(ParticleType type, double energy_keV,
                   const Vec3& momentum_GeV, const Vec3& position_m,
                   double timestamp_s, std::string interaction,
                   double wimp_mass_GeV)
  : type_(type), energy_keV_(energy_keV), momentum_(momentum_GeV),
    position_(position_m), timestamp_s_(timestamp_s),
    interaction_(std::move(interaction)), wimp_mass_GeV_(wimp_mass_GeV)
{
  if (type_ == ParticleType::DarkMatter && !(wimp_mass_GeV_ > 0.0))
    throw ConfigurationError("dark-matter mass must be > 0");
}

Particle::Particle(ParticleType type, double energy_keV,
                   const std::vector<double>& momentum_GeV,
                   const std::vector<double>& position_m,
                   double timestamp_s, std::string interaction,
                   double wimp_mass_GeV)
  : Particle(type, energy_keV, MakeVec3(momentum_GeV, "momentum"),
             MakeVec3(position_m, "position"), timestamp_s,
             std::move(interaction), wimp_mass_GeV) {}

Particle Particle::FromVelocity(ParticleType type, const Vec3& velocity_m_s,
                                const Vec3& position_m, double timestamp_s,
                                std::string interaction, double wimp_mass_GeV) {
  const double m = RestMass_GeV(type, wimp_mass_GeV);
  const double beta = Norm(velocity_m_s) / phys::kSpeedOfLight_m_s;
  if (!(beta < 1.0))
    throw ConfigurationError("particle speed must be below c");
  const double gamma = 1.0 / std::sqrt(1.0 - beta * beta);

  Vec3 p;
  for (int i = 0; i < 3; ++i)
    p[i] = gamma * m * velocity_m_s[i] / phys::kSpeedOfLight_m_s;

  // kinetic energy, (gamma-1) m written to avoid cancellation
  const double T_GeV = m * beta * beta * gamma * gamma / (gamma + 1.0);
  return Particle(type, T_GeV * phys::kGeV_to_keV, p, position_m, timestamp_s,
                  std::move(interaction), wimp_mass_GeV);
}

double Particle::rest_mass_GeV() const {
  return RestMass_GeV(type_, wimp_mass_GeV_);
}

double Particle::momentum_GeV() const { return Norm(momentum_); }

double Particle::total_energy_GeV() const {
  const double p = momentum_GeV();
  const double m = rest_mass_GeV();
  return std::sqrt(p * p + m * m);
}

double Particle::kinetic_energy_keV() const {
  const double p = momentum_GeV();
  const double m = rest_mass_GeV();
  const double E = total_energy_GeV();
  // E - m = p^2 / (E + m)
  const double T = (E + m > 0.0) ? p * p / (E + m) : 0.0;
  return T * phys::kGeV_to_keV;
}

Vec3 Particle::velocity_m_s() const {
  const double E = total_energy_GeV();
  if (!(E > 0.0)) return {0.0, 0.0, 0.0};
  Vec3 v;
  for (int i = 0; i < 3; ++i) v[i] = momentum_[i] / E * phys::kSpeedOfLight_m_s;
  return v;
}

double Particle::speed_m_s() const { return Norm(velocity_m_s()); }

} // namespace darksim
