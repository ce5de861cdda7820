#pragma once
#include <string>
#include <vector>

#include "darksim/physics/PhysicalConstants.hh"
#include "darksim/physics/Sampler.hh"

namespace darksim {

enum class ParticleType { DarkMatter, Background, CosmicRay, Neutrino };

std::string ToString(ParticleType type);

// Rest mass in GeV/c^2. Background quanta are electrons, cosmic rays muons,
// neutrinos massless; dark matter uses the configured WIMP mass.
double RestMass_GeV(ParticleType type, double wimp_mass_GeV = phys::kWimpMass_GeV);

// Throws ConfigurationError unless v has exactly three components.
Vec3 MakeVec3(const std::vector<double>& v, const char* what = "vector");

double Norm(const Vec3& v);

// A physical quantum entering the detector. Momentum in GeV/c, position in m,
// timestamp in s since exposure start, energy in keV.
class Particle {
public:
  Particle(ParticleType type, double energy_keV,
           const Vec3& momentum_GeV, const Vec3& position_m,
           double timestamp_s, std::string interaction,
           double wimp_mass_GeV = phys::kWimpMass_GeV);

  Particle(ParticleType type, double energy_keV,
           const std::vector<double>& momentum_GeV,
           const std::vector<double>& position_m,
           double timestamp_s, std::string interaction,
           double wimp_mass_GeV = phys::kWimpMass_GeV);

  // Non-relativistic dark-matter quantum from a halo velocity draw (m/s).
  static Particle FromVelocity(ParticleType type, const Vec3& velocity_m_s,
                               const Vec3& position_m, double timestamp_s,
                               std::string interaction,
                               double wimp_mass_GeV = phys::kWimpMass_GeV);

  ParticleType       type()        const noexcept { return type_; }
  double             energy_keV()  const noexcept { return energy_keV_; }
  const Vec3&        momentum()    const noexcept { return momentum_; }
  const Vec3&        position()    const noexcept { return position_; }
  double             timestamp_s() const noexcept { return timestamp_s_; }
  const std::string& interaction() const noexcept { return interaction_; }

  double rest_mass_GeV()      const;
  double momentum_GeV()       const;
  double total_energy_GeV()   const;
  double kinetic_energy_keV() const;

  // v = p c^2 / E_tot
  Vec3   velocity_m_s() const;
  double speed_m_s()    const;

private:
  ParticleType type_;
  double       energy_keV_;
  Vec3         momentum_;
  Vec3         position_;
  double       timestamp_s_;
  std::string  interaction_;
  double       wimp_mass_GeV_;
};

} // namespace darksim
