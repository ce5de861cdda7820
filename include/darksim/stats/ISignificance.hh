#pragma once

namespace darksim::stats {

/**
 * Counting-experiment significance Z(s, b) in units of sigma.
 *
 * Conventions shared by all implementations:
 *  - Z(0, 0) = 0
 *  - Z(s, 0) = +inf for s > 0
 */
class ISignificance {
public:
  virtual ~ISignificance() = default;

  virtual double Evaluate(double signal, double background) const = 0;
  virtual const char* Name() const = 0;
};

} // namespace darksim::stats
