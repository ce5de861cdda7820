#pragma once

#include <vector>

#include "darksim/stats/ISignificance.hh"

namespace darksim::stats {

/**
 * Poisson likelihood-ratio discovery significance.
 *
 * EvaluateNLL:
 *   -ln L = sum_i [ mu_i - n_i ln(mu_i) ]   (up to additive constants)
 *
 * EvaluateRatio:
 *   q = 2 [ NLL(data | model_test) - NLL(data | model_null) ]
 *
 * Evaluate(s, b) uses the Asimov dataset n = s + b against the
 * background-only hypothesis, giving the familiar
 *   Z = sqrt( 2 [ (s+b) ln(1 + s/b) - s ] ).
 */
class PoissonAsimovPLR : public ISignificance {
public:
  PoissonAsimovPLR() = default;
  ~PoissonAsimovPLR() override = default;

  double EvaluateNLL(const std::vector<double>& data,
                     const std::vector<double>& model) const;

  double EvaluateRatio(const std::vector<double>& data,
                       const std::vector<double>& model_test,
                       const std::vector<double>& model_null) const;

  double Evaluate(double signal, double background) const override;
  const char* Name() const override { return "asimov"; }
};

} // namespace darksim::stats
