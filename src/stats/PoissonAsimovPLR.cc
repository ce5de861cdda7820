#include "darksim/stats/PoissonAsimovPLR.hh"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace darksim::stats {

namespace {

inline double safe_log(double x) {
  constexpr double kMin = 1e-300;
  return std::log(x < kMin ? kMin : x);
}

} // namespace

double PoissonAsimovPLR::EvaluateNLL(const std::vector<double>& data,
                                     const std::vector<double>& model) const {
  if (data.size() != model.size()) {
    throw std::invalid_argument("PoissonAsimovPLR::EvaluateNLL: data/model size mismatch");
  }

  double nll = 0.0;
  for (std::size_t i = 0; i < data.size(); ++i) {
    const double n_i  = data[i];
    const double mu_i = model[i];

    if (mu_i <= 0.0) {
      if (n_i <= 0.0) continue;
      // data>0 with mu<=0 is impossible under this model
      return std::numeric_limits<double>::infinity();
    }
    nll += mu_i - n_i * safe_log(mu_i);
  }
  return nll;
}

double PoissonAsimovPLR::EvaluateRatio(const std::vector<double>& data,
                                       const std::vector<double>& model_test,
                                       const std::vector<double>& model_null) const {
  if (data.size() != model_test.size() || data.size() != model_null.size()) {
    throw std::invalid_argument("PoissonAsimovPLR::EvaluateRatio: size mismatch");
  }

  const double nll_test = EvaluateNLL(data, model_test);
  const double nll_null = EvaluateNLL(data, model_null);
  if (std::isinf(nll_test)) return std::numeric_limits<double>::infinity();

  const double q = 2.0 * (nll_test - nll_null);
  return q < 0.0 ? 0.0 : q;
}

double PoissonAsimovPLR::Evaluate(double s, double b) const {
  if (s <= 0.0) return 0.0;
  if (b <= 0.0) return std::numeric_limits<double>::infinity();

  // Asimov data n = s+b; test = background only, null = best fit s+b
  const std::vector<double> data{s + b};
  const double q0 = EvaluateRatio(data, {b}, {s + b});
  return std::sqrt(q0);
}

} // namespace darksim::stats
