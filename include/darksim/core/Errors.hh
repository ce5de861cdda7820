#pragma once
#include <stdexcept>
#include <string>

namespace darksim {

// Unknown detector kind or a physical parameter out of range.
// Raised before any sampling starts; the caller can retry with fixed input.
class ConfigurationError : public std::invalid_argument {
public:
  explicit ConfigurationError(const std::string& what)
  : std::invalid_argument(what) {}
};

// Rejection-sampling retry budget exhausted (v_escape far below v0).
// Fatal to the current run only.
class SamplingError : public std::runtime_error {
public:
  explicit SamplingError(const std::string& what)
  : std::runtime_error(what) {}
};

} // namespace darksim
