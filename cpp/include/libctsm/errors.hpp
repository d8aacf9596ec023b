#pragma once

#include <stdexcept>
#include <string>

namespace libctsm {

// A subject's raw record cannot be turned into an observation series.
class InvalidRecord : public std::invalid_argument {
public:
    explicit InvalidRecord(const std::string& what) : std::invalid_argument(what) {}
};

// Innovation covariance (or initial covariance) is not positive definite
// for the current trial parameters.
class DegenerateLikelihood : public std::runtime_error {
public:
    explicit DegenerateLikelihood(const std::string& what) : std::runtime_error(what) {}
};

class NonConvergence : public std::runtime_error {
public:
    explicit NonConvergence(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace libctsm
