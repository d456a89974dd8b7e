#pragma once

#include <stdexcept>
#include <string>

namespace gauss {

// Parameters outside the family's domain, malformed coefficient arrays,
// or an endpoint mode the family cannot honour.
class InvalidDomain : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// The data is not realisable by a positive-definite measure at working precision.
class AlgorithmBreakdown : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ConvergenceFailure : public std::runtime_error {
public:
    ConvergenceFailure(const std::string& what, int iterations)
        : std::runtime_error(what), iterations_(iterations) {}

    int iterations() const noexcept { return iterations_; }

private:
    int iterations_;
};

} // namespace gauss
