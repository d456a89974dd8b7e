#pragma once

#include "libgauss/core/types.hpp"

#include <vector>

namespace gauss::coefs {

template <typename T>
struct ModifiedChebyshevResult {
    RecurrenceCoefficients<T> coefs; // target family, n and n+1 entries
    Matrix<T> sigma;                 // 2n x n mixed moments, lower band only
};

// Modified Chebyshev algorithm (Wheeler 1974, Gautschi 1982).
//
// Given recurrence coefficients (a, b) of a reference family and the 2n modified
// moments nu of the target weight against the reference orthonormal polynomials,
// computes the first n recurrence coefficients of the target weight.
// Requires nu.size() = 2n even and positive, a.size() >= 2n-1, b.size() >= 2n.
// The last entry b[n] is not determined by 2n moments and is left at zero.
//
// Throws AlgorithmBreakdown when a radicand is not positive, i.e. the moments are
// not those of a positive-definite measure at working precision. Accuracy decays
// as n grows because the sigma entries lose relative precision.
template <typename T>
ModifiedChebyshevResult<T> modified_chebyshev(const RecurrenceCoefficients<T>& reference,
                                              const std::vector<T>& nu);

// Gauss coefficients for w(x) = x^r log(1/x) on (0, 1), integer r >= 0.
template <typename T>
RecurrenceCoefficients<T> logweight(int n, int r);

// Gauss coefficients for w(x) = x^rho log(1/x) on (0, 1), real rho > -1.
template <typename T>
RecurrenceCoefficients<T> logweight_real(int n, T rho);

} // namespace gauss::coefs
