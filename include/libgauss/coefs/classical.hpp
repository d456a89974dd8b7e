#pragma once

#include "libgauss/core/types.hpp"

namespace gauss::coefs {

// Recurrence coefficients for the classical weight functions.
// Each returns a of length n and b of length n+1; n >= 1 or InvalidDomain is thrown.
// Instantiated for float, double and long double.

// w(x) = 1 on (-1, 1)
template <typename T>
RecurrenceCoefficients<T> legendre(int n);

// kind 1: w(x) = 1/sqrt(1-x^2), kind 2: w(x) = sqrt(1-x^2), on (-1, 1)
template <typename T>
RecurrenceCoefficients<T> chebyshev(int n, int kind);

// w(x) = (1-x)^alpha (1+x)^beta on (-1, 1), alpha > -1, beta > -1
template <typename T>
RecurrenceCoefficients<T> jacobi(int n, T alpha, T beta);

// w(x) = x^alpha exp(-x) on (0, inf), alpha > -1
template <typename T>
RecurrenceCoefficients<T> laguerre(int n, T alpha);

// w(x) = exp(-x^2) on (-inf, inf)
template <typename T>
RecurrenceCoefficients<T> hermite(int n);

// w(x) = 1 on (0, 1)
template <typename T>
RecurrenceCoefficients<T> shifted_legendre(int n);

} // namespace gauss::coefs
