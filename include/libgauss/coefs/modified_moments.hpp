#pragma once

#include <vector>

namespace gauss::coefs {

// Modified moments nu[l] = integral_0^1 x^rho log(1/x) q_l(x) dx, l = 0..2n-1,
// where q_l is the orthonormal shifted Legendre polynomial of degree l.
//
// The integer and real exponent versions avoid cancellation differently and
// are kept separate. Both throw InvalidDomain for n < 1 or an exponent <= -1.

template <typename T>
std::vector<T> modified_moments(int n, int r);

// r = round(rho) (half-way cases away from zero, 0 for rho < 0) picks the index
// at which the Legendre factor (rho + 1 - j) passes through zero; rho itself is
// kept in the arithmetic.
template <typename T>
std::vector<T> modified_moments_real(int n, T rho);

} // namespace gauss::coefs
