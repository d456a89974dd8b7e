#pragma once

#include "libgauss/core/types.hpp"

#include <vector>

namespace gauss::math {

// P(i, j) = value at x[i] of the orthonormal polynomial of degree j, j = 0..n,
// for the weight whose recurrence coefficients are given (n = coefs.a.size()).
// Every b entry must be non-zero.
template <typename T>
Matrix<T> orthonormal_poly(const std::vector<T>& x, const RecurrenceCoefficients<T>& coefs);

} // namespace gauss::math
