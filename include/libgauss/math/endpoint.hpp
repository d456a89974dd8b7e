#pragma once

#include "libgauss/core/types.hpp"

namespace gauss::math {

// Eliminates (J - shift I) delta = e on the leading (n-1) x (n-1) block of the
// Jacobi matrix J (diagonal a, off-diagonal b[1..]) and returns the reciprocal
// of the last pivot. Throws AlgorithmBreakdown on a zero pivot, i.e. when
// shift is already an eigenvalue of that block.
template <typename T>
T solve(int n, T shift, const RecurrenceCoefficients<T>& coefs);

// Golub (1973): modifies a[n-1] (and b[n-1] for Lobatto) so that lo and/or hi
// become eigenvalues of the Jacobi matrix. Takes ownership of the coefficients
// and hands them back constrained. EndPt::Neither returns them unchanged.
template <typename T>
RecurrenceCoefficients<T> constrain_endpoints(RecurrenceCoefficients<T> coefs, T lo, T hi, EndPt endpt);

} // namespace gauss::math
