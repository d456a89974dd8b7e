#pragma once

#include "libgauss/core/types.hpp"

namespace gauss {

// Golub-Welsch: the n-point Gauss (or Radau/Lobatto, per endpt) rule for the
// weight on (lo, hi) whose monic recurrence coefficients are given.
//
// The coefficients are consumed. Nodes come back in increasing order; with an
// endpoint mode the corresponding extreme node equals lo and/or hi exactly.
//
// Throws InvalidDomain for malformed coefficients (b.size() != a.size() + 1,
// non-positive b) or an impossible endpoint request, AlgorithmBreakdown from the
// endpoint solver and ConvergenceFailure from the eigensolver.
template <typename T>
QuadratureRule<T> assemble_rule(T lo,
                                T hi,
                                RecurrenceCoefficients<T> coefs,
                                EndPt endpt,
                                const RuleConfig<T>& cfg = {});

} // namespace gauss
