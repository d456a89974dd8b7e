#pragma once

#include "libgauss/core/types.hpp"

#include <utility>
#include <variant>

namespace gauss {

// n-point rules for the classical weights. All throw InvalidDomain for n < 1,
// parameters outside the family's domain, or an endpoint mode the interval
// cannot carry (an infinite end, or Lobatto with one point).

// w(x) = 1 on (-1, 1)
template <typename T>
QuadratureRule<T> legendre(int n, EndPt endpt = EndPt::Neither, const RuleConfig<T>& cfg = {});

// Gauss-Lobatto-Legendre, n >= 2
template <typename T>
QuadratureRule<T> lobatto(int n, const RuleConfig<T>& cfg = {});

// kind 1: 1/sqrt(1-x^2), kind 2: sqrt(1-x^2), on (-1, 1)
template <typename T>
QuadratureRule<T> chebyshev(int n, int kind = 1, EndPt endpt = EndPt::Neither, const RuleConfig<T>& cfg = {});

// (1-x)^alpha (1+x)^beta on (-1, 1)
template <typename T>
QuadratureRule<T> jacobi(int n, T alpha, T beta, EndPt endpt = EndPt::Neither, const RuleConfig<T>& cfg = {});

// x^alpha exp(-x) on (0, inf); only Neither and Left are possible
template <typename T>
QuadratureRule<T> laguerre(int n, T alpha, EndPt endpt = EndPt::Neither, const RuleConfig<T>& cfg = {});

// exp(-x^2) on (-inf, inf)
template <typename T>
QuadratureRule<T> hermite(int n, const RuleConfig<T>& cfg = {});

// x^r log(1/x) on (0, 1), integer r >= 0
template <typename T>
QuadratureRule<T> logweight(int n, int r = 0, EndPt endpt = EndPt::Neither, const RuleConfig<T>& cfg = {});

// x^rho log(1/x) on (0, 1), real rho > -1
template <typename T>
QuadratureRule<T> logweight_real(int n, T rho, EndPt endpt = EndPt::Neither, const RuleConfig<T>& cfg = {});

namespace family {

struct Legendre {};
struct Chebyshev { int kind = 1; };
template <typename T> struct Jacobi { T alpha; T beta; };
template <typename T> struct Laguerre { T alpha = T(0); };
struct Hermite {};
struct LogWeight { int r = 0; };
template <typename T> struct LogWeightReal { T rho; };

template <typename T>
using Any = std::variant<Legendre, Chebyshev, Jacobi<T>, Laguerre<T>, Hermite, LogWeight, LogWeightReal<T>>;

} // namespace family

// Interval (lo, hi) of the family's weight; infinite ends are +-infinity.
template <typename T>
std::pair<T, T> interval(const family::Any<T>& f);

template <typename T>
RecurrenceCoefficients<T> coefficients(const family::Any<T>& f, int n);

template <typename T>
QuadratureRule<T> rule(const family::Any<T>& f, int n, EndPt endpt = EndPt::Neither, const RuleConfig<T>& cfg = {});

} // namespace gauss
