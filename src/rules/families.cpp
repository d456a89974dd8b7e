#include "libgauss/rules/families.hpp"

#include "libgauss/coefs/classical.hpp"
#include "libgauss/coefs/modified_chebyshev.hpp"
#include "libgauss/core/errors.hpp"
#include "libgauss/rules/assemble.hpp"

#include <limits>
#include <string>

namespace gauss {

namespace {

template <typename... F>
struct OverloadSet : F... {
    using F::operator()...;
};
template <typename... F>
OverloadSet(F...) -> OverloadSet<F...>;

template <typename T>
constexpr T inf() {
    return std::numeric_limits<T>::infinity();
}

void require_endpt(bool allowed, const char* family) {
    if (!allowed) {
        throw InvalidDomain(std::string(family) + ": endpoint mode not available on this interval");
    }
}

} // namespace

template <typename T>
QuadratureRule<T> legendre(int n, EndPt endpt, const RuleConfig<T>& cfg) {
    return assemble_rule(T(-1), T(1), coefs::legendre<T>(n), endpt, cfg);
}

template <typename T>
QuadratureRule<T> lobatto(int n, const RuleConfig<T>& cfg) {
    return legendre<T>(n, EndPt::Both, cfg);
}

template <typename T>
QuadratureRule<T> chebyshev(int n, int kind, EndPt endpt, const RuleConfig<T>& cfg) {
    return assemble_rule(T(-1), T(1), coefs::chebyshev<T>(n, kind), endpt, cfg);
}

template <typename T>
QuadratureRule<T> jacobi(int n, T alpha, T beta, EndPt endpt, const RuleConfig<T>& cfg) {
    return assemble_rule(T(-1), T(1), coefs::jacobi<T>(n, alpha, beta), endpt, cfg);
}

template <typename T>
QuadratureRule<T> laguerre(int n, T alpha, EndPt endpt, const RuleConfig<T>& cfg) {
    require_endpt(endpt == EndPt::Neither || endpt == EndPt::Left, "laguerre");
    return assemble_rule(T(0), inf<T>(), coefs::laguerre<T>(n, alpha), endpt, cfg);
}

template <typename T>
QuadratureRule<T> hermite(int n, const RuleConfig<T>& cfg) {
    return assemble_rule(-inf<T>(), inf<T>(), coefs::hermite<T>(n), EndPt::Neither, cfg);
}

template <typename T>
QuadratureRule<T> logweight(int n, int r, EndPt endpt, const RuleConfig<T>& cfg) {
    return assemble_rule(T(0), T(1), coefs::logweight<T>(n, r), endpt, cfg);
}

template <typename T>
QuadratureRule<T> logweight_real(int n, T rho, EndPt endpt, const RuleConfig<T>& cfg) {
    return assemble_rule(T(0), T(1), coefs::logweight_real<T>(n, rho), endpt, cfg);
}

template <typename T>
std::pair<T, T> interval(const family::Any<T>& f) {
    return std::visit(OverloadSet{
                          [](const family::Laguerre<T>&) { return std::pair<T, T>{T(0), inf<T>()}; },
                          [](const family::Hermite&) { return std::pair<T, T>{-inf<T>(), inf<T>()}; },
                          [](const family::LogWeight&) { return std::pair<T, T>{T(0), T(1)}; },
                          [](const family::LogWeightReal<T>&) { return std::pair<T, T>{T(0), T(1)}; },
                          [](const family::Legendre&) { return std::pair<T, T>{T(-1), T(1)}; },
                          [](const family::Chebyshev&) { return std::pair<T, T>{T(-1), T(1)}; },
                          [](const family::Jacobi<T>&) { return std::pair<T, T>{T(-1), T(1)}; },
                      },
                      f);
}

template <typename T>
RecurrenceCoefficients<T> coefficients(const family::Any<T>& f, int n) {
    return std::visit(OverloadSet{
                          [n](const family::Legendre&) { return coefs::legendre<T>(n); },
                          [n](const family::Chebyshev& c) { return coefs::chebyshev<T>(n, c.kind); },
                          [n](const family::Jacobi<T>& j) { return coefs::jacobi<T>(n, j.alpha, j.beta); },
                          [n](const family::Laguerre<T>& l) { return coefs::laguerre<T>(n, l.alpha); },
                          [n](const family::Hermite&) { return coefs::hermite<T>(n); },
                          [n](const family::LogWeight& w) { return coefs::logweight<T>(n, w.r); },
                          [n](const family::LogWeightReal<T>& w) { return coefs::logweight_real<T>(n, w.rho); },
                      },
                      f);
}

template <typename T>
QuadratureRule<T> rule(const family::Any<T>& f, int n, EndPt endpt, const RuleConfig<T>& cfg) {
    return std::visit(OverloadSet{
                          [&](const family::Legendre&) { return legendre<T>(n, endpt, cfg); },
                          [&](const family::Chebyshev& c) { return chebyshev<T>(n, c.kind, endpt, cfg); },
                          [&](const family::Jacobi<T>& j) { return jacobi<T>(n, j.alpha, j.beta, endpt, cfg); },
                          [&](const family::Laguerre<T>& l) { return laguerre<T>(n, l.alpha, endpt, cfg); },
                          [&](const family::Hermite&) {
                              require_endpt(endpt == EndPt::Neither, "hermite");
                              return hermite<T>(n, cfg);
                          },
                          [&](const family::LogWeight& w) { return logweight<T>(n, w.r, endpt, cfg); },
                          [&](const family::LogWeightReal<T>& w) { return logweight_real<T>(n, w.rho, endpt, cfg); },
                      },
                      f);
}

template QuadratureRule<float> legendre<float>(int, EndPt, const RuleConfig<float>&);
template QuadratureRule<double> legendre<double>(int, EndPt, const RuleConfig<double>&);
template QuadratureRule<long double> legendre<long double>(int, EndPt, const RuleConfig<long double>&);

template QuadratureRule<float> lobatto<float>(int, const RuleConfig<float>&);
template QuadratureRule<double> lobatto<double>(int, const RuleConfig<double>&);
template QuadratureRule<long double> lobatto<long double>(int, const RuleConfig<long double>&);

template QuadratureRule<float> chebyshev<float>(int, int, EndPt, const RuleConfig<float>&);
template QuadratureRule<double> chebyshev<double>(int, int, EndPt, const RuleConfig<double>&);
template QuadratureRule<long double> chebyshev<long double>(int, int, EndPt, const RuleConfig<long double>&);

template QuadratureRule<float> jacobi<float>(int, float, float, EndPt, const RuleConfig<float>&);
template QuadratureRule<double> jacobi<double>(int, double, double, EndPt, const RuleConfig<double>&);
template QuadratureRule<long double> jacobi<long double>(int, long double, long double, EndPt,
                                                         const RuleConfig<long double>&);

template QuadratureRule<float> laguerre<float>(int, float, EndPt, const RuleConfig<float>&);
template QuadratureRule<double> laguerre<double>(int, double, EndPt, const RuleConfig<double>&);
template QuadratureRule<long double> laguerre<long double>(int, long double, EndPt, const RuleConfig<long double>&);

template QuadratureRule<float> hermite<float>(int, const RuleConfig<float>&);
template QuadratureRule<double> hermite<double>(int, const RuleConfig<double>&);
template QuadratureRule<long double> hermite<long double>(int, const RuleConfig<long double>&);

template QuadratureRule<float> logweight<float>(int, int, EndPt, const RuleConfig<float>&);
template QuadratureRule<double> logweight<double>(int, int, EndPt, const RuleConfig<double>&);
template QuadratureRule<long double> logweight<long double>(int, int, EndPt, const RuleConfig<long double>&);

template QuadratureRule<float> logweight_real<float>(int, float, EndPt, const RuleConfig<float>&);
template QuadratureRule<double> logweight_real<double>(int, double, EndPt, const RuleConfig<double>&);
template QuadratureRule<long double> logweight_real<long double>(int, long double, EndPt,
                                                                 const RuleConfig<long double>&);

template std::pair<float, float> interval<float>(const family::Any<float>&);
template std::pair<double, double> interval<double>(const family::Any<double>&);
template std::pair<long double, long double> interval<long double>(const family::Any<long double>&);

template RecurrenceCoefficients<float> coefficients<float>(const family::Any<float>&, int);
template RecurrenceCoefficients<double> coefficients<double>(const family::Any<double>&, int);
template RecurrenceCoefficients<long double> coefficients<long double>(const family::Any<long double>&, int);

template QuadratureRule<float> rule<float>(const family::Any<float>&, int, EndPt, const RuleConfig<float>&);
template QuadratureRule<double> rule<double>(const family::Any<double>&, int, EndPt, const RuleConfig<double>&);
template QuadratureRule<long double> rule<long double>(const family::Any<long double>&, int, EndPt,
                                                       const RuleConfig<long double>&);

} // namespace gauss
