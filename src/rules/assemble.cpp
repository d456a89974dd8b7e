#include "libgauss/rules/assemble.hpp"

#include "libgauss/core/errors.hpp"
#include "libgauss/math/endpoint.hpp"
#include "libgauss/math/tridiag_eigen.hpp"

#include <algorithm>
#include <numeric>
#include <string>
#include <utility>

namespace gauss {

namespace {

template <typename T>
void validate(T lo, T hi, const RecurrenceCoefficients<T>& coefs) {
    const std::size_t n = coefs.a.size();
    if (n == 0) {
        throw InvalidDomain("assemble_rule: need at least one point");
    }
    if (coefs.b.size() != n + 1) {
        throw InvalidDomain("assemble_rule: b must have one more entry than a");
    }
    if (!(lo < hi)) {
        throw InvalidDomain("assemble_rule: interval must satisfy lo < hi");
    }
    // b[n] only enters through the recurrence of degree n+1
    for (std::size_t k = 0; k < n; ++k) {
        if (!(coefs.b[k] > T(0))) {
            throw InvalidDomain("assemble_rule: b[" + std::to_string(k)
                                + "] is not positive; the weight is not positive definite");
        }
    }
}

} // namespace

template <typename T>
QuadratureRule<T> assemble_rule(T lo, T hi, RecurrenceCoefficients<T> coefs, EndPt endpt, const RuleConfig<T>& cfg) {
    validate(lo, hi, coefs);
    const std::size_t n = coefs.a.size();

    coefs = math::constrain_endpoints(std::move(coefs), lo, hi, endpt);
    const T b0 = coefs.b[0];
    auto eig = math::special_eigenproblem(std::move(coefs.a), std::move(coefs.b), cfg.max_iterations, cfg.epsilon);

    std::vector<std::size_t> idx(n);
    std::iota(idx.begin(), idx.end(), std::size_t{0});
    std::sort(idx.begin(), idx.end(), [&](std::size_t i, std::size_t j) {
        return eig.eigenvalues[i] < eig.eigenvalues[j];
    });

    QuadratureRule<T> rule;
    rule.nodes.reserve(n);
    rule.weights.reserve(n);
    for (std::size_t i : idx) {
        const T w = b0 * eig.first_components[i];
        rule.nodes.push_back(eig.eigenvalues[i]);
        rule.weights.push_back(w * w);
    }

    // remove round-off left by the endpoint solve
    if (endpt == EndPt::Left || endpt == EndPt::Both) {
        rule.nodes.front() = lo;
    }
    if (endpt == EndPt::Right || endpt == EndPt::Both) {
        rule.nodes.back() = hi;
    }
    return rule;
}

template QuadratureRule<float> assemble_rule<float>(float, float, RecurrenceCoefficients<float>, EndPt,
                                                    const RuleConfig<float>&);
template QuadratureRule<double> assemble_rule<double>(double, double, RecurrenceCoefficients<double>, EndPt,
                                                      const RuleConfig<double>&);
template QuadratureRule<long double> assemble_rule<long double>(long double, long double,
                                                                RecurrenceCoefficients<long double>, EndPt,
                                                                const RuleConfig<long double>&);

} // namespace gauss
