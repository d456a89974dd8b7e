#include "libgauss/coefs/modified_chebyshev.hpp"

#include "libgauss/coefs/classical.hpp"
#include "libgauss/coefs/modified_moments.hpp"
#include "libgauss/core/errors.hpp"

#include <cmath>
#include <string>

namespace gauss::coefs {

namespace {

template <typename T>
RecurrenceCoefficients<T> truncate(RecurrenceCoefficients<T> coefs, int n) {
    coefs.a.resize(n);
    coefs.b.resize(n + 1);
    return coefs;
}

} // namespace

template <typename T>
ModifiedChebyshevResult<T> modified_chebyshev(const RecurrenceCoefficients<T>& reference,
                                              const std::vector<T>& nu) {
    const auto& a = reference.a;
    const auto& b = reference.b;
    const std::size_t m = nu.size();
    if (m < 2 || m % 2 != 0) {
        throw InvalidDomain("modified_chebyshev: need an even, positive number of moments");
    }
    const std::size_t n = m / 2;
    if (a.size() < 2 * n - 1 || b.size() < 2 * n) {
        throw InvalidDomain("modified_chebyshev: reference coefficients too short for "
                            + std::to_string(m) + " moments");
    }
    if (!(nu[0] > T(0))) {
        throw AlgorithmBreakdown("modified_chebyshev: zeroth moment must be positive");
    }

    ModifiedChebyshevResult<T> out;
    auto& alpha = out.coefs.a;
    auto& beta = out.coefs.b;
    alpha.assign(n, T(0));
    beta.assign(n + 1, T(0));
    out.sigma = Matrix<T>(m, n);
    auto& sigma = out.sigma;

    beta[0] = std::sqrt(nu[0]);
    for (std::size_t l = 0; l < m; ++l) {
        sigma(l, 0) = nu[l] / beta[0];
    }
    alpha[0] = a[0] + b[1] * (sigma(1, 0) / sigma(0, 0));

    // sigma(l, k) = <p_k, q_l> for the target p_k and reference q_l; column k
    // is needed for rows k..2n-k-1. The column k-1 term is absent for k = 0.
    for (std::size_t k = 0; k + 1 < n; ++k) {
        const T diag = sigma(k, k);
        T t = T(1) + (b[k + 2] / b[k + 1]) * (sigma(k + 2, k) / diag)
                   + ((a[k + 1] - alpha[k]) / b[k + 1]) * (sigma(k + 1, k) / diag);
        if (k > 0) {
            t -= (beta[k] / b[k + 1]) * (sigma(k + 1, k - 1) / diag);
        }
        if (!(t > T(0))) {
            throw AlgorithmBreakdown("modified_chebyshev: negative radicand at k = "
                                     + std::to_string(k + 1));
        }
        beta[k + 1] = b[k + 1] * std::sqrt(t);

        for (std::size_t l = k + 1; l + k + 2 <= m; ++l) {
            T s = b[l + 1] * sigma(l + 1, k) + (a[l] - alpha[k]) * sigma(l, k) + b[l] * sigma(l - 1, k);
            if (k > 0) {
                s -= beta[k] * sigma(l, k - 1);
            }
            sigma(l, k + 1) = s / beta[k + 1];
        }
        alpha[k + 1] = a[k + 1] + b[k + 2] * (sigma(k + 2, k + 1) / sigma(k + 1, k + 1))
                     - beta[k + 1] * (sigma(k + 1, k) / sigma(k + 1, k + 1));
    }
    return out;
}

template <typename T>
RecurrenceCoefficients<T> logweight(int n, int r) {
    if (n < 1) {
        throw InvalidDomain("logweight: number of points must be positive");
    }
    // one extra order so that b[n] is determined as well
    const auto nu = modified_moments<T>(n + 1, r);
    return truncate(modified_chebyshev(shifted_legendre<T>(2 * n + 2), nu).coefs, n);
}

template <typename T>
RecurrenceCoefficients<T> logweight_real(int n, T rho) {
    if (n < 1) {
        throw InvalidDomain("logweight_real: number of points must be positive");
    }
    const auto nu = modified_moments_real<T>(n + 1, rho);
    return truncate(modified_chebyshev(shifted_legendre<T>(2 * n + 2), nu).coefs, n);
}

template ModifiedChebyshevResult<float> modified_chebyshev<float>(const RecurrenceCoefficients<float>&,
                                                                  const std::vector<float>&);
template ModifiedChebyshevResult<double> modified_chebyshev<double>(const RecurrenceCoefficients<double>&,
                                                                    const std::vector<double>&);
template ModifiedChebyshevResult<long double> modified_chebyshev<long double>(
    const RecurrenceCoefficients<long double>&, const std::vector<long double>&);

template RecurrenceCoefficients<float> logweight<float>(int, int);
template RecurrenceCoefficients<double> logweight<double>(int, int);
template RecurrenceCoefficients<long double> logweight<long double>(int, int);

template RecurrenceCoefficients<float> logweight_real<float>(int, float);
template RecurrenceCoefficients<double> logweight_real<double>(int, double);
template RecurrenceCoefficients<long double> logweight_real<long double>(int, long double);

} // namespace gauss::coefs
