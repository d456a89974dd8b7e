#include "libgauss/coefs/modified_moments.hpp"

#include "libgauss/core/errors.hpp"

#include <algorithm>
#include <cmath>

namespace gauss::coefs {

// With B_l = prod_{j<l} (rho+1-j)/(rho+1+j) the plain moments against the
// shifted Legendre basis are B_l/(rho+1); the log weight moments are minus
// their derivative in rho, B_l S_l/(rho+1) with
// S_l = 1/(rho+1) + sum_{j<l} [1/(rho+1+j) - 1/(rho+1-j)].
// Once j reaches r+1 the factor (rho+1-j) is zero (integer r) or tiny, so
// the tail switches to a form that never divides by it.

template <typename T>
std::vector<T> modified_moments(int n, int r) {
    if (n < 1) {
        throw InvalidDomain("modified_moments: number of points must be positive");
    }
    if (r < 0) {
        throw InvalidDomain("modified_moments: exponent r must be non-negative");
    }
    const int len = 2 * n;
    const int m = std::min(len, r + 1);
    const T rrp1 = T(1) / T(r + 1);
    T B = T(1);
    T S = rrp1;
    std::vector<T> nu(len, T(0));
    nu[0] = rrp1 * S;
    for (int l = 2; l <= m; ++l) {
        const int j = l - 1;
        const T rrpj = T(1) / T(r + 1 + j);
        const T rmj = T(r + 1 - j);
        B *= rmj * rrpj;
        S += rrpj - T(1) / rmj;
        nu[l - 1] = rrp1 * B * S * std::sqrt(T(2 * l - 1));
    }
    if (len > r + 1) {
        T p = T(1);
        for (int j = 1; j <= r; ++j) {
            p *= T(j) / T(2 * (2 * j + 1));
        }
        nu[r + 1] = -std::sqrt(T(2 * r + 3)) * p / T(2 * (r + 1));
        for (int l = r + 2; l <= len - 1; ++l) {
            const T tl = T(l);
            nu[l] = -nu[l - 1] * ((tl - T(r) - T(1)) / (tl + T(r) + T(1)))
                  * std::sqrt((T(2) * tl + T(1)) / (T(2) * tl - T(1)));
        }
    }
    return nu;
}

template <typename T>
std::vector<T> modified_moments_real(int n, T rho) {
    if (n < 1) {
        throw InvalidDomain("modified_moments_real: number of points must be positive");
    }
    if (!(rho > T(-1))) {
        throw InvalidDomain("modified_moments_real: exponent rho must exceed -1");
    }
    const int len = 2 * n;
    const int r = (rho < T(0)) ? 0 : static_cast<int>(std::lround(rho));
    const int m = std::min(len, r + 1);
    const T rp1 = rho + T(1);
    T S = T(1) / rp1;
    T B = T(1);
    std::vector<T> nu(len, T(0));
    nu[0] = S / rp1;
    for (int l = 2; l <= m; ++l) {
        const T j = T(l - 1);
        B *= (rp1 - j) / (rp1 + j);
        S += T(1) / (rp1 + j) - T(1) / (rp1 - j);
        nu[l - 1] = (B / rp1) * S * std::sqrt(T(2 * l - 1));
    }
    if (len > r + 1) {
        // term j = r+1 folded into X and ratio
        const T tr = T(r);
        const T ratio = (rho - tr) / (rho + tr + T(2));
        const T X = (ratio - T(1)) / (rho + tr + T(2));
        nu[r + 1] = (B / rp1) * (X + ratio * S) * std::sqrt(T(2 * r + 3));
        for (int l = r + 3; l <= len; ++l) {
            const T j = T(l - 1);
            B *= (rp1 - j) / (rp1 + j);
            S += T(1) / (rp1 + j) - T(1) / (rp1 - j);
            nu[l - 1] = (B / rp1) * (X + ratio * S) * std::sqrt(T(2 * l - 1));
        }
    }
    return nu;
}

template std::vector<float> modified_moments<float>(int, int);
template std::vector<double> modified_moments<double>(int, int);
template std::vector<long double> modified_moments<long double>(int, int);

template std::vector<float> modified_moments_real<float>(int, float);
template std::vector<double> modified_moments_real<double>(int, double);
template std::vector<long double> modified_moments_real<long double>(int, long double);

} // namespace gauss::coefs
