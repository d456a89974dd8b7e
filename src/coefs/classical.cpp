#include "libgauss/coefs/classical.hpp"

#include "libgauss/core/constants.hpp"
#include "libgauss/core/errors.hpp"

#include <cmath>
#include <string>

namespace gauss::coefs {

namespace {

void require_order(int n, const char* family) {
    if (n < 1) {
        throw InvalidDomain(std::string(family) + ": number of points must be positive");
    }
}

template <typename T>
RecurrenceCoefficients<T> zeros(int n) {
    RecurrenceCoefficients<T> c;
    c.a.assign(n, T(0));
    c.b.assign(n + 1, T(0));
    return c;
}

} // namespace

template <typename T>
RecurrenceCoefficients<T> legendre(int n) {
    require_order(n, "legendre");
    auto c = zeros<T>(n);
    c.b[0] = std::sqrt(T(2));
    for (int k = 2; k <= n + 1; ++k) {
        c.b[k - 1] = T(k - 1) / std::sqrt(T(2 * k - 1) * T(2 * k - 3));
    }
    return c;
}

template <typename T>
RecurrenceCoefficients<T> chebyshev(int n, int kind) {
    require_order(n, "chebyshev");
    const T half = T(1) / T(2);
    RecurrenceCoefficients<T> c;
    c.a.assign(n, T(0));
    c.b.assign(n + 1, half);
    if (kind == 1) {
        c.b[0] = std::sqrt(PI<T>);
        if (n >= 2) {
            c.b[1] = std::sqrt(half);
        }
    } else if (kind == 2) {
        c.b[0] = std::sqrt(half * PI<T>);
    } else {
        throw InvalidDomain("chebyshev: unsupported kind " + std::to_string(kind) + " (expected 1 or 2)");
    }
    return c;
}

template <typename T>
RecurrenceCoefficients<T> jacobi(int n, T alpha, T beta) {
    require_order(n, "jacobi");
    if (!(alpha > T(-1)) || !(beta > T(-1))) {
        throw InvalidDomain("jacobi: alpha and beta must both exceed -1");
    }
    auto c = zeros<T>(n);
    const T ab = alpha + beta;
    T abi = ab + T(2);
    // log-gamma keeps the zeroth moment finite for large exponents
    c.b[0] = std::pow(T(2), (ab + T(1)) / T(2))
           * std::exp((std::lgamma(alpha + T(1)) + std::lgamma(beta + T(1)) - std::lgamma(abi)) / T(2));
    c.a[0] = (beta - alpha) / abi;
    c.b[1] = std::sqrt(T(4) * (alpha + T(1)) * (beta + T(1)) / ((ab + T(3)) * abi * abi));
    const T a2b2 = beta * beta - alpha * alpha;
    for (int i = 2; i <= n; ++i) {
        const T ti = T(i);
        abi = ab + T(2) * ti;
        c.a[i - 1] = a2b2 / ((abi - T(2)) * abi);
        c.b[i] = std::sqrt(T(4) * ti * (alpha + ti) * (beta + ti) * (ab + ti)
                           / ((abi * abi - T(1)) * abi * abi));
    }
    return c;
}

template <typename T>
RecurrenceCoefficients<T> laguerre(int n, T alpha) {
    require_order(n, "laguerre");
    if (!(alpha > T(-1))) {
        throw InvalidDomain("laguerre: alpha must exceed -1");
    }
    auto c = zeros<T>(n);
    c.b[0] = std::sqrt(std::tgamma(alpha + T(1)));
    for (int i = 1; i <= n; ++i) {
        const T ti = T(i);
        c.a[i - 1] = T(2) * ti - T(1) + alpha;
        c.b[i] = std::sqrt(ti * (alpha + ti));
    }
    return c;
}

template <typename T>
RecurrenceCoefficients<T> hermite(int n) {
    require_order(n, "hermite");
    auto c = zeros<T>(n);
    c.b[0] = std::sqrt(std::sqrt(PI<T>));
    for (int i = 1; i <= n; ++i) {
        c.b[i] = std::sqrt(T(i) / T(2));
    }
    return c;
}

template <typename T>
RecurrenceCoefficients<T> shifted_legendre(int n) {
    require_order(n, "shifted_legendre");
    RecurrenceCoefficients<T> c;
    c.a.assign(n, T(1) / T(2));
    c.b.assign(n + 1, T(0));
    c.b[0] = T(1);
    for (int k = 2; k <= n + 1; ++k) {
        c.b[k - 1] = T(k - 1) / (T(2) * std::sqrt(T(2 * k - 1) * T(2 * k - 3)));
    }
    return c;
}

template RecurrenceCoefficients<float> legendre<float>(int);
template RecurrenceCoefficients<double> legendre<double>(int);
template RecurrenceCoefficients<long double> legendre<long double>(int);

template RecurrenceCoefficients<float> chebyshev<float>(int, int);
template RecurrenceCoefficients<double> chebyshev<double>(int, int);
template RecurrenceCoefficients<long double> chebyshev<long double>(int, int);

template RecurrenceCoefficients<float> jacobi<float>(int, float, float);
template RecurrenceCoefficients<double> jacobi<double>(int, double, double);
template RecurrenceCoefficients<long double> jacobi<long double>(int, long double, long double);

template RecurrenceCoefficients<float> laguerre<float>(int, float);
template RecurrenceCoefficients<double> laguerre<double>(int, double);
template RecurrenceCoefficients<long double> laguerre<long double>(int, long double);

template RecurrenceCoefficients<float> hermite<float>(int);
template RecurrenceCoefficients<double> hermite<double>(int);
template RecurrenceCoefficients<long double> hermite<long double>(int);

template RecurrenceCoefficients<float> shifted_legendre<float>(int);
template RecurrenceCoefficients<double> shifted_legendre<double>(int);
template RecurrenceCoefficients<long double> shifted_legendre<long double>(int);

} // namespace gauss::coefs
