#include "libgauss/math/orthonormal_poly.hpp"

#include "libgauss/core/errors.hpp"

namespace gauss::math {

template <typename T>
Matrix<T> orthonormal_poly(const std::vector<T>& x, const RecurrenceCoefficients<T>& coefs) {
    const auto& a = coefs.a;
    const auto& b = coefs.b;
    const std::size_t n = a.size();
    if (b.size() != n + 1) {
        throw InvalidDomain("orthonormal_poly: b must have one more entry than a");
    }
    const std::size_t m = x.size();
    Matrix<T> p(m, n + 1);

    const T rb1 = T(1) / b[0];
    for (std::size_t i = 0; i < m; ++i) {
        p(i, 0) = rb1;
    }
    if (n == 0) {
        return p;
    }
    const T rb2 = T(1) / b[1];
    for (std::size_t i = 0; i < m; ++i) {
        p(i, 1) = rb2 * (x[i] - a[0]) * p(i, 0);
    }
    for (std::size_t j = 1; j < n; ++j) {
        const T rb = T(1) / b[j + 1];
        for (std::size_t i = 0; i < m; ++i) {
            p(i, j + 1) = rb * ((x[i] - a[j]) * p(i, j) - b[j] * p(i, j - 1));
        }
    }
    return p;
}

template Matrix<float> orthonormal_poly<float>(const std::vector<float>&, const RecurrenceCoefficients<float>&);
template Matrix<double> orthonormal_poly<double>(const std::vector<double>&, const RecurrenceCoefficients<double>&);
template Matrix<long double> orthonormal_poly<long double>(const std::vector<long double>&,
                                                           const RecurrenceCoefficients<long double>&);

} // namespace gauss::math
