#include "libgauss/math/tridiag_eigen.hpp"

#include "libgauss/core/errors.hpp"

#include <cmath>
#include <string>
#include <utility>

namespace gauss::math {

template <typename T>
TridiagonalEigen<T> special_eigenproblem(std::vector<T> d, std::vector<T> e, int max_iterations, T epsilon) {
    const std::size_t n = d.size();
    if (n == 0 || e.size() != n + 1) {
        throw InvalidDomain("special_eigenproblem: expected n diagonal and n+1 off-diagonal entries");
    }
    if (max_iterations < 0) {
        throw InvalidDomain("special_eigenproblem: max_iterations must be non-negative");
    }
    if (!(epsilon > T(0))) {
        throw InvalidDomain("special_eigenproblem: epsilon must be positive");
    }

    TridiagonalEigen<T> out;
    std::vector<T> z(n, T(0));
    z[0] = T(1);
    e[n] = T(0);

    for (std::size_t l = 0; n > 1 && l < n; ++l) {
        int iter = 0;
        while (true) {
            // look for a small sub-diagonal element to split the matrix
            std::size_t m = n - 1;
            for (std::size_t i = l; i + 1 < n; ++i) {
                if (std::abs(e[i + 1]) <= epsilon * (std::abs(d[i]) + std::abs(d[i + 1]))) {
                    m = i;
                    break;
                }
            }
            if (m == l) {
                break;
            }
            if (iter == max_iterations) {
                throw ConvergenceFailure("No convergence after " + std::to_string(iter)
                                             + " iterations (try increasing max_iterations)",
                                         iter);
            }
            ++iter;
            ++out.sweeps;

            // shift from the leading 2x2 block
            T p = d[l];
            T g = (d[l + 1] - p) / (T(2) * e[l + 1]);
            T r = std::hypot(g, T(1));
            g = d[m] - p + e[l + 1] / (g + std::copysign(r, g));
            T s = T(1);
            T c = T(1);
            p = T(0);
            for (std::size_t i = m; i-- > l;) {
                T f = s * e[i + 1];
                const T bb = c * e[i + 1];
                if (std::abs(f) < std::abs(g)) {
                    s = f / g;
                    r = std::hypot(s, T(1));
                    e[i + 2] = g * r;
                    c = T(1) / r;
                    s *= c;
                } else {
                    c = g / f;
                    r = std::hypot(c, T(1));
                    e[i + 2] = f * r;
                    s = T(1) / r;
                    c *= s;
                }
                g = d[i + 1] - p;
                r = (d[i] - g) * s + T(2) * c * bb;
                p = s * r;
                d[i + 1] = g + p;
                g = c * r - bb;
                // rotate first components of the eigenvectors
                f = z[i + 1];
                z[i + 1] = s * z[i] + c * f;
                z[i] = c * z[i] - s * f;
            }
            d[l] -= p;
            e[l + 1] = g;
            e[m + 1] = T(0);
        }
    }

    out.eigenvalues = std::move(d);
    out.first_components = std::move(z);
    return out;
}

template TridiagonalEigen<float> special_eigenproblem<float>(std::vector<float>, std::vector<float>, int, float);
template TridiagonalEigen<double> special_eigenproblem<double>(std::vector<double>, std::vector<double>, int, double);
template TridiagonalEigen<long double> special_eigenproblem<long double>(std::vector<long double>,
                                                                         std::vector<long double>, int, long double);

} // namespace gauss::math
