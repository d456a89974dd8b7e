#include "libgauss/math/endpoint.hpp"

#include "libgauss/core/errors.hpp"

#include <cmath>
#include <limits>
#include <string>

namespace gauss::math {

namespace {

// A pivot is numerically zero when it is lost in the rounding of its row of
// J - shift I.
template <typename T>
T checked_pivot(T t, T row_scale, int i) {
    if (!std::isfinite(t) || std::abs(t) <= std::numeric_limits<T>::epsilon() * row_scale) {
        throw AlgorithmBreakdown("endpoint solve: degenerate pivot at row " + std::to_string(i)
                                 + " (shift coincides with an eigenvalue)");
    }
    return t;
}

template <typename T>
void require_finite(T x, const char* which) {
    if (!std::isfinite(x)) {
        throw InvalidDomain(std::string("endpoint constraint: ") + which + " endpoint is not finite");
    }
}

} // namespace

template <typename T>
T solve(int n, T shift, const RecurrenceCoefficients<T>& coefs) {
    const auto& a = coefs.a;
    const auto& b = coefs.b;
    auto row_scale = [&](int i) {
        T scale = std::abs(a[i]) + std::abs(shift) + std::abs(b[i + 1]);
        if (i > 0) {
            scale += std::abs(b[i]);
        }
        return scale;
    };
    T t = checked_pivot(a[0] - shift, row_scale(0), 1);
    for (int i = 1; i < n - 1; ++i) {
        t = checked_pivot(a[i] - shift - b[i] * b[i] / t, row_scale(i), i + 1);
    }
    return T(1) / t;
}

template <typename T>
RecurrenceCoefficients<T> constrain_endpoints(RecurrenceCoefficients<T> coefs, T lo, T hi, EndPt endpt) {
    const int n = static_cast<int>(coefs.a.size());
    auto& a = coefs.a;
    auto& b = coefs.b;
    switch (endpt) {
    case EndPt::Neither:
        break;
    case EndPt::Left:
        require_finite(lo, "left");
        if (n == 1) {
            a[0] = lo;
        } else {
            a[n - 1] = solve(n, lo, coefs) * b[n - 1] * b[n - 1] + lo;
        }
        break;
    case EndPt::Right:
        require_finite(hi, "right");
        if (n == 1) {
            a[0] = hi;
        } else {
            a[n - 1] = solve(n, hi, coefs) * b[n - 1] * b[n - 1] + hi;
        }
        break;
    case EndPt::Both: {
        if (n == 1) {
            throw InvalidDomain("Lobatto rule needs at least two points");
        }
        require_finite(lo, "left");
        require_finite(hi, "right");
        const T g = solve(n, lo, coefs);
        const T t1 = (hi - lo) / (g - solve(n, hi, coefs));
        if (!(t1 > T(0)) || !std::isfinite(t1)) {
            throw AlgorithmBreakdown("endpoint solve: Lobatto off-diagonal is not positive");
        }
        b[n - 1] = std::sqrt(t1);
        a[n - 1] = lo + g * t1;
        break;
    }
    }
    return coefs;
}

template float solve<float>(int, float, const RecurrenceCoefficients<float>&);
template double solve<double>(int, double, const RecurrenceCoefficients<double>&);
template long double solve<long double>(int, long double, const RecurrenceCoefficients<long double>&);

template RecurrenceCoefficients<float> constrain_endpoints<float>(RecurrenceCoefficients<float>, float, float, EndPt);
template RecurrenceCoefficients<double> constrain_endpoints<double>(RecurrenceCoefficients<double>, double, double, EndPt);
template RecurrenceCoefficients<long double> constrain_endpoints<long double>(RecurrenceCoefficients<long double>,
                                                                            long double, long double, EndPt);

} // namespace gauss::math
