#pragma once

#include <cstddef>
#include <limits>
#include <type_traits>
#include <vector>

namespace gauss {

// Which interval endpoints must appear among the quadrature nodes.
enum class EndPt {
    Neither, // Gauss:        lo < x[j] < hi
    Left,    // left Radau:   lo = x[0]
    Right,   // right Radau:  x[n-1] = hi
    Both     // Lobatto:      lo = x[0], x[n-1] = hi
};

// Coefficients of the monic recurrence
//   p_k(x) = (x - a[k-1]) p_{k-1}(x) - b[k-1]^2 p_{k-2}(x),  p_0 = 1, p_{-1} = 0
// with b[0]^2 equal to the zeroth moment of the weight. a has n entries, b has n+1.
template <typename T>
struct RecurrenceCoefficients {
    std::vector<T> a;
    std::vector<T> b;

    std::size_t order() const { return a.size(); }
};

template <typename T>
struct QuadratureRule {
    std::vector<T> nodes;
    std::vector<T> weights;

    std::size_t size() const { return nodes.size(); }
};

// Row-major dense table.
template <typename T>
struct Matrix {
    std::size_t rows = 0;
    std::size_t cols = 0;
    std::vector<T> data;

    Matrix() = default;
    Matrix(std::size_t r, std::size_t c) : rows(r), cols(c), data(r * c, T(0)) {}

    T& operator()(std::size_t i, std::size_t j) { return data[i * cols + j]; }
    const T& operator()(std::size_t i, std::size_t j) const { return data[i * cols + j]; }
};

template <typename T>
constexpr int default_max_iterations() {
    static_assert(std::is_floating_point<T>::value, "floating point type required");
    return std::numeric_limits<T>::digits > std::numeric_limits<double>::digits ? 40 : 30;
}

template <typename T>
struct RuleConfig {
    // QL sweeps allowed per eigenvalue before giving up.
    int max_iterations = default_max_iterations<T>();
    // Relative tolerance for splitting the tridiagonal matrix, must be positive.
    T epsilon = std::numeric_limits<T>::epsilon();
};

} // namespace gauss
