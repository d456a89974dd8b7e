#pragma once

#include <vector>

namespace gauss::math {

template <typename T>
struct TridiagonalEigen {
    std::vector<T> eigenvalues;      // in index order, not sorted
    std::vector<T> first_components; // first entry of each normalised eigenvector
    int sweeps = 0;                  // QL sweeps over all eigenvalues
};

// Eigenvalues and first eigenvector components of the symmetric tridiagonal
// matrix with diagonal d[0..n-1] and sub-diagonal e[1..n-1] (e[i] couples d[i-1]
// and d[i]; e[0] is ignored and preserved, e has n+1 entries). Implicit QL with
// Wilkinson shift, a modified EISPACK imtql2 (Martin & Wilkinson 1968,
// Dubrulle 1970).
//
// d and e are consumed. Throws ConvergenceFailure if some eigenvalue has not
// split off after max_iterations sweeps, InvalidDomain on size mismatch,
// negative max_iterations or epsilon that is not positive.
template <typename T>
TridiagonalEigen<T> special_eigenproblem(std::vector<T> d, std::vector<T> e, int max_iterations, T epsilon);

} // namespace gauss::math
