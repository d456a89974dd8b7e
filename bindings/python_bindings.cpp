#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/numpy.h>

#include "libgauss/coefs/classical.hpp"
#include "libgauss/coefs/modified_chebyshev.hpp"
#include "libgauss/coefs/modified_moments.hpp"
#include "libgauss/core/errors.hpp"
#include "libgauss/core/types.hpp"
#include "libgauss/math/orthonormal_poly.hpp"
#include "libgauss/rules/assemble.hpp"
#include "libgauss/rules/families.hpp"

#include <string>
#include <utility>
#include <vector>

namespace py = pybind11;

namespace {

py::array_t<double> to_numpy(const gauss::Matrix<double>& mat) {
    py::array_t<double> out(std::vector<py::ssize_t>{static_cast<py::ssize_t>(mat.rows),
                                                     static_cast<py::ssize_t>(mat.cols)});
    auto view = out.mutable_unchecked<2>();
    for (std::size_t i = 0; i < mat.rows; ++i) {
        for (std::size_t j = 0; j < mat.cols; ++j) {
            view(i, j) = mat(i, j);
        }
    }
    return out;
}

} // namespace

PYBIND11_MODULE(gausspy, m) {
    m.doc() = "Gauss quadrature rules via the Golub-Welsch algorithm";

    py::register_exception<gauss::InvalidDomain>(m, "InvalidDomain", PyExc_ValueError);
    py::register_exception<gauss::AlgorithmBreakdown>(m, "AlgorithmBreakdown", PyExc_ArithmeticError);
    py::register_exception<gauss::ConvergenceFailure>(m, "ConvergenceFailure", PyExc_RuntimeError);

    // --- Core types ---
    py::enum_<gauss::EndPt>(m, "EndPt")
        .value("Neither", gauss::EndPt::Neither)
        .value("Left",    gauss::EndPt::Left)
        .value("Right",   gauss::EndPt::Right)
        .value("Both",    gauss::EndPt::Both);

    py::class_<gauss::RuleConfig<double>>(m, "RuleConfig")
        .def(py::init<>())
        .def_readwrite("max_iterations", &gauss::RuleConfig<double>::max_iterations)
        .def_readwrite("epsilon",        &gauss::RuleConfig<double>::epsilon);

    py::class_<gauss::RecurrenceCoefficients<double>>(m, "RecurrenceCoefficients")
        .def(py::init<>())
        .def(py::init([](std::vector<double> a, std::vector<double> b) {
                 return gauss::RecurrenceCoefficients<double>{std::move(a), std::move(b)};
             }),
             py::arg("a"), py::arg("b"))
        .def_readwrite("a", &gauss::RecurrenceCoefficients<double>::a)
        .def_readwrite("b", &gauss::RecurrenceCoefficients<double>::b)
        .def("__len__", &gauss::RecurrenceCoefficients<double>::order);

    py::class_<gauss::QuadratureRule<double>>(m, "QuadratureRule")
        .def_readonly("nodes",   &gauss::QuadratureRule<double>::nodes)
        .def_readonly("weights", &gauss::QuadratureRule<double>::weights)
        .def("__len__", &gauss::QuadratureRule<double>::size)
        .def("__repr__", [](const gauss::QuadratureRule<double>& q) {
            return "QuadratureRule{n=" + std::to_string(q.size()) + "}";
        });

    // --- Rules ---
    const gauss::RuleConfig<double> default_cfg{};

    m.def("legendre", &gauss::legendre<double>,
        "Gauss-Legendre rule on (-1, 1)",
        py::arg("n"), py::arg("endpt") = gauss::EndPt::Neither, py::arg("cfg") = default_cfg);

    m.def("lobatto", &gauss::lobatto<double>,
        "Gauss-Lobatto-Legendre rule, n >= 2",
        py::arg("n"), py::arg("cfg") = default_cfg);

    m.def("chebyshev", &gauss::chebyshev<double>,
        "Gauss-Chebyshev rule of the first or second kind",
        py::arg("n"), py::arg("kind") = 1, py::arg("endpt") = gauss::EndPt::Neither,
        py::arg("cfg") = default_cfg);

    m.def("jacobi", &gauss::jacobi<double>,
        "Gauss-Jacobi rule for (1-x)^alpha (1+x)^beta",
        py::arg("n"), py::arg("alpha"), py::arg("beta"), py::arg("endpt") = gauss::EndPt::Neither,
        py::arg("cfg") = default_cfg);

    m.def("laguerre", &gauss::laguerre<double>,
        "Gauss-Laguerre rule for x^alpha exp(-x)",
        py::arg("n"), py::arg("alpha") = 0.0, py::arg("endpt") = gauss::EndPt::Neither,
        py::arg("cfg") = default_cfg);

    m.def("hermite", &gauss::hermite<double>,
        "Gauss-Hermite rule for exp(-x^2)",
        py::arg("n"), py::arg("cfg") = default_cfg);

    m.def("logweight", &gauss::logweight<double>,
        "Gauss rule for x^r log(1/x) on (0, 1)",
        py::arg("n"), py::arg("r") = 0, py::arg("endpt") = gauss::EndPt::Neither,
        py::arg("cfg") = default_cfg);

    m.def("logweight_real", &gauss::logweight_real<double>,
        "Gauss rule for x^rho log(1/x) on (0, 1), real rho > -1",
        py::arg("n"), py::arg("rho"), py::arg("endpt") = gauss::EndPt::Neither,
        py::arg("cfg") = default_cfg);

    m.def("assemble_rule",
        [](double lo, double hi, gauss::RecurrenceCoefficients<double> coefs, gauss::EndPt endpt,
           const gauss::RuleConfig<double>& cfg) {
            return gauss::assemble_rule(lo, hi, std::move(coefs), endpt, cfg);
        },
        "Golub-Welsch rule from user supplied recurrence coefficients",
        py::arg("lo"), py::arg("hi"), py::arg("coefs"), py::arg("endpt") = gauss::EndPt::Neither,
        py::arg("cfg") = default_cfg);

    // --- Recurrence coefficients ---
    m.def("legendre_coefs", &gauss::coefs::legendre<double>, py::arg("n"));
    m.def("chebyshev_coefs", &gauss::coefs::chebyshev<double>, py::arg("n"), py::arg("kind") = 1);
    m.def("jacobi_coefs", &gauss::coefs::jacobi<double>, py::arg("n"), py::arg("alpha"), py::arg("beta"));
    m.def("laguerre_coefs", &gauss::coefs::laguerre<double>, py::arg("n"), py::arg("alpha") = 0.0);
    m.def("hermite_coefs", &gauss::coefs::hermite<double>, py::arg("n"));
    m.def("shifted_legendre_coefs", &gauss::coefs::shifted_legendre<double>, py::arg("n"));
    m.def("logweight_coefs", &gauss::coefs::logweight<double>, py::arg("n"), py::arg("r") = 0);
    m.def("logweight_real_coefs", &gauss::coefs::logweight_real<double>, py::arg("n"), py::arg("rho"));

    m.def("modified_moments", &gauss::coefs::modified_moments<double>,
        "Modified moments of x^r log(1/x) against orthonormal shifted Legendre polynomials",
        py::arg("n"), py::arg("r"));
    m.def("modified_moments_real", &gauss::coefs::modified_moments_real<double>,
        "Modified moments of x^rho log(1/x), real rho > -1",
        py::arg("n"), py::arg("rho"));

    m.def("modified_chebyshev",
        [](const gauss::RecurrenceCoefficients<double>& reference, const std::vector<double>& nu) {
            auto res = gauss::coefs::modified_chebyshev(reference, nu);
            return py::make_tuple(std::move(res.coefs), to_numpy(res.sigma));
        },
        "Modified Chebyshev algorithm; returns (coefs, sigma)",
        py::arg("reference"), py::arg("nu"));

    m.def("orthonormal_poly",
        [](py::array_t<double, py::array::c_style | py::array::forcecast> x,
           const gauss::RecurrenceCoefficients<double>& coefs) {
            auto buf = x.request();
            if (buf.ndim != 1) {
                throw gauss::InvalidDomain("orthonormal_poly: x must be one-dimensional");
            }
            const double* ptr = static_cast<const double*>(buf.ptr);
            std::vector<double> pts(ptr, ptr + buf.size);

            gauss::Matrix<double> p;
            {
                py::gil_scoped_release release;
                p = gauss::math::orthonormal_poly(pts, coefs);
            }
            return to_numpy(p);
        },
        "Orthonormal polynomials of degree 0..n evaluated at x (numpy, shape len(x) x (n+1))",
        py::arg("x"), py::arg("coefs"));
}
