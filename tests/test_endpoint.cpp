#include <catch2/catch_all.hpp>

#include "libgauss/coefs/classical.hpp"
#include "libgauss/core/errors.hpp"
#include "libgauss/math/endpoint.hpp"
#include "libgauss/rules/assemble.hpp"

#include <cmath>
#include <limits>

using Catch::Approx;
using gauss::EndPt;

TEST_CASE("Elimination pivot for the Legendre Jacobi matrix", "[endpoint]") {
    const auto c = gauss::coefs::legendre<double>(3);
    CHECK(gauss::math::solve(3, -1.0, c) == Approx(1.5));
    CHECK(gauss::math::solve(3, 1.0, c) == Approx(-1.5));
    // n = 2 uses only the first diagonal entry
    CHECK(gauss::math::solve(2, -1.0, c) == Approx(1.0));
}

TEST_CASE("Zero pivot is reported as breakdown", "[endpoint][edge]") {
    const auto c = gauss::coefs::legendre<double>(3);
    REQUIRE_THROWS_AS(gauss::math::solve(3, 0.0, c), gauss::AlgorithmBreakdown);
}

TEST_CASE("Numerically zero pivot is reported as breakdown", "[endpoint][edge]") {
    const auto c = gauss::coefs::legendre<double>(3);
    // 1/sqrt(3) is an eigenvalue of the leading 2x2 block
    const double s = 1.0 / std::sqrt(3.0);
    REQUIRE_THROWS_AS(gauss::math::solve(3, s, c), gauss::AlgorithmBreakdown);
    REQUIRE_THROWS_AS(gauss::math::solve(3, std::nextafter(s, 1.0), c), gauss::AlgorithmBreakdown);
    REQUIRE_THROWS_AS(gauss::math::solve(3, 1e-17, c), gauss::AlgorithmBreakdown);
    REQUIRE_NOTHROW(gauss::math::solve(3, 0.5, c));

    REQUIRE_THROWS_AS(gauss::assemble_rule(1e-17, 1.0, gauss::coefs::legendre<double>(3), EndPt::Left),
                      gauss::AlgorithmBreakdown);
    REQUIRE_THROWS_AS(gauss::assemble_rule(s, 2.0, gauss::coefs::legendre<double>(3), EndPt::Left),
                      gauss::AlgorithmBreakdown);
}

TEST_CASE("Radau constraint moves the last diagonal entry", "[endpoint]") {
    const auto left = gauss::math::constrain_endpoints(gauss::coefs::legendre<double>(2), -1.0, 1.0, EndPt::Left);
    CHECK(left.a[0] == 0.0);
    CHECK(left.a[1] == Approx(-2.0 / 3.0));

    const auto right = gauss::math::constrain_endpoints(gauss::coefs::legendre<double>(2), -1.0, 1.0, EndPt::Right);
    CHECK(right.a[1] == Approx(2.0 / 3.0));

    const auto single = gauss::math::constrain_endpoints(gauss::coefs::legendre<double>(1), -1.0, 1.0, EndPt::Right);
    CHECK(single.a[0] == 1.0);
}

TEST_CASE("Lobatto constraint moves the last diagonal and off-diagonal", "[endpoint]") {
    const auto c = gauss::math::constrain_endpoints(gauss::coefs::legendre<double>(3), -1.0, 1.0, EndPt::Both);
    CHECK(c.a[2] == Approx(0.0).margin(1e-15));
    CHECK(c.b[2] == Approx(std::sqrt(2.0 / 3.0)));
    // untouched entries
    CHECK(c.b[0] == Approx(std::sqrt(2.0)));
    CHECK(c.b[1] == Approx(1.0 / std::sqrt(3.0)));
}

TEST_CASE("Neither leaves the coefficients alone", "[endpoint]") {
    const auto ref = gauss::coefs::jacobi<double>(5, 0.2, 0.7);
    const auto c = gauss::math::constrain_endpoints(ref, -1.0, 1.0, EndPt::Neither);
    REQUIRE(c.a == ref.a);
    REQUIRE(c.b == ref.b);
}

TEST_CASE("Endpoint constraint rejects impossible requests", "[endpoint][edge]") {
    REQUIRE_THROWS_AS(gauss::math::constrain_endpoints(gauss::coefs::legendre<double>(1), -1.0, 1.0, EndPt::Both),
                      gauss::InvalidDomain);
    const double inf = std::numeric_limits<double>::infinity();
    REQUIRE_THROWS_AS(gauss::math::constrain_endpoints(gauss::coefs::laguerre<double>(4, 0.0), 0.0, inf, EndPt::Right),
                      gauss::InvalidDomain);
    REQUIRE_NOTHROW(gauss::math::constrain_endpoints(gauss::coefs::laguerre<double>(4, 0.0), 0.0, inf, EndPt::Left));
}
