#include <catch2/catch_all.hpp>

#include "libgauss/coefs/classical.hpp"
#include "libgauss/core/constants.hpp"
#include "libgauss/core/errors.hpp"
#include "libgauss/rules/assemble.hpp"
#include "libgauss/rules/families.hpp"

#include <cmath>
#include <functional>
#include <limits>
#include <numeric>
#include <string>
#include <vector>

using Catch::Approx;
using gauss::EndPt;
using gauss::QuadratureRule;

namespace {

double total_weight(const QuadratureRule<double>& q) {
    return std::accumulate(q.weights.begin(), q.weights.end(), 0.0);
}

// Nodes strictly increasing inside [lo, hi], positive weights.
void check_shape(const QuadratureRule<double>& q, int n, double lo, double hi) {
    REQUIRE(q.size() == static_cast<std::size_t>(n));
    REQUIRE(q.weights.size() == static_cast<std::size_t>(n));
    for (int j = 0; j < n; ++j) {
        INFO("j = " << j);
        CHECK(q.nodes[j] >= lo);
        CHECK(q.nodes[j] <= hi);
        CHECK(q.weights[j] > 0.0);
        if (j > 0) {
            CHECK(q.nodes[j - 1] < q.nodes[j]);
        }
    }
}

struct Case {
    std::string name;
    double lo;
    double hi;
    double mass;
    std::function<QuadratureRule<double>(int, EndPt)> make;
    bool left_ok;
    bool right_ok;
};

std::vector<Case> families() {
    const double pi = gauss::PI<double>;
    const double inf = std::numeric_limits<double>::infinity();
    const double alpha = 0.3;
    const double beta = 1.2;
    const double jac_mass = std::pow(2.0, alpha + beta + 1.0) * std::tgamma(alpha + 1.0) * std::tgamma(beta + 1.0)
                          / std::tgamma(alpha + beta + 2.0);
    return {
        {"legendre", -1.0, 1.0, 2.0, [](int n, EndPt e) { return gauss::legendre<double>(n, e); }, true, true},
        {"chebyshev1", -1.0, 1.0, pi, [](int n, EndPt e) { return gauss::chebyshev<double>(n, 1, e); }, true, true},
        {"chebyshev2", -1.0, 1.0, pi / 2.0, [](int n, EndPt e) { return gauss::chebyshev<double>(n, 2, e); }, true,
         true},
        {"jacobi", -1.0, 1.0, jac_mass,
         [=](int n, EndPt e) { return gauss::jacobi<double>(n, alpha, beta, e); }, true, true},
        {"laguerre", 0.0, inf, std::tgamma(1.5), [](int n, EndPt e) { return gauss::laguerre<double>(n, 0.5, e); },
         true, false},
        {"hermite", -inf, inf, std::sqrt(pi), [](int n, EndPt) { return gauss::hermite<double>(n); }, false, false},
        {"logweight", 0.0, 1.0, 0.25, [](int n, EndPt e) { return gauss::logweight<double>(n, 1, e); }, true, true},
        {"logweight_real", 0.0, 1.0, 1.0 / (1.4 * 1.4),
         [](int n, EndPt e) { return gauss::logweight_real<double>(n, 0.4, e); }, true, true},
    };
}

} // namespace

TEST_CASE("Two-point Gauss-Legendre", "[rules]") {
    const auto q = gauss::legendre<double>(2);
    REQUIRE(q.size() == 2);
    CHECK(q.nodes[0] == Approx(-1.0 / std::sqrt(3.0)));
    CHECK(q.nodes[1] == Approx(1.0 / std::sqrt(3.0)));
    CHECK(q.weights[0] == Approx(1.0));
    CHECK(q.weights[1] == Approx(1.0));
}

TEST_CASE("Three-point Gauss-Lobatto-Legendre", "[rules][lobatto]") {
    const auto q = gauss::lobatto<double>(3);
    REQUIRE(q.size() == 3);
    CHECK(q.nodes[0] == -1.0);
    CHECK(q.nodes[1] == Approx(0.0).margin(1e-15));
    CHECK(q.nodes[2] == 1.0);
    CHECK(q.weights[0] == Approx(1.0 / 3.0));
    CHECK(q.weights[1] == Approx(4.0 / 3.0));
    CHECK(q.weights[2] == Approx(1.0 / 3.0));
}

TEST_CASE("Two-point left Radau-Legendre", "[rules][radau]") {
    const auto q = gauss::legendre<double>(2, EndPt::Left);
    CHECK(q.nodes[0] == -1.0);
    CHECK(q.nodes[1] == Approx(1.0 / 3.0));
    CHECK(q.weights[0] == Approx(0.5));
    CHECK(q.weights[1] == Approx(1.5));
}

TEST_CASE("Two-point Gauss-Laguerre", "[rules][laguerre]") {
    const auto q = gauss::laguerre<double>(2, 0.0);
    const double s = std::sqrt(2.0);
    CHECK(q.nodes[0] == Approx(2.0 - s));
    CHECK(q.nodes[1] == Approx(2.0 + s));
    CHECK(q.weights[0] == Approx((2.0 + s) / 4.0));
    CHECK(q.weights[1] == Approx((2.0 - s) / 4.0));
}

TEST_CASE("Two-point logarithmic weight rule", "[rules][logweight]") {
    const auto q = gauss::logweight<double>(2);
    CHECK(q.nodes[0] == Approx(0.112008806166976).epsilon(1e-12));
    CHECK(q.nodes[1] == Approx(0.602276908118738).epsilon(1e-12));
    CHECK(q.weights[0] == Approx(0.718539319030384).epsilon(1e-12));
    CHECK(q.weights[1] == Approx(0.281460680969616).epsilon(1e-12));
}

TEST_CASE("Chebyshev rules match their closed forms", "[rules][chebyshev]") {
    const double pi = gauss::PI<double>;
    const int n = 7;
    const auto first = gauss::chebyshev<double>(n, 1);
    const auto second = gauss::chebyshev<double>(n, 2);
    for (int j = 1; j <= n; ++j) {
        INFO("j = " << j);
        // nodes are returned in increasing order, the closed forms decrease with j
        const double x1 = std::cos((2.0 * j - 1.0) * pi / (2.0 * n));
        const double x2 = std::cos(j * pi / (n + 1.0));
        const double s2 = std::sin(j * pi / (n + 1.0));
        CHECK(first.nodes[n - j] == Approx(x1).margin(1e-14));
        CHECK(first.weights[n - j] == Approx(pi / n).epsilon(1e-13));
        CHECK(second.nodes[n - j] == Approx(x2).margin(1e-14));
        CHECK(second.weights[n - j] == Approx(pi / (n + 1.0) * s2 * s2).epsilon(1e-12));
    }
}

TEST_CASE("Every family produces well-formed rules", "[rules][sweep]") {
    for (const auto& c : families()) {
        for (int n = 1; n <= 50; ++n) {
            INFO(c.name << ", n = " << n);
            const auto q = c.make(n, EndPt::Neither);
            check_shape(q, n, c.lo, c.hi);
            CHECK(total_weight(q) == Approx(c.mass).epsilon(1e-12));
            if (std::isfinite(c.lo)) {
                CHECK(q.nodes.front() > c.lo);
            }
            if (std::isfinite(c.hi)) {
                CHECK(q.nodes.back() < c.hi);
            }
        }
    }
}

TEST_CASE("Radau and Lobatto rules carry the exact endpoints", "[rules][sweep][endpoints]") {
    for (const auto& c : families()) {
        for (int n = 1; n <= 30; ++n) {
            INFO(c.name << ", n = " << n);
            if (c.left_ok) {
                const auto q = c.make(n, EndPt::Left);
                check_shape(q, n, c.lo, c.hi);
                CHECK(q.nodes.front() == c.lo);
                CHECK(total_weight(q) == Approx(c.mass).epsilon(1e-12));
            }
            if (c.right_ok) {
                const auto q = c.make(n, EndPt::Right);
                check_shape(q, n, c.lo, c.hi);
                CHECK(q.nodes.back() == c.hi);
                CHECK(total_weight(q) == Approx(c.mass).epsilon(1e-12));
            }
            if (c.left_ok && c.right_ok && n >= 2) {
                const auto q = c.make(n, EndPt::Both);
                check_shape(q, n, c.lo, c.hi);
                CHECK(q.nodes.front() == c.lo);
                CHECK(q.nodes.back() == c.hi);
                CHECK(total_weight(q) == Approx(c.mass).epsilon(1e-12));
            }
        }
    }
}

TEST_CASE("Rules reject invalid requests", "[rules][edge]") {
    REQUIRE_THROWS_AS(gauss::jacobi<double>(4, -1.0, 0.5), gauss::InvalidDomain);
    REQUIRE_THROWS_AS(gauss::jacobi<double>(4, 0.5, -1.0), gauss::InvalidDomain);
    REQUIRE_THROWS_AS(gauss::laguerre<double>(4, 0.0, EndPt::Right), gauss::InvalidDomain);
    REQUIRE_THROWS_AS(gauss::laguerre<double>(4, 0.0, EndPt::Both), gauss::InvalidDomain);
    REQUIRE_THROWS_AS(gauss::lobatto<double>(1), gauss::InvalidDomain);
    REQUIRE_THROWS_AS(gauss::legendre<double>(0), gauss::InvalidDomain);
    REQUIRE_THROWS_AS(gauss::chebyshev<double>(4, 3), gauss::InvalidDomain);
    REQUIRE_THROWS_AS(gauss::logweight<double>(4, -1), gauss::InvalidDomain);
    REQUIRE_THROWS_AS(gauss::logweight_real<double>(4, -1.0), gauss::InvalidDomain);
    REQUIRE_THROWS_AS(gauss::rule<double>(gauss::family::Hermite{}, 4, EndPt::Left), gauss::InvalidDomain);
    REQUIRE_THROWS_AS(gauss::rule<double>(gauss::family::Laguerre<double>{}, 4, EndPt::Right), gauss::InvalidDomain);
}

TEST_CASE("assemble_rule validates raw coefficients", "[rules][edge]") {
    auto c = gauss::coefs::legendre<double>(3);
    REQUIRE_THROWS_AS(gauss::assemble_rule(1.0, -1.0, c, EndPt::Neither), gauss::InvalidDomain);

    auto short_b = c;
    short_b.b.pop_back();
    REQUIRE_THROWS_AS(gauss::assemble_rule(-1.0, 1.0, short_b, EndPt::Neither), gauss::InvalidDomain);

    auto negative = c;
    negative.b[1] = -0.5;
    REQUIRE_THROWS_AS(gauss::assemble_rule(-1.0, 1.0, negative, EndPt::Neither), gauss::InvalidDomain);

    REQUIRE_THROWS_AS(gauss::assemble_rule(-1.0, 1.0, gauss::RecurrenceCoefficients<double>{}, EndPt::Neither),
                      gauss::InvalidDomain);
}

TEST_CASE("Iteration cap of zero surfaces as ConvergenceFailure", "[rules][edge]") {
    gauss::RuleConfig<double> cfg;
    cfg.max_iterations = 0;
    for (int n = 2; n <= 5; ++n) {
        INFO("n = " << n);
        REQUIRE_THROWS_AS(gauss::legendre<double>(n, EndPt::Neither, cfg), gauss::ConvergenceFailure);
        REQUIRE_THROWS_AS(gauss::lobatto<double>(n, cfg), gauss::ConvergenceFailure);
        REQUIRE_THROWS_AS(gauss::chebyshev<double>(n, 2, EndPt::Left, cfg), gauss::ConvergenceFailure);
        REQUIRE_THROWS_AS(gauss::jacobi<double>(n, 0.5, 0.5, EndPt::Right, cfg), gauss::ConvergenceFailure);
        REQUIRE_THROWS_AS(gauss::laguerre<double>(n, 0.0, EndPt::Neither, cfg), gauss::ConvergenceFailure);
        REQUIRE_THROWS_AS(gauss::hermite<double>(n, cfg), gauss::ConvergenceFailure);
        REQUIRE_THROWS_AS(gauss::logweight<double>(n, 0, EndPt::Neither, cfg), gauss::ConvergenceFailure);
        REQUIRE_THROWS_AS(gauss::logweight_real<double>(n, 0.5, EndPt::Neither, cfg), gauss::ConvergenceFailure);
    }
    // a single point needs no sweep
    REQUIRE_NOTHROW(gauss::legendre<double>(1, EndPt::Neither, cfg));
}

TEST_CASE("Split tolerance can be loosened or rejected", "[rules][config]") {
    const auto tight = gauss::legendre<double>(10);

    gauss::RuleConfig<double> loose;
    loose.epsilon = 1e-6;
    const auto q = gauss::legendre<double>(10, EndPt::Neither, loose);
    check_shape(q, 10, -1.0, 1.0);
    CHECK(total_weight(q) == Approx(2.0).epsilon(1e-12));
    for (std::size_t j = 0; j < q.size(); ++j) {
        CHECK(q.nodes[j] == Approx(tight.nodes[j]).margin(1e-5));
        CHECK(q.weights[j] == Approx(tight.weights[j]).margin(1e-4));
    }

    gauss::RuleConfig<double> zero;
    zero.epsilon = 0.0;
    REQUIRE_THROWS_AS(gauss::legendre<double>(10, EndPt::Neither, zero), gauss::InvalidDomain);
    zero.epsilon = -1e-6;
    REQUIRE_THROWS_AS(gauss::hermite<double>(4, zero), gauss::InvalidDomain);
}

TEST_CASE("Family dispatch matches the direct entry points", "[rules][family]") {
    using Any = gauss::family::Any<double>;
    const Any jac = gauss::family::Jacobi<double>{0.25, -0.5};
    const auto via_variant = gauss::rule<double>(jac, 6, EndPt::Right);
    const auto direct = gauss::jacobi<double>(6, 0.25, -0.5, EndPt::Right);
    CHECK(via_variant.nodes == direct.nodes);
    CHECK(via_variant.weights == direct.weights);

    const auto lw = gauss::rule<double>(Any{gauss::family::LogWeight{2}}, 5);
    const auto lw_direct = gauss::logweight<double>(5, 2);
    CHECK(lw.nodes == lw_direct.nodes);

    const auto [lo, hi] = gauss::interval<double>(Any{gauss::family::Laguerre<double>{}});
    CHECK(lo == 0.0);
    CHECK(std::isinf(hi));
    const auto [clo, chi] = gauss::interval<double>(Any{gauss::family::Chebyshev{2}});
    CHECK(clo == -1.0);
    CHECK(chi == 1.0);

    for (const Any& f : {Any{gauss::family::Legendre{}}, Any{gauss::family::Jacobi<double>{1.0, 2.0}}}) {
        const auto [flo, fhi] = gauss::interval<double>(f);
        CHECK(flo == -1.0);
        CHECK(fhi == 1.0);
    }

    const auto c = gauss::coefficients<double>(Any{gauss::family::Hermite{}}, 4);
    CHECK(c.order() == 4);

    const auto her = gauss::rule<double>(Any{gauss::family::Hermite{}}, 6);
    CHECK(her.nodes == gauss::hermite<double>(6).nodes);
    const auto lag = gauss::rule<double>(Any{gauss::family::Laguerre<double>{1.0}}, 5, EndPt::Left);
    CHECK(lag.weights == gauss::laguerre<double>(5, 1.0, EndPt::Left).weights);
}

TEST_CASE("Integer and real logarithmic exponents agree", "[rules][logweight]") {
    for (int r = 0; r <= 4; ++r) {
        INFO("r = " << r);
        const auto a = gauss::logweight<double>(10, r);
        const auto b = gauss::logweight_real<double>(10, static_cast<double>(r));
        for (std::size_t j = 0; j < a.size(); ++j) {
            CHECK(b.nodes[j] == Approx(a.nodes[j]).epsilon(1e-11));
            CHECK(b.weights[j] == Approx(a.weights[j]).epsilon(1e-11));
        }
    }
}

TEST_CASE("Rules in float and long double", "[rules][precision]") {
    CHECK(gauss::default_max_iterations<float>() == 30);
    CHECK(gauss::default_max_iterations<double>() == 30);
    const int expected_ld = std::numeric_limits<long double>::digits > std::numeric_limits<double>::digits ? 40 : 30;
    CHECK(gauss::default_max_iterations<long double>() == expected_ld);

    const auto f = gauss::legendre<float>(6);
    float sum = 0.0f;
    for (float w : f.weights) {
        sum += w;
    }
    CHECK(sum == Approx(2.0).epsilon(1e-5));

    const auto l = gauss::lobatto<long double>(6);
    CHECK(l.nodes.front() == -1.0L);
    CHECK(l.nodes.back() == 1.0L);
    const auto d = gauss::lobatto<double>(6);
    for (std::size_t j = 0; j < d.size(); ++j) {
        CHECK(static_cast<double>(l.nodes[j]) == Approx(d.nodes[j]).margin(1e-14));
        CHECK(static_cast<double>(l.weights[j]) == Approx(d.weights[j]).epsilon(1e-13));
    }
}
