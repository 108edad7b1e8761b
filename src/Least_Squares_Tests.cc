//Least_Squares_Tests.cc - A part of Kinefit 2026.

#include <cmath>
#include <limits>
#include <string>
#include <vector>
#include <stdexcept>

#include <doctest/doctest.h>

#include "Least_Squares.h"
#include "Test_Fixtures.h"


// Straight line y = a + b x sampled at x = 0, 1, ..., N-1.
static kfit::minimization_problem
line_problem(const std::vector<double> &y){
    kfit::minimization_problem p;
    p.N_residuals = y.size();
    p.residuals = [y](const std::vector<double> &params, std::vector<double> &r) -> void {
        for(size_t i = 0; i < y.size(); ++i){
            r[i] = params[0] + params[1] * static_cast<double>(i) - y[i];
        }
        return;
    };
    p.initial = { 0.0, 0.0 };
    p.lower = { -10.0, -10.0 };
    p.upper = { 10.0, 10.0 };
    return p;
}

static std::vector<double>
line(double a, double b, size_t N){
    std::vector<double> y;
    for(size_t i = 0; i < N; ++i) y.push_back(a + b * static_cast<double>(i));
    return y;
}

TEST_CASE( "minimizers recover exact solutions" ){
    const auto p = line_problem(line(1.5, -0.7, 20));

    for(const auto &minimizer : { kfit::minimizer_t(kfit::Minimize_via_GSL_LM),
                                  kfit::minimizer_t(kfit::Minimize_via_NLopt) }){
        const auto res = minimizer(p);
        REQUIRE(res.converged);
        REQUIRE(res.optimum.at(0) == doctest::Approx(1.5).epsilon(1.0E-5));
        REQUIRE(res.optimum.at(1) == doctest::Approx(-0.7).epsilon(1.0E-5));
        REQUIRE(res.RSS < 1.0E-8);
        REQUIRE(0 < res.iterations);
    }
}

TEST_CASE( "fixed parameters stay put" ){
    auto p = line_problem(line(1.5, -0.7, 20));
    p.initial = { 2.0, 0.0 };
    p.lower.at(0) = 2.0;
    p.upper.at(0) = 2.0;

    for(const auto &minimizer : { kfit::minimizer_t(kfit::Minimize_via_GSL_LM),
                                  kfit::minimizer_t(kfit::Minimize_via_NLopt) }){
        const auto res = minimizer(p);
        REQUIRE(res.converged);
        REQUIRE(res.optimum.at(0) == 2.0);
        REQUIRE(std::isfinite(res.optimum.at(1)));
        if(res.covariance){
            REQUIRE(res.covariance->matrix.at(0) == 0.0);
            REQUIRE(res.covariance->dof == 19);
        }
    }
}

TEST_CASE( "initial values outside the bounds are clamped" ){
    auto p = line_problem(line(1.5, -0.7, 20));
    p.initial = { 100.0, std::numeric_limits<double>::quiet_NaN() };
    const auto res = kfit::Minimize_via_GSL_LM(p);
    REQUIRE(res.converged);
    REQUIRE(res.optimum.at(0) == doctest::Approx(1.5).epsilon(1.0E-5));
}

TEST_CASE( "malformed problems are rejected" ){
    auto p = line_problem(line(1.0, 1.0, 5));

    SUBCASE("inverted bounds"){
        p.lower.at(1) = 1.0;
        p.upper.at(1) = -1.0;
        REQUIRE_THROWS_AS(kfit::Minimize_via_GSL_LM(p), std::invalid_argument);
        REQUIRE_THROWS_AS(kfit::Minimize_via_NLopt(p), std::invalid_argument);
    }

    SUBCASE("mismatched bounds"){
        p.lower.pop_back();
        REQUIRE_THROWS_AS(kfit::Minimize_via_GSL_LM(p), std::invalid_argument);
    }

    SUBCASE("too few residuals"){
        p.N_residuals = 1;
        REQUIRE_THROWS_AS(kfit::Minimize_via_NLopt(p), std::invalid_argument);
    }
}

TEST_CASE( "residual functions that throw do not escape the minimizers" ){
    auto p = line_problem(line(1.0, 1.0, 10));
    p.residuals = [](const std::vector<double> &params, std::vector<double> &r) -> void {
        if(0.5 < params[1]) throw std::runtime_error("outside the model domain");
        for(size_t i = 0; i < r.size(); ++i) r[i] = params[0] + params[1] - 1.0;
        return;
    };
    REQUIRE_NOTHROW(kfit::Minimize_via_GSL_LM(p));
    REQUIRE_NOTHROW(kfit::Minimize_via_NLopt(p));
}

TEST_CASE( "covariance matches ordinary least squares" ){
    const size_t N = 25;
    const auto y = kfit::testing::perturbed(line(0.3, 0.05, N), 0.01);
    const auto p = line_problem(y);

    const auto res = kfit::Minimize_via_GSL_LM(p);
    REQUIRE(res.converged);
    REQUIRE(res.covariance);
    const auto &cov = res.covariance.value();
    REQUIRE(cov.dof == static_cast<int64_t>(N - 2));
    REQUIRE(0.0 < cov.rcond);

    double x_mean = 0.0;
    for(size_t i = 0; i < N; ++i) x_mean += static_cast<double>(i) / static_cast<double>(N);
    double Sxx = 0.0;
    for(size_t i = 0; i < N; ++i) Sxx += std::pow(static_cast<double>(i) - x_mean, 2.0);
    const double s2 = res.RSS / static_cast<double>(N - 2);

    REQUIRE(cov.matrix.at(3) == doctest::Approx(s2 / Sxx).epsilon(1.0E-4));
    REQUIRE(cov.matrix.at(0) == doctest::Approx(s2 * (1.0 / N + x_mean * x_mean / Sxx)).epsilon(1.0E-4));

    SUBCASE("degenerate problems report why the covariance is absent"){
        auto q = line_problem(line(1.0, 1.0, 2));
        std::string why;
        REQUIRE(!kfit::Estimate_Covariance(q, { 1.0, 1.0 }, 0.0, why));
        REQUIRE(!why.empty());
    }
}

TEST_CASE( "Student_t_Quantile" ){
    REQUIRE(kfit::Student_t_Quantile(0.95, 10) == doctest::Approx(2.228139).epsilon(1.0E-5));
    REQUIRE(kfit::Student_t_Quantile(0.95, 1000) == doctest::Approx(1.962339).epsilon(1.0E-5));
    REQUIRE(std::isnan(kfit::Student_t_Quantile(0.95, 0)));
    REQUIRE(std::isnan(kfit::Student_t_Quantile(1.5, 10)));
}
