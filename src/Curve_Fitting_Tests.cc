//Curve_Fitting_Tests.cc - A part of Kinefit 2026.

#include <cmath>
#include <string>
#include <vector>
#include <optional>
#include <stdexcept>

#include <doctest/doctest.h>

#include "Model_Catalog.h"
#include "Curve_Fitting.h"
#include "Test_Fixtures.h"


static kfit::model_inputs_t
dual_inputs(){
    kfit::model_inputs_t in;
    in.time = kfit::testing::sample_times();
    in.aif = kfit::testing::arterial_input(in.time);
    in.vif = kfit::testing::venous_input(in.time);
    return in;
}

TEST_CASE( "fit method names" ){
    REQUIRE(kfit::Fit_Method_From_Name("LM").value() == kfit::fit_method::gsl_levenberg_marquardt);
    REQUIRE(kfit::Fit_Method_From_Name("bobyqa").value() == kfit::fit_method::nlopt_bobyqa);
    REQUIRE(!kfit::Fit_Method_From_Name("simulated_annealing"));
    for(const auto m : { kfit::fit_method::gsl_levenberg_marquardt, kfit::fit_method::nlopt_bobyqa }){
        REQUIRE(kfit::Fit_Method_From_Name(kfit::Fit_Method_Name(m)).value() == m);
    }
}

// Fits noise-free data generated from 'truth' and checks the parameters are recovered.
static void
check_recovery(const std::string &model_id, const std::vector<double> &truth, kfit::fit_method method){
    const auto catalog = kfit::testing::test_catalog();
    const auto &m = *catalog.find_model(model_id);
    const auto in = dual_inputs();
    const auto observed = kfit::Evaluate_Descriptor(m, in, truth, catalog.constants);

    kfit::fit_options_t opts;
    opts.method = method;
    const double tol = (method == kfit::fit_method::gsl_levenberg_marquardt) ? 1.0E-3 : 1.0E-2;

    const auto res = kfit::Fit_Model(m, observed, in, m.default_parameters(), {}, catalog.constants, opts);
    REQUIRE(res.ok());
    REQUIRE(res.converged);
    REQUIRE(res.method == kfit::Fit_Method_Name(method));
    REQUIRE(res.parameter_names == m.parameter_names());
    for(size_t i = 0; i < truth.size(); ++i){
        REQUIRE(res.parameters.at(i) == doctest::Approx(truth[i]).epsilon(tol));
    }
    REQUIRE(res.predicted.size() == observed.size());
    REQUIRE(res.RSS < 1.0E-6);
    return;
}

TEST_CASE( "Fit_Model recovers noise-free parameters" ){
    const std::vector<double> single_truth = { 25.0, 0.3, 0.05 };
    const std::vector<double> dual_truth = { 30.0, 25.0, 0.3, 0.05 };

    SUBCASE("single inlet via Levenberg-Marquardt"){
        check_recovery("single", single_truth, kfit::fit_method::gsl_levenberg_marquardt);
    }
    SUBCASE("single inlet via BOBYQA"){
        check_recovery("single", single_truth, kfit::fit_method::nlopt_bobyqa);
    }
    SUBCASE("dual inlet via Levenberg-Marquardt"){
        check_recovery("dual", dual_truth, kfit::fit_method::gsl_levenberg_marquardt);
    }
    SUBCASE("dual inlet via BOBYQA"){
        check_recovery("dual", dual_truth, kfit::fit_method::nlopt_bobyqa);
    }
}

TEST_CASE( "Fit_Model reports confidence intervals for noisy data" ){
    const auto catalog = kfit::testing::test_catalog();
    const auto &m = *catalog.find_model("single");
    const auto in = dual_inputs();
    const auto observed = kfit::testing::perturbed(kfit::Evaluate_Descriptor(m, in, { 25.0, 0.3, 0.05 }, catalog.constants), 0.005);

    const auto res = kfit::Fit_Model(m, observed, in, m.default_parameters(), {}, catalog.constants);
    REQUIRE(res.ok());
    REQUIRE(res.converged);
    REQUIRE(res.intervals.size() == 3);
    for(size_t i = 0; i < 3; ++i){
        REQUIRE(res.interval_status.at(i) == kfit::ci_status_t::available);
        REQUIRE(res.intervals.at(i));
        REQUIRE(res.intervals.at(i)->lower < res.parameters.at(i));
        REQUIRE(res.parameters.at(i) < res.intervals.at(i)->upper);
    }

    SUBCASE("wider confidence levels give wider intervals"){
        kfit::fit_options_t opts;
        opts.confidence_level = 0.99;
        const auto wide = kfit::Fit_Model(m, observed, in, m.default_parameters(), {}, catalog.constants, opts);
        REQUIRE(wide.intervals.at(1));
        REQUIRE( (res.intervals.at(1)->upper - res.intervals.at(1)->lower)
               < (wide.intervals.at(1)->upper - wide.intervals.at(1)->lower) );
    }

    SUBCASE("overriding a parameter removes every interval"){
        const auto edited = kfit::Override_Parameter(res, 1, 0.5);
        REQUIRE(edited.parameters.at(1) == 0.5);
        REQUIRE(edited.parameters.at(0) == res.parameters.at(0));
        for(size_t i = 0; i < 3; ++i){
            REQUIRE(!edited.intervals.at(i));
            REQUIRE(edited.interval_status.at(i) == kfit::ci_status_t::invalidated_by_edit);
        }
        REQUIRE(std::isnan(edited.RSS));
        REQUIRE_THROWS_AS(kfit::Override_Parameter(res, 3, 0.5), std::out_of_range);
    }
}

TEST_CASE( "Fit_Model honours user bounds" ){
    const auto catalog = kfit::testing::test_catalog();
    const auto &m = *catalog.find_model("single");
    const auto in = dual_inputs();
    const auto observed = kfit::Evaluate_Descriptor(m, in, { 25.0, 0.3, 0.05 }, catalog.constants);

    SUBCASE("equal bounds fix a parameter"){
        kfit::parameter_bounds_t b{ m.lower_bounds(), m.upper_bounds() };
        b.lower.at(0) = 25.0;
        b.upper.at(0) = 25.0;
        const auto res = kfit::Fit_Model(m, observed, in, m.default_parameters(), b, catalog.constants);
        REQUIRE(res.ok());
        REQUIRE(res.parameters.at(0) == 25.0);
        REQUIRE(res.interval_status.at(0) == kfit::ci_status_t::fixed_parameter);
        REQUIRE(!res.intervals.at(0));
        REQUIRE(res.parameters.at(1) == doctest::Approx(0.3).epsilon(1.0E-3));
    }

    SUBCASE("user bounds cannot widen the catalog constraints"){
        kfit::parameter_bounds_t b{ { -50.0, -1.0, -1.0 }, { 150.0, 10.0, 10.0 } };
        const auto res = kfit::Fit_Model(m, observed, in, { 200.0, 0.2, 0.03 }, b, catalog.constants);
        REQUIRE(res.ok());
        REQUIRE(res.parameters.at(0) <= 99.0);
        REQUIRE(1.0 <= res.parameters.at(0));
    }

    SUBCASE("disjoint bounds are rejected"){
        kfit::parameter_bounds_t b{ m.lower_bounds(), m.upper_bounds() };
        b.lower.at(1) = 6.0;
        const auto res = kfit::Fit_Model(m, observed, in, m.default_parameters(), b, catalog.constants);
        REQUIRE(res.failure == kfit::fit_failure_t::invalid_bounds);
    }
}

TEST_CASE( "Fit_Model reports structural failures without throwing" ){
    const auto catalog = kfit::testing::test_catalog();
    const auto &single = *catalog.find_model("single");
    const auto &dual = *catalog.find_model("dual");
    auto in = dual_inputs();
    const auto observed = kfit::Evaluate_Descriptor(dual, in, dual.default_parameters(), catalog.constants);

    SUBCASE("dual-inlet models need a VIF"){
        auto no_vif = in;
        no_vif.vif.reset();
        const auto res = kfit::Fit_Model(dual, observed, no_vif, dual.default_parameters(), {}, catalog.constants);
        REQUIRE(!res.ok());
        REQUIRE(res.failure == kfit::fit_failure_t::missing_input);
        REQUIRE(res.reason.find("VIF") != std::string::npos);
        REQUIRE(!res.converged);
        for(const auto &ci : res.intervals) REQUIRE(!ci);
    }

    SUBCASE("single-inlet models ignore a supplied VIF"){
        const auto res = kfit::Fit_Model(single, observed, in, single.default_parameters(), {}, catalog.constants);
        REQUIRE(res.ok());
    }

    SUBCASE("wrong parameter count"){
        const auto res = kfit::Fit_Model(dual, observed, in, { 1.0, 2.0 }, {}, catalog.constants);
        REQUIRE(res.failure == kfit::fit_failure_t::wrong_parameter_count);
    }

    SUBCASE("mismatched lengths"){
        auto short_observed = observed;
        short_observed.pop_back();
        const auto res = kfit::Fit_Model(dual, short_observed, in, dual.default_parameters(), {}, catalog.constants);
        REQUIRE(res.failure == kfit::fit_failure_t::mismatched_lengths);
    }

    SUBCASE("too few samples"){
        kfit::model_inputs_t tiny;
        tiny.time = { 0.0, 0.1, 0.2 };
        tiny.aif = { 0.0, 1.0, 0.5 };
        tiny.vif = tiny.aif;
        const auto res = kfit::Fit_Model(dual, { 0.0, 0.1, 0.1 }, tiny, dual.default_parameters(), {}, catalog.constants);
        REQUIRE(res.failure == kfit::fit_failure_t::too_few_samples);
    }

    SUBCASE("non-finite observations"){
        auto bad = observed;
        bad.at(10) = std::nan("");
        const auto res = kfit::Fit_Model(dual, bad, in, dual.default_parameters(), {}, catalog.constants);
        REQUIRE(res.failure == kfit::fit_failure_t::domain_error);
    }
}

TEST_CASE( "non-converged fits keep the last iterate but report no intervals" ){
    const auto catalog = kfit::testing::test_catalog();
    const auto &m = *catalog.find_model("single");
    const auto in = dual_inputs();
    const auto observed = kfit::Evaluate_Descriptor(m, in, { 25.0, 0.3, 0.05 }, catalog.constants);

    kfit::minimizer_t stalled = [](const kfit::minimization_problem &p) -> kfit::minimization_outcome {
        kfit::minimization_outcome out;
        out.optimum = p.initial;
        out.optimum.at(0) += 1.0;
        out.converged = false;
        out.iterations = 500;
        out.message = "iteration limit reached";
        return out;
    };
    const auto res = kfit::Fit_Model(m, observed, in, m.default_parameters(), {}, catalog.constants, {}, stalled);
    REQUIRE(res.ok());
    REQUIRE(!res.converged);
    REQUIRE(res.parameters.at(0) == doctest::Approx(21.0));
    REQUIRE(res.iterations == 500);
    REQUIRE(std::isfinite(res.RSS));
    for(size_t i = 0; i < res.parameters.size(); ++i){
        REQUIRE(!res.intervals.at(i));
        REQUIRE(res.interval_status.at(i) == kfit::ci_status_t::not_converged);
    }

    SUBCASE("minimizers that throw are reported as solver errors"){
        kfit::minimizer_t broken = [](const kfit::minimization_problem &) -> kfit::minimization_outcome {
            throw std::runtime_error("out of memory");
        };
        const auto failed = kfit::Fit_Model(m, observed, in, m.default_parameters(), {}, catalog.constants, {}, broken);
        REQUIRE(failed.failure == kfit::fit_failure_t::solver_error);
    }
}

TEST_CASE( "Levenberg-Marquardt stopped by its iteration cap reports no intervals" ){
    const auto catalog = kfit::testing::test_catalog();
    const auto &m = *catalog.find_model("single");
    const auto in = dual_inputs();
    const auto observed = kfit::Evaluate_Descriptor(m, in, { 25.0, 0.3, 0.05 }, catalog.constants);

    kfit::fit_options_t options;
    options.method = kfit::fit_method::gsl_levenberg_marquardt;
    options.minimizer.first_pass_iterations = 1;
    options.minimizer.max_iterations = 1;

    const auto initial = m.default_parameters();
    const auto res = kfit::Fit_Model(m, observed, in, initial, {}, catalog.constants, options);
    REQUIRE(res.ok());
    REQUIRE(!res.converged);
    REQUIRE(res.iterations <= 2);

    // The last iterate is kept and is no worse than the starting point.
    const auto start = kfit::Evaluate_Descriptor(m, in, initial, catalog.constants);
    double RSS_start = 0.0;
    for(size_t i = 0; i < observed.size(); ++i){
        RSS_start += (start[i] - observed[i]) * (start[i] - observed[i]);
    }
    REQUIRE(std::isfinite(res.RSS));
    REQUIRE(res.RSS <= RSS_start * (1.0 + 1.0E-9));
    REQUIRE(res.predicted.size() == observed.size());
    for(size_t i = 0; i < res.parameters.size(); ++i){
        REQUIRE(m.parameters.at(i).lower <= res.parameters.at(i));
        REQUIRE(res.parameters.at(i) <= m.parameters.at(i).upper);
        REQUIRE(!res.intervals.at(i));
        REQUIRE(res.interval_status.at(i) == kfit::ci_status_t::not_converged);
    }
}
