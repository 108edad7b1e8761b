//Tracer_Kinetic_Models_Tests.cc - A part of Kinefit 2026.

#include <cmath>
#include <string>
#include <vector>
#include <stdexcept>

#include <doctest/doctest.h>

#include "Kinefit_Errors.h"
#include "Signal_Conversion.h"
#include "Tracer_Kinetic_Models.h"
#include "Test_Fixtures.h"

using kfit::model_kind;


TEST_CASE( "model registry" ){
    for(const auto kind : kfit::All_Model_Kinds()){
        const auto name = kfit::Function_Name(kind);
        REQUIRE(kfit::Model_Kind_From_Function_Name(name).value() == kind);
        REQUIRE(!kfit::Parameter_Names(kind).empty());
    }
    REQUIRE(!kfit::Model_Kind_From_Function_Name("NoSuchModel"));

    REQUIRE(kfit::Inlet_Type(model_kind::high_flow_single_inlet) == kfit::inlet_t::single);
    REQUIRE(kfit::Inlet_Type(model_kind::dual_inlet_delayed) == kfit::inlet_t::dual);
    REQUIRE(kfit::Inlet_Type_From_Name("Dual").value() == kfit::inlet_t::dual);
    REQUIRE(kfit::Inlet_Type_From_Name(" single ").value() == kfit::inlet_t::single);
    REQUIRE(!kfit::Inlet_Type_From_Name("triple"));
}

TEST_CASE( "Evaluate_Model" ){
    kfit::model_inputs_t in;
    in.time = kfit::testing::sample_times();
    in.aif = kfit::testing::arterial_input(in.time);
    in.vif = kfit::testing::venous_input(in.time);
    const kfit::constant_set_t none;

    SUBCASE("structural problems are rejected"){
        auto single = in;
        single.vif.reset();
        REQUIRE_THROWS_AS(kfit::Evaluate_Model(model_kind::high_flow_dual_inlet, single, { 0.5, 0.2, 0.2, 0.03 }, none),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(kfit::Evaluate_Model(model_kind::high_flow_single_inlet, in, { 0.2, 0.2 }, none),
                          std::invalid_argument);
        auto short_aif = in;
        short_aif.aif.pop_back();
        REQUIRE_THROWS_AS(kfit::Evaluate_Model(model_kind::high_flow_single_inlet, short_aif, { 0.2, 0.2, 0.03 }, none),
                          std::invalid_argument);
    }

    SUBCASE("the tissue curve is flat until the bolus arrives"){
        const auto y = kfit::Evaluate_Model(model_kind::high_flow_single_inlet, in, { 0.2, 0.2, 0.03 }, none);
        REQUIRE(y.size() == in.time.size());
        REQUIRE(y.at(0) == 0.0);
        REQUIRE(y.at(2) == 0.0);
        REQUIRE(0.0 < y.at(50));
    }

    SUBCASE("a fully arterial dual inlet reduces to the single inlet"){
        const auto single = kfit::Evaluate_Model(model_kind::high_flow_single_inlet, in, { 0.25, 0.3, 0.05 }, none);
        const auto dual = kfit::Evaluate_Model(model_kind::high_flow_dual_inlet, in, { 1.0, 0.25, 0.3, 0.05 }, none);
        for(size_t i = 0; i < single.size(); ++i){
            REQUIRE(dual[i] == doctest::Approx(single[i]));
        }
    }

    SUBCASE("without efflux the fixed-Ve model integrates the input"){
        const auto y = kfit::Evaluate_Model(model_kind::high_flow_single_inlet_fixed_ve, in, { 0.4, 0.0 }, none);
        const auto I = kfit::Cumulative_Integral(in.time, in.aif);
        for(size_t i = 0; i < y.size(); ++i){
            REQUIRE(y[i] == doctest::Approx(0.4 * I[i]));
        }
    }

    SUBCASE("the filtration model stays finite and non-negative"){
        for(const auto Fp : { 0.0, 0.5, 5.0 }){
            const auto y = kfit::Evaluate_Model(model_kind::dual_inlet_filtration, in, { 0.3, 0.2, Fp, 0.2, 0.03 }, none);
            for(const auto x : y){
                REQUIRE(std::isfinite(x));
                REQUIRE(-1.0E-12 <= x);
            }
        }
    }

    SUBCASE("input delays postpone the response"){
        // The AIF is zero until t = 0.2 min, so with a 0.3 min delay nothing arrives before t = 0.5 min.
        const auto y = kfit::Evaluate_Model(model_kind::dual_inlet_delayed, in, { 0.5, 0.3, 0.0, 0.0, 1.0 }, none);
        for(size_t i = 0; in.time[i] <= 0.5 + 1.0E-9; ++i){
            REQUIRE(y[i] == doctest::Approx(0.0));
        }
        REQUIRE(0.0 < y.back());
    }

    SUBCASE("the signal-domain model requires its constants"){
        REQUIRE_THROWS_AS(kfit::Evaluate_Model(model_kind::high_flow_spgr_signal, in, { 0.2, 0.03, 0.2 }, none),
                          kfit::domain_error);

        const kfit::constant_set_t cs = { { "TR", 0.00378 }, { "FA", 15.0 }, { "r1", 5.9 },
                                          { "R10a", 1.0 / 1.5 }, { "R10t", 1.25 }, { "baseline", 3.0 } };
        kfit::spgr_constants_t blood;
        blood.TR = 0.00378;
        blood.FA = 15.0;
        blood.r1 = 5.9;
        blood.R10 = 1.0 / 1.5;
        blood.baseline = 3;
        auto signal_in = in;
        signal_in.aif = kfit::Concentration_To_Signal(in.aif, blood);
        for(auto &s : signal_in.aif) s *= 500.0;

        const auto y = kfit::Evaluate_Model(model_kind::high_flow_spgr_signal, signal_in, { 0.2, 0.03, 0.2 }, cs);
        REQUIRE(y.at(0) == doctest::Approx(1.0));
        REQUIRE(1.0 < y.back());
    }
}
