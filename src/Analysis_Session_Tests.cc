//Analysis_Session_Tests.cc - A part of Kinefit 2026.

#include <cmath>
#include <string>
#include <sstream>
#include <fstream>
#include <vector>
#include <stdexcept>
#include <memory>

#include <doctest/doctest.h>

#include "Analysis_Session.h"
#include "Test_Fixtures.h"


static std::string
dual_time_course(const kfit::model_catalog_t &catalog, const std::vector<double> &truth){
    const auto &m = *catalog.find_model("dual");
    kfit::model_inputs_t in;
    in.time = kfit::testing::sample_times();
    in.aif = kfit::testing::arterial_input(in.time);
    in.vif = kfit::testing::venous_input(in.time);
    const auto liver = kfit::testing::perturbed(kfit::Evaluate_Descriptor(m, in, truth, catalog.constants), 0.002);

    std::stringstream ss;
    ss.precision(17);
    ss << "time,Liver,Aorta,Portal\n";
    for(size_t i = 0; i < in.time.size(); ++i){
        ss << in.time[i] * 60.0 << "," << liver[i] << "," << in.aif[i] << "," << in.vif.value()[i] << "\n";
    }
    return ss.str();
}


TEST_CASE( "analysis_session workflow" ){
    kfit::analysis_session session(kfit::testing::test_catalog());
    REQUIRE(!session.has_data());
    REQUIRE_THROWS_AS(session.get_data(), std::logic_error);
    REQUIRE_THROWS_AS(session.select_series("Liver", "Aorta"), std::logic_error);

    std::stringstream ss(dual_time_course(session.get_catalog(), { 30.0, 25.0, 0.3, 0.05 }));
    const auto loaded = session.load_data(ss, "patient.csv");
    REQUIRE(loaded.ok());
    REQUIRE(session.has_data());
    REQUIRE(session.get_data().names.size() == 3);

    REQUIRE_THROWS_AS(session.select_series("Liver", "Spleen"), std::invalid_argument);
    REQUIRE_THROWS_AS(session.select_model("nonexistent"), std::invalid_argument);
    REQUIRE_THROWS_AS(session.run_fit(), std::logic_error);

    session.select_series("Liver", "Aorta", std::string("Portal"));
    session.select_model("dual");
    REQUIRE(session.get_model()->id == "dual");

    const auto &fit = session.run_fit();
    REQUIRE(fit.ok());
    REQUIRE(fit.converged);
    REQUIRE(fit.parameters.at(0) == doctest::Approx(30.0).epsilon(0.05));
    for(const auto &ci : fit.intervals) REQUIRE(ci);
    REQUIRE(session.get_fit());

    SUBCASE("edits recompute the curve and clear every interval"){
        const auto before = session.get_fit()->predicted;
        const auto &edited = session.edit_parameter(3, 0.2);
        REQUIRE(edited.parameters.at(3) == 0.2);
        for(size_t i = 0; i < edited.intervals.size(); ++i){
            REQUIRE(!edited.intervals.at(i));
            REQUIRE(edited.interval_status.at(i) == kfit::ci_status_t::invalidated_by_edit);
        }
        REQUIRE(edited.predicted != before);
        REQUIRE(edited.predicted == session.predict(edited.parameters));
        REQUIRE(std::isfinite(edited.RSS));
        REQUIRE_THROWS_AS(session.edit_parameter(9, 0.2), std::out_of_range);
    }

    SUBCASE("plot data includes every displayed series"){
        const auto series = session.plot_series();
        REQUIRE(series.size() == 4);
        REQUIRE(series.at(0).name == "Liver");
        REQUIRE(series.at(3).name == "dual model");

        kfit::testing::scratch_dir dir;
        const auto p = dir.path / "plot.csv";
        session.export_plot_data(p);
        std::ifstream is(p);
        std::string header;
        std::getline(is, header);
        REQUIRE(header == "time,Liver,Aorta,Portal,dual model");
    }

    SUBCASE("changing the model discards the fit"){
        session.select_model("single");
        REQUIRE(!session.get_fit());
        REQUIRE_THROWS_AS(session.edit_parameter(0, 1.0), std::logic_error);
        REQUIRE(session.plot_series().size() == 3);
    }

    SUBCASE("a failed load leaves the session empty"){
        std::stringstream bad("time,Liver\n0,1\n");
        const auto res = session.load_data(bad, "bad.csv");
        REQUIRE(!res.ok());
        REQUIRE(res.failure->stage == kfit::validation_stage::too_few_columns);
        REQUIRE(!session.has_data());
        REQUIRE(!session.get_fit());
    }

    SUBCASE("copies remain usable after the original is gone"){
        auto copy = std::make_unique<kfit::analysis_session>(session);
        session = kfit::analysis_session(kfit::testing::test_catalog());
        REQUIRE(!session.get_model());

        REQUIRE(copy->get_model() != nullptr);
        REQUIRE(copy->get_model() == copy->get_catalog().find_model("dual"));
        const auto params = copy->get_fit()->parameters;
        const auto predicted = copy->predict(params);
        REQUIRE(predicted.size() == copy->get_fit()->predicted.size());
        for(size_t i = 0; i < predicted.size(); ++i){
            REQUIRE(predicted[i] == doctest::Approx(copy->get_fit()->predicted[i]));
        }
        REQUIRE(copy->run_fit().ok());
    }

    SUBCASE("dual-inlet models without a VIF report a missing input"){
        session.select_series("Liver", "Aorta");
        const auto &res = session.run_fit();
        REQUIRE(res.failure == kfit::fit_failure_t::missing_input);
        REQUIRE_THROWS_AS(session.edit_parameter(0, 1.0), std::logic_error);
    }
}

TEST_CASE( "Prepare_Session reports per-file problems without throwing" ){
    kfit::analysis_session session(kfit::testing::test_catalog());
    kfit::testing::scratch_dir dir;

    const auto t = kfit::testing::sample_times();
    const auto aif = kfit::testing::arterial_input(t);
    const auto vif = kfit::testing::venous_input(t);
    kfit::testing::write_time_course(dir.path / "with_liver.csv", t,
                                     { { "Liver", vif }, { "Aorta", aif }, { "Portal", vif } });
    kfit::testing::write_time_course(dir.path / "with_spleen.csv", t,
                                     { { "Spleen", vif }, { "Aorta", aif }, { "Portal", vif } });
    std::ofstream(dir.path / "broken.csv") << "time,Liver\n0,1\n";

    const std::string portal = "Portal";

    SUBCASE("a file lacking the region of interest"){
        const auto problem = kfit::Prepare_Session(session, dir.path / "with_spleen.csv", "dual", "Liver", "Aorta", portal);
        REQUIRE(problem);
        REQUIRE(problem->find("Liver") != std::string::npos);
        REQUIRE_THROWS_AS(session.run_fit(), std::logic_error);
    }

    SUBCASE("a file that fails validation"){
        const auto problem = kfit::Prepare_Session(session, dir.path / "broken.csv", "dual", "Liver", "Aorta", portal);
        REQUIRE(problem);
        REQUIRE(!session.has_data());
    }

    SUBCASE("a usable file after an unusable one"){
        REQUIRE(kfit::Prepare_Session(session, dir.path / "with_spleen.csv", "dual", "Liver", "Aorta", portal));
        REQUIRE(!kfit::Prepare_Session(session, dir.path / "with_liver.csv", "dual", "Liver", "Aorta", portal));
        REQUIRE(session.run_fit().failure == kfit::fit_failure_t::none);
    }

    SUBCASE("an unknown model is a configuration error"){
        REQUIRE_THROWS_AS(kfit::Prepare_Session(session, dir.path / "with_liver.csv", "nonexistent", "Liver", "Aorta"),
                          std::invalid_argument);
    }
}
