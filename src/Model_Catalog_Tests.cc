//Model_Catalog_Tests.cc - A part of Kinefit 2026.

#include <string>
#include <sstream>
#include <vector>
#include <filesystem>

#include <doctest/doctest.h>

#include "Kinefit_Errors.h"
#include "Model_Catalog.h"
#include "Test_Fixtures.h"


// A one-model catalog with replaceable fragments.
static std::string
catalog_with(const std::string &constants,
             const std::string &function,
             const std::string &inlet,
             const std::string &parameters){
    return "<catalog><constants>" + constants + "</constants>"
           "<model id=\"m\"><name><short>M</short></name>"
           "<function>" + function + "</function>"
           + inlet +
           "<parameters>" + parameters + "</parameters></model></catalog>";
}

static std::string
parameter(const std::string &name, const std::string &def, const std::string &lower, const std::string &upper){
    return "<parameter><name><short>" + name + "</short></name><default>" + def + "</default>"
           "<constraints><lower>" + lower + "</lower><upper>" + upper + "</upper></constraints></parameter>";
}

static const std::string good_constants = "<constant><name>TR</name><value>0.004</value></constant>";
static const std::string fixed_ve_function = "HighFlowSingleInletGadoxetateFixedVe";
static const std::string single_inlet = "<inlet_type>single</inlet_type>";
static const std::string good_parameters = parameter("Khe", "0.2", "0", "5") + parameter("Kbh", "0.03", "0", "5");

static kfit::model_catalog_t
parse(const std::string &doc){
    std::stringstream ss(doc);
    return kfit::Load_Catalog(ss);
}


TEST_CASE( "Load_Catalog accepts well-formed catalogs" ){
    const auto catalog = kfit::testing::test_catalog();

    REQUIRE(catalog.constants.size() == 7);
    REQUIRE(catalog.constants.at("FA") == doctest::Approx(15.0));
    REQUIRE(catalog.y_axis_label.value() == "Concentration (mM)");
    REQUIRE(!catalog.data_folder);
    REQUIRE(catalog.models.size() == 2);

    const auto *dual = catalog.find_model("dual");
    REQUIRE(dual != nullptr);
    REQUIRE(dual->inlet == kfit::inlet_t::dual);
    REQUIRE(dual->kind == kfit::model_kind::high_flow_dual_inlet);
    REQUIRE(dual->parameter_names() == std::vector<std::string>{ "fA", "Ve", "Khe", "Kbh" });
    REQUIRE(dual->parameters.at(0).is_percentage());
    REQUIRE(!dual->parameters.at(2).is_percentage());
    REQUIRE(dual->parameters.at(2).long_name == "Khe");
    REQUIRE(dual->parameters.at(2).display_max == doctest::Approx(5.0));
    REQUIRE(catalog.find_model("missing") == nullptr);

    const auto model_units = kfit::To_Model_Units(*dual, { 50.0, 20.0, 0.2, 0.03 });
    REQUIRE(model_units.at(0) == doctest::Approx(0.5));
    REQUIRE(model_units.at(1) == doctest::Approx(0.2));
    REQUIRE(model_units.at(2) == doctest::Approx(0.2));
    REQUIRE_THROWS_AS(kfit::To_Model_Units(*dual, { 50.0 }), std::invalid_argument);

    REQUIRE_NOTHROW(parse(catalog_with(good_constants, fixed_ve_function, single_inlet, good_parameters)));
}

TEST_CASE( "Load_Catalog binds parameters to the model function by name" ){
    const auto params = parameter("fA", "50", "0", "100")
                      + parameter("Ve", "20", "0", "100")
                      + parameter("Fp", "1.0", "0", "10")
                      + parameter("Kbh", "0.03", "0", "1")
                      + parameter("khe", "0.2", "0", "5");
    const auto catalog = parse(catalog_with(good_constants, "DualInletTwoCompartmentFiltration",
                                            "<inlet_type>dual</inlet_type>", params));
    const auto &m = catalog.models.at(0);
    REQUIRE(m.parameter_names() == std::vector<std::string>{ "fA", "Ve", "Fp", "khe", "Kbh" });
    REQUIRE(m.default_parameters() == std::vector<double>{ 50.0, 20.0, 1.0, 0.2, 0.03 });
    REQUIRE(m.upper_bounds().at(3) == doctest::Approx(5.0));
    REQUIRE(m.upper_bounds().at(4) == doctest::Approx(1.0));
}

#ifdef KFIT_EXAMPLE_CATALOG
TEST_CASE( "the bundled example catalog is valid" ){
    const auto catalog = kfit::Load_Catalog_File(std::filesystem::path(KFIT_EXAMPLE_CATALOG));
    REQUIRE(catalog.models.size() == kfit::All_Model_Kinds().size());
    for(const auto &m : catalog.models){
        REQUIRE(m.parameter_names() == kfit::Parameter_Names(m.kind));
    }
}
#endif // KFIT_EXAMPLE_CATALOG

TEST_CASE( "Load_Catalog rejects malformed catalogs" ){
    SUBCASE("duplicate constants"){
        REQUIRE_THROWS_AS(parse(catalog_with(good_constants + good_constants, fixed_ve_function, single_inlet, good_parameters)),
                          kfit::duplicate_constant_error);
    }

    SUBCASE("non-numeric constants"){
        const auto bad = "<constant><name>TR</name><value>fast</value></constant>";
        REQUIRE_THROWS_AS(parse(catalog_with(bad, fixed_ve_function, single_inlet, good_parameters)),
                          kfit::malformed_constant_error);
    }

    SUBCASE("unregistered model functions"){
        REQUIRE_THROWS_AS(parse(catalog_with(good_constants, "NoSuchModel", single_inlet, good_parameters)),
                          kfit::unknown_function_error);
    }

    SUBCASE("defaults outside the constraints"){
        const auto params = parameter("Khe", "7", "0", "5") + parameter("Kbh", "0.03", "0", "5");
        REQUIRE_THROWS_AS(parse(catalog_with(good_constants, fixed_ve_function, single_inlet, params)),
                          kfit::invalid_parameter_range_error);
    }

    SUBCASE("inverted constraints"){
        const auto params = parameter("Khe", "0.2", "5", "0") + parameter("Kbh", "0.03", "0", "5");
        REQUIRE_THROWS_AS(parse(catalog_with(good_constants, fixed_ve_function, single_inlet, params)),
                          kfit::invalid_parameter_range_error);
    }

    SUBCASE("missing inlet type"){
        REQUIRE_THROWS_AS(parse(catalog_with(good_constants, fixed_ve_function, "", good_parameters)),
                          kfit::missing_element_error);
    }

    SUBCASE("missing constraints"){
        const auto params = "<parameter><name><short>Khe</short></name><default>0.2</default></parameter>"
                          + parameter("Kbh", "0.03", "0", "5");
        REQUIRE_THROWS_AS(parse(catalog_with(good_constants, fixed_ve_function, single_inlet, params)),
                          kfit::missing_element_error);
    }

    SUBCASE("inlet type contradicting the model function"){
        REQUIRE_THROWS_AS(parse(catalog_with(good_constants, fixed_ve_function, "<inlet_type>dual</inlet_type>", good_parameters)),
                          kfit::catalog_parse_error);
    }

    SUBCASE("wrong parameter count"){
        REQUIRE_THROWS_AS(parse(catalog_with(good_constants, fixed_ve_function, single_inlet, parameter("Khe", "0.2", "0", "5"))),
                          kfit::catalog_parse_error);
    }

    SUBCASE("parameter names the model function does not take"){
        const auto params = parameter("Khe", "0.2", "0", "5") + parameter("Kel", "0.03", "0", "5");
        REQUIRE_THROWS_AS(parse(catalog_with(good_constants, fixed_ve_function, single_inlet, params)),
                          kfit::catalog_parse_error);

        const auto twice = parameter("Khe", "0.2", "0", "5") + parameter("khe", "0.03", "0", "5");
        REQUIRE_THROWS_AS(parse(catalog_with(good_constants, fixed_ve_function, single_inlet, twice)),
                          kfit::catalog_parse_error);
    }

    SUBCASE("no models"){
        REQUIRE_THROWS_AS(parse("<catalog><constants>" + good_constants + "</constants></catalog>"),
                          kfit::catalog_parse_error);
    }

    SUBCASE("unparseable documents"){
        REQUIRE_THROWS_AS(parse("<catalog><model></catalog>"), kfit::catalog_parse_error);
    }

    SUBCASE("missing files"){
        REQUIRE_THROWS_AS(kfit::Load_Catalog_File("/nonexistent/kinefit/catalog.xml"), kfit::catalog_parse_error);
    }
}
