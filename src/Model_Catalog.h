//Model_Catalog.h - A part of Kinefit 2026.
//
// In-memory form of the declarative model catalog document.

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <istream>
#include <filesystem>
#include <cstdint>

#include "Signal_Conversion.h"
#include "Tracer_Kinetic_Models.h"

namespace kfit {

struct parameter_spec_t {
    std::string short_name;
    std::string long_name;
    std::string units;          // "%" denotes a percentage, which is divided by 100 before reaching the model.

    double default_value = 0.0;
    double step          = 0.0;
    int64_t precision    = 3;

    double display_min   = 0.0;
    double display_max   = 0.0;

    double lower         = 0.0; // Fit constraints, in catalog units.
    double upper         = 0.0;

    bool is_percentage() const;
};

struct model_descriptor_t {
    std::string id;             // Used to select the model.
    std::string short_name;
    std::string long_name;
    std::string function_name;
    std::string image;          // Schematic, passed through for display only.

    model_kind kind = model_kind::high_flow_single_inlet;
    inlet_t inlet   = inlet_t::single;

    std::vector<parameter_spec_t> parameters;

    std::vector<double> default_parameters() const;
    std::vector<double> lower_bounds() const;
    std::vector<double> upper_bounds() const;
    std::vector<std::string> parameter_names() const;
};

struct model_catalog_t {
    std::optional<std::string> data_folder;
    std::optional<std::string> y_axis_label;

    constant_set_t constants;

    std::vector<model_descriptor_t> models;

    // Returns nullptr if no model has the given id.
    const model_descriptor_t* find_model(const std::string &id) const;
};

// Parses a catalog document.
//
// Throws catalog_parse_error (or one of its subclasses) on any problem.
model_catalog_t
Load_Catalog(std::istream &is);

model_catalog_t
Load_Catalog_File(const std::filesystem::path &path);

// Converts parameters from catalog units to model units (percentages become fractions).
std::vector<double>
To_Model_Units(const model_descriptor_t &model, const std::vector<double> &params);

// Evaluates the descriptor's model with parameters given in catalog units.
std::vector<double>
Evaluate_Descriptor(const model_descriptor_t &model,
                    const model_inputs_t &inputs,
                    const std::vector<double> &params,
                    const constant_set_t &constants);

} // namespace kfit
