//Tracer_Kinetic_Models.h - A part of Kinefit 2026.
//
// Registry of tracer kinetic models. Each kind maps to a pure function of (time, input functions, parameters,
// constants) returning the predicted tissue curve sampled at the input times.

#pragma once

#include <string>
#include <vector>
#include <optional>

#include "Signal_Conversion.h"

namespace kfit {

enum class model_kind {
    high_flow_single_inlet,            // Ve, Khe, Kbh.
    high_flow_single_inlet_fixed_ve,   // Khe, Kbh.
    high_flow_dual_inlet,              // fA, Ve, Khe, Kbh.
    dual_inlet_filtration,             // fA, Ve, Fp, Khe, Kbh.
    dual_inlet_delayed,                // k1A, tauA, k1V, tauV, k2.
    high_flow_spgr_signal,             // Ve, Kbh, Khe. Operates on signal rather than concentration.
};

enum class inlet_t {
    single, // AIF only.
    dual,   // AIF and VIF.
};

// The input functions driving a model. All series share the time samples.
struct model_inputs_t {
    std::vector<double> time; // Minutes.
    std::vector<double> aif;
    std::optional<std::vector<double>> vif;
};

// Maps a catalog function name to a model kind. Disengaged if the name is not registered.
std::optional<model_kind>
Model_Kind_From_Function_Name(const std::string &name);

std::string
Function_Name(model_kind kind);

std::vector<model_kind>
All_Model_Kinds();

inlet_t
Inlet_Type(model_kind kind);

std::optional<inlet_t>
Inlet_Type_From_Name(const std::string &name); // "single" or "dual", case-insensitive.

std::string
Inlet_Type_Name(inlet_t inlet);

// Conventional parameter names in the order the model function consumes them.
std::vector<std::string>
Parameter_Names(model_kind kind);

// Evaluates a model at the input time samples.
//
// Parameters are fractions and rates in model units, i.e., percentages must already be converted. Parameter values
// outside physically meaningful ranges are clamped internally, so the optimizer may probe any point without
// triggering an exception.
//
// Throws std::invalid_argument for structural problems (wrong parameter count, missing VIF for a dual-inlet model,
// mismatched series lengths) and kfit::domain_error if a signal-domain model cannot convert its input.
std::vector<double>
Evaluate_Model(model_kind kind,
               const model_inputs_t &inputs,
               const std::vector<double> &params,
               const constant_set_t &constants);

} // namespace kfit
