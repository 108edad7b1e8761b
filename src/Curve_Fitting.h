//Curve_Fitting.h - A part of Kinefit 2026.
//
// Fits a catalog model to an observed tissue curve and derives confidence intervals for the parameters.

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <limits>
#include <cstdint>

#include "Signal_Conversion.h"
#include "Tracer_Kinetic_Models.h"
#include "Model_Catalog.h"
#include "Least_Squares.h"

namespace kfit {

enum class fit_method {
    gsl_levenberg_marquardt,
    nlopt_bobyqa,
};

std::optional<fit_method>
Fit_Method_From_Name(const std::string &name);

std::string
Fit_Method_Name(fit_method method);

struct fit_options_t {
    fit_method method = fit_method::gsl_levenberg_marquardt;
    double confidence_level = 0.95;
    minimizer_options_t minimizer;
};

// Why a fit could not be performed. Non-convergence is not a failure; it is reported via fit_result::converged.
enum class fit_failure_t {
    none,
    missing_input,          // No AIF, or no VIF for a dual-inlet model.
    mismatched_lengths,     // Series lengths differ.
    wrong_parameter_count,  // Initial parameters or bounds do not match the model.
    invalid_bounds,         // Bounds are inverted or not numbers.
    too_few_samples,        // Fewer observations than free parameters.
    domain_error,           // The model could not be evaluated for these inputs (e.g., signal conversion failed).
    solver_error,           // The minimizer itself failed.
};

std::string
Fit_Failure_Name(fit_failure_t f);

// Why a confidence interval is (or is not) present.
enum class ci_status_t {
    available,
    not_computed,          // The fit failed outright.
    not_converged,
    unavailable,           // The covariance could not be estimated reliably.
    fixed_parameter,       // Held fixed during the fit.
    invalidated_by_edit,   // The parameters were edited after the fit.
};

std::string
CI_Status_Name(ci_status_t s);

struct confidence_interval_t {
    double lower = std::numeric_limits<double>::quiet_NaN();
    double upper = std::numeric_limits<double>::quiet_NaN();
};

// Optional bounds that override the catalog's constraints. The effective bounds are the intersection.
struct parameter_bounds_t {
    std::vector<double> lower;
    std::vector<double> upper;
};

struct fit_result {
    std::string model_id;

    fit_failure_t failure = fit_failure_t::none;
    std::string reason;

    bool converged = false;

    std::vector<std::string> parameter_names;
    std::vector<double> parameters;                               // Catalog units. The last iterate if not converged.
    std::vector<std::optional<confidence_interval_t>> intervals;  // Catalog units.
    std::vector<ci_status_t> interval_status;
    std::string interval_reason;

    std::vector<double> predicted;  // Same samples as the observed series.

    double RSS = std::numeric_limits<double>::quiet_NaN();
    int64_t iterations = 0;
    std::string method;
    std::string solver_message;

    bool ok() const;
};

// Fits the model to the observed series.
//
// Never throws for data-dependent problems; all failures are reported in the result. An empty 'minimizer' selects
// the driver named in the options.
fit_result
Fit_Model(const model_descriptor_t &model,
          const std::vector<double> &observed,
          const model_inputs_t &inputs,
          const std::vector<double> &initial,
          const std::optional<parameter_bounds_t> &bounds,
          const constant_set_t &constants,
          const fit_options_t &options = {},
          const minimizer_t &minimizer = {});

// Replaces a parameter value after a fit. Confidence intervals become absent. The predicted curve is left untouched
// so the caller can decide whether to recompute it.
//
// Throws std::out_of_range if the index is invalid.
fit_result
Override_Parameter(const fit_result &fit, size_t index, double value);

} // namespace kfit
