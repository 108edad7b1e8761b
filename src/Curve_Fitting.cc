//Curve_Fitting.cc - A part of Kinefit 2026.

#include <cmath>
#include <string>
#include <vector>
#include <optional>
#include <exception>
#include <stdexcept>
#include <algorithm>
#include <cctype>
#include <cstdint>

#include "YgorMisc.h"
#include "YgorString.h"
#include "YgorLog.h"

#include "Kinefit_Errors.h"
#include "Curve_Fitting.h"

namespace {

kfit::fit_result
failed(kfit::fit_result res, kfit::fit_failure_t f, const std::string &reason){
    res.failure = f;
    res.reason = reason;
    res.converged = false;
    res.intervals.assign(res.parameters.size(), std::nullopt);
    res.interval_status.assign(res.parameters.size(), kfit::ci_status_t::not_computed);
    res.interval_reason = "fit was not performed";
    YLOGWARN("Unable to fit model '" << res.model_id << "': " << reason);
    return res;
}

} // namespace

std::optional<kfit::fit_method>
kfit::Fit_Method_From_Name(const std::string &name){
    std::string n(name);
    std::transform(std::begin(n), std::end(n), std::begin(n),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    std::optional<kfit::fit_method> out;
    if( (n == "gsl_levenberg_marquardt") || (n == "lm") || (n == "levenberg-marquardt") ){
        out = fit_method::gsl_levenberg_marquardt;
    }else if( (n == "nlopt_bobyqa") || (n == "bobyqa") ){
        out = fit_method::nlopt_bobyqa;
    }
    return out;
}

std::string
kfit::Fit_Method_Name(kfit::fit_method method){
    switch(method){
        case fit_method::gsl_levenberg_marquardt: return "gsl_levenberg_marquardt";
        case fit_method::nlopt_bobyqa:            return "nlopt_bobyqa";
    }
    throw std::logic_error("Unhandled fit method");
}

std::string
kfit::Fit_Failure_Name(kfit::fit_failure_t f){
    switch(f){
        case fit_failure_t::none:                  return "none";
        case fit_failure_t::missing_input:         return "missing input";
        case fit_failure_t::mismatched_lengths:    return "mismatched lengths";
        case fit_failure_t::wrong_parameter_count: return "wrong parameter count";
        case fit_failure_t::invalid_bounds:        return "invalid bounds";
        case fit_failure_t::too_few_samples:       return "too few samples";
        case fit_failure_t::domain_error:          return "domain error";
        case fit_failure_t::solver_error:          return "solver error";
    }
    throw std::logic_error("Unhandled fit failure");
}

std::string
kfit::CI_Status_Name(kfit::ci_status_t s){
    switch(s){
        case ci_status_t::available:           return "available";
        case ci_status_t::not_computed:        return "not computed";
        case ci_status_t::not_converged:       return "not converged";
        case ci_status_t::unavailable:         return "unavailable";
        case ci_status_t::fixed_parameter:     return "fixed parameter";
        case ci_status_t::invalidated_by_edit: return "invalidated by edit";
    }
    throw std::logic_error("Unhandled confidence interval status");
}

bool
kfit::fit_result::ok() const {
    return (this->failure == fit_failure_t::none);
}

kfit::fit_result
kfit::Fit_Model(const kfit::model_descriptor_t &model,
                const std::vector<double> &observed,
                const kfit::model_inputs_t &inputs,
                const std::vector<double> &initial,
                const std::optional<kfit::parameter_bounds_t> &bounds,
                const kfit::constant_set_t &constants,
                const kfit::fit_options_t &options,
                const kfit::minimizer_t &minimizer){

    fit_result res;
    res.model_id = model.id;
    res.method = Fit_Method_Name(options.method);
    res.parameter_names = model.parameter_names();
    res.parameters = initial;

    // Structural checks.
    const auto N = observed.size();
    if(inputs.aif.empty()){
        return failed(res, fit_failure_t::missing_input, "No arterial input function (AIF) was supplied");
    }
    if( (model.inlet == inlet_t::dual) && (!inputs.vif || inputs.vif->empty()) ){
        return failed(res, fit_failure_t::missing_input,
                      "Model '" + model.id + "' has a dual inlet and requires a venous input function (VIF), but none was supplied");
    }
    if( (inputs.time.size() != N)
    ||  (inputs.aif.size() != N)
    ||  ( (model.inlet == inlet_t::dual) && (inputs.vif->size() != N) ) ){
        return failed(res, fit_failure_t::mismatched_lengths, "Observed, time, and input function series lengths differ");
    }
    const auto N_params = model.parameters.size();
    if(initial.size() != N_params){
        res.parameters = model.default_parameters();
        return failed(res, fit_failure_t::wrong_parameter_count,
                      "Model '" + model.id + "' has " + std::to_string(N_params) + " parameters but "
                      + std::to_string(initial.size()) + " initial values were supplied");
    }

    // Effective bounds.
    auto lower = model.lower_bounds();
    auto upper = model.upper_bounds();
    if(bounds){
        if( (bounds->lower.size() != N_params) || (bounds->upper.size() != N_params) ){
            return failed(res, fit_failure_t::wrong_parameter_count, "Bounds do not match the number of parameters");
        }
        for(size_t i = 0; i < N_params; ++i){
            lower[i] = std::max(lower[i], bounds->lower[i]);
            upper[i] = std::min(upper[i], bounds->upper[i]);
        }
    }
    size_t N_free = 0;
    for(size_t i = 0; i < N_params; ++i){
        if( std::isnan(lower[i]) || std::isnan(upper[i]) || (upper[i] < lower[i]) ){
            return failed(res, fit_failure_t::invalid_bounds,
                          "Bounds for parameter '" + model.parameters[i].short_name + "' are empty or invalid");
        }
        if(lower[i] < upper[i]) ++N_free;
    }
    if( (N < 2) || (N < N_free) ){
        return failed(res, fit_failure_t::too_few_samples,
                      std::to_string(N) + " samples are insufficient to fit " + std::to_string(N_free) + " free parameters");
    }
    for(size_t i = 0; i < N; ++i){
        if(!std::isfinite(observed[i])){
            return failed(res, fit_failure_t::domain_error, "Observed sample " + std::to_string(i) + " is not finite");
        }
    }

    std::vector<double> start(initial);
    for(size_t i = 0; i < N_params; ++i){
        const auto clamped = std::clamp(start[i], lower[i], upper[i]);
        if(clamped != start[i]){
            YLOGWARN("Initial value of '" << model.parameters[i].short_name << "' (" << start[i]
                     << ") lies outside the bounds; using " << clamped);
            start[i] = clamped;
        }
    }
    res.parameters = start;

    // Trial evaluation to surface problems that do not depend on the parameters.
    try{
        res.predicted = Evaluate_Descriptor(model, inputs, start, constants);
    }catch(const kfit::domain_error &e){
        return failed(res, fit_failure_t::domain_error, e.what());
    }catch(const std::invalid_argument &e){
        return failed(res, fit_failure_t::mismatched_lengths, e.what());
    }

    minimization_problem problem;
    problem.N_residuals = N;
    problem.initial = start;
    problem.lower = lower;
    problem.upper = upper;
    problem.options = options.minimizer;
    problem.residuals = [&](const std::vector<double> &params, std::vector<double> &residuals) -> void {
        const auto predicted = Evaluate_Descriptor(model, inputs, params, constants);
        for(size_t i = 0; i < N; ++i){
            residuals[i] = predicted[i] - observed[i];
        }
        return;
    };

    YLOGINFO("Fitting model '" << model.id << "' to " << N << " samples with " << N_free
             << " free parameters using " << res.method);

    minimization_outcome outcome;
    try{
        if(minimizer){
            outcome = minimizer(problem);
        }else if(options.method == fit_method::nlopt_bobyqa){
            outcome = Minimize_via_NLopt(problem);
        }else{
            outcome = Minimize_via_GSL_LM(problem);
        }
    }catch(const std::exception &e){
        return failed(res, fit_failure_t::solver_error, "Minimizer failed: "_s + e.what());
    }
    if(outcome.optimum.size() != N_params){
        return failed(res, fit_failure_t::solver_error, "Minimizer returned the wrong number of parameters");
    }

    res.parameters = outcome.optimum;
    res.converged = outcome.converged;
    res.iterations = outcome.iterations;
    res.solver_message = outcome.message;
    try{
        res.predicted = Evaluate_Descriptor(model, inputs, res.parameters, constants);
    }catch(const std::exception &e){
        return failed(res, fit_failure_t::domain_error, e.what());
    }
    res.RSS = 0.0;
    for(size_t i = 0; i < N; ++i){
        res.RSS += std::pow(res.predicted[i] - observed[i], 2.0);
    }

    // Confidence intervals.
    res.intervals.assign(N_params, std::nullopt);
    res.interval_status.assign(N_params, ci_status_t::unavailable);
    if(!res.converged){
        res.interval_status.assign(N_params, ci_status_t::not_converged);
        res.interval_reason = "optimizer did not converge (" + outcome.message + ")";
        YLOGWARN("Fit of model '" << model.id << "' did not converge: " << outcome.message);

    }else if(!outcome.covariance){
        res.interval_reason = outcome.covariance_message;
        YLOGWARN("Confidence intervals unavailable for model '" << model.id << "': " << outcome.covariance_message);

    }else{
        const auto &cov = outcome.covariance.value();
        const auto t = Student_t_Quantile(options.confidence_level, cov.dof);
        if(!std::isfinite(t)){
            res.interval_reason = "Student-t quantile could not be evaluated";
        }else{
            for(size_t i = 0; i < N_params; ++i){
                if(!(lower[i] < upper[i])) continue;
                const auto sigma = std::sqrt(cov.matrix.at(i * N_params + i));
                confidence_interval_t ci;
                ci.lower = res.parameters[i] - t * sigma;
                ci.upper = res.parameters[i] + t * sigma;
                res.intervals[i] = ci;
                res.interval_status[i] = ci_status_t::available;
            }
        }
    }
    for(size_t i = 0; i < N_params; ++i){
        if(!(lower[i] < upper[i])){
            res.intervals[i] = std::nullopt;
            res.interval_status[i] = ci_status_t::fixed_parameter;
        }
    }

    YLOGINFO("Fit of model '" << model.id << "' finished: RSS = " << res.RSS << ", iterations = " << res.iterations
             << ", converged = " << (res.converged ? "yes" : "no"));
    return res;
}

kfit::fit_result
kfit::Override_Parameter(const kfit::fit_result &fit, size_t index, double value){
    if(fit.parameters.size() <= index){
        throw std::out_of_range("Parameter index " + std::to_string(index) + " is out of range");
    }
    fit_result out(fit);
    out.parameters[index] = value;
    out.intervals.assign(out.parameters.size(), std::nullopt);
    out.interval_status.assign(out.parameters.size(), ci_status_t::invalidated_by_edit);
    out.interval_reason = "parameters were edited after fitting";
    out.RSS = std::numeric_limits<double>::quiet_NaN();
    return out;
}
