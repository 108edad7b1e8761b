//Tracer_Kinetic_Models.cc - A part of Kinefit 2026.
//
// Gadoxetate liver models. The tissue is split into an extracellular space (volume fraction Ve) fed by the input
// function(s) and a hepatocyte space with uptake rate Khe and biliary efflux rate Kbh. The hepatocyte transit
// time is Th = (1 - Ve)/Kbh.
//

#include <cmath>
#include <string>
#include <vector>
#include <optional>
#include <algorithm>
#include <stdexcept>
#include <cctype>
#include <map>

#include "YgorMisc.h"
#include "YgorString.h"
#include "YgorLog.h"

#include "Kinefit_Errors.h"
#include "Signal_Conversion.h"
#include "Tracer_Kinetic_Models.h"

namespace {

const std::map<std::string, kfit::model_kind> function_names = {
    { "HighFlowSingleInletGadoxetate",        kfit::model_kind::high_flow_single_inlet },
    { "HighFlowSingleInletGadoxetateFixedVe", kfit::model_kind::high_flow_single_inlet_fixed_ve },
    { "HighFlowDualInletGadoxetate",          kfit::model_kind::high_flow_dual_inlet },
    { "DualInletTwoCompartmentFiltration",    kfit::model_kind::dual_inlet_filtration },
    { "DualInletOneCompartmentDelayed",       kfit::model_kind::dual_inlet_delayed },
    { "HighFlowGadoxetate3DSPGR",             kfit::model_kind::high_flow_spgr_signal },
};

// Extracellular fraction of the spleen, used to convert blood concentration to extracellular concentration.
constexpr double default_ve_spleen = 0.43;

double clamp_fraction(double f){
    const double eps = 1.0E-6;
    if(!std::isfinite(f)) return 0.5;
    return std::clamp(f, eps, 1.0 - eps);
}

double clamp_weight(double f){
    if(!std::isfinite(f)) return 0.5;
    return std::clamp(f, 0.0, 1.0);
}

double clamp_rate(double k){
    if(!std::isfinite(k)) return 0.0;
    return std::max(k, 0.0);
}

// Computes \int_{0}^{t} c(tau) exp(-k (t - tau)) dtau at each sample.
//
// Degenerates to the cumulative integral when k is zero.
std::vector<double>
exponential_kernel_integral(double k,
                            const std::vector<double> &time,
                            const std::vector<double> &c){
    if(k <= 0.0){
        return kfit::Cumulative_Integral(time, c);
    }
    const double T = 1.0 / k;
    auto out = kfit::Exponential_Convolution(T, time, c);
    for(auto &x : out) x *= T;
    return out;
}

// Ve * c_e + Khe * \int c_e(tau) exp(-(t - tau)/Th) dtau.
std::vector<double>
two_compartment_response(double Ve, double Khe, double Kbh,
                         const std::vector<double> &time,
                         const std::vector<double> &ce){
    const double kh = Kbh / (1.0 - Ve); // 1/Th.
    const auto uptake = exponential_kernel_integral(kh, time, ce);

    std::vector<double> out(ce.size());
    for(size_t i = 0; i < ce.size(); ++i){
        out[i] = Ve * ce[i] + Khe * uptake[i];
    }
    return out;
}

std::vector<double>
weighted_sum(double wa, const std::vector<double> &a,
             double wb, const std::vector<double> &b){
    std::vector<double> out(a.size());
    for(size_t i = 0; i < a.size(); ++i){
        out[i] = wa * a[i] + wb * b[i];
    }
    return out;
}

// Shifts a series later in time by 'tau', treating the series as zero before the first sample.
std::vector<double>
delayed(const std::vector<double> &time,
        const std::vector<double> &series,
        double tau){
    std::vector<double> out(series.size());
    for(size_t i = 0; i < time.size(); ++i){
        out[i] = kfit::Interpolate_Linearly(time, series, time[i] - tau, 0.0);
    }
    return out;
}

std::vector<double>
evaluate_filtration(const kfit::model_inputs_t &in,
                    const std::vector<double> &p){
    const double fA  = clamp_weight(p.at(0));
    const double Ve  = clamp_fraction(p.at(1));
    const double Fp  = clamp_rate(p.at(2));
    const double Khe = clamp_rate(p.at(3));
    const double Kbh = clamp_rate(p.at(4));

    const auto comb = weighted_sum(Fp * fA, in.aif, Fp * (1.0 - fA), in.vif.value());

    // Work with rates rather than transit times so that vanishing rates remain finite.
    const double kh = Kbh / (1.0 - Ve);    // 1/Th.
    const double ke = (Fp + Khe) / Ve;     // 1/Te.
    // alpha = sqrt(gamma^2 - ke*kh) = |ke - kh|/2, bounded away from zero where the two time constants coincide.
    const double alpha = std::max( std::abs(ke - kh) * 0.5, 1.0E-8 );
    const double beta  = (kh - ke) * 0.5;
    const double gamma = (kh + ke) * 0.5;

    const auto I1 = exponential_kernel_integral(gamma - alpha, in.time, comb);
    const auto I2 = exponential_kernel_integral(gamma + alpha, in.time, comb);

    std::vector<double> ce(comb.size());
    for(size_t i = 0; i < comb.size(); ++i){
        ce[i] = ( (1.0 + beta/alpha) * I1[i] + (1.0 - beta/alpha) * I2[i] ) / (2.0 * Ve);
    }
    return two_compartment_response(Ve, Khe, Kbh, in.time, ce);
}

std::vector<double>
evaluate_delayed(const kfit::model_inputs_t &in,
                 const std::vector<double> &p){
    const double k1A  = clamp_rate(p.at(0));
    const double tauA = clamp_rate(p.at(1));
    const double k1V  = clamp_rate(p.at(2));
    const double tauV = clamp_rate(p.at(3));
    const double k2   = clamp_rate(p.at(4));

    // Arterial contribution: k1A \int AIF(tau - tauA) exp(-k2 (t - tau)) dtau. The venous contribution is identical
    // with AIF -> VIF.
    const auto IA = exponential_kernel_integral(k2, in.time, delayed(in.time, in.aif, tauA));
    const auto IV = exponential_kernel_integral(k2, in.time, delayed(in.time, in.vif.value(), tauV));
    return weighted_sum(k1A, IA, k1V, IV);
}

std::vector<double>
evaluate_spgr_signal(const kfit::model_inputs_t &in,
                     const std::vector<double> &p,
                     const kfit::constant_set_t &constants){
    const double Ve  = clamp_fraction(p.at(0));
    const double Kbh = clamp_rate(p.at(1));
    const double Khe = clamp_rate(p.at(2));

    const auto get = [&](const std::string &name) -> double {
        const auto it = constants.find(name);
        if(it == std::end(constants)){
            throw kfit::domain_error("Constant '" + name + "' is required by the signal-domain model");
        }
        return it->second;
    };

    kfit::spgr_constants_t blood;
    blood.TR = get("TR");
    blood.FA = get("FA");
    blood.r1 = get("r1");
    blood.R10 = get("R10a");
    const auto baseline = get("baseline");
    if( !std::isfinite(baseline) || (baseline < 1.0) ){
        throw kfit::domain_error("Constant 'baseline' must be a positive integer");
    }
    blood.baseline = static_cast<int64_t>(std::round(baseline));

    kfit::spgr_constants_t tissue = blood;
    tissue.R10 = get("R10t");

    const auto ve_spleen_it = constants.find("ve_spleen");
    const double ve_spleen = (ve_spleen_it == std::end(constants)) ? default_ve_spleen : ve_spleen_it->second;
    if( !std::isfinite(ve_spleen) || (ve_spleen <= 0.0) ){
        throw kfit::domain_error("Constant 've_spleen' must be positive");
    }

    auto ce = kfit::Signal_To_Concentration(in.aif, blood);
    for(auto &c : ce) c /= ve_spleen;

    const auto ct = two_compartment_response(Ve, Khe, Kbh, in.time, ce);
    return kfit::Concentration_To_Signal(ct, tissue);
}

} // namespace

std::optional<kfit::model_kind>
kfit::Model_Kind_From_Function_Name(const std::string &name){
    std::optional<kfit::model_kind> out;
    const auto it = function_names.find(name);
    if(it != std::end(function_names)){
        out = it->second;
    }
    return out;
}

std::string
kfit::Function_Name(kfit::model_kind kind){
    for(const auto &p : function_names){
        if(p.second == kind) return p.first;
    }
    throw std::logic_error("Unregistered model kind");
}

std::vector<kfit::model_kind>
kfit::All_Model_Kinds(){
    return { model_kind::high_flow_single_inlet,
             model_kind::high_flow_single_inlet_fixed_ve,
             model_kind::high_flow_dual_inlet,
             model_kind::dual_inlet_filtration,
             model_kind::dual_inlet_delayed,
             model_kind::high_flow_spgr_signal };
}

kfit::inlet_t
kfit::Inlet_Type(kfit::model_kind kind){
    switch(kind){
        case model_kind::high_flow_single_inlet:
        case model_kind::high_flow_single_inlet_fixed_ve:
        case model_kind::high_flow_spgr_signal:
            return inlet_t::single;
        case model_kind::high_flow_dual_inlet:
        case model_kind::dual_inlet_filtration:
        case model_kind::dual_inlet_delayed:
            return inlet_t::dual;
    }
    throw std::logic_error("Unhandled model kind");
}

std::optional<kfit::inlet_t>
kfit::Inlet_Type_From_Name(const std::string &name){
    auto n = Canonicalize_String2(name, CANONICALIZE::TRIM_ENDS);
    std::transform(std::begin(n), std::end(n), std::begin(n),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });

    std::optional<kfit::inlet_t> out;
    if(n == "single"){
        out = inlet_t::single;
    }else if(n == "dual"){
        out = inlet_t::dual;
    }
    return out;
}

std::string
kfit::Inlet_Type_Name(kfit::inlet_t inlet){
    return (inlet == inlet_t::dual) ? "dual" : "single";
}

std::vector<std::string>
kfit::Parameter_Names(kfit::model_kind kind){
    switch(kind){
        case model_kind::high_flow_single_inlet:
            return { "Ve", "Khe", "Kbh" };
        case model_kind::high_flow_single_inlet_fixed_ve:
            return { "Khe", "Kbh" };
        case model_kind::high_flow_dual_inlet:
            return { "fA", "Ve", "Khe", "Kbh" };
        case model_kind::dual_inlet_filtration:
            return { "fA", "Ve", "Fp", "Khe", "Kbh" };
        case model_kind::dual_inlet_delayed:
            return { "k1A", "tauA", "k1V", "tauV", "k2" };
        case model_kind::high_flow_spgr_signal:
            return { "Ve", "Kbh", "Khe" };
    }
    throw std::logic_error("Unhandled model kind");
}

std::vector<double>
kfit::Evaluate_Model(kfit::model_kind kind,
                     const kfit::model_inputs_t &inputs,
                     const std::vector<double> &params,
                     const kfit::constant_set_t &constants){

    const auto N = inputs.time.size();
    if(inputs.aif.size() != N){
        throw std::invalid_argument("AIF length does not match the time samples");
    }
    if(Inlet_Type(kind) == inlet_t::dual){
        if(!inputs.vif){
            throw std::invalid_argument("Model '" + Function_Name(kind) + "' requires a venous input function");
        }
        if(inputs.vif->size() != N){
            throw std::invalid_argument("VIF length does not match the time samples");
        }
    }
    const auto expected = Parameter_Names(kind).size();
    if(params.size() != expected){
        throw std::invalid_argument("Model '" + Function_Name(kind) + "' requires " + std::to_string(expected)
                                    + " parameters but " + std::to_string(params.size()) + " were provided");
    }

    switch(kind){
        case model_kind::high_flow_single_inlet:
            return two_compartment_response(clamp_fraction(params[0]),
                                            clamp_rate(params[1]),
                                            clamp_rate(params[2]),
                                            inputs.time, inputs.aif);

        case model_kind::high_flow_single_inlet_fixed_ve:
            {
                // The extracellular term is neglected and Tc = 1/Kbh.
                const double Khe = clamp_rate(params[0]);
                const double Kbh = clamp_rate(params[1]);
                auto out = exponential_kernel_integral(Kbh, inputs.time, inputs.aif);
                for(auto &x : out) x *= Khe;
                return out;
            }

        case model_kind::high_flow_dual_inlet:
            {
                const double fA = clamp_weight(params[0]);
                const auto comb = weighted_sum(fA, inputs.aif, 1.0 - fA, inputs.vif.value());
                return two_compartment_response(clamp_fraction(params[1]),
                                                clamp_rate(params[2]),
                                                clamp_rate(params[3]),
                                                inputs.time, comb);
            }

        case model_kind::dual_inlet_filtration:
            return evaluate_filtration(inputs, params);

        case model_kind::dual_inlet_delayed:
            return evaluate_delayed(inputs, params);

        case model_kind::high_flow_spgr_signal:
            return evaluate_spgr_signal(inputs, params, constants);
    }
    throw std::logic_error("Unhandled model kind");
}
