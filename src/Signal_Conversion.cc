//Signal_Conversion.cc - A part of Kinefit 2026.
//
// NOTE: The steady-state spoiled gradient echo signal is S = M0 sin(FA) (1 - E1)/(1 - cos(FA) E1) with
//       E1 = exp(-TR R1). Dividing by the pre-contrast signal eliminates M0 and sin(FA), leaving
//       S/S_pre = (1 - E1)(1 - cos(FA) E0)/((1 - E0)(1 - cos(FA) E1)) with E0 = exp(-TR R10). This ratio is
//       inverted in closed form for E1, and C = (R1 - R10)/r1.
//

#include <cmath>
#include <string>
#include <map>
#include <vector>
#include <optional>
#include <cstdint>
#include <stdexcept>
#include <algorithm>

#include "YgorMisc.h"
#include "YgorLog.h"
#include "YgorStats.h"

#include "Kinefit_Errors.h"
#include "Signal_Conversion.h"

namespace {

double
require_constant(const kfit::constant_set_t &constants, const std::string &name){
    const auto it = constants.find(name);
    if(it == std::end(constants)){
        throw kfit::domain_error("Constant '" + name + "' is required for signal conversion but was not provided");
    }
    return it->second;
}

} // namespace

kfit::spgr_constants_t
kfit::Extract_SPGR_Constants(const kfit::constant_set_t &constants,
                             const std::optional<std::string> &series_name){
    spgr_constants_t out;
    out.TR = require_constant(constants, "TR");
    out.FA = require_constant(constants, "FA");
    out.r1 = require_constant(constants, "r1");

    const auto baseline = require_constant(constants, "baseline");
    if( !std::isfinite(baseline) || (baseline < 1.0) || (std::round(baseline) != baseline) ){
        throw kfit::domain_error("Constant 'baseline' must be a positive integer");
    }
    out.baseline = static_cast<int64_t>(baseline);

    const auto specific = series_name ? constants.find("R10_" + series_name.value())
                                      : std::end(constants);
    if(specific != std::end(constants)){
        out.R10 = specific->second;
    }else{
        out.R10 = require_constant(constants, "R10");
    }

    Validate_SPGR_Constants(out);
    return out;
}

void
kfit::Validate_SPGR_Constants(const kfit::spgr_constants_t &c){
    if( !std::isfinite(c.TR) || (c.TR <= 0.0) ){
        throw kfit::domain_error("Repetition time must be positive");
    }
    if( !std::isfinite(c.FA) || (c.FA <= 0.0) || (180.0 <= c.FA) ){
        throw kfit::domain_error("Flip angle must be within (0,180) degrees");
    }
    if( !std::isfinite(c.r1) || (c.r1 <= 0.0) ){
        throw kfit::domain_error("Relaxivity must be positive");
    }
    if( !std::isfinite(c.R10) || (c.R10 <= 0.0) ){
        throw kfit::domain_error("Pre-contrast relaxation rate must be positive");
    }
    if(c.baseline < 1){
        throw kfit::domain_error("At least one baseline sample is required");
    }
    return;
}

std::vector<double>
kfit::Signal_To_Concentration(const std::vector<double> &signal,
                              const kfit::spgr_constants_t &c){
    Validate_SPGR_Constants(c);
    if(static_cast<int64_t>(signal.size()) < c.baseline){
        throw kfit::domain_error("Baseline sample count (" + std::to_string(c.baseline)
                                 + ") exceeds series length (" + std::to_string(signal.size()) + ")");
    }

    const std::vector<double> pre(std::begin(signal), std::next(std::begin(signal), c.baseline));
    const auto S_pre = Stats::Mean(pre);
    if( !std::isfinite(S_pre) || (S_pre <= 0.0) ){
        throw kfit::domain_error("Equilibrium signal estimate is non-positive");
    }

    const auto pi = std::acos(-1.0);
    const auto cosFA = std::cos(c.FA * pi / 180.0);
    const auto E0 = std::exp(-c.TR * c.R10);
    const auto scale = (1.0 - E0) / (1.0 - cosFA * E0);

    std::vector<double> out;
    out.reserve(signal.size());
    for(size_t i = 0; i < signal.size(); ++i){
        const auto A = (signal[i] / S_pre) * scale;
        const auto E1 = (1.0 - A) / (1.0 - A * cosFA);
        if( !std::isfinite(E1) || (E1 <= 0.0) || (1.0 <= E1) ){
            throw kfit::domain_error("Signal sample " + std::to_string(i) + " cannot be converted to a relaxation rate");
        }
        const auto R1 = -std::log(E1) / c.TR;
        out.push_back( (R1 - c.R10) / c.r1 );
    }
    return out;
}

std::vector<double>
kfit::Concentration_To_Signal(const std::vector<double> &concentration,
                              const kfit::spgr_constants_t &c){
    Validate_SPGR_Constants(c);

    const auto pi = std::acos(-1.0);
    const auto cosFA = std::cos(c.FA * pi / 180.0);
    const auto E0 = std::exp(-c.TR * c.R10);
    const auto pre = (1.0 - E0) / (1.0 - cosFA * E0);

    std::vector<double> out;
    out.reserve(concentration.size());
    for(const auto C : concentration){
        const auto R1 = c.R10 + c.r1 * C;
        const auto E1 = std::exp(-c.TR * R1);
        out.push_back( ((1.0 - E1) / (1.0 - cosFA * E1)) / pre );
    }
    return out;
}

std::vector<double>
kfit::Exponential_Convolution(double T,
                              const std::vector<double> &time,
                              const std::vector<double> &series){
    if(time.size() != series.size()){
        throw std::invalid_argument("Time and series lengths differ");
    }
    if(T == 0.0) return series;

    const auto N = series.size();
    std::vector<double> f(N, 0.0);
    for(size_t i = 0; (i + 1) < N; ++i){
        const auto x = (time[i+1] - time[i]) / T;
        const auto da = series[i+1] - series[i];

        // E0 = 1 - exp(-x) and E1 = x - E0, with a series expansion where the subtraction loses precision.
        const auto E = std::exp(-x);
        const auto E0 = -std::expm1(-x);
        const auto E1 = (std::abs(x) < 1.0E-4) ? (x*x*0.5 - x*x*x/6.0 + x*x*x*x/24.0)
                                               : (x - E0);
        f[i+1] = E * f[i] + series[i] * E0 + (da / x) * E1;
    }
    return f;
}

std::vector<double>
kfit::Discrete_Convolution(const std::vector<double> &time,
                           const std::vector<double> &a,
                           const std::vector<double> &b){
    if( (time.size() != a.size())
    ||  (time.size() != b.size()) ){
        throw std::invalid_argument("Series lengths differ");
    }
    const auto N = time.size();
    if(N < 2) return std::vector<double>(N, 0.0);

    const auto dt = (time.back() - time.front()) / static_cast<double>(N - 1);
    if(!std::isfinite(dt) || (dt <= 0.0)){
        throw std::invalid_argument("Sampling interval must be positive");
    }
    for(size_t i = 1; i < N; ++i){
        if(1.0E-6 * dt < std::abs((time[i] - time[i-1]) - dt)){
            throw std::invalid_argument("Discrete convolution requires uniform sampling");
        }
    }

    std::vector<double> out(N, 0.0);
    for(size_t i = 0; i < N; ++i){
        double sum = 0.0;
        for(size_t j = 0; j <= i; ++j) sum += a[j] * b[i - j];
        out[i] = sum * dt;
    }
    return out;
}

std::vector<double>
kfit::Cumulative_Integral(const std::vector<double> &time,
                          const std::vector<double> &series){
    if(time.size() != series.size()){
        throw std::invalid_argument("Time and series lengths differ");
    }
    std::vector<double> out(series.size(), 0.0);
    for(size_t i = 1; i < series.size(); ++i){
        out[i] = out[i-1] + 0.5 * (series[i] + series[i-1]) * (time[i] - time[i-1]);
    }
    return out;
}

double
kfit::Interpolate_Linearly(const std::vector<double> &time,
                           const std::vector<double> &series,
                           double t,
                           double outside){
    if( time.empty()
    ||  (time.size() != series.size())
    ||  !std::isfinite(t)
    ||  (t < time.front())
    ||  (time.back() < t) ){
        return outside;
    }

    const auto it = std::upper_bound(std::begin(time), std::end(time), t);
    if(it == std::end(time)) return series.back();

    const auto i = static_cast<size_t>(std::distance(std::begin(time), it));
    const auto t0 = time[i-1];
    const auto t1 = time[i];
    const auto w = (t - t0) / (t1 - t0);
    return series[i-1] + w * (series[i] - series[i-1]);
}
