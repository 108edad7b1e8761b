//Signal_Conversion.h - A part of Kinefit 2026.
//
// Conversion between relative MR signal and tracer concentration for spoiled gradient echo (SPGR) acquisitions,
// plus the shared numerical routines used by the tracer kinetic models.

#pragma once

#include <string>
#include <map>
#include <vector>
#include <optional>
#include <cstdint>

namespace kfit {

// Named physical constants shared by every model in a catalog, e.g., "TR" -> 0.0058.
using constant_set_t = std::map<std::string, double>;

struct spgr_constants_t {
    double TR       = 0.0;  // Repetition time (seconds).
    double FA       = 0.0;  // Flip angle (degrees).
    double r1       = 0.0;  // Longitudinal relaxivity (1/(mM*s)).
    double R10      = 0.0;  // Pre-contrast longitudinal relaxation rate (1/s).
    int64_t baseline = 0;   // Number of leading pre-contrast samples.
};

// Gathers the SPGR constants from a constant set.
//
// The pre-contrast relaxation rate is taken from "R10_<series_name>" when present, otherwise from "R10".
// Throws kfit::domain_error if any constant is missing or invalid.
spgr_constants_t
Extract_SPGR_Constants(const constant_set_t &constants,
                       const std::optional<std::string> &series_name = {});

// Throws kfit::domain_error unless the constants describe a physically meaningful acquisition.
void
Validate_SPGR_Constants(const spgr_constants_t &c);

// Converts a signal series into concentration (mM).
//
// The equilibrium signal is estimated from the mean of the first 'baseline' samples. The SPGR signal equation is
// inverted in closed form to recover R1 at each sample, and C = (R1 - R10)/r1.
//
// Throws kfit::domain_error if the baseline exceeds the series length, the baseline signal is non-positive, or a
// sample cannot be inverted.
std::vector<double>
Signal_To_Concentration(const std::vector<double> &signal,
                        const spgr_constants_t &c);

// Converts a concentration series (mM) into signal relative to the pre-contrast signal.
//
// A zero concentration maps to a relative signal of exactly 1.
std::vector<double>
Concentration_To_Signal(const std::vector<double> &concentration,
                        const spgr_constants_t &c);


// ------------------------------------------ Numerical helpers ------------------------------------------

// Convolves a piecewise-linear series with the normalized exponential kernel exp(-t/T)/T.
//
// Exact for piecewise-linear input. If T is zero the kernel is a delta function and the input is returned.
std::vector<double>
Exponential_Convolution(double T,
                        const std::vector<double> &time,
                        const std::vector<double> &series);

// Discrete convolution of two equal-length series sampled on the same uniform grid, scaled by the sampling
// interval so the result approximates the continuous convolution integral. Only the causal part (same length as the
// inputs) is returned.
//
// Throws std::invalid_argument if the lengths differ or the sampling is not uniform.
std::vector<double>
Discrete_Convolution(const std::vector<double> &time,
                     const std::vector<double> &a,
                     const std::vector<double> &b);

// Running trapezoid-rule integral. The first element is always zero.
std::vector<double>
Cumulative_Integral(const std::vector<double> &time,
                    const std::vector<double> &series);

// Linear interpolation of a sampled series. Returns 'outside' for t beyond the sampled domain.
double
Interpolate_Linearly(const std::vector<double> &time,
                     const std::vector<double> &series,
                     double t,
                     double outside = 0.0);

} // namespace kfit
