//Least_Squares.h - A part of Kinefit 2026.
//
// Library-agnostic interface to bounded nonlinear least-squares minimizers.

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <limits>
#include <cstdint>

namespace kfit {

struct minimizer_options_t {
    int64_t first_pass_iterations = 500;      // Levenberg-Marquardt first pass.
    int64_t max_iterations        = 50'000;   // Levenberg-Marquardt second pass.
    int64_t max_evaluations       = 200'000;  // Objective evaluation cap for derivative-free methods (per stage).

    double xtol = 1.0E-8;    // Relative parameter step tolerance.
    double gtol = 1.0E-8;    // Scaled gradient tolerance.
    double ftol = 0.0;       // Relative residual reduction tolerance (disabled by default).

    double nlopt_xtol_rel = 1.0E-10;

    // Reciprocal condition number of the Jacobian below which the covariance is deemed unreliable.
    double min_rcond = 1.0E-10;
};

// Shuttle struct describing a minimization.
//
// The residual callback receives the full parameter vector and fills one residual per observation. Parameters whose
// lower and upper bounds coincide are held fixed.
struct minimization_problem {
    std::function<void(const std::vector<double> &params, std::vector<double> &residuals)> residuals;
    size_t N_residuals = 0;

    std::vector<double> initial;
    std::vector<double> lower;
    std::vector<double> upper;

    minimizer_options_t options;
};

struct covariance_estimate {
    std::vector<double> matrix;  // Row-major, full parameter dimension. Fixed parameters have zero rows/columns.
    double rcond = std::numeric_limits<double>::quiet_NaN();
    int64_t dof = 0;             // Degrees of freedom, N_residuals - N_free.
};

struct minimization_outcome {
    std::vector<double> optimum;   // Last iterate if not converged.
    double RSS = std::numeric_limits<double>::quiet_NaN();
    bool converged = false;
    int64_t iterations = 0;        // Solver iterations or objective evaluations, depending on the method.
    std::string message;           // Solver termination description.

    std::optional<covariance_estimate> covariance;
    std::string covariance_message; // Reason the covariance is absent, if it is.
};

using minimizer_t = std::function<minimization_outcome(const minimization_problem &)>;

// Levenberg-Marquardt via GNU GSL, with bounds enforced by a smooth sine reparametrisation.
minimization_outcome
Minimize_via_GSL_LM(const minimization_problem &problem);

// BOBYQA via NLopt on the residual sum of squares, followed by a Subplex restart.
minimization_outcome
Minimize_via_NLopt(const minimization_problem &problem);

// Sum of squared residuals at the given parameters. Non-finite residuals yield infinity.
double
Residual_Sum_of_Squares(const minimization_problem &problem, const std::vector<double> &params);

// Covariance of the free parameters at an optimum, (J^T J)^{-1} RSS/(N - p), using a forward-difference Jacobian.
//
// Disengaged (with the reason in 'why') when N <= p, the Jacobian is ill-conditioned, or a variance is not finite
// and non-negative.
std::optional<covariance_estimate>
Estimate_Covariance(const minimization_problem &problem,
                    const std::vector<double> &optimum,
                    double RSS,
                    std::string &why);

// Two-sided Student-t quantile, e.g., level = 0.95 gives t(0.975, dof).
double
Student_t_Quantile(double level, int64_t dof);

} // namespace kfit
