//Least_Squares.cc - A part of Kinefit 2026.
//
// This file holds isolated drivers for bounded nonlinear least-squares minimization. The Levenberg-Marquardt driver
// is specific to least-squares and therefore cannot be used for norms other than L2. The NLopt driver minimizes the
// residual sum of squares directly and does not require derivatives.
//

#ifdef KFIT_USE_GNU_GSL
#else
    #error "Attempting to compile the least-squares drivers without GNU GSL, which is required."
#endif
#ifdef KFIT_USE_NLOPT
#else
    #error "Attempting to compile the least-squares drivers without NLopt, which is required."
#endif

#include <gsl/gsl_blas.h>
#include <gsl/gsl_cdf.h>
#include <gsl/gsl_errno.h>
#include <gsl/gsl_linalg.h>
#include <gsl/gsl_matrix_double.h>
#include <gsl/gsl_multifit_nlin.h>
#include <gsl/gsl_vector_double.h>

#include <nlopt.h>

#include <stddef.h>
#include <cmath>
#include <exception>
#include <stdexcept>
#include <limits>
#include <memory>
#include <string>
#include <vector>
#include <optional>
#include <algorithm>
#include <type_traits>

#include "YgorMisc.h"
#include "YgorLog.h"

#include "Least_Squares.h"

namespace {

// Disables the abort-on-error GSL handler for the lifetime of the object, restoring the previous handler afterward.
struct gsl_error_handler_guard {
    gsl_error_handler_t *previous;

    gsl_error_handler_guard() : previous(gsl_set_error_handler_off()) {}
    ~gsl_error_handler_guard(){
        gsl_set_error_handler(previous);
    }
    gsl_error_handler_guard(const gsl_error_handler_guard &) = delete;
    gsl_error_handler_guard& operator=(const gsl_error_handler_guard &) = delete;
};

// Residuals that cannot be evaluated are replaced with this value for the Levenberg-Marquardt driver, which cannot
// tolerate infinities in its linear algebra.
constexpr double large_residual = 1.0E100;

std::vector<size_t>
free_parameter_indices(const kfit::minimization_problem &problem){
    std::vector<size_t> out;
    for(size_t i = 0; i < problem.initial.size(); ++i){
        if(problem.lower.at(i) < problem.upper.at(i)) out.push_back(i);
    }
    return out;
}

void
validate_problem(const kfit::minimization_problem &problem){
    const auto N_params = problem.initial.size();
    if(!problem.residuals){
        throw std::invalid_argument("No residual function provided");
    }
    if( (problem.lower.size() != N_params) || (problem.upper.size() != N_params) ){
        throw std::invalid_argument("Bounds do not match the number of parameters");
    }
    for(size_t i = 0; i < N_params; ++i){
        if( std::isnan(problem.lower[i]) || std::isnan(problem.upper[i]) || (problem.upper[i] < problem.lower[i]) ){
            throw std::invalid_argument("Invalid bounds for parameter #" + std::to_string(i));
        }
    }
    if(problem.N_residuals < free_parameter_indices(problem).size()){
        throw std::invalid_argument("Fewer residuals than free parameters");
    }
    return;
}

// The initial estimate, clamped to the bounds.
std::vector<double>
clamped_initial(const kfit::minimization_problem &problem){
    std::vector<double> out(problem.initial);
    for(size_t i = 0; i < out.size(); ++i){
        if(!std::isfinite(out[i])){
            out[i] = (std::isfinite(problem.lower[i]) && std::isfinite(problem.upper[i]))
                   ? 0.5 * (problem.lower[i] + problem.upper[i])
                   : (std::isfinite(problem.lower[i]) ? problem.lower[i] : 0.0);
        }
        out[i] = std::clamp(out[i], problem.lower[i], problem.upper[i]);
    }
    return out;
}

// Evaluates the user residuals. Returns false if evaluation threw, in which case all residuals are NaN.
bool
evaluate_residuals(const kfit::minimization_problem &problem,
                   const std::vector<double> &params,
                   std::vector<double> &residuals){
    residuals.assign(problem.N_residuals, std::numeric_limits<double>::quiet_NaN());
    try{
        problem.residuals(params, residuals);
    }catch(const std::exception &e){
        YLOGDEBUG("Residual evaluation failed: " << e.what());
        residuals.assign(problem.N_residuals, std::numeric_limits<double>::quiet_NaN());
        return false;
    }
    if(residuals.size() != problem.N_residuals){
        YLOGWARN("Residual function produced " << residuals.size() << " residuals, expected " << problem.N_residuals);
        residuals.assign(problem.N_residuals, std::numeric_limits<double>::quiet_NaN());
        return false;
    }
    return true;
}

// ------------------------------------------ GSL Levenberg-Marquardt ------------------------------------------

// Maps an unbounded solver coordinate onto the box [lo, hi]. Unbounded dimensions are passed through.
double
to_bounded(double u, double lo, double hi){
    if(!std::isfinite(lo) || !std::isfinite(hi)) return u;
    return lo + (hi - lo) * (1.0 + std::sin(u)) * 0.5;
}

// Inverse of to_bounded. Points on the boundary are nudged inward where the mapping has a vanishing derivative.
double
to_unbounded(double p, double lo, double hi){
    if(!std::isfinite(lo) || !std::isfinite(hi)) return p;
    const double s = std::clamp(2.0 * (p - lo) / (hi - lo) - 1.0, -0.999, 0.999);
    return std::asin(s);
}

struct lm_state {
    const kfit::minimization_problem *problem = nullptr;
    std::vector<size_t> free;
    std::vector<double> full;       // Fixed parameters keep their values here.
    std::vector<double> residuals;

    void unpack(const gsl_vector *u){
        for(size_t k = 0; k < this->free.size(); ++k){
            const auto i = this->free[k];
            this->full[i] = to_bounded(gsl_vector_get(u, k), this->problem->lower[i], this->problem->upper[i]);
        }
        return;
    }
};

int
lm_residuals( const gsl_vector *u,     //Parameters being fitted (unbounded coordinates).
              void *voided_state,      //Other information (e.g., constant function parameters).
              gsl_vector *f ){         //Vector containing the residuals.
    auto state = reinterpret_cast<lm_state*>(voided_state);
    state->unpack(u);
    evaluate_residuals(*(state->problem), state->full, state->residuals);

    for(size_t i = 0; i < state->residuals.size(); ++i){
        const auto r = state->residuals[i];
        gsl_vector_set(f, i, std::isfinite(r) ? r : large_residual);
    }
    return GSL_SUCCESS;
}

struct lm_pass_result {
    std::vector<double> u;
    double RSS = std::numeric_limits<double>::infinity();
    int status = GSL_FAILURE;
    size_t iterations = 0;
    bool converged = false;
};

lm_pass_result
lm_pass(lm_state &state,
        const gsl_multifit_fdfsolver_type *solver_type,
        const std::vector<double> &u_init,
        size_t max_iters){
    const auto &opts = state.problem->options;
    const size_t dimen = state.free.size();
    const size_t datum = state.problem->N_residuals;

    std::vector<double> params(u_init); // A shuttle into gsl for the parameters.
    gsl_vector_view params_v = gsl_vector_view_array(params.data(), dimen);

    gsl_multifit_function_fdf multifit_f;
    multifit_f.f = &lm_residuals;
    multifit_f.df = nullptr; // Forward-difference Jacobian.
    multifit_f.fdf = nullptr;
    multifit_f.n = datum;
    multifit_f.p = dimen;
    multifit_f.params = reinterpret_cast<void*>(&state);

    std::unique_ptr<gsl_multifit_fdfsolver, decltype(&gsl_multifit_fdfsolver_free)>
        solver( gsl_multifit_fdfsolver_alloc(solver_type, datum, dimen), &gsl_multifit_fdfsolver_free );
    if(!solver){
        throw std::runtime_error("Unable to allocate Levenberg-Marquardt solver");
    }
    gsl_multifit_fdfsolver_set(solver.get(), &multifit_f, &params_v.vector);

    //Perform the optimization.
    int info = -1;
    lm_pass_result out;
    out.status = gsl_multifit_fdfsolver_driver(solver.get(), max_iters, opts.xtol, opts.gtol, opts.ftol, &info);
    out.iterations = gsl_multifit_fdfsolver_niter(solver.get());

    gsl_vector *res_f = gsl_multifit_fdfsolver_residual(solver.get());
    const double chi = gsl_blas_dnrm2(res_f);
    out.RSS = chi * chi;

    gsl_vector *x = gsl_multifit_fdfsolver_position(solver.get());
    out.u.resize(dimen);
    for(size_t k = 0; k < dimen; ++k) out.u[k] = gsl_vector_get(x, k);

    if(out.status == GSL_SUCCESS){
        out.converged = true;

    }else if(out.status == GSL_ENOPROG){
        // The trust region collapsed. This happens routinely at exact (zero-residual) optima, so accept the point
        // if it is stationary.
        std::unique_ptr<gsl_matrix, decltype(&gsl_matrix_free)> J( gsl_matrix_alloc(datum, dimen), &gsl_matrix_free );
        std::unique_ptr<gsl_vector, decltype(&gsl_vector_free)> g( gsl_vector_alloc(dimen), &gsl_vector_free );
        if( (gsl_multifit_fdfsolver_jac(solver.get(), J.get()) == GSL_SUCCESS)
        &&  (gsl_blas_dgemv(CblasTrans, 1.0, J.get(), res_f, 0.0, g.get()) == GSL_SUCCESS) ){
            double g_max = 0.0;
            for(size_t k = 0; k < dimen; ++k){
                g_max = std::max(g_max, std::abs(gsl_vector_get(g.get(), k)) * std::max(std::abs(out.u[k]), 1.0));
            }
            out.converged = std::isfinite(g_max)
                         && (g_max <= std::sqrt(opts.gtol) * std::max(0.5 * out.RSS, 1.0));
        }
    }
    YLOGDEBUG("Levenberg-Marquardt pass finished after " << out.iterations << " iterations with status '"
              << gsl_strerror(out.status) << "' and RSS = " << out.RSS);
    return out;
}

// ------------------------------------------------- NLopt -----------------------------------------------------

struct nlopt_state {
    const kfit::minimization_problem *problem = nullptr;
    std::vector<size_t> free;
    std::vector<double> full;
    std::vector<double> residuals;
    int64_t evaluations = 0;
};

// Only derivative-free algorithms are used, so the gradient is never requested.
double
nlopt_objective(unsigned, const double *params, double *, void *voided_state){
    auto state = reinterpret_cast<nlopt_state*>(voided_state);
    ++(state->evaluations);
    for(size_t k = 0; k < state->free.size(); ++k){
        state->full[state->free[k]] = params[k];
    }
    evaluate_residuals(*(state->problem), state->full, state->residuals);

    double sse = 0.0;
    for(const auto r : state->residuals) sse += r * r;
    return std::isfinite(sse) ? sse : HUGE_VAL;
}

bool
nlopt_converged(nlopt_result status){
    return (status == NLOPT_SUCCESS)
        || (status == NLOPT_STOPVAL_REACHED)
        || (status == NLOPT_FTOL_REACHED)
        || (status == NLOPT_XTOL_REACHED);
}

std::string
nlopt_description(nlopt_result status){
    if(false){
    }else if(status == NLOPT_FAILURE){          return "generic failure";
    }else if(status == NLOPT_INVALID_ARGS){     return "invalid arguments";
    }else if(status == NLOPT_OUT_OF_MEMORY){    return "out of memory";
    }else if(status == NLOPT_ROUNDOFF_LIMITED){ return "roundoff limited";
    }else if(status == NLOPT_FORCED_STOP){      return "forced termination";
    }else if(status == NLOPT_SUCCESS){          return "success";
    }else if(status == NLOPT_STOPVAL_REACHED){  return "stopval reached";
    }else if(status == NLOPT_FTOL_REACHED){     return "ftol reached";
    }else if(status == NLOPT_XTOL_REACHED){     return "xtol reached";
    }else if(status == NLOPT_MAXEVAL_REACHED){  return "maxeval count reached";
    }else if(status == NLOPT_MAXTIME_REACHED){  return "maxtime reached";
    }
    return "unrecognized status code";
}

struct nlopt_stage_result {
    std::vector<double> x;
    double RSS = std::numeric_limits<double>::infinity();
    nlopt_result status = NLOPT_FAILURE;
};

nlopt_stage_result
nlopt_stage(nlopt_state &state,
            nlopt_algorithm algorithm,
            const std::vector<double> &x_init,
            const std::vector<double> &l_bnds,
            const std::vector<double> &u_bnds,
            double stopval){
    const auto &opts = state.problem->options;
    const auto dimen = static_cast<unsigned>(state.free.size());

    std::unique_ptr<std::remove_pointer<nlopt_opt>::type, decltype(&nlopt_destroy)>
        opt( nlopt_create(algorithm, dimen), &nlopt_destroy );
    if(!opt){
        throw std::runtime_error("NLopt unable to create optimizer");
    }
    if(NLOPT_SUCCESS != nlopt_set_lower_bounds(opt.get(), l_bnds.data())){
        throw std::runtime_error("NLopt unable to set lower bounds");
    }
    if(NLOPT_SUCCESS != nlopt_set_upper_bounds(opt.get(), u_bnds.data())){
        throw std::runtime_error("NLopt unable to set upper bounds");
    }
    if(NLOPT_SUCCESS != nlopt_set_min_objective(opt.get(), nlopt_objective, reinterpret_cast<void*>(&state))){
        throw std::runtime_error("NLopt unable to set objective function for minimization");
    }
    if(NLOPT_SUCCESS != nlopt_set_xtol_rel(opt.get(), opts.nlopt_xtol_rel)){
        throw std::runtime_error("NLopt unable to set xtol stopping condition");
    }
    if(NLOPT_SUCCESS != nlopt_set_stopval(opt.get(), stopval)){
        throw std::runtime_error("NLopt unable to set stopval stopping condition");
    }
    if(NLOPT_SUCCESS != nlopt_set_maxeval(opt.get(), static_cast<int>(opts.max_evaluations))){ // Maximum # of objective func evaluations.
        throw std::runtime_error("NLopt unable to set maxeval stopping condition");
    }

    nlopt_stage_result out;
    out.x = x_init;
    double func_min = std::numeric_limits<double>::infinity();
    out.status = nlopt_optimize(opt.get(), out.x.data(), &func_min);
    out.RSS = func_min;

    if(out.status < 0){
        YLOGWARN("NLopt fail: " << nlopt_description(out.status));
    }else{
        YLOGDEBUG("NLopt: " << nlopt_description(out.status) << " with RSS = " << out.RSS);
    }
    return out;
}

} // namespace


double
kfit::Residual_Sum_of_Squares(const kfit::minimization_problem &problem, const std::vector<double> &params){
    std::vector<double> residuals;
    evaluate_residuals(problem, params, residuals);
    double sse = 0.0;
    for(const auto r : residuals) sse += r * r;
    return std::isfinite(sse) ? sse : std::numeric_limits<double>::infinity();
}

double
kfit::Student_t_Quantile(double level, int64_t dof){
    if( (dof <= 0) || !(0.0 < level) || !(level < 1.0) ){
        return std::numeric_limits<double>::quiet_NaN();
    }
    return gsl_cdf_tdist_Pinv(0.5 + 0.5 * level, static_cast<double>(dof));
}

std::optional<kfit::covariance_estimate>
kfit::Estimate_Covariance(const kfit::minimization_problem &problem,
                          const std::vector<double> &optimum,
                          double RSS,
                          std::string &why){
    gsl_error_handler_guard guard;
    std::optional<kfit::covariance_estimate> out;
    why.clear();

    const auto free = free_parameter_indices(problem);
    const size_t dimen = free.size();
    const size_t datum = problem.N_residuals;
    const size_t N_params = optimum.size();

    if(dimen == 0){
        why = "no free parameters";
        return out;
    }
    if(datum <= dimen){
        why = "too few samples (" + std::to_string(datum) + ") for " + std::to_string(dimen) + " free parameters";
        return out;
    }
    if(!std::isfinite(RSS)){
        why = "residual sum of squares is not finite";
        return out;
    }

    // Forward-difference Jacobian in parameter space.
    std::vector<double> r0;
    if(!evaluate_residuals(problem, optimum, r0)){
        why = "residuals could not be evaluated at the optimum";
        return out;
    }
    std::unique_ptr<gsl_matrix, decltype(&gsl_matrix_free)> J( gsl_matrix_alloc(datum, dimen), &gsl_matrix_free );
    std::vector<double> p(optimum);
    std::vector<double> r1;
    for(size_t k = 0; k < dimen; ++k){
        const auto i = free[k];
        const double lo = problem.lower[i];
        const double hi = problem.upper[i];
        const double scale = (std::isfinite(lo) && std::isfinite(hi)) ? std::max(std::abs(optimum[i]), 1.0E-3 * (hi - lo))
                                                                       : std::max(std::abs(optimum[i]), 1.0E-3);
        double h = std::sqrt(std::numeric_limits<double>::epsilon()) * scale;
        if(hi < optimum[i] + h) h = -h; // Step inward at the upper bound.

        p[i] = optimum[i] + h;
        const bool ok = evaluate_residuals(problem, p, r1);
        p[i] = optimum[i];
        if(!ok){
            why = "residuals could not be evaluated near the optimum";
            return out;
        }
        for(size_t n = 0; n < datum; ++n){
            const double d = (r1[n] - r0[n]) / h;
            if(!std::isfinite(d)){
                why = "Jacobian is not finite";
                return out;
            }
            gsl_matrix_set(J.get(), n, k, d);
        }
    }

    // Conditioning via the singular values.
    double rcond = 0.0;
    {
        std::unique_ptr<gsl_matrix, decltype(&gsl_matrix_free)> A( gsl_matrix_alloc(datum, dimen), &gsl_matrix_free );
        std::unique_ptr<gsl_matrix, decltype(&gsl_matrix_free)> V( gsl_matrix_alloc(dimen, dimen), &gsl_matrix_free );
        std::unique_ptr<gsl_vector, decltype(&gsl_vector_free)> S( gsl_vector_alloc(dimen), &gsl_vector_free );
        std::unique_ptr<gsl_vector, decltype(&gsl_vector_free)> work( gsl_vector_alloc(dimen), &gsl_vector_free );
        gsl_matrix_memcpy(A.get(), J.get());
        if(gsl_linalg_SV_decomp(A.get(), V.get(), S.get(), work.get()) != GSL_SUCCESS){
            why = "singular value decomposition of the Jacobian failed";
            return out;
        }
        const double s_max = gsl_vector_get(S.get(), 0);
        const double s_min = gsl_vector_get(S.get(), dimen - 1);
        rcond = (0.0 < s_max) ? (s_min / s_max) : 0.0;
    }
    if(!(problem.options.min_rcond <= rcond)){
        why = "Jacobian is ill-conditioned (rcond = " + std::to_string(rcond) + ")";
        return out;
    }

    std::unique_ptr<gsl_matrix, decltype(&gsl_matrix_free)> covar( gsl_matrix_alloc(dimen, dimen), &gsl_matrix_free );
    if(gsl_multifit_covar(J.get(), 0.0, covar.get()) != GSL_SUCCESS){
        why = "covariance matrix could not be computed";
        return out;
    }

    const auto dof = static_cast<int64_t>(datum - dimen);
    const double s2 = RSS / static_cast<double>(dof);

    kfit::covariance_estimate est;
    est.rcond = rcond;
    est.dof = dof;
    est.matrix.assign(N_params * N_params, 0.0);
    for(size_t a = 0; a < dimen; ++a){
        for(size_t b = 0; b < dimen; ++b){
            est.matrix[free[a] * N_params + free[b]] = s2 * gsl_matrix_get(covar.get(), a, b);
        }
        const double var = est.matrix[free[a] * N_params + free[a]];
        if(!std::isfinite(var) || (var < 0.0)){
            why = "variance of parameter #" + std::to_string(free[a]) + " is not finite and non-negative";
            return out;
        }
    }
    out = est;
    return out;
}

kfit::minimization_outcome
kfit::Minimize_via_GSL_LM(const kfit::minimization_problem &problem){
    //GSL-based fitter. This function performs a few passes to improve the likelihood of finding a solution.
    validate_problem(problem);
    gsl_error_handler_guard guard;

    kfit::minimization_outcome out;
    out.optimum = clamped_initial(problem);

    lm_state state;
    state.problem = &problem;
    state.free = free_parameter_indices(problem);
    state.full = out.optimum;

    const size_t dimen = state.free.size();
    if(dimen == 0){
        out.RSS = Residual_Sum_of_Squares(problem, out.optimum);
        out.converged = std::isfinite(out.RSS);
        out.message = "all parameters are fixed";
        out.covariance_message = "no free parameters";
        return out;
    }

    std::vector<double> u_init(dimen);
    for(size_t k = 0; k < dimen; ++k){
        const auto i = state.free[k];
        u_init[k] = to_unbounded(out.optimum[i], problem.lower[i], problem.upper[i]);
    }

    //First-pass fit.
    auto best = lm_pass(state, gsl_multifit_fdfsolver_lmder, u_init,
                        static_cast<size_t>(problem.options.first_pass_iterations));
    size_t iterations = best.iterations;

    //If the fit was extremely good already, do not bother with another pass.
    const double dof = static_cast<double>(std::max<size_t>(problem.N_residuals - dimen, 1));
    const bool skip_second_pass = best.converged && (best.RSS / dof < 1E-10);

    //Second-pass fit.
    if(!skip_second_pass){
        auto second = lm_pass(state, gsl_multifit_fdfsolver_lmsder, best.u,
                              static_cast<size_t>(problem.options.max_iterations));
        iterations += second.iterations;
        if( second.converged
        ||  (!best.converged && (second.RSS <= best.RSS)) ){
            best = second;
        }
    }

    for(size_t k = 0; k < dimen; ++k){
        const auto i = state.free[k];
        out.optimum[i] = to_bounded(best.u[k], problem.lower[i], problem.upper[i]);
    }
    out.RSS = Residual_Sum_of_Squares(problem, out.optimum);
    out.converged = best.converged && std::isfinite(out.RSS);
    out.iterations = static_cast<int64_t>(iterations);
    out.message = gsl_strerror(best.status);

    if(out.converged){
        out.covariance = Estimate_Covariance(problem, out.optimum, out.RSS, out.covariance_message);
    }else{
        out.covariance_message = "optimizer did not converge";
    }
    return out;
}

kfit::minimization_outcome
kfit::Minimize_via_NLopt(const kfit::minimization_problem &problem){
    validate_problem(problem);

    kfit::minimization_outcome out;
    out.optimum = clamped_initial(problem);

    nlopt_state state;
    state.problem = &problem;
    state.free = free_parameter_indices(problem);
    state.full = out.optimum;

    const size_t dimen = state.free.size();
    const double RSS_init = Residual_Sum_of_Squares(problem, out.optimum);
    if(dimen == 0){
        out.RSS = RSS_init;
        out.converged = std::isfinite(out.RSS);
        out.message = "all parameters are fixed";
        out.covariance_message = "no free parameters";
        return out;
    }

    std::vector<double> x(dimen), l_bnds(dimen), u_bnds(dimen);
    for(size_t k = 0; k < dimen; ++k){
        const auto i = state.free[k];
        x[k] = out.optimum[i];
        l_bnds[k] = problem.lower[i];
        u_bnds[k] = problem.upper[i];
    }

    // An objective this far below the starting point is an exact fit for all practical purposes.
    const double stopval = std::isfinite(RSS_init) ? RSS_init * 1.0E-24 : -HUGE_VAL;

    auto best = nlopt_stage(state, NLOPT_LN_BOBYQA, x, l_bnds, u_bnds, stopval);
    if(best.status != NLOPT_STOPVAL_REACHED){
        // Restart from the BOBYQA result with a different local method to escape spurious termination.
        const bool have_x = (0 <= best.status) || (best.status == NLOPT_ROUNDOFF_LIMITED);
        const auto &x_restart = have_x ? best.x : x;
        auto second = nlopt_stage(state, NLOPT_LN_SBPLX, x_restart, l_bnds, u_bnds, stopval);
        if( (0 <= second.status)
        &&  ( (second.RSS <= best.RSS) || (best.status < 0) ) ){
            best = second;
        }
    }

    const bool usable = (0 <= best.status)
                     || ( (best.status == NLOPT_ROUNDOFF_LIMITED) && std::isfinite(best.RSS) );
    if(usable){
        for(size_t k = 0; k < dimen; ++k){
            out.optimum[state.free[k]] = best.x[k];
        }
    }
    out.RSS = Residual_Sum_of_Squares(problem, out.optimum);
    out.converged = ( nlopt_converged(best.status)
                   || ( (best.status == NLOPT_ROUNDOFF_LIMITED) && (out.RSS <= RSS_init * 1.0E-20) ) )
                 && std::isfinite(out.RSS);
    out.iterations = state.evaluations;
    out.message = nlopt_description(best.status);

    if(out.converged){
        out.covariance = Estimate_Covariance(problem, out.optimum, out.RSS, out.covariance_message);
    }else{
        out.covariance_message = "optimizer did not converge";
    }
    return out;
}
