#pragma once
#include "Types.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

namespace peakquant {

/* ------------------------------------------------------------------------- */
/*  Solver settings.  Zero (or negative) selects the automatic value.        */
/* ------------------------------------------------------------------------- */
struct LMSolverOptions {
    int    max_iterations = 0;           // 200 · (free parameters + 1)
    double ftol           = 1.49012e-8;  // relative decrease of the cost
    double xtol           = 1.49012e-8;  // relative size of the step
    double gtol           = 0;           // 1e-12 · initial max |Jᵀr|
    double initial_lambda = 0;           // 1e-3 · max diag(JᵀJ)
    bool   verbose        = false;
};

struct LMSolverSummary {
    int         iterations   = 0;
    double      initial_chi2 = 0.0;
    double      final_chi2   = 0.0;
    bool        converged    = false;
    std::string message;
};

/*  position of every free parameter in the reduced problem, -1 if fixed;
 *  an empty mask frees everything                                         */
inline Eigen::VectorXi build_free_index(const std::vector<bool>& mask, int n, int& n_free)
{
    Eigen::VectorXi slot(n);
    n_free = 0;
    for (int j = 0; j < n; ++j)
        slot[j] = (mask.empty() || mask[j]) ? n_free++ : -1;
    return slot;
}

namespace lm_detail {

/* columns of J that belong to free parameters */
inline void gather_free_columns(const Matrix& J, const Eigen::VectorXi& slot, Matrix& J_free)
{
    for (Index j = 0; j < slot.size(); ++j)
        if (slot[j] >= 0) J_free.col(slot[j]) = J.col(j);
}

/* reduced step → full-length step, zeros for fixed parameters */
inline Vector scatter_step(const Vector& step_free, const Eigen::VectorXi& slot)
{
    Vector step = Vector::Zero(slot.size());
    for (Index j = 0; j < slot.size(); ++j)
        if (slot[j] >= 0) step[j] = step_free[slot[j]];
    return step;
}

/* λ-damped normal matrix  JᵀJ + λ·diag(JᵀJ), Fletcher's scaling */
inline Matrix damped_normal_matrix(const Matrix& J_free, double lambda, Vector& diag)
{
    const Index k = J_free.cols();
    Matrix N = Matrix::Zero(k, k);
    N.selfadjointView<Eigen::Lower>().rankUpdate(J_free.adjoint());
    N.triangularView<Eigen::StrictlyUpper>() = N.transpose();
    diag = N.diagonal();
    N.diagonal().array() += lambda * (diag.array() + 1e-20);
    return N;
}

} // namespace lm_detail

/* ------------------------------------------------------------------------- */
/*  Levenberg–Marquardt                                                      */
/*                                                                           */
/*  func(p, &r, &J) fills the residuals r and, when J is not null, the full  */
/*  Jacobian dr/dp.  Parameters with a false free_mask entry keep their      */
/*  value.  On return p holds the best point visited.                        */
/*                                                                           */
/*  Nothing is thrown for a failed fit; the summary says why it stopped and  */
/*  the caller decides what that means.                                      */
/* ------------------------------------------------------------------------- */
template<typename Functor>
LMSolverSummary
levenberg_marquardt(Functor&&                func,
                    Vector&                  p,
                    const std::vector<bool>& free_mask,
                    const LMSolverOptions&   options = {})
{
    using namespace lm_detail;

    LMSolverSummary summary;
    LMSolverOptions opt = options;
    const int n = static_cast<int>(p.size());

    int n_free = 0;
    const Eigen::VectorXi slot = build_free_index(free_mask, n, n_free);

    Vector r;
    Matrix J;
    func(p, &r, &J);
    double cost = r.squaredNorm();
    summary.initial_chi2 = summary.final_chi2 = cost;

    /* ---- trivial exits ------------------------------------------- */
    if (!std::isfinite(cost)) {
        summary.message = "model is not finite at the starting point";
        return summary;
    }
    if (n_free == 0) {
        std::cout << "[LM]  every parameter is fixed, nothing to fit" << std::endl;
        summary.converged = true;
        summary.message   = "no free parameters";
        return summary;
    }
    if (r.size() < n_free) {
        summary.message = "fewer residuals than free parameters";
        return summary;
    }
    if (cost == 0.0) {
        summary.converged = true;
        summary.message   = "residuals vanish at the starting point";
        return summary;
    }

    Matrix J_free(r.size(), n_free);
    gather_free_columns(J, slot, J_free);

    /* ---- automatic settings -------------------------------------- */
    Vector grad = J_free.transpose() * r;
    if (opt.max_iterations <= 0) opt.max_iterations = 200 * (n_free + 1);
    if (opt.gtol <= 0.0) {
        const double g0 = grad.cwiseAbs().maxCoeff();
        opt.gtol = g0 > 0.0 ? 1e-12 * g0 : std::numeric_limits<double>::epsilon();
    }
    double lambda = opt.initial_lambda;
    if (lambda <= 0.0) {
        lambda = 1e-3 * J_free.colwise().squaredNorm().maxCoeff();
        if (!(lambda > 0.0)) lambda = 1e-3;
    }

    if (opt.verbose)
        std::cout << "[LM]  " << n_free << '/' << n << " free parameters, "
                  << r.size() << " residuals, start chi2 = " << cost << std::endl;

    /* ---- iterate ------------------------------------------------- */
    Vector diag;
    for (int it = 1; it <= opt.max_iterations; ++it) {
        summary.iterations = it;

        grad.noalias() = J_free.transpose() * r;
        if (grad.cwiseAbs().maxCoeff() <= opt.gtol) {
            summary.converged = true;
            summary.message   = "gradient below gtol";
            break;
        }

        const Matrix N         = damped_normal_matrix(J_free, lambda, diag);
        const Vector step_free = -N.ldlt().solve(grad);
        if (!step_free.allFinite()) {
            std::cerr << "[LM]  non-finite step, giving up" << std::endl;
            summary.message = "singular normal equations (non-finite step)";
            break;
        }

        const Vector step  = scatter_step(step_free, slot);
        const bool   small = step.norm() <= opt.xtol * (p.norm() + opt.xtol);

        Vector p_try = p + step;
        Vector r_try;
        Matrix J_try;
        func(p_try, &r_try, &J_try);
        const double cost_try = r_try.squaredNorm();

        /* gain ratio: actual over predicted decrease */
        double predicted = 0.5 * step_free.dot(lambda * diag.cwiseProduct(step_free) - grad);
        if (predicted <= 0.0) predicted = std::numeric_limits<double>::epsilon();
        const double rho = (cost - cost_try) / predicted;

        if (std::isfinite(cost_try) && rho > 0.0 && cost_try < cost) {
            const double decrease = (cost - cost_try) / cost;

            p.swap(p_try);
            r.swap(r_try);
            J.swap(J_try);
            cost = cost_try;
            gather_free_columns(J, slot, J_free);

            lambda *= std::max(1.0 / 3.0, 1.0 - std::pow(2.0 * rho - 1.0, 3.0));
            lambda  = std::max(lambda, 1e-18);

            if (opt.verbose)
                std::cout << "[LM]  " << std::setw(4) << it
                          << "  chi2 = " << std::setprecision(8) << cost
                          << "  rho = "  << std::setprecision(3) << rho
                          << "  lambda = " << lambda << '\n';

            if (cost == 0.0)
                summary.message = "residuals vanish";
            else if (decrease <= opt.ftol)
                summary.message = "cost decrease below ftol";
            else if (small)
                summary.message = "step below xtol";

            if (!summary.message.empty()) {
                summary.converged = true;
                break;
            }
        } else {
            lambda *= 2.0;
            if (opt.verbose)
                std::cout << "[LM]  " << std::setw(4) << it
                          << "  step rejected, lambda = " << std::setprecision(3) << lambda << '\n';

            /* even the undamped neighbourhood is flat: minimum reached */
            if (small) {
                summary.converged = true;
                summary.message   = "step below xtol";
                break;
            }
        }
    }

    if (!summary.converged && summary.message.empty())
        summary.message = "iteration limit (" + std::to_string(opt.max_iterations) + ") reached";

    summary.final_chi2 = cost;
    if (opt.verbose)
        std::cout << "[LM]  stopped after " << summary.iterations << " iterations: "
                  << summary.message << std::endl;
    return summary;
}

} // namespace peakquant
