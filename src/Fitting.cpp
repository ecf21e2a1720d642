#include "peakquant/Fitting.hpp"
#include "peakquant/CurveCost.hpp"
#include "peakquant/Errors.hpp"
#include "peakquant/Smoothing.hpp"
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>

namespace peakquant {

/* ===================================================================== */
/*                        o p t i m i z e _ f i t                        */
/* ===================================================================== */
CompositeCurve optimize_fit(const Vector&         x,
                            const Vector&         y,
                            const CompositeCurve& initial,
                            const FitOptions&     options)
{
    if (x.size() != y.size())
        throw std::invalid_argument(
            "optimize_fit: x has " + std::to_string(x.size()) +
            " samples but y has " + std::to_string(y.size()));

    CurveCost cost(initial, x, y);
    Eigen::VectorXd params = initial.get_params();

    /* ---- free mask: everything, or everything but the widths ----- */
    std::vector<bool> free_mask;
    if (options.freeze_widths) {
        const auto& layout = initial.layout();
        free_mask.assign(static_cast<std::size_t>(initial.param_count()), true);
        for (std::size_t c = 0; c < initial.size(); ++c)
            if (initial.at(c).as_gaussian())
                free_mask[layout.get(static_cast<int>(c), 2)] = false;
    }

    const LMSolverSummary summary =
        levenberg_marquardt(cost, params, free_mask, options.solver);

    if (!summary.converged)
        throw ConvergenceError("optimal parameters not found: " + summary.message);

    CompositeCurve fitted = initial.clone();
    fitted.set_params(params);
    return fitted;
}

/* ===================================================================== */
/*                    d e r i v a t i v e   h e l p e r s                */
/* ===================================================================== */
Vector numerical_derivative(const Vector& y, double step_size, int iterations)
{
    const Index n = y.size();
    if (n < 3)
        throw std::invalid_argument("numerical_derivative: need at least 3 samples");

    Vector d = y;
    for (int it = 0; it < iterations; ++it) {
        Vector next(n);
        next.segment(1, n - 2) =
            (d.tail(n - 2) - d.head(n - 2)) / (2.0 * step_size);
        next[0]     = next[1];
        next[n - 1] = next[n - 2];
        d.swap(next);
    }
    return d;
}

std::vector<Index> find_zero_crossings(const Vector& y)
{
    std::vector<Index> out;
    for (Index i = 0; i + 1 < y.size(); ++i) {
        const double a = y[i];
        const double b = y[i + 1];
        if ((a > 0.0 && b <= 0.0) || (a < 0.0 && b >= 0.0))
            out.push_back(i);
    }
    return out;
}

/* ===================================================================== */
/*                        e s t i m a t e _ f i t                        */
/* ===================================================================== */
CompositeCurve estimate_fit(const Vector& x, const Vector& y_raw)
{
    using L = EstimateLimits;

    /* ---------- preconditions ------------------------------------- */
    if (x.size() != y_raw.size())
        throw EstimationError("estimate_fit: x and y differ in length");
    if (y_raw.size() < L::kSmoothWindow)
        throw EstimationError(
            "estimate_fit: " + std::to_string(y_raw.size()) +
            " samples, at least " + std::to_string(L::kSmoothWindow) + " required");

    const double h = x[1] - x[0];
    if (!(h > 0.0) || !std::isfinite(h))
        throw EstimationError("estimate_fit: x must be ascending with a uniform step");

    /* ---------- smoothing and derivatives ------------------------- */
    const Vector y   = savgol_filter(y_raw, L::kSmoothWindow, L::kSmoothOrder);
    const Vector dy  = numerical_derivative(y,  h);
    const Vector ddy = numerical_derivative(dy, h);

    /* ---------- baseline = first smoothed sample ------------------ */
    CompositeCurve estimated;
    const double y0 = y[0];
    estimated.add(Constant(y0));

    const double min_height = L::kMinHeightFrac * (y.maxCoeff() - y0);

    /* ---------- screen the zero crossings of dy ------------------- */
    for (Index i : find_zero_crossings(dy)) {
        if (!(ddy[i] < 0.0)) continue;             // not a maximum

        const double w_est       = std::sqrt(-y[i] / ddy[i]);
        const double peak_height = y[i] - y0;

        if (!(w_est < L::kMaxWidth))      continue; // NaN fails as well
        if (!(peak_height > min_height))  continue;

        estimated.add(Gaussian(x[i], peak_height, w_est));
    }

    std::cout << "[Fitting] estimate: baseline " << y0 << ", "
              << estimated.peak_count() << " peak(s)" << std::endl;
    return estimated;
}

} // namespace peakquant
