#pragma once
#include "Types.hpp"
#include "CompositeCurve.hpp"
#include "SimpleLM.hpp"
#include <vector>

namespace peakquant {

/* ------------------------------------------------------------------------- */
/*  Refinement                                                               */
/* ------------------------------------------------------------------------- */
struct FitOptions {
    LMSolverOptions solver;

    /* keep every Gaussian width at its starting value */
    bool freeze_widths = false;
};

/*  Non-linear least squares of  initial.evaluate(x, p)  against y, started
 *  at initial.get_params().  Returns a refined copy; `initial` is never
 *  modified.
 *
 *  Throws ConvergenceError when the solver does not converge and
 *  std::invalid_argument when x and y differ in length.                  */
CompositeCurve optimize_fit(const Vector&         x,
                            const Vector&         y,
                            const CompositeCurve& initial,
                            const FitOptions&     options = {});

/* ------------------------------------------------------------------------- */
/*  Estimation from scratch                                                  */
/* ------------------------------------------------------------------------- */

/* fixed heuristics of estimate_fit() */
struct EstimateLimits {
    static constexpr int    kSmoothWindow    = 21;
    static constexpr int    kSmoothOrder     = 4;
    static constexpr double kMaxWidth        = 3.0;   // x units
    static constexpr double kMinHeightFrac   = 0.5;   // of max(y) - y[0]
};

/*  Smooth y, locate concave zero crossings of dy/dx and turn every one
 *  that passes the width and height screens into a Gaussian on top of a
 *  Constant baseline (= first smoothed sample).  No refinement is done.
 *
 *  x must be ascending with a uniform step.
 *  Throws EstimationError when the preconditions do not hold.            */
CompositeCurve estimate_fit(const Vector& x, const Vector& y);

/*  Three-point central difference with uniform step, applied `iterations`
 *  times.  The two end values replicate their interior neighbour so the
 *  result keeps the length of y (y needs at least 3 samples).            */
Vector numerical_derivative(const Vector& y,
                            double        step_size  = 1.0,
                            int           iterations = 1);

/*  Indices i where the sign of y changes between i and i+1.  A sample that
 *  is exactly zero closes a crossing but does not open a new one, so a
 *  derivative that touches zero at an apex yields one index.             */
std::vector<Index> find_zero_crossings(const Vector& y);

} // namespace peakquant
