#pragma once
#include <stdexcept>
#include <string>

namespace peakquant {

/*  The least-squares solver stopped without reaching a solution
 *  (iteration limit, singular normal equations, non-finite model).
 *  Recoverable: the caller keeps its previous curve.                    */
class ConvergenceError : public std::runtime_error {
public:
    explicit ConvergenceError(const std::string& what)
        : std::runtime_error(what) {}
};

/*  estimate_fit() could not run on the given samples
 *  (too few points for the smoothing window, bad abscissa step, ...).   */
class EstimationError : public std::runtime_error {
public:
    explicit EstimationError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace peakquant
