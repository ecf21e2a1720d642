#pragma once
#include "Types.hpp"
#include "CompositeCurve.hpp"
#include <optional>
#include <string>

namespace peakquant {

// One loaded intensity profile and the fit that belongs to it
struct Dataset {
    std::string                   path;        // source file (may be empty)
    std::string                   name;        // file stem, used in exports
    Vector                        x;           // strictly ascending
    Vector                        y;           // same length as x
    std::optional<CompositeCurve> curve;       // active fit, none until activated

    /* seed Constant(1) if there is no curve yet; returns the active curve */
    CompositeCurve& ensure_curve();

    /* drop the fit; the next ensure_curve() reseeds it */
    void reset_curve() { curve.reset(); }

    double x_first() const { return x[0]; }
    double x_last()  const { return x[x.size() - 1]; }
};

/* x range / divisor: width of a peak added without an explicit width */
double default_gaussian_width(double x_min, double x_max, int division_factor = 20);

} // namespace peakquant
