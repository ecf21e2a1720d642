#include "peakquant/Dataset.hpp"

namespace peakquant {

CompositeCurve& Dataset::ensure_curve()
{
    if (!curve) curve = CompositeCurve::with_baseline(1.0);
    return *curve;
}

double default_gaussian_width(double x_min, double x_max, int division_factor)
{
    return (x_max - x_min) / division_factor;
}

} // namespace peakquant
