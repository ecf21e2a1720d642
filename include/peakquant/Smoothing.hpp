#pragma once
#include "Types.hpp"

namespace peakquant {

/*  Savitzky–Golay weights that return the smoothed value at the window
 *  centre:  y_s[i] = Σ_j c_j · y[i - half + j].
 *  window_length must be odd and larger than polyorder.                 */
Vector savgol_coefficients(int window_length, int polyorder);

/*  Savitzky–Golay smoothing.  The first and last window_length/2 samples
 *  are taken from a polynomial of order polyorder fitted to the first /
 *  last window_length samples, so the output has the length of y.
 *
 *  Throws std::invalid_argument when y is shorter than the window.      */
Vector savgol_filter(const Vector& y, int window_length, int polyorder);

} // namespace peakquant
