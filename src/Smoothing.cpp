#include "peakquant/Smoothing.hpp"
#include <Eigen/Dense>
#include <stdexcept>
#include <string>

namespace peakquant {

/* -------------------------------------------------------------- *
 *  Vandermonde matrix  A(i,j) = t_iʲ  for  t_i = i - half         *
 * -------------------------------------------------------------- */
static Matrix vandermonde(int window_length, int polyorder)
{
    const int half = window_length / 2;
    Matrix A(window_length, polyorder + 1);
    for (int i = 0; i < window_length; ++i) {
        const double t = static_cast<double>(i - half);
        double tp = 1.0;
        for (int j = 0; j <= polyorder; ++j) {
            A(i, j) = tp;
            tp *= t;
        }
    }
    return A;
}

static void check_window(int window_length, int polyorder)
{
    if (window_length < 1 || window_length % 2 == 0)
        throw std::invalid_argument("savgol: window_length must be a positive odd number");
    if (polyorder < 0 || polyorder >= window_length)
        throw std::invalid_argument("savgol: polyorder must be in [0, window_length)");
}

Vector savgol_coefficients(int window_length, int polyorder)
{
    check_window(window_length, polyorder);

    /* least-squares projector  (AᵀA)⁻¹Aᵀ ; row 0 = value at t = 0  */
    const Matrix A    = vandermonde(window_length, polyorder);
    const Matrix proj = A.colPivHouseholderQr()
                         .solve(Matrix::Identity(window_length, window_length));
    return proj.row(0).transpose();
}

Vector savgol_filter(const Vector& y, int window_length, int polyorder)
{
    check_window(window_length, polyorder);

    const Index n = y.size();
    if (n < window_length)
        throw std::invalid_argument(
            "savgol_filter: " + std::to_string(n) + " samples is fewer than the "
            "window length " + std::to_string(window_length));

    const int    half = window_length / 2;
    const Vector c    = savgol_coefficients(window_length, polyorder);
    Vector       out(n);

    /* ---------- interior: plain correlation with the weights ------- */
    for (Index i = half; i < n - half; ++i)
        out[i] = c.dot(y.segment(i - half, window_length));

    /* ---------- edges: evaluate the polynomial fitted to the ------- */
    /*            first / last full window                            */
    const Matrix A = vandermonde(window_length, polyorder);
    const auto   qr = A.colPivHouseholderQr();

    auto poly_at = [polyorder](const Vector& coef, double t) {
        double v = 0.0;
        for (int j = polyorder; j >= 0; --j) v = v * t + coef[j];
        return v;
    };

    const Vector head = qr.solve(Vector(y.head(window_length)));
    const Vector tail = qr.solve(Vector(y.tail(window_length)));

    for (int i = 0; i < half; ++i) {
        out[i] = poly_at(head, static_cast<double>(i - half));
        out[n - half + i] = poly_at(tail, static_cast<double>(i + 1));
    }
    return out;
}

} // namespace peakquant
