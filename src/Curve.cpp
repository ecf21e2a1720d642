#include "peakquant/Curve.hpp"
#include <boost/math/constants/constants.hpp>
#include <array>
#include <cmath>
#include <type_traits>

namespace peakquant {

/* ===================================================================== */
/*                             C o n s t a n t                           */
/* ===================================================================== */
void Constant::set_params(std::optional<double> y)
{
    if (y) y_ = *y;
}

double Constant::evaluate(double /*x*/, const double* p)
{
    return p[0];
}

Vector Constant::evaluate(const Vector& x, const double* p)
{
    return Vector::Constant(x.size(), p[0]);
}

void Constant::gradient(const Vector& /*x*/, const double* /*p*/,
                        Eigen::Ref<Matrix> J)
{
    J.col(0).setOnes();
}

/* ===================================================================== */
/*                             G a u s s i a n                           */
/* ===================================================================== */
Gaussian::Gaussian(double xc, double amplitude, double width)
    : xc_(std::abs(xc)), amp_(std::abs(amplitude)), w_(std::abs(width))
{}

void Gaussian::set_params(std::optional<double> xc,
                          std::optional<double> amplitude,
                          std::optional<double> width)
{
    if (xc)        xc_  = std::abs(*xc);
    if (amplitude) amp_ = std::abs(*amplitude);
    if (width)     w_   = std::abs(*width);
}

void Gaussian::assign(const double* p)
{
    set_params(p[0], p[1], p[2]);
}

double Gaussian::area() const
{
    return 2.0 * amp_ * w_ * boost::math::constants::root_half_pi<double>();
}

double Gaussian::evaluate(double x, const double* p)
{
    const double u = (x - p[0]) / p[2];
    return p[1] * std::exp(-0.5 * u * u);
}

Vector Gaussian::evaluate(const Vector& x, const double* p)
{
    return (p[1] * (-0.5 * ((x.array() - p[0]) / p[2]).square()).exp()).matrix();
}

void Gaussian::gradient(const Vector& x, const double* p, Eigen::Ref<Matrix> J)
{
    const double xc = p[0];
    const double A  = p[1];
    const double w  = p[2];

    const Eigen::ArrayXd u = (x.array() - xc) / w;
    const Eigen::ArrayXd e = (-0.5 * u.square()).exp();

    J.col(0) = (A * e * u / w).matrix();              // ∂/∂xc
    J.col(1) = e.matrix();                            // ∂/∂A
    J.col(2) = (A * e * u.square() / w).matrix();     // ∂/∂w
}

/* ===================================================================== */
/*                       C u r v e   (dispatcher)                        */
/* ===================================================================== */
namespace {

/* copy a variant's own parameters into a fixed-size scratch tuple       */
template<typename C>
std::array<double, kMaxCurveParams> own_params(const C& c)
{
    std::array<double, kMaxCurveParams> p{};
    c.get_params(p.data());
    return p;
}

} // unnamed namespace

int Curve::param_count() const
{
    return std::visit([](const auto& c) { return std::decay_t<decltype(c)>::kParamCount; }, v_);
}

std::vector<double> Curve::get_params() const
{
    return std::visit([](const auto& c) {
        const auto p = own_params(c);
        return std::vector<double>(p.begin(),
                                   p.begin() + std::decay_t<decltype(c)>::kParamCount);
    }, v_);
}

void Curve::set_params(const double* p)
{
    std::visit([p](auto& c) { c.assign(p); }, v_);
}

double Curve::evaluate(double x) const
{
    return std::visit([x](const auto& c) {
        const auto p = own_params(c);
        return c.evaluate(x, p.data());
    }, v_);
}

double Curve::evaluate(double x, const double* p) const
{
    return std::visit([x, p](const auto& c) { return c.evaluate(x, p); }, v_);
}

Vector Curve::evaluate(const Vector& x) const
{
    return std::visit([&x](const auto& c) {
        const auto p = own_params(c);
        return c.evaluate(x, p.data());
    }, v_);
}

Vector Curve::evaluate(const Vector& x, const double* p) const
{
    return std::visit([&x, p](const auto& c) { return c.evaluate(x, p); }, v_);
}

void Curve::gradient(const Vector& x, const double* p, Eigen::Ref<Matrix> J) const
{
    std::visit([&x, p, &J](const auto& c) { c.gradient(x, p, J); }, v_);
}

double Curve::area() const
{
    return std::visit([](const auto& c) { return c.area(); }, v_);
}

double Curve::center() const
{
    return std::visit([](const auto& c) { return c.center(); }, v_);
}

Point Curve::handle(double baseline_x) const
{
    if (const auto* g = as_gaussian())
        return {g->center(), g->amplitude()};
    return {baseline_x, as_constant()->y()};
}

} // namespace peakquant
