#include "peakquant/CompositeCurve.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace peakquant {

CompositeCurve CompositeCurve::with_baseline(double y0)
{
    CompositeCurve cc;
    cc.add(Constant(y0));
    return cc;
}

/* --------------------------------------------------------------------- */
/*  membership                                                           */
/* --------------------------------------------------------------------- */
void CompositeCurve::add(Curve c)
{
    curves_.push_back(std::move(c));
    rebuild_layout_();
}

void CompositeCurve::remove(std::size_t index)
{
    if (index >= curves_.size())
        throw std::out_of_range("CompositeCurve::remove(): index " +
                                std::to_string(index) + " out of range");
    curves_.erase(curves_.begin() + static_cast<std::ptrdiff_t>(index));
    rebuild_layout_();
}

void CompositeCurve::clear()
{
    curves_.clear();
    rebuild_layout_();
}

std::size_t CompositeCurve::baseline_index() const
{
    for (std::size_t i = 0; i < curves_.size(); ++i)
        if (curves_[i].is_baseline()) return i;
    return curves_.size();
}

std::size_t CompositeCurve::peak_count() const
{
    return static_cast<std::size_t>(
        std::count_if(curves_.begin(), curves_.end(),
                      [](const Curve& c) { return !c.is_baseline(); }));
}

void CompositeCurve::rebuild_layout_()
{
    layout_.build(curves_);
}

void CompositeCurve::check_length_(const Vector& p) const
{
    if (p.size() != layout_.total_params)
        throw std::invalid_argument(
            "CompositeCurve: parameter vector has " + std::to_string(p.size()) +
            " entries, expected " + std::to_string(layout_.total_params));
}

/* --------------------------------------------------------------------- */
/*  flat parameter vector                                                */
/* --------------------------------------------------------------------- */
Vector CompositeCurve::get_params() const
{
    Vector p(layout_.total_params);
    for (std::size_t c = 0; c < curves_.size(); ++c) {
        const auto own = curves_[c].get_params();
        const int  off = layout_.offset[c];
        for (std::size_t k = 0; k < own.size(); ++k)
            p[off + static_cast<int>(k)] = own[k];
    }
    return p;
}

void CompositeCurve::set_params(const Vector& p)
{
    check_length_(p);
    for (std::size_t c = 0; c < curves_.size(); ++c)
        curves_[c].set_params(p.data() + layout_.offset[c]);
}

/* --------------------------------------------------------------------- */
/*  evaluation                                                           */
/* --------------------------------------------------------------------- */
double CompositeCurve::evaluate(double x) const
{
    double y = 0.0;
    for (const auto& c : curves_) y += c.evaluate(x);
    return y;
}

Vector CompositeCurve::evaluate(const Vector& x) const
{
    Vector y = Vector::Zero(x.size());
    for (const auto& c : curves_) y += c.evaluate(x);
    return y;
}

Vector CompositeCurve::evaluate(const Vector& x, const Vector& p) const
{
    check_length_(p);
    Vector y = Vector::Zero(x.size());
    for (std::size_t c = 0; c < curves_.size(); ++c)
        y += curves_[c].evaluate(x, p.data() + layout_.offset[c]);
    return y;
}

Matrix CompositeCurve::jacobian(const Vector& x, const Vector& p) const
{
    check_length_(p);
    Matrix J(x.size(), layout_.total_params);
    for (std::size_t c = 0; c < curves_.size(); ++c) {
        const int off = layout_.offset[c];
        curves_[c].gradient(x, p.data() + off,
                            J.middleCols(off, layout_.count[c]));
    }
    return J;
}

/* --------------------------------------------------------------------- */
void CompositeCurve::sort()
{
    std::stable_sort(curves_.begin(), curves_.end(),
                     [](const Curve& a, const Curve& b) {
                         return a.center() < b.center();
                     });
    rebuild_layout_();
}

double CompositeCurve::area() const
{
    double a = 0.0;
    for (const auto& c : curves_) a += c.area();
    return a;
}

} // namespace peakquant
