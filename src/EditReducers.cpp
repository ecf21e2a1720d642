#include "peakquant/EditReducers.hpp"
#include <cmath>
#include <limits>

namespace peakquant {

std::optional<std::size_t> nearest_handle(const CompositeCurve& curve,
                                          const Point&          cursor,
                                          double                baseline_x,
                                          const HandleMetric&   metric)
{
    std::optional<std::size_t> best;
    double best_d = std::numeric_limits<double>::infinity();

    for (std::size_t i = 0; i < curve.size(); ++i) {
        const Point  h  = curve.at(i).handle(baseline_x);
        const double dx = (h.x - cursor.x) / metric.x_per_px;
        const double dy = (h.y - cursor.y) / metric.y_per_px;
        const double d  = std::hypot(dx, dy);
        if (d < best_d) {
            best_d = d;
            best   = i;
        }
    }
    if (best && best_d > metric.tolerance_px) return std::nullopt;
    return best;
}

void drag(CompositeCurve& curve, std::size_t index, const Point& cursor)
{
    Curve& c = curve.at(index);
    if (auto* g = c.as_gaussian())
        g->set_params(cursor.x, cursor.y);
    else
        c.as_constant()->set_params(cursor.y);
}

void shift_drag(CompositeCurve& curve,
                std::size_t     index,
                EditState&      state,
                const Point&    cursor,
                const Point&    click_origin)
{
    Curve& c = curve.at(index);
    auto*  g = c.as_gaussian();
    if (!g) {
        c.as_constant()->set_params(cursor.y);
        return;
    }

    g->set_params(std::nullopt, cursor.y, click_origin.x - cursor.x);
    if (state.widths_locked()) {
        state.locked_width = g->width();
        apply_width_to_all(curve, *state.locked_width);
    }
}

std::optional<double> toggle_locked_widths(CompositeCurve& curve, EditState& state)
{
    if (curve.peak_count() == 0) return state.locked_width;

    if (state.widths_locked()) {
        state.locked_width.reset();
        return state.locked_width;
    }

    for (const auto& c : curve.curves()) {
        if (const auto* g = c.as_gaussian()) {
            state.locked_width = g->width();
            break;
        }
    }
    apply_width_to_all(curve, *state.locked_width);
    return state.locked_width;
}

void apply_width_to_all(CompositeCurve& curve, double width)
{
    for (std::size_t i = 0; i < curve.size(); ++i)
        if (auto* g = curve.at(i).as_gaussian())
            g->set_params(std::nullopt, std::nullopt, width);
}

std::size_t add_peak(CompositeCurve& curve, double xc, double amplitude, double width)
{
    curve.add(Gaussian(xc, amplitude, width));
    return curve.size() - 1;
}

void delete_peak(CompositeCurve& curve, std::size_t index)
{
    curve.remove(index);
}

} // namespace peakquant
