#pragma once
#include "Types.hpp"
#include "CompositeCurve.hpp"
#include <cstddef>
#include <optional>

namespace peakquant {

/* ------------------------------------------------------------------------- */
/*  Per-session interaction state handed to every reducer.                   */
/* ------------------------------------------------------------------------- */
struct EditState {
    std::optional<std::size_t> selected;      // index into the active curve
    std::optional<Point>       click_origin;  // where the current drag began
    std::optional<double>      locked_width;  // set = all peak widths equal

    bool widths_locked() const { return locked_width.has_value(); }
};

/* pixel tolerance for handle picking */
struct HandleMetric {
    double x_per_px     = 1.0;   // plot units per screen pixel
    double y_per_px     = 1.0;
    double tolerance_px = 7.0;
};

/*  Handle closest to `cursor` within the tolerance, none otherwise.
 *  Peaks are grabbed at (xc, A), the baseline at (baseline_x, y0).        */
std::optional<std::size_t> nearest_handle(const CompositeCurve& curve,
                                          const Point&          cursor,
                                          double                baseline_x,
                                          const HandleMetric&   metric = {});

/*  Plain drag: a peak follows the cursor with its centre and amplitude,
 *  the baseline takes the cursor height.  Width is untouched.             */
void drag(CompositeCurve& curve, std::size_t index, const Point& cursor);

/*  Shift drag: a peak takes amplitude = cursor.y and
 *  width = click_origin.x - cursor.x.  With locked widths the new width is
 *  stored as the lock and copied to every peak.  The baseline behaves as
 *  in drag().                                                             */
void shift_drag(CompositeCurve& curve,
                std::size_t     index,
                EditState&      state,
                const Point&    cursor,
                const Point&    click_origin);

/*  Lock on: every peak takes the width of the first peak in list order.
 *  Lock off: the lock is cleared, current widths stay.  No peaks: no-op.
 *  Returns the lock after the toggle.                                     */
std::optional<double> toggle_locked_widths(CompositeCurve& curve, EditState& state);

/* width → every Gaussian member */
void apply_width_to_all(CompositeCurve& curve, double width);

/* append a Gaussian; returns its index */
std::size_t add_peak(CompositeCurve& curve, double xc, double amplitude, double width);

/* remove a peak; the caller never passes the baseline index */
void delete_peak(CompositeCurve& curve, std::size_t index);

} // namespace peakquant
