#pragma once
#include "Types.hpp"
#include "CompositeCurve.hpp"
#include "Dataset.hpp"
#include "EditReducers.hpp"
#include "FitHistory.hpp"
#include "Fitting.hpp"
#include "ReportUtils.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace peakquant {

/*
 * Controller between the event source (mouse / keyboard / CLI) and the
 * curve model.  Owns the loaded datasets, the undo history of the active
 * one and the interaction state, and turns every intent into exactly one
 * core operation plus a status message.
 *
 * Single-threaded: all calls are expected from one event loop.
 */
class AnalysisSession {
public:
    struct Config
    {
        FitOptions   fit;                               // solver settings
        int          width_divisor    = 20;             // default width = x-range / divisor
        HandleMetric pick;                              // handle hit test
        std::size_t  history_capacity = FitHistory::kDefaultCapacity;
        bool         verbose          = true;           // echo status to stdout
    };

    AnalysisSession();
    explicit AnalysisSession(const Config& config);

    /* ------------ workspace --------------------------------------- */
    std::size_t add_dataset(Dataset ds);                // first one is activated
    void        set_active(std::size_t index);
    bool        next_dataset();
    bool        previous_dataset();

    bool           has_active()    const { return active_.has_value(); }
    std::size_t    active_index()  const;
    std::size_t    dataset_count() const { return datasets_.size(); }
    Dataset&       active();
    const Dataset& active() const;
    CompositeCurve& active_curve();

    const EditState&   edit_state()   const { return edit_; }
    const FitHistory&  history()      const { return history_; }
    const std::string& last_message() const { return message_; }

    /* ------------ interactive intents ----------------------------- */
    bool select_at(const Point& cursor);                // remembers the click origin
    bool select_at(const Point& cursor, const HandleMetric& metric);
    void clear_selection();

    void drag_selected(const Point& cursor);
    void shift_drag_selected(const Point& cursor);
    void finish_drag();                                 // history if changed

    std::size_t add_peak(const Point& at, std::optional<double> width = std::nullopt);
    bool        delete_selected();
    std::optional<double> toggle_locked_widths();

    /* ------------ fit operations ---------------------------------- */
    bool optimize();        // false: ConvergenceError, curve unchanged
    bool estimate();        // estimate_fit, then optimize()
    bool undo();
    bool redo();
    void reset_fit();

    /* ------------ reporting --------------------------------------- */
    std::vector<PeakRow>     parameter_table() const;
    std::string              parameter_table_text() const;

    /* export.csv / areas.csv, by default next to the data file */
    std::vector<std::string> export_active(const std::string& out_dir = "");

private:
    void activate_();
    void record_();
    void set_message_(const std::string& msg);

    Config                      config_;
    std::vector<Dataset>        datasets_;
    std::optional<std::size_t>  active_;
    EditState                   edit_;
    FitHistory                  history_;
    std::string                 message_;
};

} // namespace peakquant
