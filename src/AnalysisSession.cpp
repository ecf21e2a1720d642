#include "peakquant/AnalysisSession.hpp"
#include "peakquant/Errors.hpp"
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace peakquant {

/* ------------------------------------------------------------------------- */
/*  constructor                                                              */
/* ------------------------------------------------------------------------- */
AnalysisSession::AnalysisSession()
    : AnalysisSession(Config{})
{}

AnalysisSession::AnalysisSession(const Config& config)
    : config_(config)
    , history_(config.history_capacity)
{}

/* ========================================================================= */
/*  workspace                                                                */
/* ========================================================================= */
std::size_t AnalysisSession::add_dataset(Dataset ds)
{
    if (ds.x.size() == 0 || ds.x.size() != ds.y.size())
        throw std::invalid_argument("add_dataset(): x and y must be non-empty "
                                    "and of equal length");

    datasets_.push_back(std::move(ds));
    if (!active_) set_active(datasets_.size() - 1);
    return datasets_.size() - 1;
}

void AnalysisSession::set_active(std::size_t index)
{
    if (index >= datasets_.size())
        throw std::out_of_range("set_active(): no dataset " + std::to_string(index));
    active_ = index;
    activate_();
}

bool AnalysisSession::next_dataset()
{
    if (!active_ || *active_ + 1 >= datasets_.size()) return false;
    set_active(*active_ + 1);
    return true;
}

bool AnalysisSession::previous_dataset()
{
    if (!active_ || *active_ == 0) return false;
    set_active(*active_ - 1);
    return true;
}

std::size_t AnalysisSession::active_index() const
{
    if (!active_) throw std::logic_error("no active dataset");
    return *active_;
}

Dataset& AnalysisSession::active()
{
    return datasets_.at(active_index());
}

const Dataset& AnalysisSession::active() const
{
    return datasets_.at(active_index());
}

CompositeCurve& AnalysisSession::active_curve()
{
    return active().ensure_curve();
}

/* ---- a freshly activated dataset starts a new history --------------- */
void AnalysisSession::activate_()
{
    Dataset& ds = active();
    history_.reset(ds.ensure_curve());
    edit_.selected.reset();
    edit_.click_origin.reset();
}

void AnalysisSession::record_()
{
    history_.record_if_changed(active_curve());
}

void AnalysisSession::set_message_(const std::string& msg)
{
    message_ = msg;
    if (config_.verbose) std::cout << "[Session] " << msg << std::endl;
}

/* ========================================================================= */
/*  interactive intents                                                      */
/* ========================================================================= */
bool AnalysisSession::select_at(const Point& cursor)
{
    return select_at(cursor, config_.pick);
}

bool AnalysisSession::select_at(const Point& cursor, const HandleMetric& metric)
{
    Dataset& ds = active();
    edit_.click_origin = cursor;
    edit_.selected     = nearest_handle(ds.ensure_curve(), cursor, ds.x_first(), metric);
    return edit_.selected.has_value();
}

void AnalysisSession::clear_selection()
{
    edit_.selected.reset();
    edit_.click_origin.reset();
}

void AnalysisSession::drag_selected(const Point& cursor)
{
    if (!edit_.selected) return;
    drag(active_curve(), *edit_.selected, cursor);
}

void AnalysisSession::shift_drag_selected(const Point& cursor)
{
    if (!edit_.selected) return;
    const Point origin = edit_.click_origin.value_or(cursor);
    shift_drag(active_curve(), *edit_.selected, edit_, cursor, origin);
}

void AnalysisSession::finish_drag()
{
    if (edit_.selected) record_();
}

std::size_t AnalysisSession::add_peak(const Point& at, std::optional<double> width)
{
    Dataset& ds = active();

    double w = 0.0;
    if (width)                    w = *width;
    else if (edit_.locked_width)  w = *edit_.locked_width;
    else                          w = default_gaussian_width(ds.x_first(), ds.x_last(),
                                                              config_.width_divisor);

    const std::size_t idx = peakquant::add_peak(ds.ensure_curve(), at.x, at.y, w);
    record_();

    std::ostringstream msg;
    msg << std::fixed << std::setprecision(2)
        << "Gaussian added at (" << at.x << ", " << at.y << ").";
    set_message_(msg.str());
    return idx;
}

bool AnalysisSession::delete_selected()
{
    if (!edit_.selected) return false;

    CompositeCurve& cc = active_curve();
    if (*edit_.selected >= cc.size() || cc.at(*edit_.selected).is_baseline())
        return false;                                   // baselines stay

    delete_peak(cc, *edit_.selected);
    clear_selection();
    record_();
    set_message_("Gaussian deleted.");
    return true;
}

std::optional<double> AnalysisSession::toggle_locked_widths()
{
    const auto lock = peakquant::toggle_locked_widths(active_curve(), edit_);
    if (lock) {
        record_();
        std::ostringstream msg;
        msg << std::fixed << std::setprecision(2)
            << "Gaussian widths fixed to " << *lock;
        set_message_(msg.str());
    }
    return lock;
}

/* ========================================================================= */
/*  fit operations                                                           */
/* ========================================================================= */
bool AnalysisSession::optimize()
{
    Dataset& ds = active();

    FitOptions opts   = config_.fit;
    opts.freeze_widths = opts.freeze_widths || edit_.widths_locked();

    try {
        CompositeCurve fitted = optimize_fit(ds.x, ds.y, ds.ensure_curve(), opts);
        ds.curve = std::move(fitted);
    }
    catch (const ConvergenceError& e) {
        std::cerr << "[Session] " << e.what() << '\n';
        set_message_("An optimal fit was not found!");
        return false;
    }
    catch (const std::exception&) {
        set_message_("An error occurred during fitting.");
        throw;
    }

    history_.push(*ds.curve);
    set_message_("Fit found.");
    return true;
}

bool AnalysisSession::estimate()
{
    Dataset& ds = active();

    try {
        CompositeCurve est = estimate_fit(ds.x, ds.y);
        if (edit_.locked_width) apply_width_to_all(est, *edit_.locked_width);
        ds.curve = std::move(est);
    }
    catch (const EstimationError& e) {
        std::cerr << "[Session] " << e.what() << '\n';
        set_message_("An estimate could not be calculated!");
        return false;
    }
    catch (const std::exception&) {
        set_message_("An error occurred during fitting.");
        throw;
    }

    clear_selection();
    history_.push(*ds.curve);
    return optimize();
}

bool AnalysisSession::undo()
{
    auto restored = history_.undo();
    if (!restored) {
        set_message_("Nothing to undo.");
        return false;
    }
    active().curve = std::move(*restored);
    clear_selection();
    set_message_("Undo.");
    return true;
}

bool AnalysisSession::redo()
{
    auto restored = history_.redo();
    if (!restored) {
        set_message_("Nothing to redo.");
        return false;
    }
    active().curve = std::move(*restored);
    clear_selection();
    set_message_("Redo.");
    return true;
}

void AnalysisSession::reset_fit()
{
    active().reset_curve();
    activate_();
    set_message_("Fit reset.");
}

/* ========================================================================= */
/*  reporting                                                                */
/* ========================================================================= */
std::vector<PeakRow> AnalysisSession::parameter_table() const
{
    const Dataset& ds = active();
    if (!ds.curve) return {};

    /* sort a copy so the selection index keeps pointing at its curve */
    CompositeCurve sorted = ds.curve->clone();
    return peak_rows(sorted);
}

std::string AnalysisSession::parameter_table_text() const
{
    return format_peak_table(parameter_table());
}

std::vector<std::string> AnalysisSession::export_active(const std::string& out_dir)
{
    const Dataset& ds = active();

    std::string dir = out_dir;
    if (dir.empty() && !ds.path.empty())
        dir = std::filesystem::path(ds.path).parent_path().string();

    auto written = export_results(dir, ds.name, parameter_table());
    set_message_("Wrote to 'export.csv' and 'areas.csv'.");
    return written;
}

} // namespace peakquant
