#pragma once
#include "Fitting.hpp"
#include "CompositeCurve.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace peakquant {

struct PeakGuess {
    double xc;
    double amp;
    double w;
};

// Everything a batch run reads from its JSON file
struct RunConfig {
    LMSolverOptions          solver;
    bool                     lock_widths = false;
    std::optional<double>    baseline;           // initialGuess.baseline
    std::vector<PeakGuess>   peaks;              // initialGuess.peaks
    std::optional<bool>      estimate;           // unset: estimate if no peaks
    std::string              export_dir;         // empty: next to the data

    bool should_estimate() const { return estimate.value_or(peaks.empty()); }

    /* Constant(baseline or 1) followed by the configured peaks */
    CompositeCurve initial_curve() const;
};

/*  Unknown keys are ignored; a key of the wrong type throws
 *  std::invalid_argument naming the key.                                 */
RunConfig run_config_from_json(const nlohmann::json& j);

/* load_json + expand_env + run_config_from_json */
RunConfig load_run_config(const std::string& path);

} // namespace peakquant
