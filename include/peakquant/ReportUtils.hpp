#pragma once
#include "Types.hpp"
#include "CompositeCurve.hpp"
#include <array>
#include <string>
#include <vector>

namespace peakquant {

/* --------------------------------------------------------------------- */
/*                     p a r a m e t e r   t a b l e                     */
/* --------------------------------------------------------------------- */
struct PeakRow {
    int    peak;     // 1-based, ascending centre
    double y0;       // baseline offset (NaN if the curve has no baseline)
    double area;
    double xc;
    double amp;
    double w;
};

inline const std::array<const char*, 6> kPeakTableHeader =
    {"Peak", "y0", "Area", "xc", "Amp", "w"};

/* maximum number of area columns in areas.csv */
constexpr int kAreaColumns = 6;

/*  Sorts `curve` and returns one row per peak.  The sort is the reason
 *  the curve is taken by reference.                                      */
std::vector<PeakRow> peak_rows(CompositeCurve& curve);

/* tab-delimited text with a header line, numbers in %g style */
std::string format_peak_table(const std::vector<PeakRow>& rows);

/* --------------------------------------------------------------------- */
/*                           C S V  e x p o r t                          */
/* --------------------------------------------------------------------- */

/*  Append the per-peak detail block to `csv_path` (export.csv): the header
 *  `filename,Peak,y0,Area,xc,Amp,w` when the file is new, a blank separator
 *  row, then one row per peak.                                           */
void append_peak_export(const std::string&          csv_path,
                        const std::string&          dataset_name,
                        const std::vector<PeakRow>& rows);

/*  Append one summary row `name,area1,…` to `csv_path` (areas.csv); the
 *  header names Peak 1 … Peak 6.                                         */
void append_area_summary(const std::string&          csv_path,
                         const std::string&          dataset_name,
                         const std::vector<PeakRow>& rows);

/*  Both exports into `out_dir`; returns the paths written.              */
std::vector<std::string> export_results(const std::string&          out_dir,
                                        const std::string&          dataset_name,
                                        const std::vector<PeakRow>& rows);

} // namespace peakquant
