#include "peakquant/ReportUtils.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace peakquant {

/* ===================================================================== */
/*            H e l p e r s   f o r   t a b l e   f o r m a t t i n g     */
/* ===================================================================== */
static std::string fmt_g(double v)
{
    std::ostringstream s;                 // default float field == %g
    s << v;
    return s.str();
}

static std::string fmt_csv(double v)
{
    std::ostringstream s;
    s << std::setprecision(10) << v;
    return s.str();
}

/*  Open for appending; tells the caller whether a header is needed.     */
static std::ofstream open_append(const std::string& path, bool& is_new)
{
    is_new = !fs::exists(path);
    std::ofstream f(path, std::ios::app);
    if (!f)
        throw std::runtime_error("Cannot open '" + path + "' for writing");
    return f;
}

/* ===================================================================== */
/*                     p a r a m e t e r   t a b l e                     */
/* ===================================================================== */
std::vector<PeakRow> peak_rows(CompositeCurve& curve)
{
    curve.sort();

    std::vector<PeakRow> rows;
    double y0 = std::numeric_limits<double>::quiet_NaN();
    int    peak = 1;

    for (const auto& c : curve.curves()) {
        if (const auto* b = c.as_constant()) {
            y0 = b->y();
            continue;
        }
        const auto* g = c.as_gaussian();
        rows.push_back({peak++, y0, g->area(), g->center(), g->amplitude(), g->width()});
    }
    return rows;
}

std::string format_peak_table(const std::vector<PeakRow>& rows)
{
    std::ostringstream t;
    for (std::size_t k = 0; k < kPeakTableHeader.size(); ++k)
        t << (k ? "\t" : "") << kPeakTableHeader[k];
    t << '\n';

    for (const auto& r : rows) {
        t << r.peak     << '\t'
          << fmt_g(r.y0)   << '\t'
          << fmt_g(r.area) << '\t'
          << fmt_g(r.xc)   << '\t'
          << fmt_g(r.amp)  << '\t'
          << fmt_g(r.w)    << '\n';
    }
    return t.str();
}

/* ===================================================================== */
/*                           C S V  e x p o r t                          */
/* ===================================================================== */
void append_peak_export(const std::string&          csv_path,
                        const std::string&          dataset_name,
                        const std::vector<PeakRow>& rows)
{
    bool is_new = false;
    std::ofstream csv = open_append(csv_path, is_new);

    if (is_new) {
        csv << "filename";
        for (const char* h : kPeakTableHeader) csv << ',' << h;
        csv << '\n';
    }
    csv << '\n';                                   // block separator

    for (const auto& r : rows) {
        csv << dataset_name    << ','
            << r.peak          << ','
            << fmt_csv(r.y0)   << ','
            << fmt_csv(r.area) << ','
            << fmt_csv(r.xc)   << ','
            << fmt_csv(r.amp)  << ','
            << fmt_csv(r.w)    << '\n';
    }
}

void append_area_summary(const std::string&          csv_path,
                         const std::string&          dataset_name,
                         const std::vector<PeakRow>& rows)
{
    bool is_new = false;
    std::ofstream csv = open_append(csv_path, is_new);

    if (is_new) {
        csv << "Filename";
        for (int k = 1; k <= kAreaColumns; ++k) csv << ",Peak " << k;
        csv << '\n';
    }

    if (rows.size() > static_cast<std::size_t>(kAreaColumns))
        std::cerr << "[Export] " << dataset_name << ": " << rows.size()
                  << " peaks, areas.csv header names only " << kAreaColumns << '\n';

    csv << dataset_name;
    for (const auto& r : rows) csv << ',' << fmt_csv(r.area);
    for (std::size_t k = rows.size(); k < static_cast<std::size_t>(kAreaColumns); ++k)
        csv << ',';
    csv << '\n';
}

std::vector<std::string> export_results(const std::string&          out_dir,
                                        const std::string&          dataset_name,
                                        const std::vector<PeakRow>& rows)
{
    if (!out_dir.empty()) fs::create_directories(out_dir);

    const std::string peaks = (fs::path(out_dir) / "export.csv").string();
    const std::string areas = (fs::path(out_dir) / "areas.csv").string();

    append_peak_export (peaks, dataset_name, rows);
    append_area_summary(areas, dataset_name, rows);

    std::cout << "[Export] " << dataset_name << " → " << peaks << ", " << areas << '\n';
    return {peaks, areas};
}

} // namespace peakquant
