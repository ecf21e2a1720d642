#include "peakquant/AnalysisSession.hpp"
#include "peakquant/Errors.hpp"
#include "peakquant/Fitting.hpp"
#include "peakquant/ProfileLoader.hpp"
#include "peakquant/RunConfig.hpp"
#include <cxxopts.hpp>
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

using namespace peakquant;

int main(int argc, char** argv) {
    auto start_time = std::chrono::steady_clock::now();
    try {
        cxxopts::Options opts("peakquant_cli", "Gaussian peak fitting of 1-D intensity profiles");
        opts.add_options()
            ("config", "Run configuration JSON", cxxopts::value<std::string>())
            ("export", "Append results to export.csv / areas.csv")
            ("no-optimize", "Report the starting curve without refinement")
            ("verbose", "Print solver iterations")
            ("h,help", "Show help")
            ("files", "Profile files", cxxopts::value<std::vector<std::string>>());
        opts.parse_positional({"files"});
        opts.positional_help("FILE...");

        auto cli = opts.parse(argc, argv);
        if (cli.count("help") || !cli.count("files")) {
            std::cout << opts.help() << '\n';
            return 0;
        }

        RunConfig run_cfg;
        if (cli.count("config"))
            run_cfg = load_run_config(cli["config"].as<std::string>());
        if (cli.count("verbose"))
            run_cfg.solver.verbose = true;

        const bool do_optimize = cli.count("no-optimize") == 0;
        const bool do_export   = cli.count("export") > 0;
        const bool seeded      = run_cfg.baseline.has_value() || !run_cfg.peaks.empty();

        AnalysisSession::Config session_cfg;
        session_cfg.fit.solver = run_cfg.solver;
        AnalysisSession session(session_cfg);

        /* ------------------------------------------------------------- */
        /*                     load all profiles                         */
        /* ------------------------------------------------------------- */
        for (const auto& path : cli["files"].as<std::vector<std::string>>()) {
            Dataset ds;
            try {
                ds = load_profile(path);
            }
            catch (const std::exception& ex) {
                std::cerr << "Failed to read profile: " << ex.what() << '\n';
                continue;
            }
            if (seeded) ds.curve = run_cfg.initial_curve();
            session.add_dataset(std::move(ds));
        }

        if (session.dataset_count() == 0)
            throw std::runtime_error("no profile could be loaded");

        /* ------------------------------------------------------------- */
        /*                 fit every profile in turn                     */
        /* ------------------------------------------------------------- */
        std::size_t n_ok = 0;
        for (std::size_t i = 0; i < session.dataset_count(); ++i) {
            session.set_active(i);
            Dataset& ds = session.active();

            std::cout << "\n=== " << ds.name << " (" << ds.x.size() << " points) ===\n";

            if (run_cfg.lock_widths && !session.edit_state().widths_locked())
                session.toggle_locked_widths();

            bool ok = true;
            if (run_cfg.should_estimate()) {
                if (do_optimize) {
                    ok = session.estimate();
                } else {
                    try {
                        ds.curve = estimate_fit(ds.x, ds.y);
                    }
                    catch (const EstimationError& ex) {
                        std::cerr << "[Fitting] " << ex.what() << '\n';
                        ok = false;
                    }
                }
            } else if (do_optimize) {
                ok = session.optimize();
            }

            if (!ok) {
                std::cerr << ds.name << ": " << session.last_message() << '\n';
                continue;
            }

            std::cout << session.parameter_table_text();

            if (do_export) {
                for (const auto& f : session.export_active(run_cfg.export_dir))
                    std::cout << "Wrote: " << f << '\n';
            }
            ++n_ok;
        }

        std::cout << "\nFitted " << n_ok << " of " << session.dataset_count() << " profiles.\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    auto end_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();

    std::cout << "\nTook: " << duration / 1000 << "." << (duration % 1000) / 100 << "s\n";

    return 0;
}
