#include "peakquant/RunConfig.hpp"
#include "peakquant/JsonUtils.hpp"
#include <iostream>
#include <stdexcept>

namespace peakquant {

namespace {

template<typename T>
T get_as(const nlohmann::json& j, const char* key)
{
    try {
        return j.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("config key '") + key + "': " + e.what());
    }
}

template<typename T>
void read_opt(const nlohmann::json& j, const char* key, T& out)
{
    if (j.contains(key)) out = get_as<T>(j, key);
}

} // unnamed namespace

CompositeCurve RunConfig::initial_curve() const
{
    CompositeCurve cc = CompositeCurve::with_baseline(baseline.value_or(1.0));
    for (const auto& p : peaks) cc.add(Gaussian(p.xc, p.amp, p.w));
    return cc;
}

RunConfig run_config_from_json(const nlohmann::json& j)
{
    if (!j.is_object())
        throw std::invalid_argument("config: top level must be a JSON object");

    RunConfig cfg;

    /* ---------- solver ------------------------------------------- */
    if (j.contains("solver")) {
        const auto& s = j["solver"];
        read_opt(s, "maxIterations", cfg.solver.max_iterations);
        read_opt(s, "ftol",          cfg.solver.ftol);
        read_opt(s, "xtol",          cfg.solver.xtol);
        read_opt(s, "gtol",          cfg.solver.gtol);
        read_opt(s, "verbose",       cfg.solver.verbose);
    }

    read_opt(j, "lockWidths", cfg.lock_widths);
    read_opt(j, "exportDir",  cfg.export_dir);
    if (j.contains("estimate")) cfg.estimate = get_as<bool>(j, "estimate");

    /* ---------- initial guess ------------------------------------ */
    if (j.contains("initialGuess")) {
        const auto& g = j["initialGuess"];
        if (g.contains("baseline")) cfg.baseline = get_as<double>(g, "baseline");
        if (g.contains("peaks")) {
            for (const auto& p : g["peaks"]) {
                cfg.peaks.push_back({get_as<double>(p, "xc"),
                                     get_as<double>(p, "amp"),
                                     get_as<double>(p, "w")});
            }
        }
    }
    return cfg;
}

RunConfig load_run_config(const std::string& path)
{
    nlohmann::json j = load_json(path);
    expand_env(j);
    std::cout << "Loaded config from: " << path << std::endl;
    return run_config_from_json(j);
}

} // namespace peakquant
