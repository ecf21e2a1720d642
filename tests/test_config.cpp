#include "peakquant/JsonUtils.hpp"
#include "peakquant/ProfileLoader.hpp"
#include "peakquant/RunConfig.hpp"
#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace peakquant;
namespace fs = std::filesystem;

/* ---------------------------------------------------------------- */
/*  run configuration                                               */
/* ---------------------------------------------------------------- */
TEST(RunConfig, DefaultsWhenEmpty)
{
    const RunConfig cfg = run_config_from_json(nlohmann::json::object());
    EXPECT_FALSE(cfg.lock_widths);
    EXPECT_TRUE(cfg.should_estimate());
    EXPECT_TRUE(cfg.export_dir.empty());
    EXPECT_EQ(cfg.solver.max_iterations, 0);

    const CompositeCurve cc = cfg.initial_curve();
    ASSERT_EQ(cc.size(), 1u);
    EXPECT_DOUBLE_EQ(cc.at(0).as_constant()->y(), 1.0);
}

TEST(RunConfig, ReadsEveryKey)
{
    const auto j = nlohmann::json::parse(R"({
        "solver":       {"maxIterations": 50, "ftol": 1e-10, "xtol": 1e-9,
                         "gtol": 1e-12, "verbose": true},
        "lockWidths":   true,
        "exportDir":    "out",
        "initialGuess": {"baseline": 12.5,
                         "peaks": [{"xc": 30, "amp": 90, "w": 2},
                                   {"xc": 70, "amp": 60, "w": 2.5}]}
    })");

    const RunConfig cfg = run_config_from_json(j);
    EXPECT_EQ(cfg.solver.max_iterations, 50);
    EXPECT_DOUBLE_EQ(cfg.solver.ftol, 1e-10);
    EXPECT_DOUBLE_EQ(cfg.solver.xtol, 1e-9);
    EXPECT_DOUBLE_EQ(cfg.solver.gtol, 1e-12);
    EXPECT_TRUE(cfg.solver.verbose);
    EXPECT_TRUE(cfg.lock_widths);
    EXPECT_EQ(cfg.export_dir, "out");
    EXPECT_FALSE(cfg.should_estimate());

    const CompositeCurve cc = cfg.initial_curve();
    ASSERT_EQ(cc.size(), 3u);
    EXPECT_DOUBLE_EQ(cc.at(0).as_constant()->y(), 12.5);
    EXPECT_DOUBLE_EQ(cc.at(2).as_gaussian()->width(), 2.5);
}

TEST(RunConfig, ExplicitEstimateOverridesDefault)
{
    const auto j = nlohmann::json::parse(R"({
        "estimate": true,
        "initialGuess": {"peaks": [{"xc": 30, "amp": 90, "w": 2}]}
    })");
    EXPECT_TRUE(run_config_from_json(j).should_estimate());
}

TEST(RunConfig, WrongTypeNamesTheKey)
{
    const auto j = nlohmann::json::parse(R"({"lockWidths": "yes"})");
    try {
        run_config_from_json(j);
        FAIL() << "expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_NE(std::string(e.what()).find("lockWidths"), std::string::npos);
    }

    const auto missing = nlohmann::json::parse(R"({"initialGuess": {"peaks": [{"xc": 1}]}})");
    EXPECT_THROW(run_config_from_json(missing), std::invalid_argument);
    EXPECT_THROW(run_config_from_json(nlohmann::json::array()), std::invalid_argument);
}

TEST(JsonUtils, ExpandEnvReplacesVariables)
{
    ::setenv("PEAKQUANT_TEST_DIR", "/data/gels", 1);
    auto j = nlohmann::json::parse(R"({"exportDir": "${PEAKQUANT_TEST_DIR}/out",
                                        "list": ["${PEAKQUANT_TEST_DIR}", 3]})");
    expand_env(j);
    EXPECT_EQ(j["exportDir"], "/data/gels/out");
    EXPECT_EQ(j["list"][0], "/data/gels");
    EXPECT_EQ(j["list"][1], 3);
}

TEST(JsonUtils, ExpandEnvFallbackAndUnset)
{
    ::unsetenv("PEAKQUANT_TEST_UNSET");
    auto j = nlohmann::json::parse(R"(["${PEAKQUANT_TEST_UNSET:-results}/x",
                                       "a${PEAKQUANT_TEST_UNSET}b",
                                       "${unterminated"])");
    expand_env(j);
    EXPECT_EQ(j[0], "results/x");
    EXPECT_EQ(j[1], "ab");
    EXPECT_EQ(j[2], "${unterminated");
}

TEST(JsonUtils, LoadsFileWithComments)
{
    const fs::path p = fs::temp_directory_path() / "peakquant_cfg_test.json";
    {
        std::ofstream out(p);
        out << "{\n  // refinement only\n  \"estimate\": false\n}\n";
    }
    const nlohmann::json j = load_json(p.string());
    fs::remove(p);
    EXPECT_EQ(j["estimate"], false);
}

TEST(JsonUtils, MissingOrMalformedFileThrows)
{
    EXPECT_THROW(load_json("/nonexistent/peakquant.json"), std::runtime_error);

    const fs::path p = fs::temp_directory_path() / "peakquant_bad_cfg.json";
    {
        std::ofstream out(p);
        out << "{ \"estimate\": ";
    }
    EXPECT_THROW(load_json(p.string()), std::runtime_error);
    fs::remove(p);
}

/* ---------------------------------------------------------------- */
/*  profile loader                                                  */
/* ---------------------------------------------------------------- */
TEST(ProfileLoader, SkipsHeaderAndSortsRows)
{
    const Dataset ds = parse_profile("# exported profile\n"
                                     "X,Y\n"
                                     "2,20\n"
                                     "0;5\n"
                                     "1\t10\n"
                                     "\n",
                                     "lane");
    ASSERT_EQ(ds.x.size(), 3);
    EXPECT_EQ(ds.name, "lane");
    EXPECT_DOUBLE_EQ(ds.x[0], 0.0);
    EXPECT_DOUBLE_EQ(ds.y[0], 5.0);
    EXPECT_DOUBLE_EQ(ds.x[2], 2.0);
    EXPECT_DOUBLE_EQ(ds.y[2], 20.0);
    EXPECT_FALSE(ds.curve.has_value());
}

TEST(ProfileLoader, RejectsDuplicatedX)
{
    EXPECT_THROW(parse_profile("0 1\n1 2\n1 3\n", "dup"), std::runtime_error);
}

TEST(ProfileLoader, RejectsEmptyInput)
{
    EXPECT_THROW(parse_profile("Distance Gray_Value\n", "empty"), std::runtime_error);
}

TEST(ProfileLoader, LoadsFileWithStemAsName)
{
    const fs::path p = fs::temp_directory_path() / "peakquant_lane7.csv";
    {
        std::ofstream out(p);
        out << "Distance_(pixels),Gray_Value\n0,1\n1,4\n2,9\n";
    }
    const Dataset ds = load_profile(p.string());
    fs::remove(p);

    EXPECT_EQ(ds.name, "peakquant_lane7");
    EXPECT_EQ(ds.path, p.string());
    ASSERT_EQ(ds.y.size(), 3);
    EXPECT_DOUBLE_EQ(ds.y[2], 9.0);

    EXPECT_THROW(load_profile(p.string()), std::runtime_error);
}
