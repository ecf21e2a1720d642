#include "peakquant/Errors.hpp"
#include "peakquant/Fitting.hpp"
#include "peakquant/ReportUtils.hpp"
#include "TestProfiles.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace peakquant;
using peakquant::test_support::make_curve;
using peakquant::test_support::uniform_grid;

namespace {

/* 1001 samples on [0, 100] */
Vector profile_grid() { return uniform_grid(0.0, 100.0, 0.1); }

} // unnamed namespace

/* ====================================================================== */
/*  estimate_fit                                                          */
/* ====================================================================== */
TEST(EstimateFit, FindsSinglePeak)
{
    const Vector x = profile_grid();
    const Vector y = make_curve(5.0, {{50.03, 100.0, 2.5}}).evaluate(x);

    const CompositeCurve est = estimate_fit(x, y);
    ASSERT_EQ(est.size(), 2u);
    ASSERT_TRUE(est.at(0).is_baseline());
    EXPECT_NEAR(est.at(0).as_constant()->y(), 5.0, 1e-6);

    const Gaussian* g = est.at(1).as_gaussian();
    ASSERT_NE(g, nullptr);
    EXPECT_NEAR(g->center(), 50.03, 0.1);
    EXPECT_NEAR(g->amplitude(), 100.0, 1.0);
    EXPECT_GT(g->width(), 2.0);
    EXPECT_LT(g->width(), 3.0);
}

TEST(EstimateFit, RejectsPeaksWiderThanLimit)
{
    const Vector x = profile_grid();
    const Vector y = make_curve(0.0, {{50.03, 100.0, 4.0}}).evaluate(x);

    const CompositeCurve est = estimate_fit(x, y);
    EXPECT_EQ(est.peak_count(), 0u);
    EXPECT_TRUE(est.at(0).is_baseline());
}

TEST(EstimateFit, SkipsPeaksBelowHalfTheRange)
{
    const Vector x = profile_grid();
    const Vector y = make_curve(0.0, {{30.02, 100.0, 2.0}, {70.04, 30.0, 2.0}}).evaluate(x);

    const CompositeCurve est = estimate_fit(x, y);
    ASSERT_EQ(est.peak_count(), 1u);
    EXPECT_NEAR(est.at(1).center(), 30.02, 0.1);
}

TEST(EstimateFit, FlatProfileGivesBaselineOnly)
{
    const Vector x = profile_grid();
    const Vector y = Vector::Constant(x.size(), 7.0);

    const CompositeCurve est = estimate_fit(x, y);
    ASSERT_EQ(est.size(), 1u);
    EXPECT_NEAR(est.at(0).as_constant()->y(), 7.0, 1e-9);
}

TEST(EstimateFit, PreconditionFailures)
{
    const Vector x = uniform_grid(0.0, 1.9, 0.1);       // 20 samples
    const Vector y = Vector::Ones(x.size());
    EXPECT_THROW(estimate_fit(x, y), EstimationError);

    const Vector x2 = profile_grid();
    EXPECT_THROW(estimate_fit(x2, Vector::Ones(x2.size() - 1)), EstimationError);

    const Vector descending = -profile_grid();
    EXPECT_THROW(estimate_fit(descending, Vector::Ones(descending.size())), EstimationError);
}

/* ====================================================================== */
/*  optimize_fit                                                          */
/* ====================================================================== */
TEST(OptimizeFit, ExactStartStaysPut)
{
    const Vector         x    = profile_grid();
    const CompositeCurve true_curve = make_curve(5.0, {{30.0, 50.0, 2.0}});
    const Vector         y    = true_curve.evaluate(x);

    const CompositeCurve fit = optimize_fit(x, y, true_curve);
    EXPECT_TRUE(fit.get_params().isApprox(true_curve.get_params(), 1e-12));
}

TEST(OptimizeFit, RecoversTwoPeaksFromPerturbedStart)
{
    const Vector         x          = profile_grid();
    const CompositeCurve true_curve = make_curve(5.0, {{30.0, 50.0, 2.0}, {70.0, 30.0, 3.0}});
    const Vector         y          = true_curve.evaluate(x);

    const CompositeCurve start = make_curve(4.0, {{30.5, 45.0, 2.3}, {69.6, 33.0, 2.7}});
    const Vector         start_params = start.get_params();

    const CompositeCurve fit = optimize_fit(x, y, start);

    const Vector diff = fit.get_params() - true_curve.get_params();
    EXPECT_LT(diff.cwiseAbs().maxCoeff(), 1e-4);

    /* input untouched */
    EXPECT_EQ(start.get_params(), start_params);
}

TEST(OptimizeFit, FrozenWidthsKeepTheirValue)
{
    const Vector         x = profile_grid();
    const Vector         y = make_curve(5.0, {{30.0, 50.0, 2.0}}).evaluate(x);
    const CompositeCurve start = make_curve(4.0, {{30.3, 45.0, 2.4}});

    FitOptions opts;
    opts.freeze_widths = true;
    const CompositeCurve fit = optimize_fit(x, y, start, opts);

    const Gaussian* g = fit.at(1).as_gaussian();
    ASSERT_NE(g, nullptr);
    EXPECT_DOUBLE_EQ(g->width(), 2.4);
    EXPECT_NEAR(g->center(), 30.0, 0.05);
}

TEST(OptimizeFit, IterationLimitRaisesConvergenceError)
{
    const Vector x = profile_grid();
    const Vector y = make_curve(5.0, {{30.0, 50.0, 2.0}}).evaluate(x);

    FitOptions opts;
    opts.solver.max_iterations = 1;
    EXPECT_THROW(optimize_fit(x, y, make_curve(1.0, {{33.0, 20.0, 1.0}}), opts),
                 ConvergenceError);
}

TEST(OptimizeFit, LengthMismatchIsNotAConvergenceError)
{
    const Vector x = profile_grid();
    EXPECT_THROW(optimize_fit(x, Vector::Zero(10), CompositeCurve::with_baseline()),
                 std::invalid_argument);
}

TEST(OptimizeFit, BaselineOnlyFitsTheMean)
{
    const Vector x = uniform_grid(0.0, 9.0, 1.0);
    Vector y(10);
    y << 1, 2, 3, 4, 5, 6, 7, 8, 9, 10;

    const CompositeCurve fit = optimize_fit(x, y, CompositeCurve::with_baseline());
    EXPECT_NEAR(fit.at(0).as_constant()->y(), 5.5, 1e-5);
}

/* ====================================================================== */
/*  estimate, then refine, then tabulate                                  */
/* ====================================================================== */
TEST(EstimateThenOptimize, TwoPeaksEndToEnd)
{
    const Vector         x          = profile_grid();
    const CompositeCurve true_curve = make_curve(10.0, {{30.04, 100.0, 2.0}, {70.02, 70.0, 2.5}});
    const Vector         y          = true_curve.evaluate(x);

    const CompositeCurve est = estimate_fit(x, y);
    ASSERT_EQ(est.peak_count(), 2u);

    CompositeCurve fit = optimize_fit(x, y, est);
    const auto rows = peak_rows(fit);
    ASSERT_EQ(rows.size(), 2u);

    EXPECT_EQ(rows[0].peak, 1);
    EXPECT_NEAR(rows[0].y0,  10.0,  1e-4);
    EXPECT_NEAR(rows[0].xc,  30.04, 1e-4);
    EXPECT_NEAR(rows[0].amp, 100.0, 1e-4);
    EXPECT_NEAR(rows[0].w,   2.0,   1e-4);

    EXPECT_EQ(rows[1].peak, 2);
    EXPECT_NEAR(rows[1].xc,  70.02, 1e-4);
    EXPECT_NEAR(rows[1].amp, 70.0,  1e-4);
    EXPECT_NEAR(rows[1].w,   2.5,   1e-4);
    EXPECT_NEAR(rows[1].area, Gaussian(70.02, 70.0, 2.5).area(), 1e-2);
}
