#include "peakquant/Fitting.hpp"
#include "peakquant/Smoothing.hpp"
#include "TestProfiles.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace peakquant;
using peakquant::test_support::uniform_grid;

/* ---------------------------------------------------------------- */
/*  Savitzky-Golay                                                  */
/* ---------------------------------------------------------------- */
TEST(Savgol, KnownFivePointQuadraticWeights)
{
    const Vector c = savgol_coefficients(5, 2);
    ASSERT_EQ(c.size(), 5);

    const double expected[5] = {-3.0 / 35, 12.0 / 35, 17.0 / 35, 12.0 / 35, -3.0 / 35};
    for (int k = 0; k < 5; ++k) EXPECT_NEAR(c[k], expected[k], 1e-12);
}

TEST(Savgol, WeightsSumToOne)
{
    EXPECT_NEAR(savgol_coefficients(21, 4).sum(), 1.0, 1e-12);
}

TEST(Savgol, PreservesPolynomialUpToOrderIncludingEdges)
{
    const Vector x = uniform_grid(0.0, 5.0, 0.1);
    const Vector y = (1.0 + 2.0 * x.array() - 0.5 * x.array().square()
                      + 0.1 * x.array().cube() - 0.01 * x.array().pow(4)).matrix();

    const Vector s = savgol_filter(y, 21, 4);
    ASSERT_EQ(s.size(), y.size());
    EXPECT_LT((s - y).cwiseAbs().maxCoeff(), 1e-7);
}

TEST(Savgol, ConstantStaysConstant)
{
    const Vector y = Vector::Constant(30, 4.25);
    const Vector s = savgol_filter(y, 21, 4);
    EXPECT_LT((s.array() - 4.25).abs().maxCoeff(), 1e-12);
}

TEST(Savgol, ReducesAlternatingNoise)
{
    Vector y(101);
    for (Index i = 0; i < y.size(); ++i) y[i] = (i % 2 ? 1.0 : -1.0);

    const Vector s = savgol_filter(y, 21, 4);
    EXPECT_LT(s.segment(10, 81).cwiseAbs().maxCoeff(), 0.2);
}

TEST(Savgol, RejectsShortInputAndBadWindow)
{
    EXPECT_THROW(savgol_filter(Vector::Zero(20), 21, 4), std::invalid_argument);
    EXPECT_THROW(savgol_filter(Vector::Zero(50), 20, 4), std::invalid_argument);
    EXPECT_THROW(savgol_filter(Vector::Zero(50), 5, 5),  std::invalid_argument);
}

/* ---------------------------------------------------------------- */
/*  derivative helpers                                              */
/* ---------------------------------------------------------------- */
TEST(NumericalDerivative, CentralDifferenceIsExactForQuadratic)
{
    const Vector x = uniform_grid(0.0, 2.0, 0.5);       // 0 0.5 1 1.5 2
    const Vector y = x.array().square().matrix();

    const Vector d = numerical_derivative(y, 0.5);
    ASSERT_EQ(d.size(), 5);
    for (Index i = 1; i < 4; ++i) EXPECT_NEAR(d[i], 2.0 * x[i], 1e-12);

    /* ends repeat their neighbour */
    EXPECT_DOUBLE_EQ(d[0], d[1]);
    EXPECT_DOUBLE_EQ(d[4], d[3]);
}

TEST(NumericalDerivative, SecondIterationGivesSecondDerivative)
{
    const Vector x = uniform_grid(0.0, 10.0, 0.1);
    const Vector y = (3.0 * x.array().square()).matrix();

    const Vector dd = numerical_derivative(y, 0.1, 2);
    for (Index i = 2; i < dd.size() - 2; ++i) EXPECT_NEAR(dd[i], 6.0, 1e-8);
}

TEST(NumericalDerivative, NeedsThreeSamples)
{
    EXPECT_THROW(numerical_derivative(Vector::Zero(2)), std::invalid_argument);
}

TEST(ZeroCrossings, SignChanges)
{
    Vector y(6);
    y << 1.0, 0.5, -1.0, -2.0, 0.0, 3.0;
    EXPECT_EQ(find_zero_crossings(y), (std::vector<Index>{1, 3}));
}

TEST(ZeroCrossings, ExactZeroAtApexCountsOnce)
{
    Vector y(4);
    y << 2.0, 1.0, 0.0, -1.0;
    EXPECT_EQ(find_zero_crossings(y), (std::vector<Index>{1}));
}

TEST(ZeroCrossings, NoneWithoutSignChange)
{
    EXPECT_TRUE(find_zero_crossings(Vector::Constant(10, 2.0)).empty());
    EXPECT_TRUE(find_zero_crossings(Vector::Zero(10)).empty());
}
