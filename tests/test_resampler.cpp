#include "TestCurves.hpp"
#include <linecraft/Interpolation.hpp>
#include <linecraft/Resampler.hpp>

namespace linecraft_test {

using linecraft::build_ppo_grid;
using linecraft::grids_equal;
using linecraft::resample_to_grid;

class ResamplerTest : public ::testing::Test {
protected:
    static constexpr double kTolerance = 1e-9;

    // irregular measurement, nothing on a ppo grid
    Curve measured = curve_of({20.0, 37.0, 100.0, 555.0, 1234.0, 4000.0, 20000.0},
                              {70.0, 75.0, 82.0, 85.0, 84.0, 88.0, 60.0});
};

/* ---------------- grid ---------------- */

TEST_F(ResamplerTest, GridContainsPinnedFrequencyExactly) {
    Vector g = build_ppo_grid(20.0, 20000.0, 24, 1000.0);
    bool found = false;
    for (Eigen::Index i = 0; i < g.size(); ++i) found |= (g[i] == 1000.0);
    EXPECT_TRUE(found);
}

TEST_F(ResamplerTest, GridStepIsConstantInOctaves) {
    Vector g = build_ppo_grid(20.0, 20000.0, 12, 1000.0);
    ASSERT_GT(g.size(), 2);
    for (Eigen::Index i = 1; i < g.size(); ++i)
        EXPECT_NEAR(std::log2(g[i] / g[i - 1]), 1.0 / 12.0, kTolerance);
}

TEST_F(ResamplerTest, GridStaysInsideSpan) {
    Vector g = build_ppo_grid(20.0, 20000.0, 3, 1000.0);
    EXPECT_GE(g[0], 20.0);
    EXPECT_LE(g[g.size() - 1], 20000.0);
    // 1000·2^(k/3), k = −16 … 12
    EXPECT_NEAR(g[0], 1000.0 * std::pow(2.0, -16.0 / 3.0), 1e-9);
    EXPECT_NEAR(g[g.size() - 1], 16000.0, 1e-9);
}

TEST_F(ResamplerTest, PinnedFrequencyOutsideSpanStillAnchorsGrid) {
    Vector g = build_ppo_grid(1000.0, 2000.0, 1, 3000.0);
    ASSERT_EQ(g.size(), 1);
    EXPECT_DOUBLE_EQ(g[0], 1500.0);
}

TEST_F(ResamplerTest, EmptyGridIsInsufficientData) {
    EXPECT_EQ(error_kind_of([] { build_ppo_grid(1100.0, 1200.0, 1, 1000.0); }),
              ErrorKind::InsufficientData);
}

TEST_F(ResamplerTest, GridsEqualUsesRelativeTolerance) {
    Vector a(2), b(2), c(3);
    a << 100.0, 1000.0;
    b << 100.0 * (1.0 + 1e-12), 1000.0;
    c << 100.0, 1000.0, 2000.0;
    EXPECT_TRUE(grids_equal(a, b));
    EXPECT_FALSE(grids_equal(a, c));
}

/* ---------------- resampling ---------------- */

TEST_F(ResamplerTest, ZeroPpoReturnsPairUnchanged) {
    Curve r = resample_to_grid(measured, 0);
    ASSERT_EQ(r.size(), measured.size());
    for (Eigen::Index i = 0; i < r.size(); ++i) {
        EXPECT_EQ(r.frequencies()[i], measured.frequencies()[i]);
        EXPECT_EQ(r.amplitudes()[i], measured.amplitudes()[i]);
    }
}

TEST_F(ResamplerTest, NegativePpoIsInvalidResolution) {
    EXPECT_EQ(error_kind_of([&] { resample_to_grid(measured, -1); }),
              ErrorKind::InvalidResolution);
}

TEST_F(ResamplerTest, IsIdempotent) {
    Curve once  = resample_to_grid(measured, 24, 1000.0);
    Curve twice = resample_to_grid(once, 24, 1000.0);

    ASSERT_EQ(once.size(), twice.size());
    for (Eigen::Index i = 0; i < once.size(); ++i) {
        EXPECT_EQ(twice.frequencies()[i], once.frequencies()[i]);
        EXPECT_EQ(twice.amplitudes()[i], once.amplitudes()[i]);
    }
}

TEST_F(ResamplerTest, StaysWithinOriginalSpan) {
    Curve r = resample_to_grid(measured, 48, 1000.0);
    EXPECT_GE(r.min_frequency(), measured.min_frequency() * (1.0 - kTolerance));
    EXPECT_LE(r.max_frequency(), measured.max_frequency() * (1.0 + kTolerance));
}

TEST_F(ResamplerTest, InterpolatesLinearlyInLogFrequency) {
    Curve c = curve_of({100.0, 400.0}, {0.0, 20.0});
    Curve r = resample_to_grid(c, 2, 100.0);   // 100, 141, 200, 283, 400

    ASSERT_EQ(r.size(), 5);
    EXPECT_NEAR(r.frequencies()[2], 200.0, kTolerance);
    EXPECT_NEAR(r.amplitudes()[1], 5.0, kTolerance);
    EXPECT_NEAR(r.amplitudes()[2], 10.0, kTolerance);
    EXPECT_NEAR(r.amplitudes()[4], 20.0, kTolerance);
}

TEST_F(ResamplerTest, ResultIsUnnamedAndInputUntouched) {
    measured.set_name_base("driver");
    Curve r = resample_to_grid(measured, 6);
    EXPECT_EQ(r.full_name(), "");
    EXPECT_EQ(measured.size(), 7);
    EXPECT_EQ(measured.full_name(), "driver");
}

/* ---------------- interpolation ---------------- */

TEST_F(ResamplerTest, BoundedInterpolationLeavesOutsidePointsAbsent) {
    Vector f(2), y(2), q(3);
    f << 100.0, 1000.0;
    y << 1.0, 2.0;
    q << 50.0, 100.0, 2000.0;

    auto v = linecraft::interp_log_frequency_bounded(f, y, q);
    EXPECT_FALSE(v[0].has_value());
    ASSERT_TRUE(v[1].has_value());
    EXPECT_DOUBLE_EQ(*v[1], 1.0);
    EXPECT_FALSE(v[2].has_value());

    Vector held = linecraft::interp_log_frequency(f, y, q);
    EXPECT_DOUBLE_EQ(held[0], 1.0);
    EXPECT_DOUBLE_EQ(held[2], 2.0);
}

} // namespace linecraft_test
