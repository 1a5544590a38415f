#include "TestCurves.hpp"
#include <linecraft/Aggregator.hpp>

namespace linecraft_test {

using linecraft::CurveId;
using linecraft::CurveSet;
using linecraft::iqr_analysis;
using linecraft::mean_and_median;

class AggregatorTest : public ::testing::Test {
protected:
    static constexpr double kTolerance = 1e-12;

    // one shared frequency, one value per curve, ids 0, 1, …
    static CurveSet single_column(const std::vector<Real>& values, Real f = 1000.0)
    {
        CurveSet set;
        for (std::size_t i = 0; i < values.size(); ++i)
            set.emplace(i, curve_of({f}, {values[i]}));
        return set;
    }
};

TEST_F(AggregatorTest, MeanOfIdenticalCurvesIsExact) {
    Curve c = curve_of({20.0, 63.0, 1000.0, 12345.0}, {71.3, 84.1, 86.7, 79.9});
    CurveSet set;
    set.emplace(0, c);
    set.emplace(1, c);

    auto res = mean_and_median(set);
    ASSERT_EQ(res.mean.size(), c.size());
    for (Eigen::Index i = 0; i < c.size(); ++i) {
        EXPECT_EQ(res.mean.frequencies()[i], c.frequencies()[i]);
        EXPECT_EQ(res.mean.amplitudes()[i],  c.amplitudes()[i]);
        EXPECT_EQ(res.median.amplitudes()[i], c.amplitudes()[i]);
    }
    EXPECT_EQ(res.n_curves, 2u);
}

TEST_F(AggregatorTest, MedianOfThreeValues) {
    auto res = mean_and_median(single_column({80.0, 85.0, 90.0}));
    ASSERT_EQ(res.median.size(), 1);
    EXPECT_DOUBLE_EQ(res.median.amplitudes()[0], 85.0);
    EXPECT_DOUBLE_EQ(res.mean.amplitudes()[0], 85.0);
}

TEST_F(AggregatorTest, MeanIsArithmeticInDecibels) {
    auto res = mean_and_median(single_column({60.0, 80.0}));
    EXPECT_DOUBLE_EQ(res.mean.amplitudes()[0], 70.0);
}

TEST_F(AggregatorTest, RaggedGridsUsePresentValuesOnly) {
    CurveSet set;
    set.emplace(0, curve_of({100.0, 200.0}, {1.0, 2.0}));
    set.emplace(1, curve_of({200.0, 300.0}, {4.0, 6.0}));

    auto res = mean_and_median(set);
    ASSERT_EQ(res.mean.size(), 3);
    EXPECT_EQ(res.mean.frequencies()[0], 100.0);
    EXPECT_EQ(res.mean.frequencies()[2], 300.0);
    EXPECT_NEAR(res.mean.amplitudes()[0], 1.0, kTolerance);
    EXPECT_NEAR(res.mean.amplitudes()[1], 3.0, kTolerance);
    EXPECT_NEAR(res.mean.amplitudes()[2], 6.0, kTolerance);
    EXPECT_NEAR(res.median.amplitudes()[1], 3.0, kTolerance);
}

TEST_F(AggregatorTest, ResultDoesNotDependOnIds) {
    CurveSet a, b;
    a.emplace(0, curve_of({100.0, 200.0}, {1.0, 9.0}));
    a.emplace(1, curve_of({100.0, 200.0}, {5.0, 3.0}));
    a.emplace(2, curve_of({100.0, 150.0}, {2.0, 7.0}));
    b.emplace(42, a.at(2));
    b.emplace(7,  a.at(0));
    b.emplace(13, a.at(1));

    auto ra = mean_and_median(a);
    auto rb = mean_and_median(b);
    ASSERT_EQ(ra.mean.size(), rb.mean.size());
    for (Eigen::Index i = 0; i < ra.mean.size(); ++i) {
        EXPECT_EQ(ra.mean.amplitudes()[i],   rb.mean.amplitudes()[i]);
        EXPECT_EQ(ra.median.amplitudes()[i], rb.median.amplitudes()[i]);
    }
}

TEST_F(AggregatorTest, MeanNeedsTwoCurves) {
    EXPECT_EQ(error_kind_of([] { mean_and_median(single_column({80.0})); }),
              ErrorKind::InsufficientCurves);
    EXPECT_EQ(error_kind_of([] { mean_and_median(CurveSet{}); }),
              ErrorKind::InsufficientCurves);
}

/* ---------------- IQR fencing ---------------- */

TEST_F(AggregatorTest, IqrFlagsFarValue) {
    auto res = iqr_analysis(single_column({80.0, 81.0, 82.0, 120.0}), 1.5);

    // Q1 = 80.75, Q3 = 91.5, IQR = 10.75
    EXPECT_NEAR(res.lower_fence.amplitudes()[0], 80.75 - 1.5 * 10.75, kTolerance);
    EXPECT_NEAR(res.upper_fence.amplitudes()[0], 91.5 + 1.5 * 10.75, kTolerance);
    EXPECT_NEAR(res.median.amplitudes()[0], 81.5, kTolerance);
    EXPECT_EQ(res.outliers, (std::vector<CurveId>{3}));
    EXPECT_EQ(res.n_curves, 4u);
}

TEST_F(AggregatorTest, IqrWithoutOutliers) {
    auto res = iqr_analysis(single_column({80.0, 81.0, 82.0, 83.0}), 1.5);
    EXPECT_TRUE(res.outliers.empty());
}

TEST_F(AggregatorTest, IqrClassifiesOnlyByOwnPoints) {
    CurveSet set;
    set.emplace(0, curve_of({100.0, 200.0}, {80.0, 80.0}));
    set.emplace(1, curve_of({100.0, 200.0}, {81.0, 81.0}));
    set.emplace(2, curve_of({100.0, 200.0}, {82.0, 82.0}));
    // alone at 500 Hz: the column is just its own value
    set.emplace(3, curve_of({100.0, 500.0}, {81.5, 300.0}));

    auto res = iqr_analysis(set, 1.0);
    EXPECT_TRUE(res.outliers.empty());
    ASSERT_EQ(res.upper_fence.size(), 3);
    EXPECT_DOUBLE_EQ(res.upper_fence.amplitudes()[2], 300.0);
}

TEST_F(AggregatorTest, IqrZeroMultiplierFencesAreQuartiles) {
    auto res = iqr_analysis(single_column({1.0, 2.0, 3.0, 4.0, 5.0}), 0.0);
    EXPECT_DOUBLE_EQ(res.lower_fence.amplitudes()[0], 2.0);
    EXPECT_DOUBLE_EQ(res.upper_fence.amplitudes()[0], 4.0);
    EXPECT_EQ(res.outliers, (std::vector<CurveId>{0, 4}));
}

TEST_F(AggregatorTest, IqrNeedsThreeCurves) {
    EXPECT_EQ(error_kind_of([] { iqr_analysis(single_column({80.0, 81.0}), 1.5); }),
              ErrorKind::InsufficientCurves);
}

TEST_F(AggregatorTest, IqrRejectsNegativeMultiplier) {
    EXPECT_EQ(error_kind_of([] { iqr_analysis(single_column({1.0, 2.0, 3.0}), -1.0); }),
              ErrorKind::InvalidParameter);
}

} // namespace linecraft_test
