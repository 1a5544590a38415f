#include "TestCurves.hpp"
#include <limits>

namespace linecraft_test {

using linecraft::check_frequency_axis;
using linecraft::make_curve;
using linecraft::make_curve_from_text;
using linecraft::parse_real;

class ValidatorTest : public ::testing::Test {
protected:
    static constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
    static constexpr double kInf = std::numeric_limits<double>::infinity();
};

TEST_F(ValidatorTest, AcceptsStrictlyAscendingPositiveAxis) {
    Curve c = curve_of({20.0, 100.0, 1000.0, 20000.0}, {1.0, 2.0, 3.0, 4.0});

    EXPECT_EQ(c.size(), 4);
    EXPECT_EQ(c.frequencies().size(), c.amplitudes().size());
    EXPECT_DOUBLE_EQ(c.min_frequency(), 20.0);
    EXPECT_DOUBLE_EQ(c.max_frequency(), 20000.0);
}

TEST_F(ValidatorTest, SinglePointIsACurve) {
    Curve c = curve_of({1000.0}, {85.0});
    EXPECT_EQ(c.size(), 1);
}

TEST_F(ValidatorTest, RejectsDuplicateFrequency) {
    EXPECT_EQ(error_kind_of([] { curve_of({100.0, 100.0, 200.0}, {1.0, 2.0, 3.0}); }),
              ErrorKind::InvalidAxis);
}

TEST_F(ValidatorTest, RejectsUnsortedFrequencies) {
    EXPECT_EQ(error_kind_of([] { curve_of({200.0, 100.0, 300.0}, {1.0, 2.0, 3.0}); }),
              ErrorKind::InvalidAxis);
}

TEST_F(ValidatorTest, RejectsNonPositiveFrequency) {
    EXPECT_EQ(error_kind_of([] { curve_of({-10.0, 5.0}, {1.0, 2.0}); }),
              ErrorKind::InvalidAxis);
    EXPECT_EQ(error_kind_of([] { curve_of({0.0, 5.0}, {1.0, 2.0}); }),
              ErrorKind::InvalidAxis);
}

TEST_F(ValidatorTest, RejectsNonFiniteFrequency) {
    EXPECT_EQ(error_kind_of([] { curve_of({10.0, kInf}, {1.0, 2.0}); }),
              ErrorKind::InvalidAxis);
    EXPECT_EQ(error_kind_of([] { curve_of({kNaN, 10.0}, {1.0, 2.0}); }),
              ErrorKind::InvalidAxis);
}

TEST_F(ValidatorTest, RejectsNonFiniteAmplitude) {
    EXPECT_EQ(error_kind_of([] { curve_of({10.0, 20.0}, {1.0, kNaN}); }),
              ErrorKind::NonNumeric);
}

TEST_F(ValidatorTest, RejectsEmptyInput) {
    EXPECT_EQ(error_kind_of([] { curve_of({}, {}); }), ErrorKind::InsufficientData);
    EXPECT_EQ(error_kind_of([] { make_curve(std::vector<std::pair<Real, Real>>{}); }),
              ErrorKind::InsufficientData);
}

TEST_F(ValidatorTest, RejectsLengthMismatch) {
    EXPECT_EQ(error_kind_of([] { curve_of({10.0, 20.0, 30.0}, {1.0, 2.0}); }),
              ErrorKind::ShapeMismatch);
}

TEST_F(ValidatorTest, PairsKeepTheirOrder) {
    Curve c = make_curve(std::vector<std::pair<Real, Real>>{{100.0, 1.5}, {200.0, -3.0}});
    EXPECT_DOUBLE_EQ(c.frequencies()[1], 200.0);
    EXPECT_DOUBLE_EQ(c.amplitudes()[1], -3.0);
}

TEST_F(ValidatorTest, AxisCheckReportsFirstViolation) {
    Vector f(3);
    f << 100.0, 200.0, 150.0;
    EXPECT_EQ(error_kind_of([&] { check_frequency_axis(f); }), ErrorKind::InvalidAxis);
}

TEST_F(ValidatorTest, ParsesTextCells) {
    EXPECT_DOUBLE_EQ(parse_real("  1e3 "), 1000.0);
    EXPECT_DOUBLE_EQ(parse_real("-2.5"), -2.5);

    EXPECT_EQ(error_kind_of([] { parse_real("abc"); }),  ErrorKind::NonNumeric);
    EXPECT_EQ(error_kind_of([] { parse_real("12dB"); }), ErrorKind::NonNumeric);
    EXPECT_EQ(error_kind_of([] { parse_real("nan"); }),  ErrorKind::NonNumeric);
    EXPECT_EQ(error_kind_of([] { parse_real(""); }),     ErrorKind::NonNumeric);
}

TEST_F(ValidatorTest, TextCellsBuildACurve) {
    Curve c = make_curve_from_text({"100", "200"}, {"80.5", "81"});
    EXPECT_DOUBLE_EQ(c.amplitudes()[0], 80.5);

    EXPECT_EQ(error_kind_of([] { make_curve_from_text({"100", "x"}, {"1", "2"}); }),
              ErrorKind::NonNumeric);
    EXPECT_EQ(error_kind_of([] { make_curve_from_text({"100"}, {"1", "2"}); }),
              ErrorKind::ShapeMismatch);
}

TEST_F(ValidatorTest, ReplacePairKeepsNames) {
    Curve c = curve_of({100.0, 200.0}, {1.0, 2.0});
    c.set_name_base("woofer");
    c.add_name_suffix("smoothed 1/6");

    c.replace_pair(curve_of({50.0, 60.0, 70.0}, {0.0, 0.0, 0.0}));
    EXPECT_EQ(c.size(), 3);
    EXPECT_EQ(c.full_name(), "woofer - smoothed 1/6");
}

} // namespace linecraft_test
