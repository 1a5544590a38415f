#include "TestCurves.hpp"
#include <linecraft/Butterworth.hpp>
#include <complex>

namespace linecraft_test {

using linecraft::SecondOrderSection;
using linecraft::design_butterworth_lowpass;
using linecraft::filtfilt;

class ButterworthTest : public ::testing::Test {
protected:
    static constexpr double kTolerance = 1e-9;
    static constexpr double kPi        = 3.14159265358979323846;

    // |H(e^jω)| of the cascade at `freq` for the given sample rate
    static double magnitude(const std::vector<SecondOrderSection>& sos,
                            double freq, double sample_rate)
    {
        const std::complex<double> z1 = std::polar(1.0, -2.0 * kPi * freq / sample_rate);
        const std::complex<double> z2 = z1 * z1;
        std::complex<double> h = 1.0;
        for (const auto& c : sos)
            h *= (c.b0 + c.b1 * z1 + c.b2 * z2) / (1.0 + c.a1 * z1 + c.a2 * z2);
        return std::abs(h);
    }
};

TEST_F(ButterworthTest, SectionCountFollowsOrder) {
    EXPECT_EQ(design_butterworth_lowpass(8, 3.0, 96.0).size(), 4u);
    EXPECT_EQ(design_butterworth_lowpass(4, 3.0, 96.0).size(), 2u);
    EXPECT_EQ(design_butterworth_lowpass(5, 3.0, 96.0).size(), 3u);
    EXPECT_EQ(design_butterworth_lowpass(1, 3.0, 96.0).size(), 1u);
}

TEST_F(ButterworthTest, UnityGainAtDc) {
    for (int order : {1, 4, 5, 8}) {
        auto sos = design_butterworth_lowpass(order, 3.0, 96.0);
        EXPECT_NEAR(magnitude(sos, 0.0, 96.0), 1.0, kTolerance) << "order " << order;
    }
}

TEST_F(ButterworthTest, MinusThreeDecibelsAtCutoff) {
    for (int order : {4, 8}) {
        auto sos = design_butterworth_lowpass(order, 3.0, 96.0);
        EXPECT_NEAR(magnitude(sos, 3.0, 96.0), 1.0 / std::sqrt(2.0), 1e-9) << "order " << order;
    }
}

TEST_F(ButterworthTest, HigherOrderFallsOffFaster) {
    auto sos4 = design_butterworth_lowpass(4, 3.0, 96.0);
    auto sos8 = design_butterworth_lowpass(8, 3.0, 96.0);
    EXPECT_LT(magnitude(sos8, 12.0, 96.0), magnitude(sos4, 12.0, 96.0));
    EXPECT_LT(magnitude(sos8, 12.0, 96.0), 1e-4);
}

TEST_F(ButterworthTest, RejectsCutoffAtOrAboveNyquist) {
    EXPECT_EQ(error_kind_of([] { design_butterworth_lowpass(8, 48.0, 96.0); }),
              ErrorKind::InvalidResolution);
    EXPECT_EQ(error_kind_of([] { design_butterworth_lowpass(8, 0.0, 96.0); }),
              ErrorKind::InvalidResolution);
}

TEST_F(ButterworthTest, RejectsBadOrderOrRate) {
    EXPECT_EQ(error_kind_of([] { design_butterworth_lowpass(0, 3.0, 96.0); }),
              ErrorKind::InvalidParameter);
    EXPECT_EQ(error_kind_of([] { design_butterworth_lowpass(4, 3.0, 0.0); }),
              ErrorKind::InvalidParameter);
}

TEST_F(ButterworthTest, FiltfiltKeepsConstantSignal) {
    auto sos = design_butterworth_lowpass(8, 3.0, 96.0);
    Vector x = Vector::Constant(200, 84.5);
    Vector y = filtfilt(sos, x);

    ASSERT_EQ(y.size(), x.size());
    for (Eigen::Index i = 0; i < y.size(); ++i) EXPECT_NEAR(y[i], 84.5, 1e-9);
}

TEST_F(ButterworthTest, FiltfiltIsZeroPhaseOnRamp) {
    auto sos = design_butterworth_lowpass(4, 3.0, 96.0);
    const Eigen::Index n = 800;
    Vector x(n);
    for (Eigen::Index i = 0; i < n; ++i) x[i] = 0.05 * static_cast<double>(i);

    Vector y = filtfilt(sos, x);
    // away from the ends the ramp passes without any shift
    for (Eigen::Index i = 250; i < n - 250; ++i) EXPECT_NEAR(y[i], x[i], 1e-6);
}

TEST_F(ButterworthTest, FiltfiltRemovesFastRipple) {
    auto sos = design_butterworth_lowpass(8, 3.0, 96.0);
    const Eigen::Index n = 960;
    Vector x(n);
    for (Eigen::Index i = 0; i < n; ++i)
        x[i] = 80.0 + std::sin(2.0 * kPi * 24.0 * static_cast<double>(i) / 96.0 + 0.3);

    Vector y = filtfilt(sos, x);
    for (Eigen::Index i = 250; i < n - 250; ++i) EXPECT_NEAR(y[i], 80.0, 1e-3);
}

TEST_F(ButterworthTest, FiltfiltOfSingleSampleIsIdentity) {
    auto sos = design_butterworth_lowpass(8, 3.0, 96.0);
    Vector x = Vector::Constant(1, 3.0);
    EXPECT_DOUBLE_EQ(filtfilt(sos, x)[0], 3.0);
}

} // namespace linecraft_test
