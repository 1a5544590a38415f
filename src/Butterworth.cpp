#include "linecraft/Butterworth.hpp"
#include "linecraft/CurveError.hpp"
#include <algorithm>
#include <boost/math/constants/constants.hpp>
#include <cmath>
#include <sstream>

namespace linecraft {

namespace {

using boost::math::double_constants::pi;

struct SectionState {
    Real z1 = 0.0;
    Real z2 = 0.0;
};

/* state every section settles into for a constant input `level` */
std::vector<SectionState> steady_state(const std::vector<SecondOrderSection>& sos,
                                       Real level)
{
    std::vector<SectionState> zi(sos.size());
    Real u = level;
    for (std::size_t s = 0; s < sos.size(); ++s) {
        const auto& c = sos[s];
        const Real dc = (c.b0 + c.b1 + c.b2) / (1.0 + c.a1 + c.a2);
        const Real y  = dc * u;
        zi[s].z2 = c.b2 * u - c.a2 * y;
        zi[s].z1 = c.b1 * u - c.a1 * y + zi[s].z2;
        u = y;
    }
    return zi;
}

void run_cascade(const std::vector<SecondOrderSection>& sos,
                 std::vector<SectionState>               state,
                 std::vector<Real>&                      data)
{
    for (std::size_t s = 0; s < sos.size(); ++s) {
        const auto& c = sos[s];
        Real z1 = state[s].z1;
        Real z2 = state[s].z2;
        for (auto& v : data) {
            const Real x = v;
            const Real y = c.b0 * x + z1;
            z1 = c.b1 * x - c.a1 * y + z2;
            z2 = c.b2 * x - c.a2 * y;
            v  = y;
        }
    }
}

} // anonymous namespace

std::vector<SecondOrderSection>
design_butterworth_lowpass(int order, Real cutoff, Real sample_rate)
{
    if (order < 1) {
        std::ostringstream msg;
        msg << "design_butterworth_lowpass(): order must be >= 1, got " << order;
        throw CurveError(ErrorKind::InvalidParameter, msg.str());
    }
    if (!(sample_rate > 0.0))
        throw CurveError(ErrorKind::InvalidParameter,
                         "design_butterworth_lowpass(): sample rate must be > 0");
    if (!(cutoff > 0.0) || !(cutoff < 0.5 * sample_rate)) {
        std::ostringstream msg;
        msg << "design_butterworth_lowpass(): cutoff " << cutoff
            << " is outside (0, " << 0.5 * sample_rate << ")";
        throw CurveError(ErrorKind::InvalidResolution, msg.str());
    }

    const Real omega    = 2.0 * pi * cutoff / sample_rate;
    const Real cosOmega = std::cos(omega);
    const Real sinOmega = std::sin(omega);

    std::vector<SecondOrderSection> sos;

    /* analog poles  s_k = exp(j·π(2k + N + 1) / 2N); one biquad per
     * upper-half-plane pole, Q = 1 / (2·cos φ) with φ its angle to the
     * negative real axis                                                */
    for (int k = 0; k < order; ++k) {
        const Real theta = pi * (2.0 * k + order + 1.0) / (2.0 * order);
        if (std::sin(theta) <= 1e-12) continue;

        const Real Q     = 1.0 / (2.0 * -std::cos(theta));
        const Real alpha = sinOmega / (2.0 * Q);
        const Real a0    = 1.0 + alpha;

        SecondOrderSection c;
        c.b0 = (1.0 - cosOmega) / 2.0 / a0;
        c.b1 = (1.0 - cosOmega) / a0;
        c.b2 = (1.0 - cosOmega) / 2.0 / a0;
        c.a1 = -2.0 * cosOmega / a0;
        c.a2 = (1.0 - alpha) / a0;
        sos.push_back(c);
    }

    /* the real pole of odd orders */
    if (order % 2 == 1) {
        const Real K = std::tan(omega / 2.0);
        SecondOrderSection c;
        c.b0 = K / (1.0 + K);
        c.b1 = c.b0;
        c.b2 = 0.0;
        c.a1 = (K - 1.0) / (K + 1.0);
        c.a2 = 0.0;
        sos.push_back(c);
    }
    return sos;
}

Vector filtfilt(const std::vector<SecondOrderSection>& sos, const Vector& x)
{
    const Eigen::Index n = x.size();
    if (n < 2 || sos.empty()) return x;

    /* ---- padding length ------------------------------------------ */
    const auto zero_b2 = std::count_if(sos.begin(), sos.end(),
                                       [](const SecondOrderSection& c) { return c.b2 == 0.0; });
    const auto zero_a2 = std::count_if(sos.begin(), sos.end(),
                                       [](const SecondOrderSection& c) { return c.a2 == 0.0; });
    const Eigen::Index ntaps = 2 * static_cast<Eigen::Index>(sos.size()) + 1
                             - std::min(zero_b2, zero_a2);
    const Eigen::Index pad   = std::min<Eigen::Index>(3 * ntaps, n - 1);

    /* ---- odd extension: 2·x[0] − x[pad…1]  |  x  |  2·x[n−1] − x[n−2…] */
    std::vector<Real> ext;
    ext.reserve(n + 2 * pad);
    for (Eigen::Index i = pad; i >= 1; --i) ext.push_back(2.0 * x[0] - x[i]);
    for (Eigen::Index i = 0; i < n; ++i)    ext.push_back(x[i]);
    for (Eigen::Index i = n - 2; i >= n - 1 - pad; --i)
        ext.push_back(2.0 * x[n - 1] - x[i]);

    /* ---- forward ------------------------------------------------- */
    run_cascade(sos, steady_state(sos, ext.front()), ext);

    /* ---- backward ------------------------------------------------ */
    std::reverse(ext.begin(), ext.end());
    run_cascade(sos, steady_state(sos, ext.front()), ext);
    std::reverse(ext.begin(), ext.end());

    Vector out(n);
    for (Eigen::Index i = 0; i < n; ++i) out[i] = ext[pad + i];
    return out;
}

} // namespace linecraft
