#include "linecraft/Smoothing.hpp"
#include "linecraft/Butterworth.hpp"
#include "linecraft/CurveError.hpp"
#include "linecraft/Resampler.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <vector>


namespace linecraft {

namespace {
constexpr Real KERNEL_RADIUS = 5.0;   // in σ
constexpr Real OCTAVE_SLACK  = 1e-9;

void check_bandwidth(Real bandwidth, const char* caller)
{
    if (!(bandwidth > 0.0) || !std::isfinite(bandwidth)) {
        std::ostringstream msg;
        msg << caller << "(): bandwidth must be finite and > 0, got " << bandwidth;
        throw CurveError(ErrorKind::InvalidParameter, msg.str());
    }
}

void check_resolution(int resolution, const char* caller)
{
    if (resolution <= 0) {
        std::ostringstream msg;
        msg << caller << "(): resolution must be > 0 ppo, got " << resolution;
        throw CurveError(ErrorKind::InvalidResolution, msg.str());
    }
}

Vector log2_of(const Vector& f)
{
    Vector out(f.size());
    for (Eigen::Index i = 0; i < f.size(); ++i) out[i] = std::log2(f[i]);
    return out;
}

} // anonymous namespace

SmoothingKind smoothing_kind_from_index(int index)
{
    switch (index) {
    case 0: return SmoothingKind::ButterworthOrder8;
    case 1: return SmoothingKind::ButterworthOrder4;
    case 2: return SmoothingKind::Rectangular;
    case 3: return SmoothingKind::Gaussian;
    default: break;
    }
    std::ostringstream msg;
    msg << "smoothing_kind_from_index(): smoothing type " << index
        << " is not available";
    throw CurveError(ErrorKind::UnsupportedAlgorithm, msg.str());
}

SmoothingKind smoothing_kind_from_string(const std::string& name)
{
    for (auto kind : {SmoothingKind::ButterworthOrder8, SmoothingKind::ButterworthOrder4,
                      SmoothingKind::Rectangular, SmoothingKind::Gaussian}) {
        if (to_string(kind) == name) return kind;
    }
    throw CurveError(ErrorKind::UnsupportedAlgorithm,
                     "smoothing_kind_from_string(): unknown smoothing type '" + name + "'");
}

std::string to_string(SmoothingKind kind)
{
    switch (kind) {
    case SmoothingKind::ButterworthOrder8: return "butterworth8";
    case SmoothingKind::ButterworthOrder4: return "butterworth4";
    case SmoothingKind::Rectangular:       return "rectangular";
    case SmoothingKind::Gaussian:          return "gaussian";
    }
    return "unknown";
}

Curve smooth_curve(const Curve& curve, const SmoothingParams& p)
{
    switch (p.kind) {
    case SmoothingKind::ButterworthOrder8:
        return smooth_butterworth(curve, p.bandwidth, p.resolution, 8, p.pinned_frequency);
    case SmoothingKind::ButterworthOrder4:
        return smooth_butterworth(curve, p.bandwidth, p.resolution, 4, p.pinned_frequency);
    case SmoothingKind::Rectangular:
        return smooth_rectangular(curve, p.bandwidth);
    case SmoothingKind::Gaussian:
        return smooth_gaussian(curve, p.bandwidth, p.resolution, p.pinned_frequency);
    }
    throw CurveError(ErrorKind::UnsupportedAlgorithm,
                     "smooth_curve(): this smoothing type is not available");
}

/* ------------------------------------------------------------------ */
Curve smooth_butterworth(const Curve& curve,
                         Real         bandwidth,
                         int          resolution,
                         int          order,
                         Real         pinned_frequency)
{
    check_bandwidth(bandwidth, "smooth_butterworth");
    check_resolution(resolution, "smooth_butterworth");

    const Curve resampled = resample_to_grid(curve, resolution, pinned_frequency);

    /* the log-spaced grid is a signal sampled at `resolution` per octave */
    const Real cutoff = 1.0 / (2.0 * bandwidth);
    const auto sos    = design_butterworth_lowpass(order, cutoff,
                                                   static_cast<Real>(resolution));

    return Curve(resampled.frequencies(), filtfilt(sos, resampled.amplitudes()));
}

/* ------------------------------------------------------------------ */
Curve smooth_rectangular(const Curve& curve, Real bandwidth)
{
    check_bandwidth(bandwidth, "smooth_rectangular");

    const Vector& amp  = curve.amplitudes();
    const Vector  oct  = log2_of(curve.frequencies());
    const Real    half = 0.5 * bandwidth + OCTAVE_SLACK;
    const Eigen::Index n = oct.size();

    Vector out(n);
    Eigen::Index lo = 0;
    Eigen::Index hi = 0;   // one past the window
    for (Eigen::Index i = 0; i < n; ++i) {
        while (oct[lo] < oct[i] - half) ++lo;
        while (hi < n && oct[hi] <= oct[i] + half) ++hi;

        Real sum = 0.0;
        for (Eigen::Index j = lo; j < hi; ++j) sum += amp[j];
        out[i] = sum / static_cast<Real>(hi - lo);
    }
    return Curve(curve.frequencies(), std::move(out));
}

/* ------------------------------------------------------------------ */
Curve smooth_gaussian(const Curve& curve,
                      Real         bandwidth,
                      int          resolution,
                      Real         pinned_frequency)
{
    check_bandwidth(bandwidth, "smooth_gaussian");
    check_resolution(resolution, "smooth_gaussian");

    const Curve   resampled = resample_to_grid(curve, resolution, pinned_frequency);
    const Vector  oct   = log2_of(resampled.frequencies());
    const Vector& amp   = resampled.amplitudes();
    const std::size_t n = static_cast<std::size_t>(oct.size());

    const Real sigma  = 0.5 * bandwidth;
    const Real inv2s2 = 1.0 / (2.0 * sigma * sigma);
    const Real reach  = KERNEL_RADIUS * sigma;

    const double* octData = oct.data();
    Vector out(oct.size());

    #pragma omp parallel for schedule(static)
    for (std::ptrdiff_t i = 0; i < static_cast<std::ptrdiff_t>(n); ++i)
    {
        const Real x_i = octData[i];
        const std::size_t jStart = std::lower_bound(octData, octData + n, x_i - reach) - octData;
        const std::size_t jEnd   = std::upper_bound(octData + jStart, octData + n, x_i + reach) - octData;

        Real wSum = 0.0;
        Real sum  = 0.0;
        for (std::size_t j = jStart; j < jEnd; ++j) {
            const Real delta = octData[j] - x_i;
            const Real w     = std::exp(-delta * delta * inv2s2);
            sum  += w * amp[j];
            wSum += w;
        }
        out[i] = sum / wSum;
    }

    return Curve(resampled.frequencies(), std::move(out));
}

} // namespace linecraft
