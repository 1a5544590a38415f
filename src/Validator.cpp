#include "linecraft/Validator.hpp"
#include "linecraft/CurveError.hpp"
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace linecraft {

void check_frequency_axis(const Vector& f)
{
    if (f.size() < 1)
        throw CurveError(ErrorKind::InsufficientData,
                         "check_frequency_axis(): curve has no points");

    for (Eigen::Index i = 0; i < f.size(); ++i) {
        if (!std::isfinite(f[i])) {
            std::ostringstream msg;
            msg << "check_frequency_axis(): frequency #" << i << " is not finite";
            throw CurveError(ErrorKind::InvalidAxis, msg.str());
        }
        if (f[i] <= 0.0) {
            std::ostringstream msg;
            msg << "check_frequency_axis(): frequency " << f[i]
                << " at #" << i << " is not positive";
            throw CurveError(ErrorKind::InvalidAxis, msg.str());
        }
        if (i > 0 && f[i] <= f[i - 1]) {
            std::ostringstream msg;
            msg << "check_frequency_axis(): frequency " << f[i] << " at #" << i
                << (f[i] == f[i - 1] ? " is a duplicate" : " is not ascending");
            throw CurveError(ErrorKind::InvalidAxis, msg.str());
        }
    }
}

void check_pair(const Vector& f, const Vector& a)
{
    if (f.size() != a.size()) {
        std::ostringstream msg;
        msg << "check_pair(): " << f.size() << " frequencies but "
            << a.size() << " amplitudes";
        throw CurveError(ErrorKind::ShapeMismatch, msg.str());
    }
    check_frequency_axis(f);

    if (!a.allFinite())
        throw CurveError(ErrorKind::NonNumeric,
                         "check_pair(): amplitudes contain NaN/Inf");
}

Curve make_curve(const std::vector<std::pair<Real, Real>>& points)
{
    Vector f(points.size());
    Vector a(points.size());
    for (std::size_t i = 0; i < points.size(); ++i) {
        f[i] = points[i].first;
        a[i] = points[i].second;
    }
    return Curve(std::move(f), std::move(a));
}

Curve make_curve(const std::vector<Real>& frequencies,
                 const std::vector<Real>& amplitudes)
{
    Vector f = Eigen::Map<const Vector>(frequencies.data(), frequencies.size());
    Vector a = Eigen::Map<const Vector>(amplitudes.data(), amplitudes.size());
    return Curve(std::move(f), std::move(a));
}

Real parse_real(const std::string& token)
{
    std::size_t used = 0;
    Real value = 0.0;
    try {
        value = std::stod(token, &used);
    } catch (const std::invalid_argument&) {
        throw CurveError(ErrorKind::NonNumeric,
                         "parse_real(): '" + token + "' is not a number");
    } catch (const std::out_of_range&) {
        throw CurveError(ErrorKind::NonNumeric,
                         "parse_real(): '" + token + "' is out of range");
    }

    /* only blanks may follow the number */
    for (; used < token.size(); ++used) {
        if (!std::isspace(static_cast<unsigned char>(token[used])))
            throw CurveError(ErrorKind::NonNumeric,
                             "parse_real(): '" + token + "' is not a number");
    }
    if (!std::isfinite(value))
        throw CurveError(ErrorKind::NonNumeric,
                         "parse_real(): '" + token + "' is not finite");
    return value;
}

Curve make_curve_from_text(const std::vector<std::string>& frequencies,
                           const std::vector<std::string>& amplitudes)
{
    if (frequencies.size() != amplitudes.size()) {
        std::ostringstream msg;
        msg << "make_curve_from_text(): " << frequencies.size() << " frequency cells but "
            << amplitudes.size() << " amplitude cells";
        throw CurveError(ErrorKind::ShapeMismatch, msg.str());
    }

    Vector f(frequencies.size());
    Vector a(amplitudes.size());
    for (std::size_t i = 0; i < frequencies.size(); ++i) {
        f[i] = parse_real(frequencies[i]);
        a[i] = parse_real(amplitudes[i]);
    }
    return Curve(std::move(f), std::move(a));
}

} // namespace linecraft
