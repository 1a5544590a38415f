#include "linecraft/CurveError.hpp"

namespace linecraft {

std::string to_string(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::InvalidAxis:          return "InvalidAxis";
    case ErrorKind::ShapeMismatch:        return "ShapeMismatch";
    case ErrorKind::NonNumeric:           return "NonNumeric";
    case ErrorKind::InsufficientData:     return "InsufficientData";
    case ErrorKind::InvalidResolution:    return "InvalidResolution";
    case ErrorKind::UnsupportedAlgorithm: return "UnsupportedAlgorithm";
    case ErrorKind::InsufficientCurves:   return "InsufficientCurves";
    case ErrorKind::InvalidParameter:     return "InvalidParameter";
    }
    return "Unknown";
}

CurveError::CurveError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

} // namespace linecraft
