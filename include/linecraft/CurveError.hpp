#pragma once
#include <stdexcept>
#include <string>

namespace linecraft {

enum class ErrorKind {
    InvalidAxis,
    ShapeMismatch,
    NonNumeric,
    InsufficientData,
    InvalidResolution,
    UnsupportedAlgorithm,
    InsufficientCurves,
    InvalidParameter
};

std::string to_string(ErrorKind kind);

/*
 * Every failure of the analysis engine is reported as a CurveError.
 * what() carries the human-readable cause, kind() the category the
 * caller can branch on.
 */
class CurveError : public std::runtime_error {
public:
    CurveError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace linecraft
