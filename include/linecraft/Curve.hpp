#pragma once
#include "Types.hpp"
#include <map>
#include <string>
#include <vector>

namespace linecraft {

/*
 * Validated frequency response.
 *
 * The frequency/amplitude pair is fixed at construction: frequencies are
 * finite, > 0 and strictly ascending, amplitudes are finite dB values of
 * the same length (>= 1).  The pair can only be exchanged as a whole via
 * replace_pair().  Naming is independent of the numeric content.
 */
class Curve {
public:
    // throws CurveError when the pair violates the invariants above
    Curve(Vector frequencies, Vector amplitudes);

    const Vector& frequencies() const { return freqs_; }
    const Vector& amplitudes()  const { return amps_; }
    Eigen::Index  size()        const { return freqs_.size(); }

    Real min_frequency() const { return freqs_[0]; }
    Real max_frequency() const { return freqs_[freqs_.size() - 1]; }

    // whole-pair replacement, names are kept
    void replace_pair(const Curve& source);

    /* ---- naming -------------------------------------------------- */
    void set_name_prefix(const std::string& prefix) { prefix_ = prefix; }
    void set_name_base(const std::string& base)     { base_ = base; }
    void add_name_suffix(const std::string& suffix);
    bool remove_name_suffix(const std::string& suffix);
    void clear_name_suffixes() { suffixes_.clear(); }

    // base name and suffixes of `other`, prefix untouched
    void copy_name_from(const Curve& other);

    const std::string&              name_prefix()   const { return prefix_; }
    const std::string&              name_base()     const { return base_; }
    const std::vector<std::string>& name_suffixes() const { return suffixes_; }

    std::string base_name_and_suffixes() const;
    std::string full_name() const;

private:
    Vector                   freqs_;
    Vector                   amps_;
    std::string              prefix_;
    std::string              base_;
    std::vector<std::string> suffixes_;
};

// curves keyed by an identifier chosen by the caller
using CurveSet = std::map<CurveId, Curve>;

} // namespace linecraft
