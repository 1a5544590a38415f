#include "linecraft/Curve.hpp"
#include "linecraft/Validator.hpp"
#include <algorithm>
#include <utility>

namespace linecraft {

namespace {

std::string join_names(const std::vector<std::string>& parts)
{
    std::string out;
    for (const auto& p : parts) {
        if (p.empty()) continue;
        if (!out.empty()) out += " - ";
        out += p;
    }
    return out;
}

} // anonymous namespace

Curve::Curve(Vector frequencies, Vector amplitudes)
{
    check_pair(frequencies, amplitudes);
    freqs_ = std::move(frequencies);
    amps_  = std::move(amplitudes);
}

void Curve::replace_pair(const Curve& source)
{
    freqs_ = source.freqs_;
    amps_  = source.amps_;
}

void Curve::add_name_suffix(const std::string& suffix)
{
    suffixes_.push_back(suffix);
}

bool Curve::remove_name_suffix(const std::string& suffix)
{
    auto it = std::find(suffixes_.begin(), suffixes_.end(), suffix);
    if (it == suffixes_.end()) return false;
    suffixes_.erase(it);
    return true;
}

void Curve::copy_name_from(const Curve& other)
{
    base_     = other.base_;
    suffixes_ = other.suffixes_;
}

std::string Curve::base_name_and_suffixes() const
{
    std::vector<std::string> parts{base_};
    parts.insert(parts.end(), suffixes_.begin(), suffixes_.end());
    return join_names(parts);
}

std::string Curve::full_name() const
{
    std::vector<std::string> parts{prefix_, base_};
    parts.insert(parts.end(), suffixes_.begin(), suffixes_.end());
    return join_names(parts);
}

} // namespace linecraft
