#pragma once
#include <string>
#include <vector>

namespace linecraft {

/*
 * Name that best represents a group of curves: the longest common
 * substring of every pair of names is counted, the most frequent one
 * wins (first seen on ties) and is trimmed of blanks and dashes.
 * A single name is returned as it is, no names give "".
 */
std::string representative_name(const std::vector<std::string>& names);

// longest common substring, earliest in `a` on ties
std::string longest_common_substring(const std::string& a, const std::string& b);

} // namespace linecraft
