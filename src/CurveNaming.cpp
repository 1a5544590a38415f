#include "linecraft/CurveNaming.hpp"
#include <algorithm>
#include <utility>

namespace linecraft {

std::string longest_common_substring(const std::string& a, const std::string& b)
{
    /* run[j] = length of the common run ending at a[i-1], b[j-1] */
    std::vector<std::size_t> prev(b.size() + 1, 0);
    std::vector<std::size_t> run (b.size() + 1, 0);

    std::size_t best_len = 0;
    std::size_t best_end = 0;   // one past the match in a
    for (std::size_t i = 1; i <= a.size(); ++i) {
        for (std::size_t j = 1; j <= b.size(); ++j) {
            run[j] = (a[i - 1] == b[j - 1]) ? prev[j - 1] + 1 : 0;
            if (run[j] > best_len) {
                best_len = run[j];
                best_end = i;
            }
        }
        std::swap(prev, run);
    }
    return a.substr(best_end - best_len, best_len);
}

std::string representative_name(const std::vector<std::string>& names)
{
    if (names.empty())     return "";
    if (names.size() == 1) return names.front();

    std::vector<std::pair<std::string, int>> counts;   // insertion ordered
    for (std::size_t i = 0; i < names.size(); ++i) {
        for (std::size_t j = i + 1; j < names.size(); ++j) {
            std::string match = longest_common_substring(names[i], names[j]);
            auto it = std::find_if(counts.begin(), counts.end(),
                                   [&](const auto& c) { return c.first == match; });
            if (it == counts.end()) counts.emplace_back(std::move(match), 1);
            else                    ++it->second;
        }
    }

    auto best = counts.begin();
    for (auto it = counts.begin(); it != counts.end(); ++it)
        if (it->second > best->second) best = it;

    const std::string& s = best->first;
    const auto first = s.find_first_not_of(" -");
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(" -");
    return s.substr(first, last - first + 1);
}

} // namespace linecraft
