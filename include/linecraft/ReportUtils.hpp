#pragma once
#include "CurveRegistry.hpp"
#include "SimilarityScorer.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace linecraft {

/* --------------------------------------------------------------------- */
/*               best-fit ranking as plain text / JSON                   */
/* --------------------------------------------------------------------- */

/*
 * -- Standard deviation of weighted residual error (Swr) --
 * Reference: #2    Amount of frequency points: 97
 *
 * Item name          Swr
 * -----------  ---------
 * #2 - foo             0
 * ...
 */
std::string    format_best_fit_table(const BestFitReport& report);
nlohmann::json best_fit_to_json(const BestFitReport& report);

/* --------------------------------------------------------------------- */
/*                      curve collection snapshot                        */
/* --------------------------------------------------------------------- */
nlohmann::json registry_to_json(const CurveRegistry& registry);

// pretty printed, "-" writes to stdout
void write_json(const std::string& path, const nlohmann::json& j);

} // namespace linecraft
