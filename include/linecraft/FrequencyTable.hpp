#pragma once
#include "Types.hpp"
#include "Curve.hpp"
#include <map>
#include <optional>
#include <vector>

namespace linecraft {

/*
 * frequency → (curve id → amplitude or absent)
 *
 * The columns are the union of every frequency found in any curve.  A
 * cell is present only when that exact frequency is a sample of that
 * curve; nothing is interpolated.  A column holds only its present
 * cells, an id missing from it is an absent cell.
 */
class FrequencyTable {
public:
    using Column = std::map<CurveId, Real>;

    explicit FrequencyTable(const CurveSet& curves);

    const std::map<Real, Column>& columns() const { return columns_; }
    std::size_t column_count() const { return columns_.size(); }
    const std::vector<CurveId>& curve_ids() const { return ids_; }

    std::optional<Real> value(Real frequency, CurveId id) const;

    // present values of one column, ascending
    static std::vector<Real> present_values(const Column& column);

private:
    std::vector<CurveId>   ids_;
    std::map<Real, Column> columns_;
};

} // namespace linecraft
