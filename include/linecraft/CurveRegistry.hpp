#pragma once
#include "Types.hpp"
#include "Curve.hpp"
#include <map>
#include <optional>
#include <vector>

namespace linecraft {

/*
 * Owner of the curve collection: ids are handed out once and never
 * reused, display order and visibility are kept beside the curves, and
 * at most one curve is the reference at any time.
 *
 * Unknown ids raise CurveError(InvalidParameter) before anything changes.
 */
class CurveRegistry {
public:
    static constexpr const char* REFERENCE_SUFFIX = "reference";

    CurveId add(Curve curve, bool visible = true);
    CurveId insert(std::size_t position, Curve curve, bool visible = true);
    void    remove(const std::vector<CurveId>& ids);

    // display position of `id` becomes min(position, size() − 1)
    void    move(CurveId id, std::size_t position);

    bool         contains(CurveId id) const;
    const Curve& get(CurveId id) const;
    Curve&       get(CurveId id);
    std::size_t  size() const { return order_.size(); }
    std::size_t  position_of(CurveId id) const;

    const std::vector<CurveId>& ids() const { return order_; }   // display order
    std::vector<CurveId>        visible_ids() const;

    bool is_visible(CurveId id) const;
    void set_visible(const std::vector<CurveId>& ids, bool visible);

    /* a previous reference is released (and its suffix removed) first */
    void set_reference(CurveId id);
    void clear_reference();
    std::optional<CurveId> reference() const { return reference_; }
    bool is_reference(CurveId id) const { return reference_ == id; }

    // copies of the requested curves keyed by id
    CurveSet select(const std::vector<CurveId>& ids) const;

    // "#1", "#2", … following the display order
    void reset_prefixes();

private:
    struct Entry {
        Curve curve;
        bool  visible = true;
    };

    const Entry& entry(CurveId id) const;
    Entry&       entry(CurveId id);
    void         require_all(const std::vector<CurveId>& ids) const;

    std::map<CurveId, Entry> entries_;
    std::vector<CurveId>     order_;
    std::optional<CurveId>   reference_;
    CurveId                  next_id_ = 0;
};

} // namespace linecraft
