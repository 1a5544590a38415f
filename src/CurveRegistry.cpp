#include "linecraft/CurveRegistry.hpp"
#include "linecraft/CurveError.hpp"
#include <algorithm>
#include <set>
#include <string>

namespace linecraft {

namespace {

[[noreturn]] void unknown_id(const char* caller, CurveId id)
{
    throw CurveError(ErrorKind::InvalidParameter,
                     std::string(caller) + "(): no curve with id " + std::to_string(id));
}

} // anonymous namespace

CurveId CurveRegistry::add(Curve curve, bool visible)
{
    return insert(order_.size(), std::move(curve), visible);
}

CurveId CurveRegistry::insert(std::size_t position, Curve curve, bool visible)
{
    const CurveId id = next_id_++;
    entries_.emplace(id, Entry{std::move(curve), visible});
    position = std::min(position, order_.size());
    order_.insert(order_.begin() + static_cast<std::ptrdiff_t>(position), id);
    return id;
}

void CurveRegistry::remove(const std::vector<CurveId>& ids)
{
    require_all(ids);
    const std::set<CurveId> gone(ids.begin(), ids.end());

    if (reference_ && gone.count(*reference_)) reference_.reset();
    for (auto id : gone) entries_.erase(id);
    order_.erase(std::remove_if(order_.begin(), order_.end(),
                                [&](CurveId id) { return gone.count(id) > 0; }),
                 order_.end());
}

void CurveRegistry::move(CurveId id, std::size_t position)
{
    const std::size_t from = position_of(id);
    order_.erase(order_.begin() + static_cast<std::ptrdiff_t>(from));
    position = std::min(position, order_.size());
    order_.insert(order_.begin() + static_cast<std::ptrdiff_t>(position), id);
}

bool CurveRegistry::contains(CurveId id) const
{
    return entries_.count(id) > 0;
}

const CurveRegistry::Entry& CurveRegistry::entry(CurveId id) const
{
    auto it = entries_.find(id);
    if (it == entries_.end()) unknown_id("CurveRegistry::entry", id);
    return it->second;
}

CurveRegistry::Entry& CurveRegistry::entry(CurveId id)
{
    auto it = entries_.find(id);
    if (it == entries_.end()) unknown_id("CurveRegistry::entry", id);
    return it->second;
}

void CurveRegistry::require_all(const std::vector<CurveId>& ids) const
{
    for (auto id : ids)
        if (!contains(id)) unknown_id("CurveRegistry", id);
}

const Curve& CurveRegistry::get(CurveId id) const { return entry(id).curve; }
Curve&       CurveRegistry::get(CurveId id)       { return entry(id).curve; }

std::size_t CurveRegistry::position_of(CurveId id) const
{
    auto it = std::find(order_.begin(), order_.end(), id);
    if (it == order_.end()) unknown_id("CurveRegistry::position_of", id);
    return static_cast<std::size_t>(it - order_.begin());
}

std::vector<CurveId> CurveRegistry::visible_ids() const
{
    std::vector<CurveId> out;
    for (auto id : order_)
        if (entries_.at(id).visible) out.push_back(id);
    return out;
}

bool CurveRegistry::is_visible(CurveId id) const
{
    return entry(id).visible;
}

void CurveRegistry::set_visible(const std::vector<CurveId>& ids, bool visible)
{
    require_all(ids);
    for (auto id : ids) entries_.at(id).visible = visible;
}

void CurveRegistry::set_reference(CurveId id)
{
    Entry& e = entry(id);
    if (reference_ == id) return;

    clear_reference();
    e.curve.add_name_suffix(REFERENCE_SUFFIX);
    reference_ = id;
}

void CurveRegistry::clear_reference()
{
    if (!reference_) return;
    entries_.at(*reference_).curve.remove_name_suffix(REFERENCE_SUFFIX);
    reference_.reset();
}

CurveSet CurveRegistry::select(const std::vector<CurveId>& ids) const
{
    require_all(ids);
    CurveSet out;
    for (auto id : ids) out.emplace(id, entries_.at(id).curve);
    return out;
}

void CurveRegistry::reset_prefixes()
{
    for (std::size_t i = 0; i < order_.size(); ++i)
        entries_.at(order_[i]).curve.set_name_prefix("#" + std::to_string(i + 1));
}

} // namespace linecraft
