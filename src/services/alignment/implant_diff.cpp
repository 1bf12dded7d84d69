#include "services/alignment/implant_diff.hpp"

#include "services/coordinate/coordinate_conventions.hpp"

#include <utility>

namespace screw_planner::services::alignment {

namespace {

template <typename Map>
std::set<std::string> changedKeys(const Map& before, const Map& after) {
    std::set<std::string> changed;
    for (const auto& [name, value] : before) {
        auto it = after.find(name);
        if (it == after.end() || !(it->second == value)) {
            changed.insert(name);
        }
    }
    for (const auto& [name, value] : after) {
        if (!before.contains(name)) {
            changed.insert(name);
        }
    }
    return changed;
}

std::map<std::string, ImplantPlacement> byName(const std::vector<ImplantPlacement>& placements) {
    std::map<std::string, ImplantPlacement> result;
    for (const auto& placement : placements) {
        ImplantPlacement normalized = placement;
        normalized.entryPoint = coordinate::CoordinateConventions::toRas(placement.entryPoint);
        normalized.tipPoint = coordinate::CoordinateConventions::toRas(placement.tipPoint);
        result.insert_or_assign(placement.name, std::move(normalized));
    }
    return result;
}

}  // namespace

std::set<std::string> diffImplantProperties(
    const ImplantPropertyMap& before, const ImplantPropertyMap& after) {
    return changedKeys(before, after);
}

std::set<std::string> diffPlacements(
    const std::vector<ImplantPlacement>& before,
    const std::vector<ImplantPlacement>& after) {
    return changedKeys(byName(before), byName(after));
}

}  // namespace screw_planner::services::alignment
