/**
 * @file implant_diff.hpp
 * @brief Change detection between two immutable implant snapshots
 * @details Callers keep the previous state themselves and ask which implants
 *          changed, instead of the pipeline caching per-implant state.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "services/alignment/rigid_alignment.hpp"

#include <map>
#include <set>
#include <string>
#include <vector>

namespace screw_planner::services::alignment {

/**
 * @brief Device dimensions of one implant
 */
struct ImplantProperties {
    double radius = 0.0;
    double length = 0.0;

    [[nodiscard]] bool operator==(const ImplantProperties& other) const = default;
};

/// Implant name -> dimensions
using ImplantPropertyMap = std::map<std::string, ImplantProperties>;

/**
 * @brief Names whose dimensions differ between @p before and @p after
 *
 * Names present on only one side count as changed.
 */
[[nodiscard]] std::set<std::string> diffImplantProperties(
    const ImplantPropertyMap& before, const ImplantPropertyMap& after);

/**
 * @brief Names whose control points or dimensions differ
 *
 * Implants are matched by name; if a name repeats, the last placement wins.
 * Points are compared after conversion to a common coordinate system.
 */
[[nodiscard]] std::set<std::string> diffPlacements(
    const std::vector<ImplantPlacement>& before,
    const std::vector<ImplantPlacement>& after);

}  // namespace screw_planner::services::alignment
