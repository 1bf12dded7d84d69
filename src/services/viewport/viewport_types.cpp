#include "services/viewport/viewport_types.hpp"

namespace screw_planner::services::viewport {

std::string toString(ViewportId id) {
    switch (id) {
        case ViewportId::Axial: return "mpr-axial";
        case ViewportId::Sagittal: return "mpr-sagittal";
        case ViewportId::Coronal: return "mpr-coronal";
    }
    return "mpr-unknown";
}

std::optional<ViewportId> viewportIdFromString(const std::string& str) {
    for (auto id : kViewportOrder) {
        if (toString(id) == str) {
            return id;
        }
    }
    return std::nullopt;
}

}  // namespace screw_planner::services::viewport
