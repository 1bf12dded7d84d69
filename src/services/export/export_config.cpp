#include "services/export/export_config.hpp"

#include "core/vector_math.hpp"

namespace screw_planner::services {

bool ExportConfig::isValid() const {
    if (frameOfReferenceUID && frameOfReferenceUID->empty()) {
        return false;
    }
    return cameraDistance > 0.0 &&
           parallelScale > 0.0 &&
           bodyCenterMargin >= 0.0 &&
           capOffset >= 0.0 &&
           core::math::normalized(referenceAxis).has_value() &&
           !volumeId.empty() &&
           !renderingEngineId.empty() &&
           !viewportType.empty() &&
           !snapshotFileName.empty() &&
           !transformationFileName.empty();
}

std::string ExportConfig::resolvedFrameOfReferenceUID() const {
    return frameOfReferenceUID.value_or(PLACEHOLDER_FRAME_OF_REFERENCE_UID);
}

bool ExportConfig::usesPlaceholderFrameOfReference() const {
    return !frameOfReferenceUID.has_value();
}

alignment::AlignmentOptions ExportConfig::alignmentOptions() const {
    alignment::AlignmentOptions options;
    options.referenceAxis = referenceAxis;
    options.bodyCenterMargin = bodyCenterMargin;
    options.capOffset = capOffset;
    return options;
}

viewport::ViewportSettings ExportConfig::viewportSettings() const {
    viewport::ViewportSettings settings;
    settings.cameraDistance = cameraDistance;
    settings.parallelScale = parallelScale;
    settings.renderingEngineId = renderingEngineId;
    settings.viewportType = viewportType;
    return settings;
}

}  // namespace screw_planner::services
