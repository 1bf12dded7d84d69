#include "services/viewport/viewport_synthesizer.hpp"

#include "core/logging.hpp"
#include "core/vector_math.hpp"
#include "services/coordinate/coordinate_conventions.hpp"

#include <utility>

namespace screw_planner::services::viewport {

namespace {
auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("ViewportSynthesizer");
    return logger;
}

struct PlaneAxes {
    int viewUpColumn;
    int normalColumn;
    int voxelAxis;   ///< 0 = I, 1 = J, 2 = K
};

PlaneAxes axesFor(ViewportId id) {
    switch (id) {
        case ViewportId::Axial: return {1, 0, 2};
        case ViewportId::Sagittal: return {0, 2, 0};
        case ViewportId::Coronal: return {0, 1, 1};
    }
    return {1, 0, 2};
}
}  // namespace

using core::GeometryError;
using core::Vector3;
using coordinate::CoordinateConventions;

ViewportSynthesizer::ViewportSynthesizer(ViewportSettings settings,
                                         coordinate::RoundingMode rounding)
    : settings_(std::move(settings)), indexer_(rounding) {}

std::expected<Vector3, GeometryError> ViewportSynthesizer::inPlaneVector2(
    const Vector3& viewUp, const Vector3& viewPlaneNormal) {

    auto v = core::math::normalized(core::math::cross(viewUp, viewPlaneNormal));
    if (!v) {
        return std::unexpected(GeometryError{
            GeometryError::Code::DegenerateGeometry,
            "viewUp is parallel to viewPlaneNormal"
        });
    }
    return *v;
}

std::expected<ViewportDescriptor, GeometryError> ViewportSynthesizer::buildViewport(
    ViewportId id,
    const core::AffineTransform& pose,
    const coordinate::VolumeGeometry& volume) const {

    auto poseLps = CoordinateConventions::toLps(pose);
    auto voxel = indexer_.sliceIndices(poseLps.translation(), volume.ijkToRas);
    if (!voxel) {
        getLogger()->error("Slice index lookup failed for {}: {}",
                           toString(id), voxel.error().toString());
        return std::unexpected(voxel.error());
    }
    return assemble(id, poseLps, *voxel, volume);
}

std::expected<ViewportSet, GeometryError> ViewportSynthesizer::buildViewports(
    const core::AffineTransform& pose,
    const coordinate::VolumeGeometry& volume) const {

    auto poseLps = CoordinateConventions::toLps(pose);

    // The focal point is shared, so the slice indices are solved once
    auto voxel = indexer_.sliceIndices(poseLps.translation(), volume.ijkToRas);
    if (!voxel) {
        getLogger()->error("Slice index lookup failed: {}", voxel.error().toString());
        return std::unexpected(voxel.error());
    }

    ViewportSet viewports;
    for (size_t n = 0; n < kViewportOrder.size(); ++n) {
        auto descriptor = assemble(kViewportOrder[n], poseLps, *voxel, volume);
        if (!descriptor) {
            return std::unexpected(descriptor.error());
        }
        viewports[n] = std::move(*descriptor);
    }
    return viewports;
}

std::expected<ViewportDescriptor, GeometryError> ViewportSynthesizer::assemble(
    ViewportId id,
    const core::AffineTransform& poseLps,
    const coordinate::VoxelIndex& voxel,
    const coordinate::VolumeGeometry& volume) const {

    const auto axes = axesFor(id);
    const Vector3 focalPoint = poseLps.translation().value;
    const Vector3 viewUp = poseLps.column(axes.viewUpColumn);
    const Vector3 normal = poseLps.column(axes.normalColumn);

    auto vec2 = inPlaneVector2(viewUp, normal);
    if (!vec2) {
        getLogger()->error("Cannot build {}: {}", toString(id), vec2.error().message);
        return std::unexpected(vec2.error());
    }

    ViewportDescriptor d;
    d.id = id;
    d.frameOfReferenceUID = volume.frameOfReferenceUID;

    d.viewUp = viewUp;
    d.viewPlaneNormal = normal;
    d.focalPoint = focalPoint;
    d.position = core::math::add(focalPoint, core::math::scale(normal, settings_.cameraDistance));
    d.parallelScale = settings_.parallelScale;

    d.sliceIndex = voxel.toArray()[static_cast<size_t>(axes.voxelAxis)];
    d.planeRestriction.frameOfReferenceUID = volume.frameOfReferenceUID;
    d.planeRestriction.point = focalPoint;
    d.planeRestriction.inPlaneVector1 = viewUp;
    d.planeRestriction.inPlaneVector2 = *vec2;
    d.volumeId = volume.volumeId;

    d.viewportType = settings_.viewportType;
    d.renderingEngineId = settings_.renderingEngineId;

    getLogger()->debug("{}: slice {}, normal ({:.4f}, {:.4f}, {:.4f})",
                       toString(id), d.sliceIndex, normal[0], normal[1], normal[2]);
    return d;
}

}  // namespace screw_planner::services::viewport
