#include "services/alignment/frame_reference.hpp"

#include "core/logging.hpp"
#include "core/vector_math.hpp"
#include "services/alignment/rigid_alignment.hpp"

#include <cmath>
#include <utility>

namespace screw_planner::services::alignment {

namespace {
auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("FrameReference");
    return logger;
}

bool hasOrthonormalColumns(const core::Matrix3& m, double tolerance) {
    for (int a = 0; a < 3; ++a) {
        for (int b = a; b < 3; ++b) {
            double expected = (a == b) ? 1.0 : 0.0;
            double actual = core::math::dot(core::math::column(m, a), core::math::column(m, b));
            if (std::abs(actual - expected) > tolerance) {
                return false;
            }
        }
    }
    return true;
}
}  // namespace

std::string toString(AnatomicalPlane plane) {
    switch (plane) {
        case AnatomicalPlane::Axial: return "axial";
        case AnatomicalPlane::Coronal: return "coronal";
        case AnatomicalPlane::Sagittal: return "sagittal";
    }
    return "unknown";
}

AnatomicalFrame AnatomicalFrame::standard() {
    AnatomicalFrame frame;
    frame.axial = {{{-1.0, 0.0, 0.0},
                    { 0.0, 1.0, 0.0},
                    { 0.0, 0.0, 1.0}}};
    frame.coronal = {{{-1.0, 0.0, 0.0},
                      { 0.0, 0.0, 1.0},
                      { 0.0, 1.0, 0.0}}};
    frame.sagittal = {{{ 0.0, 0.0, 1.0},
                       {-1.0, 0.0, 0.0},
                       { 0.0, 1.0, 0.0}}};
    return frame;
}

const core::Matrix3& AnatomicalFrame::matrix(AnatomicalPlane plane) const {
    switch (plane) {
        case AnatomicalPlane::Axial: return axial;
        case AnatomicalPlane::Coronal: return coronal;
        case AnatomicalPlane::Sagittal: return sagittal;
    }
    return axial;
}

core::Vector3 AnatomicalFrame::planeNormal(AnatomicalPlane plane) const {
    return core::math::column(matrix(plane), 2);
}

bool AnatomicalFrame::isOrthonormal(double tolerance) const {
    return hasOrthonormalColumns(axial, tolerance) &&
           hasOrthonormalColumns(coronal, tolerance) &&
           hasOrthonormalColumns(sagittal, tolerance);
}

FrameReference::FrameReference(AnatomicalFrame frame, AnatomicalPlane pivot)
    : frame_(std::move(frame)), pivot_(pivot) {
    if (!frame_.isOrthonormal()) {
        getLogger()->warn("Anatomical frame is not orthonormal; viewport roll is undefined");
    }
}

core::Vector3 FrameReference::planeNormal(AnatomicalPlane plane) const {
    return frame_.planeNormal(plane);
}

std::expected<core::Matrix3, core::GeometryError> FrameReference::correctionRotation(
    const core::Vector3& measuredDirection) const {
    return RigidAlignment::shortestArcRotation(planeNormal(pivot_), measuredDirection);
}

std::expected<core::AffineTransform, core::GeometryError> FrameReference::correctAxes(
    const core::AffineTransform& pose, const core::Vector3& measuredDirection) const {

    auto direction = core::math::normalized(measuredDirection);
    if (!direction) {
        getLogger()->error("Cannot correct axes: measured direction has zero length");
        return std::unexpected(core::GeometryError{
            core::GeometryError::Code::DegenerateGeometry,
            "measured direction has zero length"
        });
    }

    auto rfix = correctionRotation(*direction);
    if (!rfix) {
        return std::unexpected(rfix.error());
    }

    auto negatedAxial = core::math::scale(planeNormal(AnatomicalPlane::Axial), -1.0);
    auto newX = core::math::multiply(*rfix, negatedAxial);
    auto newZ = core::math::cross(newX, *direction);

    core::AffineTransform corrected = pose;
    corrected.setColumn(0, newX);
    corrected.setColumn(2, newZ);

    getLogger()->debug("Pivot {} -> X ({:.4f}, {:.4f}, {:.4f}), Z ({:.4f}, {:.4f}, {:.4f})",
                       toString(pivot_), newX[0], newX[1], newX[2], newZ[0], newZ[1], newZ[2]);
    return corrected;
}

}  // namespace screw_planner::services::alignment
