#include "services/coordinate/coordinate_conventions.hpp"

#include "core/vector_math.hpp"

#include <algorithm>
#include <format>

namespace screw_planner::services::coordinate {

using core::AffineTransform;
using core::CoordinateSystem;
using core::GeometryError;
using core::Matrix4;
using core::Point3;
using core::Vector3;

Matrix4 CoordinateConventions::flipMatrix() {
    return {-1.0,  0.0, 0.0, 0.0,
             0.0, -1.0, 0.0, 0.0,
             0.0,  0.0, 1.0, 0.0,
             0.0,  0.0, 0.0, 1.0};
}

AffineTransform CoordinateConventions::convert(
    const AffineTransform& transform, CoordinateSystem target) {

    if (transform.system == target) {
        return transform;
    }

    AffineTransform result;
    result.matrix = core::math::multiply(flipMatrix(), transform.matrix);
    result.system = target;
    return result;
}

Point3 CoordinateConventions::convert(const Point3& point, CoordinateSystem target) {
    if (point.system == target) {
        return point;
    }
    return Point3{flipDirection(point.value), target};
}

AffineTransform CoordinateConventions::toLps(const AffineTransform& transform) {
    return convert(transform, CoordinateSystem::LPS);
}

AffineTransform CoordinateConventions::toRas(const AffineTransform& transform) {
    return convert(transform, CoordinateSystem::RAS);
}

Point3 CoordinateConventions::toLps(const Point3& point) {
    return convert(point, CoordinateSystem::LPS);
}

Point3 CoordinateConventions::toRas(const Point3& point) {
    return convert(point, CoordinateSystem::RAS);
}

Vector3 CoordinateConventions::flipDirection(const Vector3& direction) {
    return {-direction[0], -direction[1], direction[2]};
}

std::expected<AffineTransform, GeometryError> CoordinateConventions::matrixFromValues(
    std::span<const double> values, CoordinateSystem system) {

    if (values.size() != 16) {
        return std::unexpected(GeometryError{
            GeometryError::Code::ShapeError,
            std::format("expected a 4x4 matrix (16 values), got {} values", values.size())
        });
    }

    AffineTransform transform;
    std::copy(values.begin(), values.end(), transform.matrix.begin());
    transform.system = system;
    return transform;
}

std::expected<Point3, GeometryError> CoordinateConventions::pointFromValues(
    std::span<const double> values, CoordinateSystem system) {

    if (values.size() != 3) {
        return std::unexpected(GeometryError{
            GeometryError::Code::ShapeError,
            std::format("expected a 3-vector, got {} values", values.size())
        });
    }
    return Point3{values[0], values[1], values[2], system};
}

std::expected<AffineTransform, GeometryError> CoordinateConventions::matrixToLps(
    std::span<const double> values, CoordinateSystem inSystem) {
    return matrixFromValues(values, inSystem).transform(
        [](const AffineTransform& t) { return toLps(t); });
}

std::expected<AffineTransform, GeometryError> CoordinateConventions::matrixToRas(
    std::span<const double> values, CoordinateSystem inSystem) {
    return matrixFromValues(values, inSystem).transform(
        [](const AffineTransform& t) { return toRas(t); });
}

std::expected<Point3, GeometryError> CoordinateConventions::pointToLps(
    std::span<const double> values, CoordinateSystem inSystem) {
    return pointFromValues(values, inSystem).transform(
        [](const Point3& p) { return toLps(p); });
}

std::expected<Point3, GeometryError> CoordinateConventions::pointToRas(
    std::span<const double> values, CoordinateSystem inSystem) {
    return pointFromValues(values, inSystem).transform(
        [](const Point3& p) { return toRas(p); });
}

}  // namespace screw_planner::services::coordinate
