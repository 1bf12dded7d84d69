// BSD 3-Clause License
//
// Copyright (c) 2021-2025, 🍀☀🌕🌥 🌊
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#include "services/coordinate/slice_indexer.hpp"

#include "core/logging.hpp"
#include "core/vector_math.hpp"
#include "services/coordinate/coordinate_conventions.hpp"

#include <cmath>
#include <format>
#include <limits>

namespace screw_planner::services::coordinate {

namespace {
auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("SliceIndexer");
    return logger;
}
}

using core::AffineTransform;
using core::CoordinateSystem;
using core::GeometryError;
using core::Matrix4;
using core::Point3;

SliceIndexer::SliceIndexer(RoundingMode mode) : mode_(mode) {}

std::expected<ContinuousIndex, GeometryError> SliceIndexer::continuousIndex(
    const Point3& focalPoint,
    const AffineTransform& ijkToRas,
    const Matrix4& rasToLpsFlip) const {

    Matrix4 ijkToLps = ijkToRas.system == CoordinateSystem::LPS
        ? ijkToRas.matrix
        : core::math::multiply(rasToLpsFlip, ijkToRas.matrix);

    Point3 focalLps = CoordinateConventions::toLps(focalPoint);

    auto solution = core::math::solve4x4(
        ijkToLps, {focalLps.x(), focalLps.y(), focalLps.z(), 1.0});
    if (!solution) {
        getLogger()->error("ijkToLps is singular; cannot recover slice indices");
        return std::unexpected(GeometryError{
            GeometryError::Code::SingularMatrix,
            "ijkToLps has no unique inverse"
        });
    }

    const auto& x = *solution;
    return ContinuousIndex{x[0], x[1], x[2]};
}

std::expected<ContinuousIndex, GeometryError> SliceIndexer::continuousIndex(
    const Point3& focalPoint, const AffineTransform& ijkToRas) const {
    return continuousIndex(focalPoint, ijkToRas, CoordinateConventions::flipMatrix());
}

std::expected<VoxelIndex, GeometryError> SliceIndexer::sliceIndices(
    const Point3& focalPoint,
    const AffineTransform& ijkToRas,
    const Matrix4& rasToLpsFlip) const {

    auto ijk = continuousIndex(focalPoint, ijkToRas, rasToLpsFlip);
    if (!ijk) {
        return std::unexpected(ijk.error());
    }

    std::array<int, 3> rounded{};
    for (size_t axis = 0; axis < 3; ++axis) {
        double value = roundIndex((*ijk)[axis], mode_);
        if (value < static_cast<double>(std::numeric_limits<int>::min()) ||
            value > static_cast<double>(std::numeric_limits<int>::max())) {
            return std::unexpected(GeometryError{
                GeometryError::Code::DegenerateGeometry,
                std::format("voxel coordinate {} is outside the integer index range", value)
            });
        }
        rounded[axis] = static_cast<int>(value);
    }

    getLogger()->debug("Focal point ({:.3f}, {:.3f}, {:.3f}) -> ijk ({:.3f}, {:.3f}, {:.3f}) -> ({}, {}, {})",
                       focalPoint.x(), focalPoint.y(), focalPoint.z(),
                       (*ijk)[0], (*ijk)[1], (*ijk)[2],
                       rounded[0], rounded[1], rounded[2]);

    return VoxelIndex{rounded[0], rounded[1], rounded[2]};
}

std::expected<VoxelIndex, GeometryError> SliceIndexer::sliceIndices(
    const Point3& focalPoint, const AffineTransform& ijkToRas) const {
    return sliceIndices(focalPoint, ijkToRas, CoordinateConventions::flipMatrix());
}

Point3 SliceIndexer::physicalPoint(
    const VoxelIndex& voxel,
    const AffineTransform& ijkToRas,
    CoordinateSystem target) {

    auto p = core::math::transformPoint(
        ijkToRas.matrix,
        {static_cast<double>(voxel.i), static_cast<double>(voxel.j), static_cast<double>(voxel.k)});
    return CoordinateConventions::convert(Point3{p, ijkToRas.system}, target);
}

double SliceIndexer::roundIndex(double value, RoundingMode mode) {
    if (mode == RoundingMode::HalfAwayFromZero) {
        return std::round(value);
    }

    double floorValue = std::floor(value);
    double fraction = value - floorValue;
    if (fraction > 0.5) {
        return floorValue + 1.0;
    }
    if (fraction < 0.5) {
        return floorValue;
    }
    // Exact tie: pick the even neighbour
    return std::fmod(floorValue, 2.0) == 0.0 ? floorValue : floorValue + 1.0;
}

}  // namespace screw_planner::services::coordinate
