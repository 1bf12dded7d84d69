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

/**
 * @file slice_indexer.hpp
 * @brief Recovery of integer voxel slice indices from a physical focal point
 * @details Solves ijkToLps * [i, j, k, 1]^T = [p, 1]^T with an LU solve
 *          (never an explicit inverse) and rounds each component.
 *
 * Rounding defaults to round-half-to-even, matching the planning host that
 * produced the reference snapshots; round-half-away-from-zero is available
 * as a named alternative.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "core/geometry_types.hpp"
#include "services/coordinate/coordinate_types.hpp"

#include <expected>

namespace screw_planner::services::coordinate {

/**
 * @brief Rounding rule applied to continuous voxel coordinates
 */
enum class RoundingMode {
    HalfToEven,        ///< 2.5 -> 2, 3.5 -> 4 (banker's rounding)
    HalfAwayFromZero   ///< 2.5 -> 3, -2.5 -> -3 (std::round)
};

/**
 * @brief Inverts the voxel-to-physical affine to locate slices
 *
 * @example
 * @code
 * SliceIndexer indexer;
 * auto ijk = indexer.sliceIndices(focalPointLps, volume.ijkToRas);
 * if (ijk) {
 *     int axialSlice = ijk->k;
 * }
 * @endcode
 *
 * @trace SRS-FR-104
 */
class SliceIndexer {
public:
    explicit SliceIndexer(RoundingMode mode = RoundingMode::HalfToEven);

    [[nodiscard]] RoundingMode roundingMode() const noexcept { return mode_; }

    /**
     * @brief Continuous IJK coordinates of a physical point
     * @param focalPoint Physical point; converted to LPS if given in RAS
     * @param ijkToRas Voxel-to-physical affine (an LPS-tagged affine is used as is)
     * @param rasToLpsFlip Flip applied on the left of ijkToRas
     * @return IJK coordinates, or SingularMatrix if the affine is singular
     */
    [[nodiscard]] std::expected<ContinuousIndex, core::GeometryError> continuousIndex(
        const core::Point3& focalPoint,
        const core::AffineTransform& ijkToRas,
        const core::Matrix4& rasToLpsFlip) const;

    [[nodiscard]] std::expected<ContinuousIndex, core::GeometryError> continuousIndex(
        const core::Point3& focalPoint,
        const core::AffineTransform& ijkToRas) const;

    /**
     * @brief Rounded voxel indices of a physical focal point
     * @return (i, j, k); SingularMatrix if the affine is singular;
     *         DegenerateGeometry if a rounded index does not fit in an int
     */
    [[nodiscard]] std::expected<VoxelIndex, core::GeometryError> sliceIndices(
        const core::Point3& focalPoint,
        const core::AffineTransform& ijkToRas,
        const core::Matrix4& rasToLpsFlip) const;

    [[nodiscard]] std::expected<VoxelIndex, core::GeometryError> sliceIndices(
        const core::Point3& focalPoint,
        const core::AffineTransform& ijkToRas) const;

    /**
     * @brief Physical position of a voxel, expressed in @p target
     */
    [[nodiscard]] static core::Point3 physicalPoint(
        const VoxelIndex& voxel,
        const core::AffineTransform& ijkToRas,
        core::CoordinateSystem target);

    /// Round one coordinate with the given rule
    [[nodiscard]] static double roundIndex(double value, RoundingMode mode);

private:
    RoundingMode mode_;
};

}  // namespace screw_planner::services::coordinate
