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
 * @file viewport_synthesizer.hpp
 * @brief Builds the three orthogonal MPR viewports from an implant pose
 * @details Axis mapping from the pose's rotation columns:
 *
 * | Viewport | viewUp   | viewPlaneNormal | sliceIndex |
 * |----------|----------|-----------------|------------|
 * | axial    | column 1 | column 0        | K          |
 * | sagittal | column 0 | column 2        | I          |
 * | coronal  | column 0 | column 1        | J          |
 *
 * Camera position = focalPoint + viewPlaneNormal * cameraDistance.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "core/geometry_types.hpp"
#include "services/coordinate/coordinate_types.hpp"
#include "services/coordinate/slice_indexer.hpp"
#include "services/viewport/viewport_types.hpp"

#include <expected>

namespace screw_planner::services::viewport {

/**
 * @brief Pose to viewport descriptor conversion
 *
 * The pose is converted to LPS first if it is tagged RAS; its translation is
 * the shared focal point of all three viewports.
 *
 * @example
 * @code
 * ViewportSynthesizer synthesizer;
 * auto viewports = synthesizer.buildViewports(poseLps, volume);
 * if (viewports) {
 *     const auto& axial = (*viewports)[0];
 * }
 * @endcode
 *
 * @trace SRS-FR-106
 */
class ViewportSynthesizer {
public:
    explicit ViewportSynthesizer(
        ViewportSettings settings = {},
        coordinate::RoundingMode rounding = coordinate::RoundingMode::HalfToEven);

    [[nodiscard]] const ViewportSettings& settings() const noexcept { return settings_; }

    /**
     * @brief Build one viewport
     * @param id Which plane to build
     * @param pose Implant pose (RAS or LPS)
     * @param volume Loaded volume geometry
     * @return Descriptor, DegenerateGeometry if viewUp is parallel to the
     *         plane normal, or SingularMatrix if the volume affine is singular
     */
    [[nodiscard]] std::expected<ViewportDescriptor, core::GeometryError> buildViewport(
        ViewportId id,
        const core::AffineTransform& pose,
        const coordinate::VolumeGeometry& volume) const;

    /// All three viewports in axial, sagittal, coronal order
    [[nodiscard]] std::expected<ViewportSet, core::GeometryError> buildViewports(
        const core::AffineTransform& pose,
        const coordinate::VolumeGeometry& volume) const;

    /// Normalized viewUp x viewPlaneNormal; DegenerateGeometry if parallel
    [[nodiscard]] static std::expected<core::Vector3, core::GeometryError> inPlaneVector2(
        const core::Vector3& viewUp, const core::Vector3& viewPlaneNormal);

private:
    std::expected<ViewportDescriptor, core::GeometryError> assemble(
        ViewportId id,
        const core::AffineTransform& poseLps,
        const coordinate::VoxelIndex& voxel,
        const coordinate::VolumeGeometry& volume) const;

    ViewportSettings settings_;
    coordinate::SliceIndexer indexer_;
};

}  // namespace screw_planner::services::viewport
