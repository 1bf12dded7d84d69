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
 * @file frame_reference.hpp
 * @brief Anatomical reference frame and implant axis correction
 * @details Holds the axial, coronal and sagittal direction-cosine matrices of
 *          the loaded volume and re-aligns an implant pose's local X and Z
 *          axes to them, so that MPR viewports built from the pose keep the
 *          volume's native orientation whatever the implant tilt.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "core/geometry_types.hpp"

#include <expected>
#include <string>

namespace screw_planner::services::alignment {

/**
 * @brief The three orthogonal anatomical planes
 */
enum class AnatomicalPlane {
    Axial,
    Coronal,
    Sagittal
};

[[nodiscard]] std::string toString(AnatomicalPlane plane);

/**
 * @brief Direction cosines of the three anatomical slice planes
 *
 * Column 2 of each matrix is the plane normal. Captured once per loaded
 * volume and never mutated afterwards.
 */
struct AnatomicalFrame {
    core::Matrix3 axial{};
    core::Matrix3 coronal{};
    core::Matrix3 sagittal{};

    /// Orientation of an axis-aligned volume in RAS
    [[nodiscard]] static AnatomicalFrame standard();

    [[nodiscard]] const core::Matrix3& matrix(AnatomicalPlane plane) const;

    [[nodiscard]] core::Vector3 planeNormal(AnatomicalPlane plane) const;

    /// True if every matrix has unit, mutually orthogonal columns
    [[nodiscard]] bool isOrthonormal(double tolerance = 1e-6) const;

    [[nodiscard]] bool operator==(const AnatomicalFrame& other) const = default;
};

/**
 * @brief Re-aligns an implant pose's local axes to the anatomical frame
 *
 * The correction rotation Rfix carries the pivot plane's normal (coronal by
 * default) onto the measured implant direction. The pose then gets
 * X = Rfix * (-axial normal) and Z = X x direction; column 1 and the
 * translation are kept. The resulting rotation block is orthonormal when the
 * frame is, but its determinant is not forced to +1.
 *
 * @example
 * @code
 * FrameReference reference(AnatomicalFrame::standard());
 * auto corrected = reference.correctAxes(pose, direction);
 * @endcode
 *
 * @trace SRS-FR-105
 */
class FrameReference {
public:
    explicit FrameReference(AnatomicalFrame frame,
                            AnatomicalPlane pivot = AnatomicalPlane::Coronal);

    [[nodiscard]] const AnatomicalFrame& frame() const noexcept { return frame_; }
    [[nodiscard]] AnatomicalPlane pivot() const noexcept { return pivot_; }

    [[nodiscard]] core::Vector3 planeNormal(AnatomicalPlane plane) const;

    /**
     * @brief Rotation carrying the pivot plane normal onto @p measuredDirection
     * @return Rfix, or DegenerateGeometry for a zero-length direction
     */
    [[nodiscard]] std::expected<core::Matrix3, core::GeometryError>
    correctionRotation(const core::Vector3& measuredDirection) const;

    /**
     * @brief Overwrite the pose's local X and Z axes
     * @param pose Coarse pose from RigidAlignment
     * @param measuredDirection Unit implant direction, same system as @p pose
     * @return Corrected pose, or DegenerateGeometry for a zero-length direction
     */
    [[nodiscard]] std::expected<core::AffineTransform, core::GeometryError>
    correctAxes(const core::AffineTransform& pose,
                const core::Vector3& measuredDirection) const;

private:
    AnatomicalFrame frame_;
    AnatomicalPlane pivot_;
};

}  // namespace screw_planner::services::alignment
