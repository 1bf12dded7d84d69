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
 * @file rigid_alignment.hpp
 * @brief Rigid pose of an implant from its two planned control points
 * @details Computes the shortest-arc rotation carrying the implant model's
 *          native long axis onto the planned trajectory and assembles a 4x4
 *          pose whose translation is chosen by a named anchoring policy.
 *
 * ## Translation policies
 * | Policy             | Translation                   | Used by                 |
 * |--------------------|-------------------------------|-------------------------|
 * | AnchorAtStart      | entry                         | transformation file     |
 * | AnchorAtMidpoint   | (entry + tip) / 2             | viewport snapshot export|
 * | AnchorAtBodyCenter | entry + u * (length + m) / 2  | 3D body placement       |
 * | AnchorAtCapOffset  | entry - u * capOffset         | 3D cap placement        |
 *
 * u is the unit direction from entry to tip, m the body-center margin.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "core/geometry_types.hpp"

#include <expected>
#include <optional>
#include <string>

namespace screw_planner::services::alignment {

/**
 * @brief A planned implant: two control points plus device dimensions
 *
 * Entry and tip should share one coordinate system; a tip given in the other
 * system is converted to the entry's system before any math.
 */
struct ImplantPlacement {
    std::string name;
    core::Point3 entryPoint;
    core::Point3 tipPoint;
    double radius = 0.0;    ///< mm
    double length = 0.0;    ///< mm

    [[nodiscard]] bool operator==(const ImplantPlacement& other) const = default;
};

/**
 * @brief Where the pose translation is anchored along the trajectory
 */
enum class TranslationPolicy {
    AnchorAtStart,
    AnchorAtMidpoint,
    AnchorAtBodyCenter,
    AnchorAtCapOffset
};

[[nodiscard]] std::string toString(TranslationPolicy policy);

/// Parse "start", "midpoint", "body-center" or "cap-offset"
[[nodiscard]] std::optional<TranslationPolicy> translationPolicyFromString(const std::string& str);

/**
 * @brief Fixed parameters of the implant model
 */
struct AlignmentOptions {
    /// Native long axis of the device model, pointing from entry toward tip
    core::Vector3 referenceAxis = {0.0, -1.0, 0.0};

    /// Added to the length before halving for AnchorAtBodyCenter (mm)
    double bodyCenterMargin = 4.0;

    /// Distance behind the entry point for AnchorAtCapOffset (mm)
    double capOffset = 7.5;
};

/**
 * @brief Maps the device's reference axis onto a planned trajectory
 *
 * @example
 * @code
 * RigidAlignment alignment;
 * ImplantPlacement screw{"L4-left", {0, 0, 0}, {0, -35, 0}, 6.5, 35.0};
 *
 * auto pose = alignment.computePose(screw, TranslationPolicy::AnchorAtMidpoint);
 * if (pose) {
 *     auto center = pose->translation();   // (0, -17.5, 0)
 * }
 * @endcode
 *
 * @trace SRS-FR-103
 */
class RigidAlignment {
public:
    explicit RigidAlignment(AlignmentOptions options = {});

    [[nodiscard]] const AlignmentOptions& options() const noexcept { return options_; }

    /**
     * @brief Minimal rotation carrying @p from onto @p to
     *
     * Both vectors are normalized first. Parallel input yields the identity;
     * antiparallel input yields a half turn about the axis perpendicular to
     * @p from that is built from the basis vector least aligned with it.
     *
     * @return Proper rotation, or DegenerateGeometry if either vector has zero length
     */
    [[nodiscard]] static std::expected<core::Matrix3, core::GeometryError>
    shortestArcRotation(const core::Vector3& from, const core::Vector3& to);

    /**
     * @brief Unit vector from entry to tip
     * @return Direction, or DegenerateGeometry if entry == tip
     */
    [[nodiscard]] static std::expected<core::Vector3, core::GeometryError>
    measuredDirection(const ImplantPlacement& placement);

    /// Rotation taking the reference axis onto @p direction
    [[nodiscard]] std::expected<core::Matrix3, core::GeometryError>
    alignmentRotation(const core::Vector3& direction) const;

    /**
     * @brief Assemble the implant pose in the entry point's coordinate system
     * @param placement Planned control points
     * @param policy Translation anchor
     * @return Pose, or DegenerateGeometry if entry == tip
     */
    [[nodiscard]] std::expected<core::AffineTransform, core::GeometryError>
    computePose(const ImplantPlacement& placement, TranslationPolicy policy) const;

    /**
     * @brief Signed distance of the anchor from the entry along the trajectory
     *
     * The midpoint offset uses @p length as the entry-to-tip distance.
     */
    [[nodiscard]] double anchorOffset(TranslationPolicy policy, double length) const;

    /**
     * @brief Rebuild control points from a stored pose
     *
     * Inverse of computePose for a placement whose control points are
     * @p length apart: entry = translation - offset * d, tip = entry + length * d,
     * with d = R * referenceAxis.
     *
     * @return Placement in the pose's coordinate system, or DegenerateGeometry
     *         if the rotation collapses the reference axis
     */
    [[nodiscard]] std::expected<ImplantPlacement, core::GeometryError> restorePlacement(
        const std::string& name,
        const core::AffineTransform& pose,
        double radius,
        double length,
        TranslationPolicy policy) const;

private:
    AlignmentOptions options_;
};

}  // namespace screw_planner::services::alignment
