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
 * @file viewport_types.hpp
 * @brief MPR viewport descriptors consumed by the external volume viewer
 * @details A ViewportDescriptor carries everything the viewer needs to
 *          restore one orthographic slice view: camera, view reference with
 *          slice index and plane restriction, presentation and metadata.
 *          All vectors and points are expressed in LPS.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "core/geometry_types.hpp"

#include <array>
#include <optional>
#include <string>

namespace screw_planner::services::viewport {

/**
 * @brief Identity of an MPR viewport, in serialized order
 */
enum class ViewportId {
    Axial,
    Sagittal,
    Coronal
};

/// Fixed output order of the three viewports
inline constexpr std::array<ViewportId, 3> kViewportOrder = {
    ViewportId::Axial, ViewportId::Sagittal, ViewportId::Coronal
};

/// "mpr-axial", "mpr-sagittal" or "mpr-coronal"
[[nodiscard]] std::string toString(ViewportId id);

[[nodiscard]] std::optional<ViewportId> viewportIdFromString(const std::string& str);

/**
 * @brief Region of the volume a viewport may query
 */
struct PlaneRestriction {
    std::string frameOfReferenceUID;
    core::Vector3 point = {0.0, 0.0, 0.0};
    core::Vector3 inPlaneVector1 = {0.0, 0.0, 0.0};   ///< == viewUp
    core::Vector3 inPlaneVector2 = {0.0, 0.0, 0.0};   ///< unit, viewUp x viewPlaneNormal

    [[nodiscard]] bool operator==(const PlaneRestriction& other) const = default;
};

/**
 * @brief One orthographic MPR viewport (LPS)
 */
struct ViewportDescriptor {
    ViewportId id = ViewportId::Axial;
    std::string frameOfReferenceUID;

    // Camera
    core::Vector3 viewUp = {0.0, 0.0, 0.0};
    core::Vector3 viewPlaneNormal = {0.0, 0.0, 0.0};
    core::Vector3 position = {0.0, 0.0, 0.0};
    core::Vector3 focalPoint = {0.0, 0.0, 0.0};
    bool parallelProjection = true;
    double parallelScale = 0.0;
    double viewAngle = 90.0;
    bool flipHorizontal = false;
    bool flipVertical = false;
    double rotation = 0.0;

    // View reference
    int sliceIndex = 0;
    PlaneRestriction planeRestriction;
    std::string volumeId;

    // Presentation and metadata
    double zoom = 1.0;
    std::array<double, 2> pan = {0.0, 0.0};
    std::string viewportType = "orthographic";
    std::string renderingEngineId = "OHIFCornerstoneRenderingEngine";

    [[nodiscard]] bool operator==(const ViewportDescriptor& other) const = default;
};

/// Axial, sagittal and coronal descriptors, in that order
using ViewportSet = std::array<ViewportDescriptor, 3>;

/**
 * @brief Camera constants shared by all three viewports
 */
struct ViewportSettings {
    /// Distance of the camera from the focal point along the plane normal (mm)
    double cameraDistance = 350.0;

    double parallelScale = 234.20727282007405;

    std::string renderingEngineId = "OHIFCornerstoneRenderingEngine";

    std::string viewportType = "orthographic";
};

}  // namespace screw_planner::services::viewport
