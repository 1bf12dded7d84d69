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
 * @file coordinate_conventions.hpp
 * @brief Conversion between the RAS and LPS anatomical coordinate systems
 * @details RAS and LPS differ by negating X and Y; Z is shared. The flip is
 *          its own inverse, so converting twice yields the input exactly.
 *
 * Affine transforms are converted by left-multiplying the flip matrix
 * (T_lps = F * T_ras). Only the output (world) frame is relabeled; the
 * transform's local axes keep their meaning, so the result is still a
 * valid pose for a model defined in its own local frame.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "core/geometry_types.hpp"

#include <expected>
#include <span>

namespace screw_planner::services::coordinate {

/**
 * @brief Pure functions relabeling points and transforms between RAS and LPS
 *
 * @example
 * @code
 * auto poseLps = CoordinateConventions::toLps(poseRas);
 * auto back = CoordinateConventions::toRas(poseLps);   // == poseRas
 *
 * auto parsed = CoordinateConventions::matrixToLps(values);  // 16 values
 * if (!parsed) {
 *     // parsed.error().code == GeometryError::Code::ShapeError
 * }
 * @endcode
 *
 * @trace SRS-FR-102
 */
class CoordinateConventions {
public:
    /// diag(-1, -1, 1, 1), row-major
    [[nodiscard]] static core::Matrix4 flipMatrix();

    /**
     * @brief Express a transform in @p target
     *
     * Returns the input unchanged if it is already in @p target.
     */
    [[nodiscard]] static core::AffineTransform convert(
        const core::AffineTransform& transform, core::CoordinateSystem target);

    [[nodiscard]] static core::Point3 convert(
        const core::Point3& point, core::CoordinateSystem target);

    [[nodiscard]] static core::AffineTransform toLps(const core::AffineTransform& transform);
    [[nodiscard]] static core::AffineTransform toRas(const core::AffineTransform& transform);
    [[nodiscard]] static core::Point3 toLps(const core::Point3& point);
    [[nodiscard]] static core::Point3 toRas(const core::Point3& point);

    /// Directions flip like points but ignore translation
    [[nodiscard]] static core::Vector3 flipDirection(const core::Vector3& direction);

    /**
     * @brief Build a transform from raw row-major values
     * @param values 16 row-major values
     * @param system Coordinate system the values are expressed in
     * @return Transform, or ShapeError if @p values does not hold 16 elements
     */
    [[nodiscard]] static std::expected<core::AffineTransform, core::GeometryError>
    matrixFromValues(std::span<const double> values, core::CoordinateSystem system);

    /**
     * @brief Build a point from raw values
     * @return Point, or ShapeError if @p values does not hold 3 elements
     */
    [[nodiscard]] static std::expected<core::Point3, core::GeometryError>
    pointFromValues(std::span<const double> values, core::CoordinateSystem system);

    /// Raw 4x4 form of toLps; ShapeError unless 16 values
    [[nodiscard]] static std::expected<core::AffineTransform, core::GeometryError>
    matrixToLps(std::span<const double> values,
                core::CoordinateSystem inSystem = core::CoordinateSystem::RAS);

    /// Raw 4x4 form of toRas; ShapeError unless 16 values
    [[nodiscard]] static std::expected<core::AffineTransform, core::GeometryError>
    matrixToRas(std::span<const double> values,
                core::CoordinateSystem inSystem = core::CoordinateSystem::LPS);

    /// Raw point form of toLps; ShapeError unless 3 values
    [[nodiscard]] static std::expected<core::Point3, core::GeometryError>
    pointToLps(std::span<const double> values,
               core::CoordinateSystem inSystem = core::CoordinateSystem::RAS);

    /// Raw point form of toRas; ShapeError unless 3 values
    [[nodiscard]] static std::expected<core::Point3, core::GeometryError>
    pointToRas(std::span<const double> values,
               core::CoordinateSystem inSystem = core::CoordinateSystem::LPS);
};

}  // namespace screw_planner::services::coordinate
