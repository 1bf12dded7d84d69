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
 * @file coordinate_types.hpp
 * @brief Voxel-space and volume geometry types
 * @details Defines the integer VoxelIndex used for MPR slice selection and
 *          the immutable VolumeGeometry describing the loaded image volume
 *          (IJK to RAS affine, Frame of Reference UID, viewer volume id).
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "core/geometry_types.hpp"

#include <array>
#include <string>

namespace screw_planner::services::coordinate {

/**
 * @brief 3D voxel indices (integer indices into image volume)
 */
struct VoxelIndex {
    int i = 0;
    int j = 0;
    int k = 0;

    VoxelIndex() = default;
    VoxelIndex(int pi, int pj, int pk) : i(pi), j(pj), k(pk) {}

    [[nodiscard]] std::array<int, 3> toArray() const {
        return {i, j, k};
    }

    [[nodiscard]] bool operator==(const VoxelIndex& other) const noexcept {
        return i == other.i && j == other.j && k == other.k;
    }
};

/// Non-rounded IJK coordinates recovered from a physical point
using ContinuousIndex = std::array<double, 3>;

/**
 * @brief Geometry of the loaded volume, immutable for the session
 */
struct VolumeGeometry {
    /// Voxel (IJK) to physical RAS affine
    core::AffineTransform ijkToRas = core::AffineTransform::identity(core::CoordinateSystem::RAS);

    /// DICOM Frame of Reference UID binding the volume to physical space
    std::string frameOfReferenceUID;

    /// Volume identifier understood by the target viewer
    std::string volumeId;
};

}  // namespace screw_planner::services::coordinate
