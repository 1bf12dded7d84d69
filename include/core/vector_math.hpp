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
 * @file vector_math.hpp
 * @brief Small linear-algebra helpers over the pipeline value types
 * @details Thin wrappers around vtkMath / vtkMatrix4x4 so that callers work
 *          with std::array based types and never touch raw VTK buffers.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "core/geometry_types.hpp"

#include <optional>

namespace screw_planner::core::math {

/// Vectors shorter than this are treated as zero-length
constexpr double DegenerateLength = 1e-9;

[[nodiscard]] double dot(const Vector3& a, const Vector3& b);

[[nodiscard]] Vector3 cross(const Vector3& a, const Vector3& b);

[[nodiscard]] double norm(const Vector3& v);

/**
 * @brief Unit vector along @p v
 * @return nullopt if @p v is shorter than DegenerateLength
 */
[[nodiscard]] std::optional<Vector3> normalized(const Vector3& v);

[[nodiscard]] Vector3 add(const Vector3& a, const Vector3& b);

[[nodiscard]] Vector3 subtract(const Vector3& a, const Vector3& b);

[[nodiscard]] Vector3 scale(const Vector3& v, double s);

[[nodiscard]] Matrix3 identity3();

[[nodiscard]] Matrix3 transpose(const Matrix3& m);

[[nodiscard]] Matrix3 multiply(const Matrix3& a, const Matrix3& b);

[[nodiscard]] Vector3 multiply(const Matrix3& m, const Vector3& v);

[[nodiscard]] double determinant(const Matrix3& m);

/// Column @p col of a 3x3 matrix
[[nodiscard]] Vector3 column(const Matrix3& m, int col);

/// a * b for row-major 4x4 matrices
[[nodiscard]] Matrix4 multiply(const Matrix4& a, const Matrix4& b);

/// Apply a row-major 4x4 matrix to the homogeneous point [p, 1]
[[nodiscard]] Vector3 transformPoint(const Matrix4& m, const Vector3& p);

/**
 * @brief Solve A x = b for a row-major 4x4 system (Crout LU, no inversion)
 * @return nullopt if A is singular
 */
[[nodiscard]] std::optional<std::array<double, 4>> solve4x4(
    const Matrix4& a, const std::array<double, 4>& b);

/// Largest absolute element-wise difference
[[nodiscard]] double maxAbsDifference(const Matrix4& a, const Matrix4& b);

}  // namespace screw_planner::core::math
