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
 * @file geometry_types.hpp
 * @brief Value types shared by the trajectory-to-viewport pipeline
 * @details Defines 3-vectors, 3x3 and row-major 4x4 matrices, points and
 *          affine transforms tagged with their anatomical coordinate system,
 *          and the GeometryError returned by every geometric operation.
 *
 * Every physical value carries the coordinate system it is expressed in.
 * Conversion between systems goes through CoordinateConventions only.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include <array>
#include <string>

namespace screw_planner::core {

/**
 * @brief Anatomical labeling of the patient coordinate axes
 */
enum class CoordinateSystem {
    RAS,    ///< Right-Anterior-Superior (3D Slicer convention)
    LPS     ///< Left-Posterior-Superior (DICOM / ITK / Cornerstone convention)
};

/**
 * @brief Convert CoordinateSystem to string
 */
[[nodiscard]] inline std::string toString(CoordinateSystem system) {
    switch (system) {
        case CoordinateSystem::RAS: return "RAS";
        case CoordinateSystem::LPS: return "LPS";
    }
    return "Unknown";
}

/// Free 3-vector (direction or displacement), millimeters where applicable
using Vector3 = std::array<double, 3>;

/// 3x3 matrix, indexed [row][column]
using Matrix3 = std::array<std::array<double, 3>, 3>;

/// 4x4 homogeneous matrix stored row-major (same layout as vtkMatrix4x4)
using Matrix4 = std::array<double, 16>;

/**
 * @brief Error information for geometric operations
 *
 * @trace SRS-FR-101
 */
struct GeometryError {
    enum class Code {
        Success,
        ShapeError,          ///< Wrong matrix or vector dimensionality
        DegenerateGeometry,  ///< Zero-length or parallel vectors, undefined rotation
        SingularMatrix       ///< Linear system without a unique solution
    };

    Code code = Code::Success;
    std::string message;

    [[nodiscard]] bool isSuccess() const noexcept {
        return code == Code::Success;
    }

    [[nodiscard]] std::string toString() const {
        switch (code) {
            case Code::Success: return "Success";
            case Code::ShapeError: return "Shape error: " + message;
            case Code::DegenerateGeometry: return "Degenerate geometry: " + message;
            case Code::SingularMatrix: return "Singular matrix: " + message;
        }
        return "Unknown error";
    }
};

/**
 * @brief A physical point in a named coordinate system (mm)
 */
struct Point3 {
    Vector3 value = {0.0, 0.0, 0.0};
    CoordinateSystem system = CoordinateSystem::RAS;

    Point3() = default;
    Point3(double px, double py, double pz,
           CoordinateSystem sys = CoordinateSystem::RAS)
        : value{px, py, pz}, system(sys) {}
    Point3(const Vector3& v, CoordinateSystem sys) : value(v), system(sys) {}

    [[nodiscard]] double x() const noexcept { return value[0]; }
    [[nodiscard]] double y() const noexcept { return value[1]; }
    [[nodiscard]] double z() const noexcept { return value[2]; }

    [[nodiscard]] bool operator==(const Point3& other) const noexcept {
        return value == other.value && system == other.system;
    }
};

/**
 * @brief 4x4 homogeneous affine transform in a named coordinate system
 *
 * The top-left 3x3 block is the rotation (orthonormal is expected but not
 * enforced), column 3 the translation, and the bottom row [0, 0, 0, 1].
 * Composition is only meaningful within a single coordinate system.
 */
struct AffineTransform {
    Matrix4 matrix = {1.0, 0.0, 0.0, 0.0,
                      0.0, 1.0, 0.0, 0.0,
                      0.0, 0.0, 1.0, 0.0,
                      0.0, 0.0, 0.0, 1.0};
    CoordinateSystem system = CoordinateSystem::RAS;

    [[nodiscard]] static AffineTransform identity(
        CoordinateSystem sys = CoordinateSystem::RAS) {
        AffineTransform t;
        t.system = sys;
        return t;
    }

    [[nodiscard]] double at(int row, int col) const {
        return matrix[static_cast<size_t>(row * 4 + col)];
    }

    void set(int row, int col, double value) {
        matrix[static_cast<size_t>(row * 4 + col)] = value;
    }

    /// Column @p col of the rotation block (0 = local X, 1 = local Y, 2 = local Z)
    [[nodiscard]] Vector3 column(int col) const {
        return {at(0, col), at(1, col), at(2, col)};
    }

    void setColumn(int col, const Vector3& v) {
        for (int r = 0; r < 3; ++r) {
            set(r, col, v[static_cast<size_t>(r)]);
        }
    }

    [[nodiscard]] Matrix3 rotation() const {
        Matrix3 r{};
        for (int i = 0; i < 3; ++i) {
            for (int j = 0; j < 3; ++j) {
                r[static_cast<size_t>(i)][static_cast<size_t>(j)] = at(i, j);
            }
        }
        return r;
    }

    void setRotation(const Matrix3& r) {
        for (int i = 0; i < 3; ++i) {
            for (int j = 0; j < 3; ++j) {
                set(i, j, r[static_cast<size_t>(i)][static_cast<size_t>(j)]);
            }
        }
    }

    [[nodiscard]] Point3 translation() const {
        return Point3{column(3), system};
    }

    void setTranslation(const Vector3& t) {
        setColumn(3, t);
    }

    [[nodiscard]] bool operator==(const AffineTransform& other) const noexcept {
        return matrix == other.matrix && system == other.system;
    }
};

}  // namespace screw_planner::core
