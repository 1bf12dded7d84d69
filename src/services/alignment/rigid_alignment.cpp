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

#include "services/alignment/rigid_alignment.hpp"

#include "core/logging.hpp"
#include "core/vector_math.hpp"
#include "services/coordinate/coordinate_conventions.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <utility>

namespace screw_planner::services::alignment {

namespace {
auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("RigidAlignment");
    return logger;
}

using core::GeometryError;
using core::Matrix3;
using core::Vector3;
namespace math = core::math;

/// sin(angle) below this is treated as parallel or antiparallel
constexpr double CollinearTolerance = 1e-12;

Matrix3 skew(const Vector3& v) {
    return {{{0.0, -v[2], v[1]},
             {v[2], 0.0, -v[0]},
             {-v[1], v[0], 0.0}}};
}

Matrix3 addMatrices(const Matrix3& a, const Matrix3& b) {
    Matrix3 r{};
    for (size_t i = 0; i < 3; ++i) {
        for (size_t j = 0; j < 3; ++j) {
            r[i][j] = a[i][j] + b[i][j];
        }
    }
    return r;
}

Matrix3 scaleMatrix(const Matrix3& m, double s) {
    Matrix3 r{};
    for (size_t i = 0; i < 3; ++i) {
        for (size_t j = 0; j < 3; ++j) {
            r[i][j] = m[i][j] * s;
        }
    }
    return r;
}

/// Half turn about unit axis k: 2 k k^T - I
Matrix3 halfTurn(const Vector3& k) {
    Matrix3 r{};
    for (size_t i = 0; i < 3; ++i) {
        for (size_t j = 0; j < 3; ++j) {
            r[i][j] = 2.0 * k[i] * k[j] - (i == j ? 1.0 : 0.0);
        }
    }
    return r;
}

/// Basis axis with the smallest absolute component of @p v
Vector3 leastAlignedAxis(const Vector3& v) {
    size_t best = 0;
    for (size_t i = 1; i < 3; ++i) {
        if (std::abs(v[i]) < std::abs(v[best])) {
            best = i;
        }
    }
    Vector3 axis = {0.0, 0.0, 0.0};
    axis[best] = 1.0;
    return axis;
}

GeometryError degenerate(const std::string& what) {
    return GeometryError{GeometryError::Code::DegenerateGeometry, what};
}

}  // namespace

std::string toString(TranslationPolicy policy) {
    switch (policy) {
        case TranslationPolicy::AnchorAtStart: return "start";
        case TranslationPolicy::AnchorAtMidpoint: return "midpoint";
        case TranslationPolicy::AnchorAtBodyCenter: return "body-center";
        case TranslationPolicy::AnchorAtCapOffset: return "cap-offset";
    }
    return "unknown";
}

std::optional<TranslationPolicy> translationPolicyFromString(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "start") return TranslationPolicy::AnchorAtStart;
    if (lower == "midpoint") return TranslationPolicy::AnchorAtMidpoint;
    if (lower == "body-center") return TranslationPolicy::AnchorAtBodyCenter;
    if (lower == "cap-offset") return TranslationPolicy::AnchorAtCapOffset;
    return std::nullopt;
}

RigidAlignment::RigidAlignment(AlignmentOptions options)
    : options_(std::move(options)) {}

std::expected<Matrix3, GeometryError> RigidAlignment::shortestArcRotation(
    const Vector3& from, const Vector3& to) {

    auto a = math::normalized(from);
    if (!a) {
        return std::unexpected(degenerate("source vector has zero length"));
    }
    auto b = math::normalized(to);
    if (!b) {
        return std::unexpected(degenerate("target vector has zero length"));
    }

    double c = math::dot(*a, *b);
    Vector3 v = math::cross(*a, *b);
    double s = math::norm(v);
    if (s < CollinearTolerance) {
        if (c > 0.0) {
            return math::identity3();
        }
        auto axis = math::normalized(math::cross(*a, leastAlignedAxis(*a)));
        if (!axis) {
            return std::unexpected(degenerate("no axis perpendicular to source vector"));
        }
        return halfTurn(*axis);
    }

    // Rodrigues: R = I + sin(theta) K + (1 - cos(theta)) K^2 with unit axis K
    double theta = std::atan2(s, c);
    Matrix3 k = skew(math::scale(v, 1.0 / s));
    Matrix3 k2 = math::multiply(k, k);
    return addMatrices(addMatrices(math::identity3(), scaleMatrix(k, std::sin(theta))),
                       scaleMatrix(k2, 1.0 - std::cos(theta)));
}

std::expected<Vector3, GeometryError> RigidAlignment::measuredDirection(
    const ImplantPlacement& placement) {

    auto tip = coordinate::CoordinateConventions::convert(
        placement.tipPoint, placement.entryPoint.system);
    auto direction = math::normalized(math::subtract(tip.value, placement.entryPoint.value));
    if (!direction) {
        return std::unexpected(degenerate(
            "entry and tip of '" + placement.name + "' coincide"));
    }
    return *direction;
}

std::expected<Matrix3, GeometryError> RigidAlignment::alignmentRotation(
    const Vector3& direction) const {
    return shortestArcRotation(options_.referenceAxis, direction);
}

double RigidAlignment::anchorOffset(TranslationPolicy policy, double length) const {
    switch (policy) {
        case TranslationPolicy::AnchorAtStart: return 0.0;
        case TranslationPolicy::AnchorAtMidpoint: return length / 2.0;
        case TranslationPolicy::AnchorAtBodyCenter:
            return (length + options_.bodyCenterMargin) / 2.0;
        case TranslationPolicy::AnchorAtCapOffset: return -options_.capOffset;
    }
    return 0.0;
}

std::expected<core::AffineTransform, GeometryError> RigidAlignment::computePose(
    const ImplantPlacement& placement, TranslationPolicy policy) const {

    auto direction = measuredDirection(placement);
    if (!direction) {
        getLogger()->error("Cannot align '{}': {}", placement.name, direction.error().message);
        return std::unexpected(direction.error());
    }

    auto rotation = alignmentRotation(*direction);
    if (!rotation) {
        getLogger()->error("Cannot align '{}': {}", placement.name, rotation.error().message);
        return std::unexpected(rotation.error());
    }

    const auto system = placement.entryPoint.system;
    const auto& entry = placement.entryPoint.value;

    Vector3 translation;
    if (policy == TranslationPolicy::AnchorAtMidpoint) {
        auto tip = coordinate::CoordinateConventions::convert(placement.tipPoint, system);
        translation = math::scale(math::add(entry, tip.value), 0.5);
    } else {
        translation = math::add(
            entry, math::scale(*direction, anchorOffset(policy, placement.length)));
    }

    auto pose = core::AffineTransform::identity(system);
    pose.setRotation(*rotation);
    pose.setTranslation(translation);

    getLogger()->debug("'{}' direction ({:.4f}, {:.4f}, {:.4f}), {} anchor ({:.3f}, {:.3f}, {:.3f}) {}",
                       placement.name, (*direction)[0], (*direction)[1], (*direction)[2],
                       toString(policy), translation[0], translation[1], translation[2],
                       core::toString(system));
    return pose;
}

std::expected<ImplantPlacement, GeometryError> RigidAlignment::restorePlacement(
    const std::string& name,
    const core::AffineTransform& pose,
    double radius,
    double length,
    TranslationPolicy policy) const {

    auto direction = math::normalized(math::multiply(pose.rotation(), options_.referenceAxis));
    if (!direction) {
        return std::unexpected(degenerate("pose of '" + name + "' collapses the reference axis"));
    }

    Vector3 anchor = pose.translation().value;
    Vector3 entry = math::subtract(anchor, math::scale(*direction, anchorOffset(policy, length)));
    Vector3 tip = math::add(entry, math::scale(*direction, length));

    ImplantPlacement placement;
    placement.name = name;
    placement.entryPoint = core::Point3{entry, pose.system};
    placement.tipPoint = core::Point3{tip, pose.system};
    placement.radius = radius;
    placement.length = length;
    return placement;
}

}  // namespace screw_planner::services::alignment
