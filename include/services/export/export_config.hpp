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
 * @file export_config.hpp
 * @brief Settings of the snapshot export pipeline
 * @details Defines ExportConfig with the viewer constants (Frame of Reference
 *          UID, volume id, camera distance, parallel scale), the implant
 *          model parameters (reference axis, translation policy, offsets) and
 *          the output file names, plus the ExportError reported by the
 *          exporter and the configuration loader.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "core/geometry_types.hpp"
#include "core/logging.hpp"
#include "services/alignment/rigid_alignment.hpp"
#include "services/viewport/viewport_types.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace screw_planner::services {

/**
 * @brief Error information for export operations
 *
 * @trace SRS-FR-109
 */
struct ExportError {
    enum class Code {
        Success,
        InvalidConfig,
        GeometryFailed,
        SerializationFailed,
        FileAccessDenied
    };

    Code code = Code::Success;
    std::string message;

    /// Implant being processed when the failure happened, if any
    std::string implantName;

    [[nodiscard]] bool isSuccess() const noexcept {
        return code == Code::Success;
    }

    [[nodiscard]] std::string toString() const {
        std::string where = implantName.empty() ? "" : " [" + implantName + "]";
        switch (code) {
            case Code::Success: return "Success";
            case Code::InvalidConfig: return "Invalid configuration: " + message;
            case Code::GeometryFailed: return "Geometry failed" + where + ": " + message;
            case Code::SerializationFailed: return "Serialization failed: " + message;
            case Code::FileAccessDenied: return "File access denied: " + message;
        }
        return "Unknown error";
    }
};

/**
 * @brief Export pipeline configuration
 *
 * @trace SRS-FR-110
 */
struct ExportConfig {
    /// Used when the volume's own Frame of Reference UID is unknown
    static constexpr const char* PLACEHOLDER_FRAME_OF_REFERENCE_UID =
        "1.2.826.0.1.3680043.8.498.86332697281993822957134910852142346599";

    /// DICOM Frame of Reference UID of the loaded volume
    std::optional<std::string> frameOfReferenceUID;

    /// Volume identifier understood by the viewer
    std::string volumeId = "cornerstoneStreamingImageVolume:default";

    double parallelScale = 234.20727282007405;

    /// Camera distance from the focal point (mm)
    double cameraDistance = 350.0;

    std::string renderingEngineId = "OHIFCornerstoneRenderingEngine";

    std::string viewportType = "orthographic";

    /// Native long axis of the implant model
    core::Vector3 referenceAxis = {0.0, -1.0, 0.0};

    /// Anchor of the exported pose
    alignment::TranslationPolicy translationPolicy = alignment::TranslationPolicy::AnchorAtMidpoint;

    /// mm added to the length for the body-center anchor
    double bodyCenterMargin = 4.0;

    /// mm behind the entry point for the cap anchor
    double capOffset = 7.5;

    std::string snapshotFileName = "viewport-snapshots-ohif.json";

    std::string transformationFileName = "transformation.json";

    logging::LogLevel logLevel = logging::LogLevel::Info;

    /// Directory of the rotating log file; empty logs to stderr only
    std::filesystem::path logDirectory;

    /**
     * @brief Validate the configuration
     * @return true if the configuration can drive an export
     */
    [[nodiscard]] bool isValid() const;

    /// Configured UID, or the placeholder if none is set
    [[nodiscard]] std::string resolvedFrameOfReferenceUID() const;

    /// True if resolvedFrameOfReferenceUID() falls back to the placeholder
    [[nodiscard]] bool usesPlaceholderFrameOfReference() const;

    [[nodiscard]] alignment::AlignmentOptions alignmentOptions() const;

    [[nodiscard]] viewport::ViewportSettings viewportSettings() const;
};

}  // namespace screw_planner::services
