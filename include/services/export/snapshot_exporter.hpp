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
 * @file snapshot_exporter.hpp
 * @brief End-to-end export of implant plans to viewer snapshot files
 * @details Drives the full pipeline for each implant: rigid alignment, frame
 *          correction, RAS to LPS conversion, slice indexing and viewport
 *          synthesis, then writes the snapshot file in one atomic overwrite.
 *          Also writes and reads the companion transformation file.
 *
 * ## Pipeline
 * ```
 * ImplantPlacement ──► RigidAlignment ──► FrameReference ──► toLps
 *                                                             │
 *          SnapshotSerializer ◄── ViewportSynthesizer ◄───────┘
 * ```
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "services/alignment/frame_reference.hpp"
#include "services/alignment/rigid_alignment.hpp"
#include "services/coordinate/coordinate_types.hpp"
#include "services/export/export_config.hpp"
#include "services/export/snapshot_serializer.hpp"
#include "services/export/transformation_file.hpp"

#include <expected>
#include <filesystem>
#include <memory>
#include <vector>

namespace screw_planner::services {

/**
 * @brief Exports implant placements for one loaded volume
 *
 * Stateless between calls apart from the immutable configuration, volume and
 * frame given at construction; safe to call concurrently for different
 * output files.
 *
 * @example
 * @code
 * SnapshotExporter exporter(config, volume, alignment::AnatomicalFrame::standard());
 *
 * auto written = exporter.exportSnapshots(placements, "/data/output");
 * if (!written) {
 *     spdlog::error("{}", written.error().toString());
 * }
 * @endcode
 *
 * @trace SRS-FR-109
 */
class SnapshotExporter {
public:
    /**
     * @param config Export settings
     * @param volume Volume geometry; an empty UID or volume id is taken from @p config
     * @param frame Anatomical reference frame of the volume
     */
    SnapshotExporter(ExportConfig config,
                     coordinate::VolumeGeometry volume,
                     alignment::AnatomicalFrame frame);
    ~SnapshotExporter();

    // Non-copyable, movable
    SnapshotExporter(const SnapshotExporter&) = delete;
    SnapshotExporter& operator=(const SnapshotExporter&) = delete;
    SnapshotExporter(SnapshotExporter&&) noexcept;
    SnapshotExporter& operator=(SnapshotExporter&&) noexcept;

    [[nodiscard]] const ExportConfig& config() const;

    /// Volume geometry with UID and volume id resolved
    [[nodiscard]] const coordinate::VolumeGeometry& volume() const;

    /**
     * @brief Corrected implant pose in LPS
     * @return Pose, or GeometryFailed naming the implant
     */
    [[nodiscard]] std::expected<core::AffineTransform, ExportError> computeViewerPose(
        const alignment::ImplantPlacement& placement) const;

    /**
     * @brief Snapshot of one implant, time-stamped now
     * @return Snapshot, or GeometryFailed naming the implant
     */
    [[nodiscard]] std::expected<ViewportSnapshot, ExportError> buildSnapshot(
        const alignment::ImplantPlacement& placement) const;

    /// Snapshots of all implants in input order; fails on the first bad implant
    [[nodiscard]] std::expected<std::vector<SnapshotEntry>, ExportError> buildSnapshots(
        const std::vector<alignment::ImplantPlacement>& placements) const;

    /**
     * @brief Build all snapshots and overwrite the snapshot file
     *
     * Nothing is written unless every implant succeeds.
     *
     * @param placements Implants to export
     * @param outputDir Existing output directory
     * @return Path of the written file
     */
    [[nodiscard]] std::expected<std::filesystem::path, ExportError> exportSnapshots(
        const std::vector<alignment::ImplantPlacement>& placements,
        const std::filesystem::path& outputDir) const;

    /// Entry-anchored RAS poses of all implants plus the volume affine
    [[nodiscard]] std::expected<TransformationDocument, ExportError> buildTransformations(
        const std::vector<alignment::ImplantPlacement>& placements) const;

    /**
     * @brief Overwrite the transformation file in @p outputDir
     * @return Path of the written file
     */
    [[nodiscard]] std::expected<std::filesystem::path, ExportError> exportTransformations(
        const std::vector<alignment::ImplantPlacement>& placements,
        const std::filesystem::path& outputDir) const;

    /**
     * @brief Control points of every implant in a transformation file
     *
     * Stored matrices are entry-anchored poses; @p options must describe the
     * same implant model that produced them.
     */
    [[nodiscard]] static std::expected<std::vector<alignment::ImplantPlacement>, ExportError>
    restorePlacements(const TransformationDocument& document,
                      const alignment::AlignmentOptions& options = {});

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace screw_planner::services
