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

#include "services/export/snapshot_exporter.hpp"

#include "core/logging.hpp"
#include "services/coordinate/coordinate_conventions.hpp"
#include "services/viewport/viewport_synthesizer.hpp"

#include <cmath>
#include <utility>

namespace screw_planner::services {

namespace {

using alignment::ImplantPlacement;

ExportError geometryFailed(const std::string& implant, const core::GeometryError& error) {
    return ExportError{ExportError::Code::GeometryFailed, error.toString(), implant};
}

ExportError fromSerialization(const SerializationError& error) {
    auto code = error.code == SerializationError::Code::FileAccessDenied
        ? ExportError::Code::FileAccessDenied
        : ExportError::Code::SerializationFailed;
    return ExportError{code, error.toString(), {}};
}

bool isFinite(const core::Vector3& v) {
    return std::isfinite(v[0]) && std::isfinite(v[1]) && std::isfinite(v[2]);
}

std::expected<void, ExportError> checkPlacement(const ImplantPlacement& placement) {
    if (!isFinite(placement.entryPoint.value) || !isFinite(placement.tipPoint.value)) {
        return std::unexpected(ExportError{
            ExportError::Code::GeometryFailed, "control point is not finite", placement.name});
    }
    if (!std::isfinite(placement.radius) || !std::isfinite(placement.length) ||
        placement.radius < 0.0 || placement.length < 0.0) {
        return std::unexpected(ExportError{
            ExportError::Code::GeometryFailed, "radius and length must be non-negative",
            placement.name});
    }
    return {};
}

std::expected<void, ExportError> checkOutputDir(const std::filesystem::path& outputDir) {
    std::error_code ec;
    if (!std::filesystem::is_directory(outputDir, ec)) {
        return std::unexpected(ExportError{
            ExportError::Code::FileAccessDenied,
            "Output directory does not exist: " + outputDir.string(), {}});
    }
    return {};
}

}  // namespace

// =============================================================================
// SnapshotExporter::Impl
// =============================================================================

class SnapshotExporter::Impl {
public:
    Impl(ExportConfig cfg, coordinate::VolumeGeometry vol, alignment::AnatomicalFrame frame)
        : config(std::move(cfg))
        , volume(std::move(vol))
        , rigidAlignment(config.alignmentOptions())
        , frameReference(std::move(frame))
        , synthesizer(config.viewportSettings())
    {
        if (volume.frameOfReferenceUID.empty()) {
            volume.frameOfReferenceUID = config.resolvedFrameOfReferenceUID();
            if (config.usesPlaceholderFrameOfReference()) {
                logger->warn("No Frame of Reference UID available; using placeholder {}",
                             volume.frameOfReferenceUID);
            }
        }
        if (volume.volumeId.empty()) {
            volume.volumeId = config.volumeId;
        }
    }

    std::shared_ptr<spdlog::logger> logger = logging::LoggerFactory::create("SnapshotExporter");
    ExportConfig config;
    coordinate::VolumeGeometry volume;
    alignment::RigidAlignment rigidAlignment;
    alignment::FrameReference frameReference;
    viewport::ViewportSynthesizer synthesizer;
    SnapshotSerializer serializer;

    std::expected<void, ExportError> checkConfig() const {
        if (!config.isValid()) {
            logger->error("Export configuration is invalid");
            return std::unexpected(ExportError{
                ExportError::Code::InvalidConfig, "export configuration is invalid", {}});
        }
        return {};
    }
};

// =============================================================================
// SnapshotExporter public methods
// =============================================================================

SnapshotExporter::SnapshotExporter(ExportConfig config,
                                   coordinate::VolumeGeometry volume,
                                   alignment::AnatomicalFrame frame)
    : impl_(std::make_unique<Impl>(std::move(config), std::move(volume), std::move(frame))) {}

SnapshotExporter::~SnapshotExporter() = default;

SnapshotExporter::SnapshotExporter(SnapshotExporter&&) noexcept = default;
SnapshotExporter& SnapshotExporter::operator=(SnapshotExporter&&) noexcept = default;

const ExportConfig& SnapshotExporter::config() const {
    return impl_->config;
}

const coordinate::VolumeGeometry& SnapshotExporter::volume() const {
    return impl_->volume;
}

std::expected<core::AffineTransform, ExportError> SnapshotExporter::computeViewerPose(
    const ImplantPlacement& placement) const {

    if (auto valid = checkPlacement(placement); !valid) {
        impl_->logger->error("{}", valid.error().toString());
        return std::unexpected(valid.error());
    }

    // The anatomical frame is expressed in RAS, like the volume affine
    ImplantPlacement ras = placement;
    ras.entryPoint = coordinate::CoordinateConventions::toRas(placement.entryPoint);
    ras.tipPoint = coordinate::CoordinateConventions::toRas(placement.tipPoint);

    auto direction = alignment::RigidAlignment::measuredDirection(ras);
    if (!direction) {
        return std::unexpected(geometryFailed(placement.name, direction.error()));
    }

    auto corrected = impl_->rigidAlignment.computePose(ras, impl_->config.translationPolicy)
        .and_then([&](const core::AffineTransform& pose) {
            return impl_->frameReference.correctAxes(pose, *direction);
        });
    if (!corrected) {
        return std::unexpected(geometryFailed(placement.name, corrected.error()));
    }

    return coordinate::CoordinateConventions::toLps(*corrected);
}

std::expected<ViewportSnapshot, ExportError> SnapshotExporter::buildSnapshot(
    const ImplantPlacement& placement) const {

    auto poseLps = computeViewerPose(placement);
    if (!poseLps) {
        return std::unexpected(poseLps.error());
    }

    auto viewports = impl_->synthesizer.buildViewports(*poseLps, impl_->volume);
    if (!viewports) {
        return std::unexpected(geometryFailed(placement.name, viewports.error()));
    }

    ViewportSnapshot snapshot;
    snapshot.name = placement.name;
    snapshot.timestamp = SnapshotSerializer::currentTimestamp();
    snapshot.radius = placement.radius;
    snapshot.length = placement.length;
    snapshot.transform = *poseLps;
    snapshot.viewports = std::move(*viewports);

    impl_->logger->debug("Built snapshot '{}' (slices K={}, I={}, J={})", placement.name,
                         snapshot.viewports[0].sliceIndex,
                         snapshot.viewports[1].sliceIndex,
                         snapshot.viewports[2].sliceIndex);
    return snapshot;
}

std::expected<std::vector<SnapshotEntry>, ExportError> SnapshotExporter::buildSnapshots(
    const std::vector<ImplantPlacement>& placements) const {

    std::vector<SnapshotEntry> entries;
    entries.reserve(placements.size());

    for (const auto& placement : placements) {
        auto snapshot = buildSnapshot(placement);
        if (!snapshot) {
            impl_->logger->error("{}", snapshot.error().toString());
            return std::unexpected(snapshot.error());
        }
        entries.emplace_back(placement.name, std::move(*snapshot));
    }
    return entries;
}

std::expected<std::filesystem::path, ExportError> SnapshotExporter::exportSnapshots(
    const std::vector<ImplantPlacement>& placements,
    const std::filesystem::path& outputDir) const {

    if (auto ok = impl_->checkConfig(); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = checkOutputDir(outputDir); !ok) {
        impl_->logger->error("{}", ok.error().toString());
        return std::unexpected(ok.error());
    }

    auto entries = buildSnapshots(placements);
    if (!entries) {
        impl_->logger->error("Snapshot export aborted; {} left untouched",
                             (outputDir / impl_->config.snapshotFileName).string());
        return std::unexpected(entries.error());
    }

    auto filePath = outputDir / impl_->config.snapshotFileName;
    auto saved = impl_->serializer.save(*entries, filePath);
    if (!saved) {
        return std::unexpected(fromSerialization(saved.error()));
    }

    impl_->logger->info("Exported {} implant(s) to {}", entries->size(), filePath.string());
    return filePath;
}

std::expected<TransformationDocument, ExportError> SnapshotExporter::buildTransformations(
    const std::vector<ImplantPlacement>& placements) const {

    TransformationDocument document;
    document.ijkToRas = coordinate::CoordinateConventions::toRas(impl_->volume.ijkToRas);

    for (const auto& placement : placements) {
        if (auto valid = checkPlacement(placement); !valid) {
            return std::unexpected(valid.error());
        }

        ImplantPlacement ras = placement;
        ras.entryPoint = coordinate::CoordinateConventions::toRas(placement.entryPoint);
        ras.tipPoint = coordinate::CoordinateConventions::toRas(placement.tipPoint);

        auto pose = impl_->rigidAlignment.computePose(ras, alignment::TranslationPolicy::AnchorAtStart);
        if (!pose) {
            return std::unexpected(geometryFailed(placement.name, pose.error()));
        }

        TransformationRecord record;
        record.name = placement.name;
        record.matrix = *pose;
        record.radius = placement.radius;
        record.length = placement.length;
        document.implants.push_back(std::move(record));
    }
    return document;
}

std::expected<std::filesystem::path, ExportError> SnapshotExporter::exportTransformations(
    const std::vector<ImplantPlacement>& placements,
    const std::filesystem::path& outputDir) const {

    if (auto ok = impl_->checkConfig(); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = checkOutputDir(outputDir); !ok) {
        impl_->logger->error("{}", ok.error().toString());
        return std::unexpected(ok.error());
    }

    auto document = buildTransformations(placements);
    if (!document) {
        impl_->logger->error("{}", document.error().toString());
        return std::unexpected(document.error());
    }

    auto filePath = outputDir / impl_->config.transformationFileName;
    auto saved = TransformationFile::save(*document, filePath);
    if (!saved) {
        return std::unexpected(fromSerialization(saved.error()));
    }
    return filePath;
}

std::expected<std::vector<ImplantPlacement>, ExportError> SnapshotExporter::restorePlacements(
    const TransformationDocument& document,
    const alignment::AlignmentOptions& options) {

    alignment::RigidAlignment aligner(options);
    std::vector<ImplantPlacement> placements;
    placements.reserve(document.implants.size());

    for (const auto& record : document.implants) {
        auto placement = aligner.restorePlacement(
            record.name, record.matrix, record.radius, record.length,
            alignment::TranslationPolicy::AnchorAtStart);
        if (!placement) {
            return std::unexpected(geometryFailed(record.name, placement.error()));
        }
        placements.push_back(std::move(*placement));
    }
    return placements;
}

}  // namespace screw_planner::services
