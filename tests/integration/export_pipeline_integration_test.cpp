#include <gtest/gtest.h>

#include <QCoreApplication>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

#include "services/alignment/frame_reference.hpp"
#include "services/coordinate/coordinate_conventions.hpp"
#include "services/export/snapshot_exporter.hpp"
#include "services/export/snapshot_serializer.hpp"
#include "services/export/transformation_file.hpp"

#include "../test_utils/geometry_fixtures.hpp"

using namespace screw_planner;
using namespace screw_planner::services;
namespace fixtures = screw_planner::test_utils;
using screw_planner::core::CoordinateSystem;

class ExportPipelineIntegration : public ::testing::Test {
protected:
    void SetUp() override {
        outputDir_ = std::filesystem::temp_directory_path() / "export_pipeline_integration_test";
        std::filesystem::remove_all(outputDir_);
        std::filesystem::create_directories(outputDir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(outputDir_);
    }

    static std::string readFile(const std::filesystem::path& path) {
        std::ifstream file(path);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    SnapshotExporter makeExporter(const coordinate::VolumeGeometry& volume,
                                  ExportConfig config = {}) const {
        return SnapshotExporter(std::move(config), volume, alignment::AnatomicalFrame::standard());
    }

    std::filesystem::path outputDir_;
};

// =============================================================================
// Straight posterior trajectory through a flipped-axis volume
// Pipeline: placement -> midpoint pose -> coronal-pivot correction -> LPS -> viewports
// =============================================================================

TEST_F(ExportPipelineIntegration, PosteriorTrajectoryViewports) {
    auto volume = fixtures::makeVolume(fixtures::flippedIjkToRas());
    auto exporter = makeExporter(volume);

    auto placement = fixtures::makePlacement("L4", {0.0, 0.0, 0.0}, {0.0, -35.0, 0.0}, 3.25, 35.0);
    auto snapshot = exporter.buildSnapshot(placement);
    ASSERT_TRUE(snapshot.has_value()) << snapshot.error().toString();

    // Corrected RAS axes X = (0, 0, -1), Y = (0, 1, 0), Z = (-1, 0, 0), flipped to LPS
    const auto& pose = snapshot->transform;
    EXPECT_EQ(pose.system, CoordinateSystem::LPS);
    fixtures::expectVectorNear(pose.column(0), {0.0, 0.0, -1.0});
    fixtures::expectVectorNear(pose.column(1), {0.0, -1.0, 0.0});
    fixtures::expectVectorNear(pose.column(2), {1.0, 0.0, 0.0});
    fixtures::expectVectorNear(pose.translation().value, {0.0, 17.5, 0.0});

    const auto& axial = snapshot->viewports[0];
    fixtures::expectVectorNear(axial.viewUp, {0.0, -1.0, 0.0});
    fixtures::expectVectorNear(axial.viewPlaneNormal, {0.0, 0.0, -1.0});
    fixtures::expectVectorNear(axial.position, {0.0, 17.5, -350.0});
    EXPECT_EQ(axial.sliceIndex, 0);

    const auto& sagittal = snapshot->viewports[1];
    fixtures::expectVectorNear(sagittal.viewPlaneNormal, {1.0, 0.0, 0.0});
    EXPECT_EQ(sagittal.sliceIndex, 100);

    // J = 117.5 exactly; half-to-even rounds up to 118
    const auto& coronal = snapshot->viewports[2];
    fixtures::expectVectorNear(coronal.viewPlaneNormal, {0.0, -1.0, 0.0});
    EXPECT_EQ(coronal.sliceIndex, 118);

    EXPECT_EQ(snapshot->name, "L4");
    EXPECT_DOUBLE_EQ(snapshot->radius, 3.25);
    EXPECT_DOUBLE_EQ(snapshot->length, 35.0);
}

TEST_F(ExportPipelineIntegration, LpsInputMatchesRasInput) {
    auto exporter = makeExporter(fixtures::makeVolume());

    for (const auto& ras : fixtures::lumbarPlacements()) {
        auto lps = ras;
        lps.entryPoint = coordinate::CoordinateConventions::toLps(ras.entryPoint);
        lps.tipPoint = coordinate::CoordinateConventions::toLps(ras.tipPoint);

        auto fromRas = exporter.computeViewerPose(ras);
        auto fromLps = exporter.computeViewerPose(lps);
        ASSERT_TRUE(fromRas.has_value());
        ASSERT_TRUE(fromLps.has_value());
        fixtures::expectMatrix4Near(fromLps->matrix, fromRas->matrix);
    }
}

// =============================================================================
// Snapshot file export
// =============================================================================

TEST_F(ExportPipelineIntegration, ExportWritesAllImplantsInOrder) {
    auto volume = fixtures::makeVolume();
    auto exporter = makeExporter(volume);
    auto placements = fixtures::lumbarPlacements();

    auto written = exporter.exportSnapshots(placements, outputDir_);
    ASSERT_TRUE(written.has_value()) << written.error().toString();
    EXPECT_EQ(*written, outputDir_ / SnapshotSerializer::DEFAULT_FILE_NAME);

    SnapshotSerializer serializer;
    auto entries = serializer.load(*written);
    ASSERT_TRUE(entries.has_value()) << entries.error().toString();
    ASSERT_EQ(entries->size(), placements.size());

    for (size_t n = 0; n < placements.size(); ++n) {
        const auto& [name, snapshot] = (*entries)[n];
        EXPECT_EQ(name, placements[n].name);
        EXPECT_EQ(snapshot.name, placements[n].name);
        EXPECT_DOUBLE_EQ(snapshot.length, placements[n].length);
        for (const auto& viewport : snapshot.viewports) {
            EXPECT_EQ(viewport.frameOfReferenceUID, volume.frameOfReferenceUID);
            EXPECT_EQ(viewport.volumeId, volume.volumeId);
        }
    }
}

TEST_F(ExportPipelineIntegration, MissingUidUsesPlaceholder) {
    auto volume = fixtures::makeVolume(fixtures::anisotropicIjkToRas(), "", "");
    auto exporter = makeExporter(volume);

    EXPECT_EQ(exporter.volume().frameOfReferenceUID,
              ExportConfig::PLACEHOLDER_FRAME_OF_REFERENCE_UID);
    EXPECT_EQ(exporter.volume().volumeId, ExportConfig{}.volumeId);

    auto snapshot = exporter.buildSnapshot(fixtures::lumbarPlacements().front());
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->viewports[0].planeRestriction.frameOfReferenceUID,
              ExportConfig::PLACEHOLDER_FRAME_OF_REFERENCE_UID);
}

TEST_F(ExportPipelineIntegration, ConfiguredUidFillsMissingVolumeUid) {
    ExportConfig config;
    config.frameOfReferenceUID = "1.2.3.4.5";
    auto exporter = makeExporter(fixtures::makeVolume(fixtures::anisotropicIjkToRas(), ""), config);
    EXPECT_EQ(exporter.volume().frameOfReferenceUID, "1.2.3.4.5");
}

TEST_F(ExportPipelineIntegration, FailingImplantWritesNothing) {
    auto exporter = makeExporter(fixtures::makeVolume());
    auto path = outputDir_ / SnapshotSerializer::DEFAULT_FILE_NAME;

    ASSERT_TRUE(exporter.exportSnapshots(fixtures::lumbarPlacements(), outputDir_).has_value());
    auto before = readFile(path);

    auto placements = fixtures::lumbarPlacements();
    placements.insert(placements.begin() + 1,
                      fixtures::makePlacement("broken", {1.0, 2.0, 3.0}, {1.0, 2.0, 3.0}));

    auto result = exporter.exportSnapshots(placements, outputDir_);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ExportError::Code::GeometryFailed);
    EXPECT_EQ(result.error().implantName, "broken");
    EXPECT_EQ(readFile(path), before);
}

TEST_F(ExportPipelineIntegration, NonUtf8NameIsReportedNotThrown) {
    auto exporter = makeExporter(fixtures::makeVolume());
    auto placements = fixtures::lumbarPlacements();
    placements[0].name = "L4-g\xe4uche";

    auto snapshots = exporter.exportSnapshots(placements, outputDir_);
    ASSERT_FALSE(snapshots.has_value());
    EXPECT_EQ(snapshots.error().code, ExportError::Code::SerializationFailed);
    EXPECT_FALSE(std::filesystem::exists(outputDir_ / SnapshotSerializer::DEFAULT_FILE_NAME));

    auto transformations = exporter.exportTransformations(placements, outputDir_);
    ASSERT_FALSE(transformations.has_value());
    EXPECT_EQ(transformations.error().code, ExportError::Code::SerializationFailed);
    EXPECT_FALSE(std::filesystem::exists(outputDir_ / TransformationFile::DEFAULT_FILE_NAME));
}

TEST_F(ExportPipelineIntegration, MissingOutputDirectory) {
    auto exporter = makeExporter(fixtures::makeVolume());
    auto result = exporter.exportSnapshots(fixtures::lumbarPlacements(), outputDir_ / "missing");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ExportError::Code::FileAccessDenied);
}

TEST_F(ExportPipelineIntegration, InvalidConfigIsRejected) {
    ExportConfig config;
    config.parallelScale = -1.0;
    auto exporter = makeExporter(fixtures::makeVolume(), config);
    auto result = exporter.exportSnapshots(fixtures::lumbarPlacements(), outputDir_);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ExportError::Code::InvalidConfig);
    EXPECT_FALSE(std::filesystem::exists(outputDir_ / SnapshotSerializer::DEFAULT_FILE_NAME));
}

TEST_F(ExportPipelineIntegration, EmptyPlacementListWritesEmptyDocument) {
    auto exporter = makeExporter(fixtures::makeVolume());
    auto written = exporter.exportSnapshots({}, outputDir_);
    ASSERT_TRUE(written.has_value());

    SnapshotSerializer serializer;
    auto entries = serializer.load(*written);
    ASSERT_TRUE(entries.has_value());
    EXPECT_TRUE(entries->empty());
}

// =============================================================================
// Transformation file round trip
// Pipeline: placements -> entry-anchored poses -> file -> restored placements
// =============================================================================

TEST_F(ExportPipelineIntegration, TransformationsRestorePlacements) {
    auto volume = fixtures::makeVolume();
    auto exporter = makeExporter(volume);
    auto placements = fixtures::lumbarPlacements();

    auto written = exporter.exportTransformations(placements, outputDir_);
    ASSERT_TRUE(written.has_value()) << written.error().toString();
    EXPECT_EQ(*written, outputDir_ / TransformationFile::DEFAULT_FILE_NAME);

    auto document = TransformationFile::load(*written);
    ASSERT_TRUE(document.has_value()) << document.error().toString();
    fixtures::expectMatrix4Near(document->ijkToRas.matrix, volume.ijkToRas.matrix);

    auto restored = SnapshotExporter::restorePlacements(*document, exporter.config().alignmentOptions());
    ASSERT_TRUE(restored.has_value()) << restored.error().toString();
    ASSERT_EQ(restored->size(), placements.size());

    for (size_t n = 0; n < placements.size(); ++n) {
        EXPECT_EQ((*restored)[n].name, placements[n].name);
        EXPECT_DOUBLE_EQ((*restored)[n].radius, placements[n].radius);
        fixtures::expectVectorNear((*restored)[n].entryPoint.value, placements[n].entryPoint.value);
        fixtures::expectVectorNear((*restored)[n].tipPoint.value, placements[n].tipPoint.value);
    }
}

TEST_F(ExportPipelineIntegration, RestoredPlacementsExportSameSnapshots) {
    auto volume = fixtures::makeVolume();
    auto exporter = makeExporter(volume);
    auto placements = fixtures::lumbarPlacements();

    auto document = exporter.buildTransformations(placements);
    ASSERT_TRUE(document.has_value());
    auto restored = SnapshotExporter::restorePlacements(*document);
    ASSERT_TRUE(restored.has_value());

    for (size_t n = 0; n < placements.size(); ++n) {
        auto original = exporter.buildSnapshot(placements[n]);
        auto again = exporter.buildSnapshot((*restored)[n]);
        ASSERT_TRUE(original.has_value());
        ASSERT_TRUE(again.has_value());
        fixtures::expectMatrix4Near(again->transform.matrix, original->transform.matrix);
        for (size_t v = 0; v < 3; ++v) {
            EXPECT_EQ(again->viewports[v].sliceIndex, original->viewports[v].sliceIndex);
        }
    }
}

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
