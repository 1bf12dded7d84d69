#include <gtest/gtest.h>

#include "services/export/export_config_manager.hpp"

#include <QCoreApplication>
#include <QSettings>
#include <QTemporaryDir>

#include <filesystem>
#include <memory>

using namespace screw_planner;
using namespace screw_planner::services;

class ExportConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!QCoreApplication::instance()) {
            static int argc = 1;
            static char name[] = "export_config_manager_test";
            static char* argv[] = {name, nullptr};
            app = std::make_unique<QCoreApplication>(argc, argv);
        }
        ASSERT_TRUE(tempDir.isValid());
        configPath = std::filesystem::path(tempDir.path().toStdString()) / "export.ini";
    }

    /// Write raw values into the Export group
    void writeRaw(std::initializer_list<std::pair<QString, QVariant>> values) {
        QSettings settings(QString::fromStdString(configPath.string()), QSettings::IniFormat);
        settings.beginGroup(ExportConfigManager::SETTINGS_GROUP);
        for (const auto& [key, value] : values) {
            settings.setValue(key, value);
        }
        settings.endGroup();
        settings.sync();
    }

    std::unique_ptr<QCoreApplication> app;
    QTemporaryDir tempDir;
    std::filesystem::path configPath;
};

// ==================== Defaults ====================

TEST_F(ExportConfigManagerTest, DefaultConfigIsValid) {
    ExportConfig config;
    EXPECT_TRUE(config.isValid());
    EXPECT_TRUE(config.usesPlaceholderFrameOfReference());
    EXPECT_EQ(config.resolvedFrameOfReferenceUID(),
              ExportConfig::PLACEHOLDER_FRAME_OF_REFERENCE_UID);
    EXPECT_EQ(config.translationPolicy, alignment::TranslationPolicy::AnchorAtMidpoint);
}

TEST_F(ExportConfigManagerTest, DerivedOptions) {
    ExportConfig config;
    config.capOffset = 9.0;
    config.cameraDistance = 200.0;
    config.frameOfReferenceUID = "1.2.3";

    EXPECT_DOUBLE_EQ(config.alignmentOptions().capOffset, 9.0);
    EXPECT_DOUBLE_EQ(config.viewportSettings().cameraDistance, 200.0);
    EXPECT_EQ(config.resolvedFrameOfReferenceUID(), "1.2.3");
    EXPECT_FALSE(config.usesPlaceholderFrameOfReference());
}

TEST_F(ExportConfigManagerTest, InvalidConfigs) {
    ExportConfig config;
    config.cameraDistance = 0.0;
    EXPECT_FALSE(config.isValid());

    config = ExportConfig{};
    config.referenceAxis = {0.0, 0.0, 0.0};
    EXPECT_FALSE(config.isValid());

    config = ExportConfig{};
    config.frameOfReferenceUID = "";
    EXPECT_FALSE(config.isValid());
}

// ==================== Persistence ====================

TEST_F(ExportConfigManagerTest, SaveAndLoadRoundTrip) {
    ExportConfig config;
    config.frameOfReferenceUID = "1.2.840.113619.2.55.3.2831164356";
    config.volumeId = "cornerstoneStreamingImageVolume:ct";
    config.parallelScale = 180.5;
    config.cameraDistance = 420.0;
    config.referenceAxis = {0.0, 0.0, -1.0};
    config.translationPolicy = alignment::TranslationPolicy::AnchorAtCapOffset;
    config.bodyCenterMargin = 2.0;
    config.capOffset = 6.25;
    config.snapshotFileName = "snapshots.json";
    config.logLevel = logging::LogLevel::Debug;
    config.logDirectory = "/var/log/screw_planner";

    auto saved = ExportConfigManager::save(config, configPath);
    ASSERT_TRUE(saved.has_value()) << saved.error().toString();

    auto loaded = ExportConfigManager::load(configPath);
    ASSERT_TRUE(loaded.has_value()) << loaded.error().toString();
    EXPECT_EQ(loaded->frameOfReferenceUID, config.frameOfReferenceUID);
    EXPECT_EQ(loaded->volumeId, config.volumeId);
    EXPECT_DOUBLE_EQ(loaded->parallelScale, 180.5);
    EXPECT_DOUBLE_EQ(loaded->cameraDistance, 420.0);
    EXPECT_EQ(loaded->referenceAxis, config.referenceAxis);
    EXPECT_EQ(loaded->translationPolicy, alignment::TranslationPolicy::AnchorAtCapOffset);
    EXPECT_DOUBLE_EQ(loaded->bodyCenterMargin, 2.0);
    EXPECT_DOUBLE_EQ(loaded->capOffset, 6.25);
    EXPECT_EQ(loaded->snapshotFileName, "snapshots.json");
    EXPECT_EQ(loaded->transformationFileName, config.transformationFileName);
    EXPECT_EQ(loaded->logLevel, logging::LogLevel::Debug);
    EXPECT_EQ(loaded->logDirectory, std::filesystem::path("/var/log/screw_planner"));
}

TEST_F(ExportConfigManagerTest, MissingUidStaysUnset) {
    ASSERT_TRUE(ExportConfigManager::save(ExportConfig{}, configPath).has_value());
    auto loaded = ExportConfigManager::load(configPath);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_FALSE(loaded->frameOfReferenceUID.has_value());
    EXPECT_TRUE(loaded->logDirectory.empty());
}

TEST_F(ExportConfigManagerTest, PartialFileKeepsDefaults) {
    writeRaw({{"cameraDistance", 500.0}});
    auto loaded = ExportConfigManager::load(configPath);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_DOUBLE_EQ(loaded->cameraDistance, 500.0);
    EXPECT_DOUBLE_EQ(loaded->parallelScale, ExportConfig{}.parallelScale);
    EXPECT_EQ(loaded->renderingEngineId, "OHIFCornerstoneRenderingEngine");
}

TEST_F(ExportConfigManagerTest, InvalidValuesFallBackToDefaults) {
    writeRaw({
        {"cameraDistance", "-10"},
        {"parallelScale", "wide"},
        {"translationPolicy", "tip"},
        {"referenceAxis", "0,0,0"},
        {"capOffset", "-1"},
        {"logLevel", "verbose"},
        {"volumeId", "   "}
    });

    auto loaded = ExportConfigManager::load(configPath);
    ASSERT_TRUE(loaded.has_value()) << loaded.error().toString();

    ExportConfig defaults;
    EXPECT_DOUBLE_EQ(loaded->cameraDistance, defaults.cameraDistance);
    EXPECT_DOUBLE_EQ(loaded->parallelScale, defaults.parallelScale);
    EXPECT_EQ(loaded->translationPolicy, defaults.translationPolicy);
    EXPECT_EQ(loaded->referenceAxis, defaults.referenceAxis);
    EXPECT_DOUBLE_EQ(loaded->capOffset, defaults.capOffset);
    EXPECT_EQ(loaded->logLevel, defaults.logLevel);
    EXPECT_EQ(loaded->volumeId, defaults.volumeId);
}

TEST_F(ExportConfigManagerTest, AxisAsCommaSeparatedText) {
    writeRaw({{"referenceAxis", "1, 0, 0"}});
    auto loaded = ExportConfigManager::load(configPath);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->referenceAxis, (core::Vector3{1.0, 0.0, 0.0}));
}

TEST_F(ExportConfigManagerTest, PolicyNamesAreCaseInsensitive) {
    writeRaw({{"translationPolicy", "Body-Center"}});
    auto loaded = ExportConfigManager::load(configPath);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->translationPolicy, alignment::TranslationPolicy::AnchorAtBodyCenter);
}

// ==================== Errors ====================

TEST_F(ExportConfigManagerTest, MissingFileIsInvalidConfig) {
    auto loaded = ExportConfigManager::load(configPath.parent_path() / "absent.ini");
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, ExportError::Code::InvalidConfig);
}

TEST_F(ExportConfigManagerTest, DirectoryIsInvalidConfig) {
    auto loaded = ExportConfigManager::load(configPath.parent_path());
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, ExportError::Code::InvalidConfig);
}
