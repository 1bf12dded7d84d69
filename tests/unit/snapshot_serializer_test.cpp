#include <gtest/gtest.h>

#include "services/export/snapshot_serializer.hpp"
#include "services/viewport/viewport_synthesizer.hpp"
#include "../test_utils/geometry_fixtures.hpp"

#include <QCoreApplication>

#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>

using namespace screw_planner;
using namespace screw_planner::services;
using screw_planner::core::AffineTransform;
using screw_planner::core::CoordinateSystem;
using Json = nlohmann::ordered_json;

class SnapshotSerializerTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir_ = std::filesystem::temp_directory_path() / "snapshot_serializer_test";
        std::filesystem::remove_all(testDir_);
        std::filesystem::create_directories(testDir_);

        volume_ = test_utils::makeVolume(test_utils::flippedIjkToRas());
    }

    void TearDown() override {
        std::filesystem::remove_all(testDir_);
    }

    ViewportSnapshot makeSnapshot(const std::string& name, double offset) const {
        AffineTransform pose = AffineTransform::identity(CoordinateSystem::LPS);
        // Half turn about Z keeps the axes orthonormal but non-trivial
        pose.setRotation({{{-1.0, 0.0, 0.0}, {0.0, -1.0, 0.0}, {0.0, 0.0, 1.0}}});
        pose.setTranslation({-90.0 + offset, -90.0, 5.0 + offset * 0.5});

        ViewportSnapshot snapshot;
        snapshot.name = name;
        snapshot.timestamp = "2025-03-14T09:26:53.589Z";
        snapshot.radius = 3.25;
        snapshot.length = 40.0;
        snapshot.transform = pose;
        auto viewports = synthesizer_.buildViewports(pose, volume_);
        EXPECT_TRUE(viewports.has_value());
        if (viewports) {
            snapshot.viewports = *viewports;
        }
        return snapshot;
    }

    std::vector<SnapshotEntry> makeEntries() const {
        return {
            {"L4-left", makeSnapshot("L4-left", 0.0)},
            {"L4-right", makeSnapshot("L4-right", 1.3)},
            {"L5-left", makeSnapshot("L5-left", -2.7)}
        };
    }

    static std::string readFile(const std::filesystem::path& path) {
        std::ifstream file(path);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    std::filesystem::path testDir_;
    coordinate::VolumeGeometry volume_;
    viewport::ViewportSynthesizer synthesizer_;
    SnapshotSerializer serializer_;
};

// ==================== Document layout ====================

TEST_F(SnapshotSerializerTest, DocumentIsArrayOfNamedPairs) {
    auto root = serializer_.toJson(makeEntries());
    ASSERT_TRUE(root.is_array());
    ASSERT_EQ(root.size(), 3u);
    EXPECT_EQ(root[0][0], "L4-left");
    EXPECT_EQ(root[2][0], "L5-left");
    EXPECT_EQ(root[1][1]["name"], "L4-right");
    EXPECT_EQ(root[1][1]["transform"].size(), 16u);
    EXPECT_EQ(root[1][1]["viewports"].size(), 3u);
}

TEST_F(SnapshotSerializerTest, SnapshotKeysAreOrdered) {
    auto j = serializer_.toJson(makeSnapshot("a", 0.0));
    std::vector<std::string> keys;
    for (auto it = j.begin(); it != j.end(); ++it) {
        keys.push_back(it.key());
    }
    EXPECT_EQ(keys, (std::vector<std::string>{
        "name", "timestamp", "radius", "length", "transform", "viewports"}));
}

TEST_F(SnapshotSerializerTest, ViewportFieldsAreMirrored) {
    auto j = serializer_.toJson(makeSnapshot("a", 0.0));
    const auto& axial = j["viewports"][0];

    EXPECT_EQ(axial["metadata"]["viewportId"], "mpr-axial");
    EXPECT_EQ(axial["metadata"]["renderingEngineId"], "OHIFCornerstoneRenderingEngine");
    EXPECT_EQ(axial["frameOfReferenceUID"], volume_.frameOfReferenceUID);
    EXPECT_EQ(axial["viewReference"]["FrameOfReferenceUID"], volume_.frameOfReferenceUID);
    EXPECT_EQ(axial["viewReference"]["cameraFocalPoint"], axial["camera"]["focalPoint"]);
    EXPECT_EQ(axial["viewReference"]["viewUp"], axial["camera"]["viewUp"]);
    EXPECT_EQ(axial["viewReference"]["volumeId"], volume_.volumeId);
    EXPECT_EQ(axial["viewReference"]["sliceIndex"], 5);
    EXPECT_EQ(axial["viewPresentation"]["zoom"], axial["metadata"]["zoom"]);
    EXPECT_EQ(axial["camera"]["parallelProjection"], true);

    const auto& restriction = axial["viewReference"]["planeRestriction"];
    EXPECT_TRUE(restriction["inPlaneVector1"].is_array());
    ASSERT_TRUE(restriction["inPlaneVector2"].is_object());
    EXPECT_TRUE(restriction["inPlaneVector2"].contains("0"));
    EXPECT_TRUE(restriction["inPlaneVector2"].contains("2"));
}

TEST_F(SnapshotSerializerTest, SerializeUsesTwoSpaceIndent) {
    auto text = serializer_.serialize(makeEntries());
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(text->rfind("[\n  [\n    \"L4-left\"", 0), 0u);
}

// ==================== Round trip ====================

TEST_F(SnapshotSerializerTest, DeserializeRestoresEntriesInOrder) {
    auto entries = makeEntries();
    auto restored = serializer_.deserialize(serializer_.serialize(entries).value());
    ASSERT_TRUE(restored.has_value()) << restored.error().toString();
    EXPECT_EQ(*restored, entries);
}

TEST_F(SnapshotSerializerTest, DuplicateNamesArePreserved) {
    std::vector<SnapshotEntry> entries = {
        {"L4-left", makeSnapshot("L4-left", 0.0)},
        {"L4-left", makeSnapshot("L4-left", 4.0)}
    };
    auto restored = serializer_.deserialize(serializer_.serialize(entries).value());
    ASSERT_TRUE(restored.has_value());
    ASSERT_EQ(restored->size(), 2u);
    EXPECT_EQ(*restored, entries);
}

TEST_F(SnapshotSerializerTest, EmptyDocument) {
    auto restored = serializer_.deserialize("[]");
    ASSERT_TRUE(restored.has_value());
    EXPECT_TRUE(restored->empty());
}

// ==================== Schema errors ====================

TEST_F(SnapshotSerializerTest, MalformedJsonIsInvalidJson) {
    auto result = serializer_.deserialize("[[\"a\", {");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, SerializationError::Code::InvalidJson);
}

TEST_F(SnapshotSerializerTest, NonArrayRootIsRejected) {
    auto result = serializer_.fromJson(Json::object());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, SerializationError::Code::InvalidSchema);
    EXPECT_NE(result.error().message.find("<root>"), std::string::npos);
}

TEST_F(SnapshotSerializerTest, MissingFieldIsNamed) {
    auto root = serializer_.toJson(makeEntries());
    root[1][1]["viewports"][2]["camera"].erase("viewUp");

    auto result = serializer_.fromJson(root);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, SerializationError::Code::InvalidSchema);
    EXPECT_NE(result.error().message.find("[1][1].viewports[2].camera.viewUp"), std::string::npos)
        << result.error().message;
}

TEST_F(SnapshotSerializerTest, WrongViewportCountIsRejected) {
    auto root = serializer_.toJson(makeEntries());
    root[0][1]["viewports"].erase(static_cast<Json::size_type>(2));

    auto result = serializer_.fromJson(root);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message.find("[0][1].viewports"), std::string::npos);
}

TEST_F(SnapshotSerializerTest, ViewportsOutOfOrderAreRejected) {
    auto root = serializer_.toJson(makeEntries());
    std::swap(root[0][1]["viewports"][0], root[0][1]["viewports"][1]);

    auto result = serializer_.fromJson(root);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message.find("[0][1].viewports[0].metadata.viewportId"),
              std::string::npos) << result.error().message;
}

TEST_F(SnapshotSerializerTest, WrongTypeIsRejected) {
    auto root = serializer_.toJson(makeEntries());
    root[2][1]["radius"] = "3.25";

    auto result = serializer_.fromJson(root);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message.find("[2][1].radius"), std::string::npos);
}

TEST_F(SnapshotSerializerTest, InPlaneVector2AsArrayIsRejected) {
    auto root = serializer_.toJson(makeEntries());
    root[0][1]["viewports"][1]["viewReference"]["planeRestriction"]["inPlaneVector2"] =
        Json::array({1.0, 0.0, 0.0});

    auto result = serializer_.fromJson(root);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message.find("planeRestriction.inPlaneVector2"), std::string::npos);
}

// ==================== Timestamp ====================

TEST_F(SnapshotSerializerTest, TimestampIsUtcWithMilliseconds) {
    auto timestamp = SnapshotSerializer::currentTimestamp();
    std::regex pattern(R"(^\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{3}Z$)");
    EXPECT_TRUE(std::regex_match(timestamp, pattern)) << timestamp;
}

// ==================== Files ====================

TEST_F(SnapshotSerializerTest, SaveAndLoad) {
    auto path = testDir_ / SnapshotSerializer::DEFAULT_FILE_NAME;
    auto entries = makeEntries();

    auto saved = serializer_.save(entries, path);
    ASSERT_TRUE(saved.has_value()) << saved.error().toString();
    EXPECT_TRUE(std::filesystem::exists(path));

    auto loaded = serializer_.load(path);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, entries);
}

TEST_F(SnapshotSerializerTest, SaveOverwritesPreviousFile) {
    auto path = testDir_ / SnapshotSerializer::DEFAULT_FILE_NAME;
    ASSERT_TRUE(serializer_.save(makeEntries(), path).has_value());

    std::vector<SnapshotEntry> single = {{"S1", makeSnapshot("S1", 0.0)}};
    ASSERT_TRUE(serializer_.save(single, path).has_value());

    auto loaded = serializer_.load(path);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, single);
}

TEST_F(SnapshotSerializerTest, SaveIntoMissingDirectoryFails) {
    auto path = testDir_ / "missing" / SnapshotSerializer::DEFAULT_FILE_NAME;
    auto saved = serializer_.save(makeEntries(), path);
    ASSERT_FALSE(saved.has_value());
    EXPECT_EQ(saved.error().code, SerializationError::Code::FileAccessDenied);
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(SnapshotSerializerTest, FailedSaveLeavesNoPartialFile) {
    auto path = testDir_ / SnapshotSerializer::DEFAULT_FILE_NAME;
    ASSERT_TRUE(serializer_.save(makeEntries(), path).has_value());
    auto before = readFile(path);

    // A directory in place of the target cannot be replaced
    auto blocked = testDir_ / "blocked.json";
    std::filesystem::create_directories(blocked);
    EXPECT_FALSE(serializer_.save(makeEntries(), blocked).has_value());

    EXPECT_EQ(readFile(path), before);
    for (const auto& entry : std::filesystem::directory_iterator(testDir_)) {
        auto name = entry.path().filename().string();
        EXPECT_TRUE(name == SnapshotSerializer::DEFAULT_FILE_NAME || name == "blocked.json") << name;
    }
}

TEST_F(SnapshotSerializerTest, NonUtf8NameIsInvalidSchema) {
    auto entries = makeEntries();
    entries[1].first = "L4-g\xe4uche";

    auto text = serializer_.serialize(entries);
    ASSERT_FALSE(text.has_value());
    EXPECT_EQ(text.error().code, SerializationError::Code::InvalidSchema);
    EXPECT_EQ(text.error().message.rfind("[1][0]", 0), 0u) << text.error().message;

    auto path = testDir_ / SnapshotSerializer::DEFAULT_FILE_NAME;
    auto saved = serializer_.save(entries, path);
    ASSERT_FALSE(saved.has_value());
    EXPECT_EQ(saved.error().code, SerializationError::Code::InvalidSchema);
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(SnapshotSerializerTest, LoadMissingFile) {
    auto loaded = serializer_.load(testDir_ / "absent.json");
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, SerializationError::Code::FileNotFound);
}

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
