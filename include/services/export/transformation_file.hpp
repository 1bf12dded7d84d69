/**
 * @file transformation_file.hpp
 * @brief Companion "transformation file" holding raw implant poses
 * @details JSON object mapping each implant name to
 *          {"matrix": [16 row-major values], "radius": r, "length": l}, plus
 *          a top-level "ijkToRas" entry holding the volume affine. Matrices
 *          are RAS, anchored at the entry point.
 *
 * Written matrices are always flat 16-element lists; the reader also accepts
 * nested 4x4 lists written by older planners. Implant order is preserved.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "core/geometry_types.hpp"
#include "services/export/snapshot_serializer.hpp"

#include <nlohmann/json.hpp>

#include <expected>
#include <filesystem>
#include <string>
#include <vector>

namespace screw_planner::services {

/**
 * @brief Stored pose and dimensions of one implant
 */
struct TransformationRecord {
    std::string name;
    core::AffineTransform matrix = core::AffineTransform::identity(core::CoordinateSystem::RAS);
    double radius = 0.0;
    double length = 0.0;

    [[nodiscard]] bool operator==(const TransformationRecord& other) const = default;
};

/**
 * @brief Whole transformation file
 */
struct TransformationDocument {
    std::vector<TransformationRecord> implants;
    core::AffineTransform ijkToRas = core::AffineTransform::identity(core::CoordinateSystem::RAS);

    [[nodiscard]] bool operator==(const TransformationDocument& other) const = default;
};

/**
 * @brief Reader and writer for transformation files
 *
 * @trace SRS-FR-108
 */
class TransformationFile {
public:
    static constexpr const char* DEFAULT_FILE_NAME = "transformation.json";

    /// Top-level key of the volume affine; not usable as an implant name
    static constexpr const char* IJK_TO_RAS_KEY = "ijkToRas";

    /**
     * @brief Build the JSON object
     * @return Object, or InvalidSchema for duplicate or reserved implant names
     */
    [[nodiscard]] static std::expected<nlohmann::ordered_json, SerializationError> toJson(
        const TransformationDocument& document);

    /**
     * @brief Parse the JSON object
     * @return Document, or InvalidSchema naming the offending field
     */
    [[nodiscard]] static std::expected<TransformationDocument, SerializationError> fromJson(
        const nlohmann::ordered_json& root);

    /**
     * @brief Atomically replace @p filePath with the document
     * @return InvalidSchema for names that cannot be encoded, FileAccessDenied
     *         if the file cannot be written
     */
    [[nodiscard]] static std::expected<void, SerializationError> save(
        const TransformationDocument& document,
        const std::filesystem::path& filePath);

    [[nodiscard]] static std::expected<TransformationDocument, SerializationError> load(
        const std::filesystem::path& filePath);
};

}  // namespace screw_planner::services
