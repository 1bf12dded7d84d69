/**
 * @file json_document.hpp
 * @brief Shared JSON file access and strict schema reading
 * @details File reads go through QFile and writes through QSaveFile so that
 *          a failed write never leaves a truncated document behind.
 *          SchemaReader extracts typed fields and records the first
 *          mismatch together with the path of the offending field.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "core/geometry_types.hpp"
#include "services/export/snapshot_serializer.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>

namespace screw_planner::services {

/**
 * @brief Read a whole UTF-8 file
 * @return Content, FileNotFound or FileAccessDenied
 */
[[nodiscard]] std::expected<std::string, SerializationError> readTextFile(
    const std::filesystem::path& filePath);

/**
 * @brief Atomically replace @p filePath with @p content
 * @return FileAccessDenied if the file cannot be opened, written or committed
 */
[[nodiscard]] std::expected<void, SerializationError> writeTextFileAtomically(
    const std::filesystem::path& filePath, const std::string& content);

/**
 * @brief Parse @p text as JSON
 * @return Document, or InvalidJson with the parser's message
 */
[[nodiscard]] std::expected<nlohmann::ordered_json, SerializationError> parseJson(
    const std::string& text);

/**
 * @brief Pretty-print @p root with a 2-space indent
 * @return Text, or InvalidSchema naming the first string that is not valid UTF-8
 */
[[nodiscard]] std::expected<std::string, SerializationError> dumpJson(
    const nlohmann::ordered_json& root);

/**
 * @brief Typed field access that remembers the first schema violation
 *
 * Accessors return a zero value once an error is recorded, so a whole
 * record can be read before checking ok().
 *
 * @code
 * SchemaReader reader;
 * double radius = reader.number(snapshot, "radius", "[0][1]");
 * auto viewUp = reader.vector3(camera, "viewUp", "[0][1].viewports[0].camera");
 * if (!reader.ok()) {
 *     return std::unexpected(reader.error());
 * }
 * @endcode
 */
class SchemaReader {
public:
    using Json = nlohmann::ordered_json;

    [[nodiscard]] bool ok() const noexcept { return !error_.has_value(); }

    [[nodiscard]] SerializationError error() const;

    /// Record a violation at @p path unless one is already recorded
    void fail(const std::string& path, const std::string& what);

    /// Child @p key of object @p parent, or nullptr after recording an error
    [[nodiscard]] const Json* member(const Json& parent, const std::string& key,
                                     const std::string& path);

    [[nodiscard]] double number(const Json& parent, const std::string& key,
                                const std::string& path);

    [[nodiscard]] int integer(const Json& parent, const std::string& key,
                              const std::string& path);

    [[nodiscard]] bool boolean(const Json& parent, const std::string& key,
                               const std::string& path);

    [[nodiscard]] std::string string(const Json& parent, const std::string& key,
                                     const std::string& path);

    /// [x, y, z]
    [[nodiscard]] core::Vector3 vector3(const Json& parent, const std::string& key,
                                        const std::string& path);

    /// {"0": x, "1": y, "2": z}
    [[nodiscard]] core::Vector3 indexedVector3(const Json& parent, const std::string& key,
                                               const std::string& path);

    /// [x, y]
    [[nodiscard]] std::array<double, 2> vector2(const Json& parent, const std::string& key,
                                                const std::string& path);

    /// 16 row-major values, or a nested 4x4 list when @p allowNested is set
    [[nodiscard]] core::Matrix4 matrix4(const Json& parent, const std::string& key,
                                        const std::string& path, bool allowNested = false);

    [[nodiscard]] double numberValue(const Json& value, const std::string& path);

private:
    std::optional<SerializationError> error_;
};

/// "[0][1]" + "camera" -> "[0][1].camera"
[[nodiscard]] std::string fieldPath(const std::string& parent, const std::string& key);

/// "[0][1].viewports" + 2 -> "[0][1].viewports[2]"
[[nodiscard]] std::string indexPath(const std::string& parent, size_t index);

}  // namespace screw_planner::services
