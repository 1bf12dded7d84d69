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
 * @file snapshot_serializer.hpp
 * @brief JSON persistence of implant viewport snapshots
 * @details The snapshot file is a JSON array of [name, snapshot] pairs, not
 *          a mapping: duplicate names are kept positionally. Each snapshot
 *          holds the implant dimensions, its LPS pose as 16 row-major values
 *          and the axial, sagittal and coronal viewports.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "core/geometry_types.hpp"
#include "services/viewport/viewport_types.hpp"

#include <nlohmann/json.hpp>

#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace screw_planner::services {

/**
 * @brief Error information for serialization operations
 *
 * InvalidSchema messages start with the path of the offending field,
 * e.g. "[0][1].viewports[2].camera.viewUp".
 *
 * @trace SRS-FR-107
 */
struct SerializationError {
    enum class Code {
        Success,
        FileAccessDenied,
        FileNotFound,
        InvalidJson,
        InvalidSchema,
        InternalError
    };

    Code code = Code::Success;
    std::string message;

    [[nodiscard]] bool isSuccess() const noexcept {
        return code == Code::Success;
    }

    [[nodiscard]] std::string toString() const {
        switch (code) {
            case Code::Success: return "Success";
            case Code::FileAccessDenied: return "File access denied: " + message;
            case Code::FileNotFound: return "File not found: " + message;
            case Code::InvalidJson: return "Invalid JSON: " + message;
            case Code::InvalidSchema: return "Invalid schema: " + message;
            case Code::InternalError: return "Internal error: " + message;
        }
        return "Unknown error";
    }
};

/**
 * @brief Viewer state for one implant at one point in time
 */
struct ViewportSnapshot {
    std::string name;

    /// UTC, ISO-8601 with milliseconds and a 'Z' suffix
    std::string timestamp;

    double radius = 0.0;
    double length = 0.0;

    /// Implant pose in LPS
    core::AffineTransform transform = core::AffineTransform::identity(core::CoordinateSystem::LPS);

    /// Axial, sagittal, coronal
    viewport::ViewportSet viewports;

    [[nodiscard]] bool operator==(const ViewportSnapshot& other) const = default;
};

/// One [name, snapshot] pair of the snapshot file
using SnapshotEntry = std::pair<std::string, ViewportSnapshot>;

/**
 * @brief Reads and writes viewport snapshot files
 *
 * @example
 * @code
 * SnapshotSerializer serializer;
 * std::vector<SnapshotEntry> entries = ...;
 *
 * auto saved = serializer.save(entries, outputDir / "viewport-snapshots-ohif.json");
 * if (!saved) {
 *     spdlog::error("Save failed: {}", saved.error().toString());
 * }
 *
 * auto loaded = serializer.load(outputDir / "viewport-snapshots-ohif.json");
 * @endcode
 *
 * @trace SRS-FR-107
 */
class SnapshotSerializer {
public:
    /// Default file name in the output directory
    static constexpr const char* DEFAULT_FILE_NAME = "viewport-snapshots-ohif.json";

    SnapshotSerializer();
    ~SnapshotSerializer();

    // Non-copyable, movable
    SnapshotSerializer(const SnapshotSerializer&) = delete;
    SnapshotSerializer& operator=(const SnapshotSerializer&) = delete;
    SnapshotSerializer(SnapshotSerializer&&) noexcept;
    SnapshotSerializer& operator=(SnapshotSerializer&&) noexcept;

    /// Current UTC time, e.g. "2025-03-14T09:26:53.589Z"
    [[nodiscard]] static std::string currentTimestamp();

    [[nodiscard]] nlohmann::ordered_json toJson(const std::vector<SnapshotEntry>& entries) const;

    [[nodiscard]] nlohmann::ordered_json toJson(const ViewportSnapshot& snapshot) const;

    /**
     * @brief Exact inverse of toJson for well-formed documents
     * @return Entries in document order, or InvalidSchema naming the bad field
     */
    [[nodiscard]] std::expected<std::vector<SnapshotEntry>, SerializationError> fromJson(
        const nlohmann::ordered_json& root) const;

    /**
     * @brief Pretty-printed document with 2-space indent
     * @return Text, or InvalidSchema if a name or UID is not valid UTF-8
     */
    [[nodiscard]] std::expected<std::string, SerializationError> serialize(
        const std::vector<SnapshotEntry>& entries) const;

    [[nodiscard]] std::expected<std::vector<SnapshotEntry>, SerializationError> deserialize(
        const std::string& text) const;

    /**
     * @brief Replace @p filePath with the serialized entries
     *
     * The file is written to a temporary and committed atomically; on any
     * failure the previous file is left untouched.
     */
    [[nodiscard]] std::expected<void, SerializationError> save(
        const std::vector<SnapshotEntry>& entries,
        const std::filesystem::path& filePath) const;

    [[nodiscard]] std::expected<std::vector<SnapshotEntry>, SerializationError> load(
        const std::filesystem::path& filePath) const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace screw_planner::services
