/**
 * @file export_config_manager.hpp
 * @brief INI persistence of ExportConfig
 * @details Stores every ExportConfig field under the [Export] group of an INI
 *          file through QSettings. Keys absent from the file keep their
 *          defaults; unparseable values are replaced by the default and
 *          reported as a warning.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "services/export/export_config.hpp"

#include <expected>
#include <filesystem>

namespace screw_planner::services {

/**
 * @brief Loads and saves ExportConfig as an INI file
 *
 * @example
 * @code
 * auto config = ExportConfigManager::load("screw_planner.ini");
 * if (!config) {
 *     spdlog::error("{}", config.error().toString());
 * }
 * @endcode
 *
 * @trace SRS-FR-110
 */
class ExportConfigManager {
public:
    /// INI group holding the export settings
    static constexpr const char* SETTINGS_GROUP = "Export";

    /**
     * @brief Read a configuration file
     * @return Configuration, or InvalidConfig if the file is missing,
     *         unreadable, malformed or describes an invalid configuration
     */
    [[nodiscard]] static std::expected<ExportConfig, ExportError> load(
        const std::filesystem::path& filePath);

    /**
     * @brief Write @p config to @p filePath
     * @return FileAccessDenied if the file cannot be written
     */
    [[nodiscard]] static std::expected<void, ExportError> save(
        const ExportConfig& config,
        const std::filesystem::path& filePath);
};

}  // namespace screw_planner::services
