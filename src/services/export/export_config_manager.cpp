#include "services/export/export_config_manager.hpp"

#include "core/logging.hpp"

#include <QSettings>
#include <QString>
#include <QStringList>

#include <cmath>

namespace screw_planner::services {

namespace {
auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("ExportConfig");
    return logger;
}

constexpr const char* KEY_FRAME_OF_REFERENCE_UID = "frameOfReferenceUID";
constexpr const char* KEY_VOLUME_ID = "volumeId";
constexpr const char* KEY_PARALLEL_SCALE = "parallelScale";
constexpr const char* KEY_CAMERA_DISTANCE = "cameraDistance";
constexpr const char* KEY_RENDERING_ENGINE_ID = "renderingEngineId";
constexpr const char* KEY_VIEWPORT_TYPE = "viewportType";
constexpr const char* KEY_REFERENCE_AXIS = "referenceAxis";
constexpr const char* KEY_TRANSLATION_POLICY = "translationPolicy";
constexpr const char* KEY_BODY_CENTER_MARGIN = "bodyCenterMargin";
constexpr const char* KEY_CAP_OFFSET = "capOffset";
constexpr const char* KEY_SNAPSHOT_FILE = "snapshotFileName";
constexpr const char* KEY_TRANSFORMATION_FILE = "transformationFileName";
constexpr const char* KEY_LOG_LEVEL = "logLevel";
constexpr const char* KEY_LOG_DIRECTORY = "logDirectory";

void warnFallback(const char* key, const QString& raw) {
    getLogger()->warn("Invalid value '{}' for {}; using default", raw.toStdString(), key);
}

/// Positive (or non-negative when @p allowZero) finite number, else default
void readNumber(const QSettings& settings, const char* key, double& target, bool allowZero) {
    if (!settings.contains(key)) {
        return;
    }
    QString raw = settings.value(key).toString();
    bool ok = false;
    double value = raw.toDouble(&ok);
    if (!ok || !std::isfinite(value) || value < 0.0 || (!allowZero && value == 0.0)) {
        warnFallback(key, raw);
        return;
    }
    target = value;
}

void readText(const QSettings& settings, const char* key, std::string& target) {
    if (!settings.contains(key)) {
        return;
    }
    QString raw = settings.value(key).toString().trimmed();
    if (raw.isEmpty()) {
        warnFallback(key, raw);
        return;
    }
    target = raw.toStdString();
}

void readAxis(const QSettings& settings, core::Vector3& target) {
    if (!settings.contains(KEY_REFERENCE_AXIS)) {
        return;
    }
    QStringList parts = settings.value(KEY_REFERENCE_AXIS).toStringList();
    if (parts.size() == 1) {
        parts = parts.front().split(',', Qt::SkipEmptyParts);
    }
    QString raw = parts.join(',');
    if (parts.size() != 3) {
        warnFallback(KEY_REFERENCE_AXIS, raw);
        return;
    }

    core::Vector3 axis{};
    for (qsizetype i = 0; i < 3; ++i) {
        bool ok = false;
        axis[static_cast<size_t>(i)] = parts[i].trimmed().toDouble(&ok);
        if (!ok) {
            warnFallback(KEY_REFERENCE_AXIS, raw);
            return;
        }
    }
    if (axis[0] == 0.0 && axis[1] == 0.0 && axis[2] == 0.0) {
        warnFallback(KEY_REFERENCE_AXIS, raw);
        return;
    }
    target = axis;
}

void readPolicy(const QSettings& settings, alignment::TranslationPolicy& target) {
    if (!settings.contains(KEY_TRANSLATION_POLICY)) {
        return;
    }
    QString raw = settings.value(KEY_TRANSLATION_POLICY).toString();
    auto policy = alignment::translationPolicyFromString(raw.trimmed().toStdString());
    if (!policy) {
        warnFallback(KEY_TRANSLATION_POLICY, raw);
        return;
    }
    target = *policy;
}

void readLogLevel(const QSettings& settings, logging::LogLevel& target) {
    if (!settings.contains(KEY_LOG_LEVEL)) {
        return;
    }
    QString raw = settings.value(KEY_LOG_LEVEL).toString().trimmed();
    auto level = logging::logLevelFromString(raw.toStdString());
    if (level == logging::LogLevel::Info && raw.compare("info", Qt::CaseInsensitive) != 0) {
        warnFallback(KEY_LOG_LEVEL, raw);
        return;
    }
    target = level;
}

}  // namespace

std::expected<ExportConfig, ExportError> ExportConfigManager::load(
    const std::filesystem::path& filePath) {

    std::error_code ec;
    if (!std::filesystem::is_regular_file(filePath, ec)) {
        return std::unexpected(ExportError{
            ExportError::Code::InvalidConfig,
            "Config file not found: " + filePath.string()
        });
    }

    QSettings settings(QString::fromStdString(filePath.string()), QSettings::IniFormat);
    if (settings.status() != QSettings::NoError) {
        return std::unexpected(ExportError{
            ExportError::Code::InvalidConfig,
            "Cannot parse config file: " + filePath.string()
        });
    }

    ExportConfig config;
    settings.beginGroup(SETTINGS_GROUP);

    if (settings.contains(KEY_FRAME_OF_REFERENCE_UID)) {
        QString uid = settings.value(KEY_FRAME_OF_REFERENCE_UID).toString().trimmed();
        if (!uid.isEmpty()) {
            config.frameOfReferenceUID = uid.toStdString();
        }
    }
    readText(settings, KEY_VOLUME_ID, config.volumeId);
    readNumber(settings, KEY_PARALLEL_SCALE, config.parallelScale, false);
    readNumber(settings, KEY_CAMERA_DISTANCE, config.cameraDistance, false);
    readText(settings, KEY_RENDERING_ENGINE_ID, config.renderingEngineId);
    readText(settings, KEY_VIEWPORT_TYPE, config.viewportType);
    readAxis(settings, config.referenceAxis);
    readPolicy(settings, config.translationPolicy);
    readNumber(settings, KEY_BODY_CENTER_MARGIN, config.bodyCenterMargin, true);
    readNumber(settings, KEY_CAP_OFFSET, config.capOffset, true);
    readText(settings, KEY_SNAPSHOT_FILE, config.snapshotFileName);
    readText(settings, KEY_TRANSFORMATION_FILE, config.transformationFileName);
    readLogLevel(settings, config.logLevel);
    if (settings.contains(KEY_LOG_DIRECTORY)) {
        config.logDirectory = settings.value(KEY_LOG_DIRECTORY).toString().trimmed().toStdString();
    }

    settings.endGroup();

    if (!config.isValid()) {
        return std::unexpected(ExportError{
            ExportError::Code::InvalidConfig,
            "Configuration in " + filePath.string() + " is not usable"
        });
    }

    getLogger()->info("Loaded export configuration from {}", filePath.string());
    return config;
}

std::expected<void, ExportError> ExportConfigManager::save(
    const ExportConfig& config,
    const std::filesystem::path& filePath) {

    QSettings settings(QString::fromStdString(filePath.string()), QSettings::IniFormat);
    settings.beginGroup(SETTINGS_GROUP);

    // Clear existing entries
    settings.remove("");

    if (config.frameOfReferenceUID) {
        settings.setValue(KEY_FRAME_OF_REFERENCE_UID,
                          QString::fromStdString(*config.frameOfReferenceUID));
    }
    settings.setValue(KEY_VOLUME_ID, QString::fromStdString(config.volumeId));
    settings.setValue(KEY_PARALLEL_SCALE, config.parallelScale);
    settings.setValue(KEY_CAMERA_DISTANCE, config.cameraDistance);
    settings.setValue(KEY_RENDERING_ENGINE_ID, QString::fromStdString(config.renderingEngineId));
    settings.setValue(KEY_VIEWPORT_TYPE, QString::fromStdString(config.viewportType));
    settings.setValue(KEY_REFERENCE_AXIS, QStringList{
        QString::number(config.referenceAxis[0], 'g', 17),
        QString::number(config.referenceAxis[1], 'g', 17),
        QString::number(config.referenceAxis[2], 'g', 17)
    });
    settings.setValue(KEY_TRANSLATION_POLICY,
                      QString::fromStdString(alignment::toString(config.translationPolicy)));
    settings.setValue(KEY_BODY_CENTER_MARGIN, config.bodyCenterMargin);
    settings.setValue(KEY_CAP_OFFSET, config.capOffset);
    settings.setValue(KEY_SNAPSHOT_FILE, QString::fromStdString(config.snapshotFileName));
    settings.setValue(KEY_TRANSFORMATION_FILE,
                      QString::fromStdString(config.transformationFileName));
    settings.setValue(KEY_LOG_LEVEL, QString::fromStdString(logging::toString(config.logLevel)));
    if (!config.logDirectory.empty()) {
        settings.setValue(KEY_LOG_DIRECTORY, QString::fromStdString(config.logDirectory.string()));
    }

    settings.endGroup();
    settings.sync();

    if (settings.status() != QSettings::NoError) {
        return std::unexpected(ExportError{
            ExportError::Code::FileAccessDenied,
            "Cannot write config file: " + filePath.string()
        });
    }
    return {};
}

}  // namespace screw_planner::services
