#include "core/logging.hpp"
#include "services/alignment/frame_reference.hpp"
#include "services/export/export_config_manager.hpp"
#include "services/export/snapshot_exporter.hpp"
#include "services/export/transformation_file.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>

#include <cstdio>
#include <filesystem>
#include <optional>

using namespace screw_planner;

namespace {

int fail(const std::shared_ptr<spdlog::logger>& logger, const std::string& message) {
    logger->error("{}", message);
    return 1;
}

}  // namespace

/**
 * @brief Command-line entry point
 *
 * Reads a transformation file, restores each implant's control points and
 * writes the viewer snapshot file for all of them.
 */
int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("screw_planner_export");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("kcenon");
    app.setOrganizationDomain("github.com/kcenon");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Convert planned implant trajectories into MPR viewport snapshots.");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption transformationsOption(
        {"t", "transformations"}, "Transformation file to read.", "file");
    QCommandLineOption outputDirOption(
        {"o", "output-dir"}, "Directory receiving the snapshot file "
        "(default: directory of the transformation file).", "dir");
    QCommandLineOption configOption(
        {"c", "config"}, "INI configuration file.", "file");
    QCommandLineOption frameOfReferenceOption(
        "frame-of-reference-uid", "DICOM Frame of Reference UID of the volume.", "uid");
    QCommandLineOption volumeIdOption(
        "volume-id", "Volume identifier understood by the viewer.", "id");
    QCommandLineOption logLevelOption(
        "log-level", "trace, debug, info, warning, error, critical or off.", "level");
    QCommandLineOption logDirOption(
        "log-dir", "Also write a rotating log file into this directory.", "dir");

    parser.addOptions({transformationsOption, outputDirOption, configOption,
                       frameOfReferenceOption, volumeIdOption, logLevelOption,
                       logDirOption});
    parser.process(app);

    services::ExportConfig config;
    std::optional<services::ExportError> configError;
    if (parser.isSet(configOption)) {
        auto loaded = services::ExportConfigManager::load(
            parser.value(configOption).toStdString());
        if (loaded) {
            config = *loaded;
        } else {
            configError = loaded.error();
        }
    }

    if (parser.isSet(logLevelOption)) {
        config.logLevel = logging::logLevelFromString(parser.value(logLevelOption).toStdString());
    }

    if (parser.isSet(logDirOption)) {
        config.logDirectory = parser.value(logDirOption).toStdString();
    }

    logging::LogConfig logConfig;
    logConfig.level = config.logLevel;
    logConfig.logDirectory = config.logDirectory;
    logConfig.fileName = "screw_planner_export.log";
    try {
        logging::LoggerFactory::configure(logConfig);
    } catch (const spdlog::spdlog_ex& e) {
        std::fprintf(stderr, "Cannot open log file in %s: %s\n",
                     config.logDirectory.string().c_str(), e.what());
        return 1;
    }
    auto logger = logging::LoggerFactory::create("ScrewPlannerExport");

    if (configError) {
        return fail(logger, configError->toString());
    }

    if (parser.isSet(frameOfReferenceOption)) {
        config.frameOfReferenceUID = parser.value(frameOfReferenceOption).toStdString();
    }
    if (parser.isSet(volumeIdOption)) {
        config.volumeId = parser.value(volumeIdOption).toStdString();
    }
    if (!config.isValid()) {
        return fail(logger, "Invalid export configuration");
    }

    if (!parser.isSet(transformationsOption)) {
        return fail(logger, "--transformations is required");
    }
    std::filesystem::path transformationsPath =
        parser.value(transformationsOption).toStdString();
    std::filesystem::path outputDir = parser.isSet(outputDirOption)
        ? std::filesystem::path(parser.value(outputDirOption).toStdString())
        : transformationsPath.parent_path();
    if (outputDir.empty()) {
        outputDir = ".";
    }

    auto document = services::TransformationFile::load(transformationsPath);
    if (!document) {
        return fail(logger, document.error().toString());
    }

    auto placements = services::SnapshotExporter::restorePlacements(
        *document, config.alignmentOptions());
    if (!placements) {
        return fail(logger, placements.error().toString());
    }

    services::coordinate::VolumeGeometry volume;
    volume.ijkToRas = document->ijkToRas;

    services::SnapshotExporter exporter(
        config, volume, services::alignment::AnatomicalFrame::standard());

    auto written = exporter.exportSnapshots(*placements, outputDir);
    if (!written) {
        return fail(logger, written.error().toString());
    }

    std::printf("%s\n", written->string().c_str());
    return 0;
}
