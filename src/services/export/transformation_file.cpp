#include "services/export/transformation_file.hpp"

#include "core/logging.hpp"
#include "services/export/json_document.hpp"

#include <set>

namespace screw_planner::services {

namespace {
auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("TransformationFile");
    return logger;
}

using Json = nlohmann::ordered_json;

Json matrixToJson(const core::Matrix4& m) {
    Json j = Json::array();
    for (double value : m) {
        j.push_back(value);
    }
    return j;
}
}  // namespace

std::expected<Json, SerializationError> TransformationFile::toJson(
    const TransformationDocument& document) {

    Json root = Json::object();
    std::set<std::string> seen;

    for (const auto& record : document.implants) {
        if (record.name == IJK_TO_RAS_KEY) {
            return std::unexpected(SerializationError{
                SerializationError::Code::InvalidSchema,
                std::string("implant name '") + IJK_TO_RAS_KEY + "' is reserved"
            });
        }
        if (!seen.insert(record.name).second) {
            return std::unexpected(SerializationError{
                SerializationError::Code::InvalidSchema,
                "duplicate implant name '" + record.name + "'"
            });
        }

        root[record.name] = {
            {"matrix", matrixToJson(record.matrix.matrix)},
            {"radius", record.radius},
            {"length", record.length}
        };
    }

    root[IJK_TO_RAS_KEY] = matrixToJson(document.ijkToRas.matrix);
    return root;
}

std::expected<TransformationDocument, SerializationError> TransformationFile::fromJson(
    const Json& root) {

    SchemaReader reader;
    TransformationDocument document;

    if (!root.is_object()) {
        reader.fail("", "expected an object of implant transformations");
        return std::unexpected(reader.error());
    }

    if (!root.contains(IJK_TO_RAS_KEY)) {
        reader.fail(IJK_TO_RAS_KEY, "missing field");
        return std::unexpected(reader.error());
    }

    document.ijkToRas.matrix = reader.matrix4(root, IJK_TO_RAS_KEY, "", true);
    document.ijkToRas.system = core::CoordinateSystem::RAS;

    for (auto it = root.begin(); it != root.end() && reader.ok(); ++it) {
        if (it.key() == IJK_TO_RAS_KEY) {
            continue;
        }

        TransformationRecord record;
        record.name = it.key();
        record.matrix.matrix = reader.matrix4(it.value(), "matrix", it.key(), true);
        record.matrix.system = core::CoordinateSystem::RAS;
        record.radius = reader.number(it.value(), "radius", it.key());
        record.length = reader.number(it.value(), "length", it.key());
        document.implants.push_back(std::move(record));
    }

    if (!reader.ok()) {
        getLogger()->error("Rejected transformation document: {}", reader.error().message);
        return std::unexpected(reader.error());
    }
    return document;
}

std::expected<void, SerializationError> TransformationFile::save(
    const TransformationDocument& document,
    const std::filesystem::path& filePath) {

    auto root = toJson(document);
    if (!root) {
        getLogger()->error("{}", root.error().toString());
        return std::unexpected(root.error());
    }

    auto written = dumpJson(*root).and_then([&filePath](const std::string& text) {
        return writeTextFileAtomically(filePath, text);
    });
    if (!written) {
        getLogger()->error("{}", written.error().toString());
        return written;
    }

    getLogger()->info("Saved {} implant transformation(s) to {}",
                      document.implants.size(), filePath.string());
    return {};
}

std::expected<TransformationDocument, SerializationError> TransformationFile::load(
    const std::filesystem::path& filePath) {

    auto document = readTextFile(filePath)
        .and_then(parseJson)
        .and_then([](const Json& root) { return fromJson(root); });

    if (!document) {
        getLogger()->error("Cannot load {}: {}", filePath.string(), document.error().toString());
        return document;
    }

    getLogger()->info("Loaded {} implant transformation(s) from {}",
                      document->implants.size(), filePath.string());
    return document;
}

}  // namespace screw_planner::services
