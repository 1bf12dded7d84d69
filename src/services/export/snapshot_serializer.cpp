#include "services/export/snapshot_serializer.hpp"

#include "core/logging.hpp"
#include "services/export/json_document.hpp"

#include <QDateTime>

namespace screw_planner::services {

using Json = nlohmann::ordered_json;
using viewport::ViewportDescriptor;

namespace {

Json vectorToJson(const core::Vector3& v) {
    return Json::array({v[0], v[1], v[2]});
}

Json indexedVectorToJson(const core::Vector3& v) {
    Json j = Json::object();
    j["0"] = v[0];
    j["1"] = v[1];
    j["2"] = v[2];
    return j;
}

Json panToJson(const std::array<double, 2>& pan) {
    return Json::array({pan[0], pan[1]});
}

Json viewportToJson(const ViewportDescriptor& v) {
    Json j;
    j["frameOfReferenceUID"] = v.frameOfReferenceUID;
    j["camera"] = {
        {"viewUp", vectorToJson(v.viewUp)},
        {"viewPlaneNormal", vectorToJson(v.viewPlaneNormal)},
        {"position", vectorToJson(v.position)},
        {"focalPoint", vectorToJson(v.focalPoint)},
        {"parallelProjection", v.parallelProjection},
        {"parallelScale", v.parallelScale},
        {"viewAngle", v.viewAngle},
        {"flipHorizontal", v.flipHorizontal},
        {"flipVertical", v.flipVertical},
        {"rotation", v.rotation}
    };
    j["viewReference"] = {
        {"FrameOfReferenceUID", v.frameOfReferenceUID},
        {"cameraFocalPoint", vectorToJson(v.focalPoint)},
        {"viewPlaneNormal", vectorToJson(v.viewPlaneNormal)},
        {"viewUp", vectorToJson(v.viewUp)},
        {"sliceIndex", v.sliceIndex},
        {"planeRestriction", {
            {"FrameOfReferenceUID", v.planeRestriction.frameOfReferenceUID},
            {"point", vectorToJson(v.planeRestriction.point)},
            {"inPlaneVector1", vectorToJson(v.planeRestriction.inPlaneVector1)},
            {"inPlaneVector2", indexedVectorToJson(v.planeRestriction.inPlaneVector2)}
        }},
        {"volumeId", v.volumeId}
    };
    j["viewPresentation"] = {
        {"rotation", v.rotation},
        {"zoom", v.zoom},
        {"pan", panToJson(v.pan)},
        {"flipHorizontal", v.flipHorizontal},
        {"flipVertical", v.flipVertical}
    };
    j["metadata"] = {
        {"viewportId", viewport::toString(v.id)},
        {"viewportType", v.viewportType},
        {"renderingEngineId", v.renderingEngineId},
        {"zoom", v.zoom},
        {"pan", panToJson(v.pan)}
    };
    return j;
}

ViewportDescriptor jsonToViewport(const Json& j, const std::string& path, SchemaReader& reader) {
    ViewportDescriptor v;
    v.frameOfReferenceUID = reader.string(j, "frameOfReferenceUID", path);

    if (const Json* camera = reader.member(j, "camera", path)) {
        const auto here = fieldPath(path, "camera");
        v.viewUp = reader.vector3(*camera, "viewUp", here);
        v.viewPlaneNormal = reader.vector3(*camera, "viewPlaneNormal", here);
        v.position = reader.vector3(*camera, "position", here);
        v.focalPoint = reader.vector3(*camera, "focalPoint", here);
        v.parallelProjection = reader.boolean(*camera, "parallelProjection", here);
        v.parallelScale = reader.number(*camera, "parallelScale", here);
        v.viewAngle = reader.number(*camera, "viewAngle", here);
        v.flipHorizontal = reader.boolean(*camera, "flipHorizontal", here);
        v.flipVertical = reader.boolean(*camera, "flipVertical", here);
        v.rotation = reader.number(*camera, "rotation", here);
    }

    if (const Json* reference = reader.member(j, "viewReference", path)) {
        const auto here = fieldPath(path, "viewReference");
        v.sliceIndex = reader.integer(*reference, "sliceIndex", here);
        v.volumeId = reader.string(*reference, "volumeId", here);

        if (const Json* restriction = reader.member(*reference, "planeRestriction", here)) {
            const auto inner = fieldPath(here, "planeRestriction");
            auto& pr = v.planeRestriction;
            pr.frameOfReferenceUID = reader.string(*restriction, "FrameOfReferenceUID", inner);
            pr.point = reader.vector3(*restriction, "point", inner);
            pr.inPlaneVector1 = reader.vector3(*restriction, "inPlaneVector1", inner);
            pr.inPlaneVector2 = reader.indexedVector3(*restriction, "inPlaneVector2", inner);
        }
    }

    if (const Json* presentation = reader.member(j, "viewPresentation", path)) {
        const auto here = fieldPath(path, "viewPresentation");
        v.zoom = reader.number(*presentation, "zoom", here);
        v.pan = reader.vector2(*presentation, "pan", here);
    }

    if (const Json* metadata = reader.member(j, "metadata", path)) {
        const auto here = fieldPath(path, "metadata");
        auto idText = reader.string(*metadata, "viewportId", here);
        if (reader.ok()) {
            if (auto id = viewport::viewportIdFromString(idText)) {
                v.id = *id;
            } else {
                reader.fail(fieldPath(here, "viewportId"), "unknown viewport id '" + idText + "'");
            }
        }
        v.viewportType = reader.string(*metadata, "viewportType", here);
        v.renderingEngineId = reader.string(*metadata, "renderingEngineId", here);
    }
    return v;
}

}  // namespace

// =============================================================================
// SnapshotSerializer::Impl
// =============================================================================

class SnapshotSerializer::Impl {
public:
    std::shared_ptr<spdlog::logger> logger = logging::LoggerFactory::create("SnapshotSerializer");

    Json snapshotToJson(const ViewportSnapshot& snapshot) const {
        Json j;
        j["name"] = snapshot.name;
        j["timestamp"] = snapshot.timestamp;
        j["radius"] = snapshot.radius;
        j["length"] = snapshot.length;

        Json transform = Json::array();
        for (double value : snapshot.transform.matrix) {
            transform.push_back(value);
        }
        j["transform"] = transform;

        Json viewports = Json::array();
        for (const auto& v : snapshot.viewports) {
            viewports.push_back(viewportToJson(v));
        }
        j["viewports"] = viewports;
        return j;
    }

    ViewportSnapshot jsonToSnapshot(const Json& j, const std::string& path,
                                    SchemaReader& reader) const {
        ViewportSnapshot snapshot;
        snapshot.name = reader.string(j, "name", path);
        snapshot.timestamp = reader.string(j, "timestamp", path);
        snapshot.radius = reader.number(j, "radius", path);
        snapshot.length = reader.number(j, "length", path);
        snapshot.transform.matrix = reader.matrix4(j, "transform", path);
        snapshot.transform.system = core::CoordinateSystem::LPS;

        const Json* viewports = reader.member(j, "viewports", path);
        if (!viewports) {
            return snapshot;
        }
        const auto here = fieldPath(path, "viewports");
        if (!viewports->is_array() || viewports->size() != viewport::kViewportOrder.size()) {
            reader.fail(here, "expected exactly 3 viewports (axial, sagittal, coronal)");
            return snapshot;
        }

        for (size_t n = 0; n < viewport::kViewportOrder.size(); ++n) {
            const auto itemPath = indexPath(here, n);
            snapshot.viewports[n] = jsonToViewport((*viewports)[n], itemPath, reader);
            if (reader.ok() && snapshot.viewports[n].id != viewport::kViewportOrder[n]) {
                reader.fail(fieldPath(itemPath, "metadata.viewportId"),
                            "expected " + viewport::toString(viewport::kViewportOrder[n]));
            }
        }
        return snapshot;
    }
};

// =============================================================================
// SnapshotSerializer public methods
// =============================================================================

SnapshotSerializer::SnapshotSerializer() : impl_(std::make_unique<Impl>()) {}

SnapshotSerializer::~SnapshotSerializer() = default;

SnapshotSerializer::SnapshotSerializer(SnapshotSerializer&&) noexcept = default;
SnapshotSerializer& SnapshotSerializer::operator=(SnapshotSerializer&&) noexcept = default;

std::string SnapshotSerializer::currentTimestamp() {
    return QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString();
}

Json SnapshotSerializer::toJson(const ViewportSnapshot& snapshot) const {
    return impl_->snapshotToJson(snapshot);
}

Json SnapshotSerializer::toJson(const std::vector<SnapshotEntry>& entries) const {
    Json root = Json::array();
    for (const auto& [name, snapshot] : entries) {
        root.push_back(Json::array({name, impl_->snapshotToJson(snapshot)}));
    }
    return root;
}

std::expected<std::vector<SnapshotEntry>, SerializationError> SnapshotSerializer::fromJson(
    const Json& root) const {

    SchemaReader reader;
    if (!root.is_array()) {
        reader.fail("", "expected an array of [name, snapshot] pairs");
        return std::unexpected(reader.error());
    }

    std::vector<SnapshotEntry> entries;
    entries.reserve(root.size());

    for (size_t i = 0; i < root.size(); ++i) {
        const auto& pair = root[i];
        const auto pairPath = indexPath("", i);
        if (!pair.is_array() || pair.size() != 2) {
            reader.fail(pairPath, "expected a [name, snapshot] pair");
            break;
        }
        if (!pair[0].is_string()) {
            reader.fail(indexPath(pairPath, 0), "expected a string");
            break;
        }

        auto snapshot = impl_->jsonToSnapshot(pair[1], indexPath(pairPath, 1), reader);
        if (!reader.ok()) {
            break;
        }
        entries.emplace_back(pair[0].get<std::string>(), std::move(snapshot));
    }

    if (!reader.ok()) {
        impl_->logger->error("Rejected snapshot document: {}", reader.error().message);
        return std::unexpected(reader.error());
    }
    return entries;
}

std::expected<std::string, SerializationError> SnapshotSerializer::serialize(
    const std::vector<SnapshotEntry>& entries) const {
    return dumpJson(toJson(entries));
}

std::expected<std::vector<SnapshotEntry>, SerializationError> SnapshotSerializer::deserialize(
    const std::string& text) const {
    return parseJson(text).and_then(
        [this](const Json& root) { return fromJson(root); });
}

std::expected<void, SerializationError> SnapshotSerializer::save(
    const std::vector<SnapshotEntry>& entries,
    const std::filesystem::path& filePath) const {

    auto written = serialize(entries).and_then([&filePath](const std::string& text) {
        return writeTextFileAtomically(filePath, text);
    });
    if (!written) {
        impl_->logger->error("{}", written.error().toString());
        return written;
    }
    impl_->logger->info("Saved {} viewport snapshot(s) to {}", entries.size(), filePath.string());
    return {};
}

std::expected<std::vector<SnapshotEntry>, SerializationError> SnapshotSerializer::load(
    const std::filesystem::path& filePath) const {

    auto content = readTextFile(filePath);
    if (!content) {
        impl_->logger->error("{}", content.error().toString());
        return std::unexpected(content.error());
    }

    auto entries = deserialize(*content);
    if (entries) {
        impl_->logger->info("Loaded {} viewport snapshot(s) from {}",
                            entries->size(), filePath.string());
    }
    return entries;
}

}  // namespace screw_planner::services
