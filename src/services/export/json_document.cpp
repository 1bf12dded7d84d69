#include "services/export/json_document.hpp"

#include <QByteArray>
#include <QFile>
#include <QSaveFile>
#include <QString>

#include <cmath>
#include <limits>

namespace screw_planner::services {

using Json = nlohmann::ordered_json;

std::expected<std::string, SerializationError> readTextFile(
    const std::filesystem::path& filePath) {

    std::error_code ec;
    if (!std::filesystem::exists(filePath, ec)) {
        return std::unexpected(SerializationError{
            SerializationError::Code::FileNotFound,
            "File not found: " + filePath.string()
        });
    }

    QFile file(QString::fromStdString(filePath.string()));
    if (!file.open(QIODevice::ReadOnly)) {
        return std::unexpected(SerializationError{
            SerializationError::Code::FileAccessDenied,
            "Cannot open file for reading: " + filePath.string()
        });
    }

    QByteArray content = file.readAll();
    file.close();
    return content.toStdString();
}

std::expected<void, SerializationError> writeTextFileAtomically(
    const std::filesystem::path& filePath, const std::string& content) {

    QSaveFile file(QString::fromStdString(filePath.string()));
    if (!file.open(QIODevice::WriteOnly)) {
        return std::unexpected(SerializationError{
            SerializationError::Code::FileAccessDenied,
            "Cannot open file for writing: " + filePath.string()
        });
    }

    QByteArray bytes = QByteArray::fromStdString(content);
    if (file.write(bytes) != bytes.size()) {
        file.cancelWriting();
        return std::unexpected(SerializationError{
            SerializationError::Code::FileAccessDenied,
            "Failed to write " + filePath.string() + ": " + file.errorString().toStdString()
        });
    }

    if (!file.commit()) {
        return std::unexpected(SerializationError{
            SerializationError::Code::FileAccessDenied,
            "Failed to commit " + filePath.string() + ": " + file.errorString().toStdString()
        });
    }
    return {};
}

std::expected<Json, SerializationError> parseJson(const std::string& text) {
    try {
        return Json::parse(text);
    } catch (const Json::parse_error& e) {
        return std::unexpected(SerializationError{
            SerializationError::Code::InvalidJson,
            std::string("JSON parse error: ") + e.what()
        });
    }
}

namespace {

bool encodable(const std::string& text) {
    try {
        static_cast<void>(Json(text).dump());
        return true;
    } catch (const Json::type_error&) {
        return false;
    }
}

/// Path of the first key or string value that cannot be encoded, if any
std::optional<std::string> findUnencodable(const Json& node, const std::string& path) {
    if (node.is_string()) {
        return encodable(node.get_ref<const std::string&>()) ? std::nullopt
                                                            : std::optional(path);
    }
    if (node.is_array()) {
        for (size_t i = 0; i < node.size(); ++i) {
            if (auto found = findUnencodable(node[i], indexPath(path, i))) {
                return found;
            }
        }
    } else if (node.is_object()) {
        size_t position = 0;
        for (const auto& [key, value] : node.items()) {
            if (!encodable(key)) {
                // The key itself cannot be printed; name it by position
                return fieldPath(path, "<key " + std::to_string(position) + ">");
            }
            if (auto found = findUnencodable(value, fieldPath(path, key))) {
                return found;
            }
            ++position;
        }
    }
    return std::nullopt;
}

}  // namespace

std::expected<std::string, SerializationError> dumpJson(const Json& root) {
    try {
        return root.dump(2);
    } catch (const Json::type_error& e) {
        auto path = findUnencodable(root, "").value_or("");
        return std::unexpected(SerializationError{
            SerializationError::Code::InvalidSchema,
            (path.empty() ? std::string("<root>") : path) + ": " + e.what()
        });
    }
}

std::string fieldPath(const std::string& parent, const std::string& key) {
    return parent.empty() ? key : parent + "." + key;
}

std::string indexPath(const std::string& parent, size_t index) {
    return parent + "[" + std::to_string(index) + "]";
}

// =============================================================================
// SchemaReader
// =============================================================================

SerializationError SchemaReader::error() const {
    return error_.value_or(SerializationError{});
}

void SchemaReader::fail(const std::string& path, const std::string& what) {
    if (!error_) {
        error_ = SerializationError{
            SerializationError::Code::InvalidSchema,
            (path.empty() ? std::string("<root>") : path) + ": " + what
        };
    }
}

const Json* SchemaReader::member(const Json& parent, const std::string& key,
                                 const std::string& path) {
    if (error_) {
        return nullptr;
    }
    if (!parent.is_object()) {
        fail(path, "expected an object");
        return nullptr;
    }
    auto it = parent.find(key);
    if (it == parent.end()) {
        fail(fieldPath(path, key), "missing field");
        return nullptr;
    }
    return &*it;
}

double SchemaReader::numberValue(const Json& value, const std::string& path) {
    if (error_) {
        return 0.0;
    }
    if (!value.is_number()) {
        fail(path, "expected a number");
        return 0.0;
    }
    return value.get<double>();
}

double SchemaReader::number(const Json& parent, const std::string& key,
                            const std::string& path) {
    const Json* value = member(parent, key, path);
    return value ? numberValue(*value, fieldPath(path, key)) : 0.0;
}

int SchemaReader::integer(const Json& parent, const std::string& key,
                          const std::string& path) {
    const Json* value = member(parent, key, path);
    if (!value) {
        return 0;
    }
    if (value->is_number_integer()) {
        auto v = value->get<long long>();
        if (v >= std::numeric_limits<int>::min() && v <= std::numeric_limits<int>::max()) {
            return static_cast<int>(v);
        }
    } else if (value->is_number_float()) {
        double v = value->get<double>();
        if (std::trunc(v) == v &&
            v >= std::numeric_limits<int>::min() && v <= std::numeric_limits<int>::max()) {
            return static_cast<int>(v);
        }
    }
    fail(fieldPath(path, key), "expected an integer");
    return 0;
}

bool SchemaReader::boolean(const Json& parent, const std::string& key,
                           const std::string& path) {
    const Json* value = member(parent, key, path);
    if (!value) {
        return false;
    }
    if (!value->is_boolean()) {
        fail(fieldPath(path, key), "expected a boolean");
        return false;
    }
    return value->get<bool>();
}

std::string SchemaReader::string(const Json& parent, const std::string& key,
                                 const std::string& path) {
    const Json* value = member(parent, key, path);
    if (!value) {
        return {};
    }
    if (!value->is_string()) {
        fail(fieldPath(path, key), "expected a string");
        return {};
    }
    return value->get<std::string>();
}

core::Vector3 SchemaReader::vector3(const Json& parent, const std::string& key,
                                    const std::string& path) {
    core::Vector3 result = {0.0, 0.0, 0.0};
    const Json* value = member(parent, key, path);
    if (!value) {
        return result;
    }
    const auto here = fieldPath(path, key);
    if (!value->is_array() || value->size() != 3) {
        fail(here, "expected an array of 3 numbers");
        return result;
    }
    for (size_t i = 0; i < 3; ++i) {
        result[i] = numberValue((*value)[i], indexPath(here, i));
    }
    return result;
}

core::Vector3 SchemaReader::indexedVector3(const Json& parent, const std::string& key,
                                           const std::string& path) {
    core::Vector3 result = {0.0, 0.0, 0.0};
    const Json* value = member(parent, key, path);
    if (!value) {
        return result;
    }
    const auto here = fieldPath(path, key);
    if (!value->is_object() || value->size() != 3) {
        fail(here, "expected an object with keys \"0\", \"1\", \"2\"");
        return result;
    }
    for (size_t i = 0; i < 3; ++i) {
        result[i] = number(*value, std::to_string(i), here);
    }
    return result;
}

std::array<double, 2> SchemaReader::vector2(const Json& parent, const std::string& key,
                                            const std::string& path) {
    std::array<double, 2> result = {0.0, 0.0};
    const Json* value = member(parent, key, path);
    if (!value) {
        return result;
    }
    const auto here = fieldPath(path, key);
    if (!value->is_array() || value->size() != 2) {
        fail(here, "expected an array of 2 numbers");
        return result;
    }
    for (size_t i = 0; i < 2; ++i) {
        result[i] = numberValue((*value)[i], indexPath(here, i));
    }
    return result;
}

core::Matrix4 SchemaReader::matrix4(const Json& parent, const std::string& key,
                                    const std::string& path, bool allowNested) {
    core::Matrix4 result{};
    const Json* value = member(parent, key, path);
    if (!value) {
        return result;
    }
    const auto here = fieldPath(path, key);

    if (value->is_array() && value->size() == 16) {
        for (size_t i = 0; i < 16; ++i) {
            result[i] = numberValue((*value)[i], indexPath(here, i));
        }
        return result;
    }

    if (allowNested && value->is_array() && value->size() == 4) {
        for (size_t r = 0; r < 4; ++r) {
            const auto& row = (*value)[r];
            const auto rowPath = indexPath(here, r);
            if (!row.is_array() || row.size() != 4) {
                fail(rowPath, "expected a row of 4 numbers");
                return result;
            }
            for (size_t c = 0; c < 4; ++c) {
                result[r * 4 + c] = numberValue(row[c], indexPath(rowPath, c));
            }
        }
        return result;
    }

    fail(here, allowNested ? "expected 16 numbers or a 4x4 nested list"
                           : "expected an array of 16 numbers");
    return result;
}

}  // namespace screw_planner::services
