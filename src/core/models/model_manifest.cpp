#include "core/models/model_manifest.h"

#include "core/shared/logging.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>

namespace gf {

namespace {

// Three numeric channel constants; with |positive| every one must be > 0.
bool readChannelTriple(const QJsonValue& value, bool positive, std::array<float, 3>& out)
{
    const QJsonArray array = value.toArray();
    if (array.size() != 3) {
        return false;
    }
    std::array<float, 3> parsed{};
    for (int c = 0; c < 3; ++c) {
        const QJsonValue channel = array.at(c);
        if (!channel.isDouble()) {
            return false;
        }
        parsed[static_cast<size_t>(c)] = static_cast<float>(channel.toDouble());
        if (positive && parsed[static_cast<size_t>(c)] <= 0.0f) {
            return false;
        }
    }
    out = parsed;
    return true;
}

std::vector<QString> readNames(const QJsonValue& value)
{
    std::vector<QString> names;
    const QJsonArray array = value.toArray();
    names.reserve(static_cast<size_t>(array.size()));
    for (const QJsonValue& name : array) {
        if (name.isString() && !name.toString().isEmpty()) {
            names.push_back(name.toString());
        }
    }
    return names;
}

std::optional<ModelManifestEntry> readEncoder(const QString& role, const QJsonObject& obj)
{
    ModelManifestEntry entry;
    entry.name = obj.value(QStringLiteral("name")).toString(role);
    entry.file = obj.value(QStringLiteral("file")).toString().trimmed();
    if (entry.file.isEmpty()) {
        LOG_WARN(gfCore, "ModelManifest: '%s' names no model file", qPrintable(role));
        return std::nullopt;
    }

    entry.modelId = obj.value(QStringLiteral("modelId")).toString(entry.name);
    entry.fallbackRole = obj.value(QStringLiteral("fallbackRole")).toString();
    entry.dimensions = obj.value(QStringLiteral("dimensions")).toInt(0);
    entry.imageSize = obj.value(QStringLiteral("imageSize")).toInt(entry.imageSize);
    entry.intraOpThreads = obj.value(QStringLiteral("intraOpThreads")).toInt(entry.intraOpThreads);
    if (entry.dimensions <= 0 || entry.imageSize <= 0) {
        LOG_WARN(gfCore, "ModelManifest: '%s' needs positive dimensions and imageSize",
                 qPrintable(role));
        return std::nullopt;
    }

    if (obj.contains(QStringLiteral("mean"))
        && !readChannelTriple(obj.value(QStringLiteral("mean")), false, entry.mean)) {
        LOG_WARN(gfCore, "ModelManifest: '%s' has a malformed mean, keeping CLIP defaults",
                 qPrintable(role));
    }
    if (obj.contains(QStringLiteral("std"))
        && !readChannelTriple(obj.value(QStringLiteral("std")), true, entry.std)) {
        LOG_WARN(gfCore, "ModelManifest: '%s' has a malformed std, keeping CLIP defaults",
                 qPrintable(role));
    }

    entry.inputs = readNames(obj.value(QStringLiteral("inputs")));
    entry.outputs = readNames(obj.value(QStringLiteral("outputs")));
    return entry;
}

} // namespace

std::optional<ModelManifest> ModelManifest::loadFromFile(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(gfCore, "ModelManifest: cannot open %s", qPrintable(path));
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(gfCore, "ModelManifest: %s is not a JSON object (%s)", qPrintable(path),
                 qPrintable(parseError.errorString()));
        return std::nullopt;
    }
    return loadFromJson(doc.object());
}

std::optional<ModelManifest> ModelManifest::loadFromJson(const QJsonObject& root)
{
    const QJsonValue models = root.value(QStringLiteral("models"));
    if (!models.isObject()) {
        LOG_WARN(gfCore, "ModelManifest: missing or invalid 'models' object");
        return std::nullopt;
    }

    ModelManifest manifest;
    const QJsonObject byRole = models.toObject();
    for (auto it = byRole.constBegin(); it != byRole.constEnd(); ++it) {
        if (!it.value().isObject()) {
            LOG_WARN(gfCore, "ModelManifest: entry '%s' is not an object, skipping",
                     qPrintable(it.key()));
            continue;
        }
        if (std::optional<ModelManifestEntry> entry = readEncoder(it.key(), it.value().toObject())) {
            manifest.models.emplace(it.key(), std::move(*entry));
        }
    }
    return manifest;
}

} // namespace gf
