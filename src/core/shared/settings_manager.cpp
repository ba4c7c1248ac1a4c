#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>

namespace gf {

namespace {

QStringList stringListFromJson(const QJsonValue& value)
{
    QStringList list;
    const QJsonArray array = value.toArray();
    list.reserve(array.size());
    for (const QJsonValue& item : array) {
        list.append(item.toString());
    }
    return list;
}

void readInt(const QJsonObject& json, const char* key, int& target)
{
    const QString name = QString::fromLatin1(key);
    if (json.contains(name)) {
        target = json.value(name).toInt(target);
    }
}

void readDouble(const QJsonObject& json, const char* key, double& target)
{
    const QString name = QString::fromLatin1(key);
    if (json.contains(name)) {
        target = json.value(name).toDouble(target);
    }
}

QString envPath(const char* envName)
{
    const QString value = qEnvironmentVariable(envName).trimmed();
    if (value.isEmpty()) {
        return {};
    }
    return QDir::cleanPath(value);
}

} // namespace

std::optional<Settings> SettingsManager::load()
{
    return loadFrom(settingsFilePath());
}

std::optional<Settings> SettingsManager::loadFrom(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(gfCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(gfCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object());
}

bool SettingsManager::save(const Settings& settings)
{
    return saveTo(settings, settingsFilePath());
}

bool SettingsManager::saveTo(const Settings& settings, const QString& filePath)
{
    const QFileInfo fileInfo(filePath);
    const QString parentDir = fileInfo.absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(gfCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(gfCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(gfCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }

    return true;
}

QString SettingsManager::settingsFilePath()
{
    const QString configured = envPath("GHURFATI_CONFIG");
    if (!configured.isEmpty()) {
        return configured;
    }
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/ghurfati/settings.json");
}

QString SettingsManager::dataDirectory()
{
    const QString configured = envPath("GHURFATI_DATA_DIR");
    if (!configured.isEmpty()) {
        return configured;
    }
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/ghurfati");
}

void SettingsManager::resolvePaths(Settings& settings)
{
    if (settings.dataDir.isEmpty()) {
        settings.dataDir = dataDirectory();
    }
    const QDir dataDir(settings.dataDir);

    if (settings.dbPath.isEmpty()) {
        settings.dbPath = dataDir.filePath(QStringLiteral("jobs.db"));
    }
    if (settings.imageRoot.isEmpty()) {
        settings.imageRoot = dataDir.filePath(QStringLiteral("images"));
    }
    if (settings.indexPath.isEmpty()) {
        settings.indexPath = dataDir.filePath(QStringLiteral("catalog.hnsw"));
    }
    if (settings.indexMetaPath.isEmpty()) {
        settings.indexMetaPath = dataDir.filePath(QStringLiteral("catalog.meta"));
    }
    if (settings.catalogDbPath.isEmpty()) {
        settings.catalogDbPath = dataDir.filePath(QStringLiteral("catalog.db"));
    }

    const QString modelsOverride = envPath("GHURFATI_MODELS_DIR");
    if (!modelsOverride.isEmpty()) {
        settings.modelsDir = modelsOverride;
    } else if (settings.modelsDir.isEmpty()) {
        settings.modelsDir = dataDir.filePath(QStringLiteral("models"));
    }
}

QJsonObject SettingsManager::toJson(const Settings& settings)
{
    QJsonObject json;
    json.insert(QStringLiteral("dataDir"), settings.dataDir);
    json.insert(QStringLiteral("dbPath"), settings.dbPath);
    json.insert(QStringLiteral("imageRoot"), settings.imageRoot);

    json.insert(QStringLiteral("generatorCommand"), settings.generatorCommand);
    json.insert(QStringLiteral("generatorArgs"), QJsonArray::fromStringList(settings.generatorArgs));
    json.insert(QStringLiteral("generationTimeoutMs"), settings.generationTimeoutMs);

    json.insert(QStringLiteral("detectorCommand"), settings.detectorCommand);
    json.insert(QStringLiteral("detectorArgs"), QJsonArray::fromStringList(settings.detectorArgs));
    json.insert(QStringLiteral("extractionTimeoutMs"), settings.extractionTimeoutMs);
    json.insert(QStringLiteral("minDetectionScore"), settings.minDetectionScore);
    json.insert(QStringLiteral("maxRegions"), settings.maxRegions);
    json.insert(QStringLiteral("embeddingEnabled"), settings.embeddingEnabled);
    json.insert(QStringLiteral("modelsDir"), settings.modelsDir);

    json.insert(QStringLiteral("indexPath"), settings.indexPath);
    json.insert(QStringLiteral("indexMetaPath"), settings.indexMetaPath);
    json.insert(QStringLiteral("catalogDbPath"), settings.catalogDbPath);
    json.insert(QStringLiteral("embeddingDimensions"), settings.embeddingDimensions);
    json.insert(QStringLiteral("indexEfSearch"), settings.indexEfSearch);
    json.insert(QStringLiteral("indexQueryTimeoutMs"), settings.indexQueryTimeoutMs);
    json.insert(QStringLiteral("catalogPoolSize"), settings.catalogPoolSize);
    json.insert(QStringLiteral("catalogAcquireTimeoutMs"), settings.catalogAcquireTimeoutMs);

    json.insert(QStringLiteral("matchK"), settings.matchK);
    json.insert(QStringLiteral("overfetchFactor"), settings.overfetchFactor);
    json.insert(QStringLiteral("categoryMismatchPenalty"), settings.categoryMismatchPenalty);
    json.insert(QStringLiteral("ambiguousHintScore"), settings.ambiguousHintScore);
    json.insert(QStringLiteral("perJobMatchConcurrency"), settings.perJobMatchConcurrency);

    json.insert(QStringLiteral("admissionCapacity"), settings.admissionCapacity);
    json.insert(QStringLiteral("generationSlots"), settings.generationSlots);
    json.insert(QStringLiteral("workerCount"), settings.workerCount);
    json.insert(QStringLiteral("retryMaxAttempts"), settings.retryMaxAttempts);
    json.insert(QStringLiteral("retryBaseDelayMs"), settings.retryBaseDelayMs);
    json.insert(QStringLiteral("retryMultiplier"), settings.retryMultiplier);
    json.insert(QStringLiteral("retryMaxDelayMs"), settings.retryMaxDelayMs);
    json.insert(QStringLiteral("retentionDays"), settings.retentionDays);
    return json;
}

Settings SettingsManager::fromJson(const QJsonObject& json)
{
    Settings settings;

    settings.dataDir = json.value(QStringLiteral("dataDir")).toString(settings.dataDir);
    settings.dbPath = json.value(QStringLiteral("dbPath")).toString(settings.dbPath);
    settings.imageRoot = json.value(QStringLiteral("imageRoot")).toString(settings.imageRoot);

    settings.generatorCommand =
        json.value(QStringLiteral("generatorCommand")).toString(settings.generatorCommand);
    settings.generatorArgs = stringListFromJson(json.value(QStringLiteral("generatorArgs")));
    readInt(json, "generationTimeoutMs", settings.generationTimeoutMs);

    settings.detectorCommand =
        json.value(QStringLiteral("detectorCommand")).toString(settings.detectorCommand);
    settings.detectorArgs = stringListFromJson(json.value(QStringLiteral("detectorArgs")));
    readInt(json, "extractionTimeoutMs", settings.extractionTimeoutMs);
    readDouble(json, "minDetectionScore", settings.minDetectionScore);
    readInt(json, "maxRegions", settings.maxRegions);
    settings.embeddingEnabled = json.value(QStringLiteral("embeddingEnabled"))
                                    .toBool(settings.embeddingEnabled);
    settings.modelsDir = json.value(QStringLiteral("modelsDir")).toString(settings.modelsDir);

    settings.indexPath = json.value(QStringLiteral("indexPath")).toString(settings.indexPath);
    settings.indexMetaPath =
        json.value(QStringLiteral("indexMetaPath")).toString(settings.indexMetaPath);
    settings.catalogDbPath =
        json.value(QStringLiteral("catalogDbPath")).toString(settings.catalogDbPath);
    readInt(json, "embeddingDimensions", settings.embeddingDimensions);
    readInt(json, "indexEfSearch", settings.indexEfSearch);
    readInt(json, "indexQueryTimeoutMs", settings.indexQueryTimeoutMs);
    readInt(json, "catalogPoolSize", settings.catalogPoolSize);
    readInt(json, "catalogAcquireTimeoutMs", settings.catalogAcquireTimeoutMs);

    readInt(json, "matchK", settings.matchK);
    readInt(json, "overfetchFactor", settings.overfetchFactor);
    readDouble(json, "categoryMismatchPenalty", settings.categoryMismatchPenalty);
    readDouble(json, "ambiguousHintScore", settings.ambiguousHintScore);
    readInt(json, "perJobMatchConcurrency", settings.perJobMatchConcurrency);

    readInt(json, "admissionCapacity", settings.admissionCapacity);
    readInt(json, "generationSlots", settings.generationSlots);
    readInt(json, "workerCount", settings.workerCount);
    readInt(json, "retryMaxAttempts", settings.retryMaxAttempts);
    readInt(json, "retryBaseDelayMs", settings.retryBaseDelayMs);
    readDouble(json, "retryMultiplier", settings.retryMultiplier);
    readInt(json, "retryMaxDelayMs", settings.retryMaxDelayMs);
    readInt(json, "retentionDays", settings.retentionDays);

    return settings;
}

} // namespace gf
