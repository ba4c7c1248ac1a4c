#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace gf {

// Reads and writes the matcher's settings.json.
//
// The file lives at $GHURFATI_CONFIG when set, otherwise at
// <GenericDataLocation>/ghurfati/settings.json.
class SettingsManager {
public:
    // nullopt when the file is missing or not a JSON object; callers then
    // run on defaults.
    static std::optional<Settings> load();
    static std::optional<Settings> loadFrom(const QString& filePath);

    // Parent directories are created as needed.
    static bool save(const Settings& settings);
    static bool saveTo(const Settings& settings, const QString& filePath);

    static QString settingsFilePath();

    // Data directory: $GHURFATI_DATA_DIR, else <GenericDataLocation>/ghurfati.
    static QString dataDirectory();

    // Fills every empty path in |settings| from its data directory and the
    // GHURFATI_MODELS_DIR override.
    static void resolvePaths(Settings& settings);

    // Keys absent from |json| keep their default values.
    static QJsonObject toJson(const Settings& settings);
    static Settings fromJson(const QJsonObject& json);
};

} // namespace gf
