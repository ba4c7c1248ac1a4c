#pragma once

#include <QJsonObject>
#include <QString>

#include <array>
#include <map>
#include <optional>
#include <vector>

namespace gf {

// An image encoder declared in <modelsDir>/manifest.json. The preprocessing
// fields describe what the ONNX graph expects: square RGB input of
// imageSize pixels, normalized per channel as (v - mean) / std.
struct ModelManifestEntry {
    QString name;
    QString file;                 // relative to the models directory
    QString modelId;              // recorded next to the catalog index
    QString fallbackRole;
    int dimensions = 0;           // embedding width, must match the index
    int imageSize = 224;
    std::array<float, 3> mean = {0.48145466f, 0.4578275f, 0.40821073f};
    std::array<float, 3> std = {0.26862954f, 0.26130258f, 0.27577711f};
    std::vector<QString> inputs;
    std::vector<QString> outputs;
    int intraOpThreads = 2;
};

struct ModelManifest {
    std::map<QString, ModelManifestEntry> models;   // keyed by role

    static std::optional<ModelManifest> loadFromFile(const QString& path);
    static std::optional<ModelManifest> loadFromJson(const QJsonObject& root);
};

} // namespace gf
