#pragma once

#include "core/models/model_manifest.h"

#include <QString>

#include <memory>
#include <string>
#include <vector>

namespace Ort {
struct Session;
}

namespace gf {

// One ONNX Runtime CPU session for an image encoder from the manifest.
class ModelSession {
public:
    explicit ModelSession(const ModelManifestEntry& manifest);
    ~ModelSession();

    ModelSession(const ModelSession&) = delete;
    ModelSession& operator=(const ModelSession&) = delete;

    // Loads the graph and checks it against the manifest entry.
    bool initialize(const QString& modelPath);
    bool isAvailable() const { return m_available; }

    const ModelManifestEntry& manifest() const { return m_manifest; }
    const std::vector<std::string>& inputNames() const { return m_inputNames; }
    const std::vector<std::string>& outputNames() const { return m_outputNames; }

    // Borrowed; valid while this ModelSession lives. Run() may be called
    // from several threads at once.
    Ort::Session* session() const;

private:
    bool checkEncoderGraph() const;

    class Impl;
    std::unique_ptr<Impl> m_impl;

    ModelManifestEntry m_manifest;
    std::vector<std::string> m_inputNames;
    std::vector<std::string> m_outputNames;
    bool m_available = false;
};

} // namespace gf
