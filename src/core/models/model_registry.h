#pragma once

#include "core/models/model_manifest.h"
#include "core/models/model_session.h"

#include <QString>

#include <map>
#include <memory>
#include <mutex>
#include <set>

namespace gf {

// Owns the ONNX sessions described by <modelsDir>/manifest.json. Sessions are
// created on first use and live as long as the registry; callers keep raw
// pointers.
class ModelRegistry {
public:
    explicit ModelRegistry(const QString& modelsDir);
    ~ModelRegistry();

    ModelRegistry(const ModelRegistry&) = delete;
    ModelRegistry& operator=(const ModelRegistry&) = delete;

    // Session for |role|, walking fallbackRole links until one loads. A role
    // whose model failed once is not retried. nullptr when nothing loads.
    ModelSession* getSession(const QString& role);

    bool hasModel(const QString& role) const;

    const ModelManifest& manifest() const { return m_manifest; }
    const QString& modelsDir() const { return m_modelsDir; }

private:
    ModelSession* loadRole(const QString& role);

    QString m_modelsDir;
    ModelManifest m_manifest;
    std::map<QString, std::unique_ptr<ModelSession>> m_sessions;
    std::set<QString> m_failedRoles;
    std::mutex m_mutex;
};

} // namespace gf
