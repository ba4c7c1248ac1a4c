#include "core/models/model_registry.h"

#include "core/shared/logging.h"

#include <QDir>

namespace gf {

ModelRegistry::ModelRegistry(const QString& modelsDir)
    : m_modelsDir(QDir::cleanPath(modelsDir))
{
    const QString manifestPath = QDir(m_modelsDir).filePath(QStringLiteral("manifest.json"));
    if (std::optional<ModelManifest> loaded = ModelManifest::loadFromFile(manifestPath)) {
        m_manifest = std::move(*loaded);
        LOG_INFO(gfCore, "ModelRegistry: %d encoder(s) declared in %s",
                 static_cast<int>(m_manifest.models.size()), qPrintable(manifestPath));
    } else {
        LOG_WARN(gfCore, "ModelRegistry: no usable manifest in %s", qPrintable(m_modelsDir));
    }
}

ModelRegistry::~ModelRegistry() = default;

ModelSession* ModelRegistry::getSession(const QString& role)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    std::set<QString> visited;
    QString current = role;
    while (!current.isEmpty() && visited.insert(current).second) {
        if (ModelSession* session = loadRole(current)) {
            if (current != role) {
                LOG_INFO(gfCore, "ModelRegistry: serving '%s' with fallback '%s'",
                         qPrintable(role), qPrintable(current));
            }
            return session;
        }
        const auto entry = m_manifest.models.find(current);
        current = entry != m_manifest.models.end() ? entry->second.fallbackRole : QString();
    }

    LOG_WARN(gfCore, "ModelRegistry: no loadable model for role '%s'", qPrintable(role));
    return nullptr;
}

ModelSession* ModelRegistry::loadRole(const QString& role)
{
    const auto cached = m_sessions.find(role);
    if (cached != m_sessions.end()) {
        return cached->second.get();
    }
    if (m_failedRoles.count(role) > 0) {
        return nullptr;
    }

    const auto entry = m_manifest.models.find(role);
    if (entry == m_manifest.models.end()) {
        m_failedRoles.insert(role);
        return nullptr;
    }

    auto session = std::make_unique<ModelSession>(entry->second);
    if (!session->initialize(QDir(m_modelsDir).filePath(entry->second.file))) {
        m_failedRoles.insert(role);
        return nullptr;
    }

    ModelSession* raw = session.get();
    m_sessions.emplace(role, std::move(session));
    return raw;
}

bool ModelRegistry::hasModel(const QString& role) const
{
    return m_manifest.models.count(role) > 0;
}

} // namespace gf
