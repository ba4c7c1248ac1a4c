#pragma once

#include "core/shared/types.h"

#include <QString>

#include <optional>

namespace gf {

// Maps opaque image references ("uploads/x.jpg", "styled/<jobId>/styled.png")
// to files under one root directory. References never escape the root.
class ImageStorage {
public:
    explicit ImageStorage(const QString& rootDir);

    bool ensureRoot() const;
    const QString& rootDir() const;

    // Absolute path for |ref|, or nullopt for empty, absolute or
    // parent-escaping references.
    std::optional<QString> resolve(const QString& ref) const;

    // True when |ref| resolves to a readable, non-empty file.
    bool exists(const QString& ref) const;

    struct Allocation {
        QString ref;
        QString path;
    };

    // Slot for a job's styled rendering. The same job always gets the same
    // slot; any previous file in it is removed.
    std::optional<Allocation> allocateStyled(const JobId& jobId) const;

    // Deletes everything the pipeline wrote for |jobId|.
    bool removeJobArtifacts(const JobId& jobId) const;

private:
    QString m_rootDir;
};

} // namespace gf
