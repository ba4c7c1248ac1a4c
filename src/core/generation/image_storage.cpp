#include "core/generation/image_storage.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>

namespace gf {

namespace {

const QString kStyledDir = QStringLiteral("styled");
const QString kStyledFile = QStringLiteral("styled.png");

bool isSafeJobId(const JobId& jobId)
{
    if (jobId.isEmpty()) {
        return false;
    }
    for (const QChar c : jobId) {
        if (!c.isLetterOrNumber() && c != QLatin1Char('-')) {
            return false;
        }
    }
    return true;
}

} // namespace

ImageStorage::ImageStorage(const QString& rootDir)
    : m_rootDir(QDir::cleanPath(QDir(rootDir).absolutePath()))
{
}

bool ImageStorage::ensureRoot() const
{
    if (!QDir().mkpath(m_rootDir)) {
        LOG_ERROR(gfGeneration, "Failed to create image root %s", qPrintable(m_rootDir));
        return false;
    }
    return true;
}

const QString& ImageStorage::rootDir() const
{
    return m_rootDir;
}

std::optional<QString> ImageStorage::resolve(const QString& ref) const
{
    const QString trimmed = ref.trimmed();
    if (trimmed.isEmpty() || QDir::isAbsolutePath(trimmed)) {
        return std::nullopt;
    }

    const QString path = QDir::cleanPath(m_rootDir + QLatin1Char('/') + trimmed);
    if (!path.startsWith(m_rootDir + QLatin1Char('/'))) {
        return std::nullopt;
    }
    return path;
}

bool ImageStorage::exists(const QString& ref) const
{
    const std::optional<QString> path = resolve(ref);
    if (!path) {
        return false;
    }
    const QFileInfo info(*path);
    return info.isFile() && info.isReadable() && info.size() > 0;
}

std::optional<ImageStorage::Allocation> ImageStorage::allocateStyled(const JobId& jobId) const
{
    if (!isSafeJobId(jobId)) {
        return std::nullopt;
    }

    Allocation allocation;
    allocation.ref = kStyledDir + QLatin1Char('/') + jobId + QLatin1Char('/') + kStyledFile;
    const std::optional<QString> path = resolve(allocation.ref);
    if (!path) {
        return std::nullopt;
    }
    allocation.path = *path;

    if (!QDir().mkpath(QFileInfo(allocation.path).absolutePath())) {
        LOG_ERROR(gfGeneration, "Failed to create output directory for job %s", qPrintable(jobId));
        return std::nullopt;
    }
    if (QFile::exists(allocation.path) && !QFile::remove(allocation.path)) {
        LOG_WARN(gfGeneration, "Could not clear previous output %s", qPrintable(allocation.path));
        return std::nullopt;
    }
    return allocation;
}

bool ImageStorage::removeJobArtifacts(const JobId& jobId) const
{
    if (!isSafeJobId(jobId)) {
        return false;
    }
    QDir jobDir(m_rootDir + QLatin1Char('/') + kStyledDir + QLatin1Char('/') + jobId);
    if (!jobDir.exists()) {
        return true;
    }
    return jobDir.removeRecursively();
}

} // namespace gf
