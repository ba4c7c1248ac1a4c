#include "core/extraction/process_region_detector.h"
#include "core/shared/logging.h"
#include "core/shared/process_runner.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

namespace gf {

namespace {

std::optional<DetectedRegion> parseRegion(const QJsonObject& obj)
{
    const QJsonArray box = obj.value(QStringLiteral("box")).toArray();
    if (box.size() != 4) {
        return std::nullopt;
    }

    DetectedRegion region;
    region.box.x = box.at(0).toDouble(-1.0);
    region.box.y = box.at(1).toDouble(-1.0);
    region.box.width = box.at(2).toDouble(-1.0);
    region.box.height = box.at(3).toDouble(-1.0);
    if (!region.box.isValid()) {
        return std::nullopt;
    }

    region.category = obj.value(QStringLiteral("category")).toString().trimmed().toLower();
    region.score = static_cast<float>(obj.value(QStringLiteral("score")).toDouble(0.0));

    const QJsonArray embedding = obj.value(QStringLiteral("embedding")).toArray();
    region.embedding.reserve(static_cast<size_t>(embedding.size()));
    for (const QJsonValue& value : embedding) {
        region.embedding.push_back(static_cast<float>(value.toDouble()));
    }
    return region;
}

} // namespace

ProcessRegionDetector::ProcessRegionDetector(const QString& command,
                                             const QStringList& args,
                                             int timeoutMs)
    : m_command(command)
    , m_args(args)
    , m_timeoutMs(timeoutMs)
{
}

StageResult<std::vector<DetectedRegion>> ProcessRegionDetector::detect(const QString& imagePath)
{
    using Result = StageResult<std::vector<DetectedRegion>>;

    if (m_command.isEmpty()) {
        return Result::failure(StageError::transient(
            QStringLiteral("detector_unavailable"), QStringLiteral("No region detector is configured")));
    }

    const QStringList args = expandArguments(m_args, {{QStringLiteral("input"), imagePath}});
    const ProcessOutcome outcome = runProcess(m_command, args, m_timeoutMs);

    switch (outcome.status) {
    case ProcessOutcome::Status::FailedToStart:
        return Result::failure(StageError::transient(
            QStringLiteral("detector_unavailable"), QStringLiteral("Region detector could not be started")));
    case ProcessOutcome::Status::TimedOut:
        return Result::failure(StageError::transient(
            QStringLiteral("extraction_timeout"), QStringLiteral("Region detection timed out")));
    case ProcessOutcome::Status::Crashed:
        return Result::failure(StageError::transient(
            QStringLiteral("detector_failed"), QStringLiteral("Region detector failed")));
    case ProcessOutcome::Status::Finished:
        break;
    }

    if (outcome.exitCode == kExitUnreadableImage) {
        return Result::failure(StageError::validation(
            QStringLiteral("corrupt_image"), QStringLiteral("Rendered image could not be decoded")));
    }
    if (outcome.exitCode == kExitUnavailable) {
        return Result::failure(StageError::transient(
            QStringLiteral("detector_unavailable"), QStringLiteral("Region detector is temporarily unavailable")));
    }
    if (outcome.exitCode != 0) {
        LOG_WARN(gfExtraction, "Detector exited %d: %s",
                 outcome.exitCode, qPrintable(outcome.standardError));
        return Result::failure(StageError::transient(
            QStringLiteral("detector_failed"), QStringLiteral("Region detector failed")));
    }

    return parseOutput(outcome.standardOutput);
}

StageResult<std::vector<DetectedRegion>> ProcessRegionDetector::parseOutput(const QByteArray& output)
{
    using Result = StageResult<std::vector<DetectedRegion>>;

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(output, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()
        || !doc.object().value(QStringLiteral("regions")).isArray()) {
        LOG_WARN(gfExtraction, "Detector output is not a region document: %s",
                 qPrintable(parseError.errorString()));
        return Result::failure(StageError::transient(
            QStringLiteral("detector_malformed_output"), QStringLiteral("Region detector failed")));
    }

    const QJsonArray entries = doc.object().value(QStringLiteral("regions")).toArray();
    std::vector<DetectedRegion> regions;
    regions.reserve(static_cast<size_t>(entries.size()));
    int skipped = 0;
    for (const QJsonValue& entry : entries) {
        auto region = parseRegion(entry.toObject());
        if (!region) {
            ++skipped;
            continue;
        }
        regions.push_back(std::move(*region));
    }

    if (skipped > 0) {
        LOG_WARN(gfExtraction, "Skipped %d malformed detector region(s)", skipped);
    }
    return Result::success(std::move(regions));
}

} // namespace gf
