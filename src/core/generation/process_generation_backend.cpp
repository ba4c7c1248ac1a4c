#include "core/generation/process_generation_backend.h"
#include "core/shared/logging.h"
#include "core/shared/process_runner.h"

#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>

namespace gf {

ProcessGenerationBackend::ProcessGenerationBackend(const QString& command, const QStringList& args)
    : m_command(command)
    , m_args(args)
{
}

std::optional<StageError> ProcessGenerationBackend::generate(const GenerationRequest& request)
{
    if (m_command.isEmpty()) {
        return StageError::transient(QStringLiteral("generator_unavailable"),
                                     QStringLiteral("No style generator is configured"));
    }

    const QString strength = request.params.strength.has_value()
        ? QString::number(request.params.strength.value())
        : QString();
    const QStringList args = expandArguments(m_args, {
        {QStringLiteral("input"), request.photoPath},
        {QStringLiteral("output"), request.outputPath},
        {QStringLiteral("style"), request.params.style},
        {QStringLiteral("strength"), strength},
        {QStringLiteral("room"), request.params.roomCategory},
    });

    QJsonObject payload = styleParamsToJson(request.params);
    payload.insert(QStringLiteral("jobId"), request.jobId);
    payload.insert(QStringLiteral("input"), request.photoPath);
    payload.insert(QStringLiteral("output"), request.outputPath);

    const ProcessOutcome outcome = runProcess(
        m_command, args, request.timeoutMs, QJsonDocument(payload).toJson(QJsonDocument::Compact));

    switch (outcome.status) {
    case ProcessOutcome::Status::FailedToStart:
        return StageError::transient(QStringLiteral("generator_unavailable"),
                                     QStringLiteral("Style generator could not be started"));
    case ProcessOutcome::Status::TimedOut:
        return StageError::transient(QStringLiteral("generation_timeout"),
                                     QStringLiteral("Style generation timed out"));
    case ProcessOutcome::Status::Crashed:
        LOG_WARN(gfGeneration, "Generator crashed for job %s", qPrintable(request.jobId));
        return StageError::transient(QStringLiteral("generator_failed"),
                                     QStringLiteral("Style generator failed"));
    case ProcessOutcome::Status::Finished:
        break;
    }

    if (outcome.exitCode == kExitInvalidParams) {
        return StageError::validation(QStringLiteral("invalid_style"),
                                      QStringLiteral("Style parameters were rejected"));
    }
    if (outcome.exitCode == kExitUnavailable) {
        return StageError::transient(QStringLiteral("generator_unavailable"),
                                     QStringLiteral("Style generator is temporarily unavailable"));
    }
    if (outcome.exitCode != 0) {
        LOG_WARN(gfGeneration, "Generator exited %d for job %s: %s", outcome.exitCode,
                 qPrintable(request.jobId), qPrintable(outcome.standardError));
        return StageError::transient(QStringLiteral("generator_failed"),
                                     QStringLiteral("Style generator failed"));
    }

    const QFileInfo output(request.outputPath);
    if (!output.isFile() || output.size() == 0) {
        LOG_WARN(gfGeneration, "Generator reported success without output for job %s",
                 qPrintable(request.jobId));
        return StageError::transient(QStringLiteral("empty_output"),
                                     QStringLiteral("Style generator produced no image"));
    }

    LOG_DEBUG(gfGeneration, "Generator finished job %s in %lldms",
              qPrintable(request.jobId), static_cast<long long>(outcome.durationMs));
    return std::nullopt;
}

} // namespace gf
