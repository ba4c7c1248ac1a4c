#include "matcher_service.h"
#include "core/extraction/feature_extraction_stage.h"
#include "core/extraction/onnx_region_embedder.h"
#include "core/extraction/process_region_detector.h"
#include "core/generation/image_storage.h"
#include "core/generation/process_generation_backend.h"
#include "core/generation/style_generation_stage.h"
#include "core/ipc/message.h"
#include "core/matching/matching_stage.h"
#include "core/models/model_registry.h"
#include "core/pipeline/admission_queue.h"
#include "core/pipeline/job_store.h"
#include "core/pipeline/orchestrator.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"
#include "core/vector/hnsw_index_client.h"

#include <QDir>
#include <QJsonObject>

#include <algorithm>

namespace gf {

MatcherService::MatcherService(QObject* parent)
    : ServiceBase(QStringLiteral("matcher"), parent)
{
    registerMethod(QStringLiteral("submit"), [this](uint64_t id, const QJsonObject& params) {
        return handleSubmit(id, params);
    });
    registerMethod(QStringLiteral("getStatus"), [this](uint64_t id, const QJsonObject& params) {
        return handleGetStatus(id, params);
    });
    registerMethod(QStringLiteral("cancel"), [this](uint64_t id, const QJsonObject& params) {
        return handleCancel(id, params);
    });
    registerMethod(QStringLiteral("getStats"), [this](uint64_t id, const QJsonObject&) {
        return handleGetStats(id);
    });
    registerMethod(QStringLiteral("purgeExpired"), [this](uint64_t id, const QJsonObject&) {
        return handlePurgeExpired(id);
    });
}

MatcherService::~MatcherService()
{
    if (m_orchestrator) {
        m_orchestrator->stop();
    }
}

bool MatcherService::prepare()
{
    m_settings = SettingsManager::load().value_or(Settings{});
    SettingsManager::resolvePaths(m_settings);

    if (!QDir().mkpath(m_settings.dataDir)) {
        LOG_ERROR(gfCore, "Failed to create data directory: %s", qPrintable(m_settings.dataDir));
        return false;
    }

    m_store = JobStore::open(m_settings.dbPath);
    if (!m_store) {
        return false;
    }

    m_storage = std::make_unique<ImageStorage>(m_settings.imageRoot);
    if (!m_storage->ensureRoot()) {
        LOG_ERROR(gfCore, "Image root unavailable: %s", qPrintable(m_settings.imageRoot));
        return false;
    }

    m_generationBackend = std::make_unique<ProcessGenerationBackend>(m_settings.generatorCommand,
                                                                     m_settings.generatorArgs);
    m_generation = std::make_unique<StyleGenerationStage>(
        m_generationBackend.get(), m_storage.get(), m_settings.generationTimeoutMs);

    m_detector = std::make_unique<ProcessRegionDetector>(
        m_settings.detectorCommand, m_settings.detectorArgs, m_settings.extractionTimeoutMs);

    if (m_settings.embeddingEnabled) {
        m_models = std::make_unique<ModelRegistry>(m_settings.modelsDir);
        m_embedder = std::make_unique<OnnxRegionEmbedder>(m_models.get());
        if (!m_embedder->initialize()) {
            LOG_WARN(gfExtraction, "Region encoder unavailable; relying on detector embeddings");
            m_embedder.reset();
        } else if (m_embedder->dimensions() != m_settings.embeddingDimensions) {
            LOG_ERROR(gfExtraction, "Region encoder produces %d dimensions, configured %d",
                      m_embedder->dimensions(), m_settings.embeddingDimensions);
            return false;
        }
    }

    FeatureExtractionStage::Options extractionOptions;
    extractionOptions.minDetectionScore = m_settings.minDetectionScore;
    extractionOptions.maxRegions = m_settings.maxRegions;
    extractionOptions.dimensions = m_settings.embeddingDimensions;
    m_extraction = std::make_unique<FeatureExtractionStage>(
        m_detector.get(), m_embedder.get(), m_storage.get(), extractionOptions);

    m_index = HnswIndexClient::open(m_settings);
    if (!m_index) {
        return false;
    }

    CatalogReranker::Options rerankOptions;
    rerankOptions.categoryMismatchPenalty = m_settings.categoryMismatchPenalty;
    rerankOptions.ambiguousHintScore = m_settings.ambiguousHintScore;
    MatchingStage::Options matchingOptions;
    matchingOptions.overfetchFactor = m_settings.overfetchFactor;
    m_matching = std::make_unique<MatchingStage>(m_index.get(), CatalogReranker(rerankOptions),
                                                 matchingOptions);

    m_admission = std::make_unique<AdmissionQueue>(
        static_cast<size_t>(std::max(m_settings.admissionCapacity, 1)), m_settings.generationSlots);

    m_orchestrator = std::make_unique<Orchestrator>(
        m_store.get(), m_admission.get(), m_generation.get(), m_extraction.get(), m_matching.get(),
        m_storage.get(), Orchestrator::optionsFromSettings(m_settings));

    // Emitted on worker threads; sendNotification() hops to the server thread.
    connect(m_orchestrator.get(), &Orchestrator::jobFinished, this,
            [this](const QString& jobId, const QString& status) {
                QJsonObject params;
                params[QStringLiteral("jobId")] = jobId;
                params[QStringLiteral("status")] = status;
                sendNotification(QStringLiteral("jobFinished"), params);
            },
            Qt::DirectConnection);

    m_orchestrator->start();
    const int purged = m_orchestrator->purgeExpired();
    if (purged > 0) {
        LOG_INFO(gfPipeline, "Purged %d expired job(s) at startup", purged);
    }
    return true;
}

void MatcherService::teardown()
{
    if (m_orchestrator) {
        m_orchestrator->stop();
    }
}

QJsonObject MatcherService::stageErrorReply(uint64_t id, const StageError& error)
{
    QJsonObject reply = IpcMessage::makeError(id, ipcErrorCodeForKind(error.kind), error.message);
    QJsonObject body = reply.value(QStringLiteral("error")).toObject();
    body[QStringLiteral("reason")] = error.code;
    reply[QStringLiteral("error")] = body;
    return reply;
}

QJsonObject MatcherService::handleSubmit(uint64_t id, const QJsonObject& params)
{
    const QString photoRef = params.value(QStringLiteral("photoRef")).toString().trimmed();
    if (photoRef.isEmpty()) {
        return IpcMessage::makeError(id, IpcErrorCode::InvalidParams,
                                     QStringLiteral("Missing 'photoRef' parameter"));
    }

    const StyleParams style = styleParamsFromJson(params);
    const StageResult<JobId> submitted = m_orchestrator->submit(photoRef, style);
    if (!submitted.ok()) {
        return stageErrorReply(id, submitted.error);
    }

    QJsonObject result;
    result[QStringLiteral("jobId")] = *submitted.value;
    result[QStringLiteral("status")] = jobStatusToString(JobStatus::Queued);
    return IpcMessage::makeResponse(id, result);
}

QJsonObject MatcherService::handleGetStatus(uint64_t id, const QJsonObject& params)
{
    const QString jobId = params.value(QStringLiteral("jobId")).toString();
    if (jobId.isEmpty()) {
        return IpcMessage::makeError(id, IpcErrorCode::InvalidParams,
                                     QStringLiteral("Missing 'jobId' parameter"));
    }

    const std::optional<JobSnapshot> snapshot = m_orchestrator->status(jobId);
    if (!snapshot) {
        return IpcMessage::makeError(id, IpcErrorCode::NotFound,
                                     QStringLiteral("Unknown job: %1").arg(jobId));
    }

    QJsonObject result = jobToJson(snapshot->job);
    if (snapshot->result) {
        result[QStringLiteral("result")] = matchResultToJson(*snapshot->result);
    }
    return IpcMessage::makeResponse(id, result);
}

QJsonObject MatcherService::handleCancel(uint64_t id, const QJsonObject& params)
{
    const QString jobId = params.value(QStringLiteral("jobId")).toString();
    if (jobId.isEmpty()) {
        return IpcMessage::makeError(id, IpcErrorCode::InvalidParams,
                                     QStringLiteral("Missing 'jobId' parameter"));
    }

    QJsonObject result;
    result[QStringLiteral("jobId")] = jobId;
    switch (m_orchestrator->cancel(jobId)) {
    case CancelOutcome::NotFound:
        return IpcMessage::makeError(id, IpcErrorCode::NotFound,
                                     QStringLiteral("Unknown job: %1").arg(jobId));
    case CancelOutcome::Cancelled:
        result[QStringLiteral("cancelled")] = true;
        result[QStringLiteral("pending")] = false;
        break;
    case CancelOutcome::Pending:
        result[QStringLiteral("cancelled")] = true;
        result[QStringLiteral("pending")] = true;
        break;
    case CancelOutcome::AlreadyFinished:
        result[QStringLiteral("cancelled")] = false;
        result[QStringLiteral("pending")] = false;
        break;
    }
    return IpcMessage::makeResponse(id, result);
}

QJsonObject MatcherService::handleGetStats(uint64_t id)
{
    const OrchestratorStats stats = m_orchestrator->stats();

    QJsonObject admission;
    admission[QStringLiteral("depth")] = static_cast<qint64>(stats.admission.depth);
    admission[QStringLiteral("capacity")] = static_cast<qint64>(stats.admission.capacity);
    admission[QStringLiteral("generationSlots")] = stats.admission.generationSlots;
    admission[QStringLiteral("activeGenerations")] = stats.admission.activeGenerations;
    admission[QStringLiteral("rejected")] = static_cast<qint64>(stats.admission.rejected);

    QJsonObject jobs;
    for (const auto& entry : stats.jobsByStatus) {
        jobs[jobStatusToString(entry.first)] = entry.second;
    }

    QJsonObject result;
    result[QStringLiteral("admission")] = admission;
    result[QStringLiteral("runningJobs")] = stats.runningJobs;
    result[QStringLiteral("pendingCancels")] = stats.pendingCancels;
    result[QStringLiteral("jobs")] = jobs;
    return IpcMessage::makeResponse(id, result);
}

QJsonObject MatcherService::handlePurgeExpired(uint64_t id)
{
    QJsonObject result;
    result[QStringLiteral("removed")] = m_orchestrator->purgeExpired();
    return IpcMessage::makeResponse(id, result);
}

} // namespace gf
