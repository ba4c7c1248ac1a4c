#include "core/pipeline/orchestrator.h"
#include "core/extraction/feature_extraction_stage.h"
#include "core/generation/image_storage.h"
#include "core/generation/style_generation_stage.h"
#include "core/matching/matching_stage.h"
#include "core/pipeline/job_store.h"
#include "core/pipeline/region_fan_out.h"
#include "core/pipeline/result_aggregator.h"
#include "core/shared/logging.h"
#include "core/shared/settings.h"

#include <QDateTime>
#include <QUuid>

#include <algorithm>
#include <chrono>

namespace gf {

namespace {

QDateTime nowUtc()
{
    return QDateTime::currentDateTimeUtc();
}

RetryPolicy::Config retryConfigFromSettings(const Settings& settings)
{
    RetryPolicy::Config config;
    config.maxAttempts = settings.retryMaxAttempts;
    config.baseDelayMs = settings.retryBaseDelayMs;
    config.multiplier = settings.retryMultiplier;
    config.maxDelayMs = settings.retryMaxDelayMs;
    return config;
}

} // namespace

// ── Construction / destruction ──────────────────────────────

Orchestrator::Options Orchestrator::optionsFromSettings(const Settings& settings)
{
    Options options;
    options.workerCount = settings.workerCount;
    options.matchK = settings.matchK;
    options.perJobMatchConcurrency = settings.perJobMatchConcurrency;
    options.retentionDays = settings.retentionDays;
    options.generationRetry = retryConfigFromSettings(settings);
    options.extractionRetry = retryConfigFromSettings(settings);
    options.matchingRetry = retryConfigFromSettings(settings);
    return options;
}

Orchestrator::Orchestrator(JobStore* store,
                           AdmissionQueue* admission,
                           StyleGenerationStage* generation,
                           FeatureExtractionStage* extraction,
                           MatchingStage* matching,
                           ImageStorage* storage,
                           const Options& options,
                           QObject* parent)
    : QObject(parent)
    , m_store(store)
    , m_admission(admission)
    , m_generation(generation)
    , m_extraction(extraction)
    , m_matching(matching)
    , m_storage(storage)
    , m_options(options)
    , m_generationRetry(options.generationRetry)
    , m_extractionRetry(options.extractionRetry)
    , m_matchingRetry(options.matchingRetry)
{
    LOG_INFO(gfPipeline, "Orchestrator created (workers=%d, k=%d, match concurrency=%d)",
             m_options.workerCount, m_options.matchK, m_options.perJobMatchConcurrency);
}

Orchestrator::~Orchestrator()
{
    stop();
}

// ── Lifecycle ───────────────────────────────────────────────

void Orchestrator::start()
{
    if (m_running.load()) {
        LOG_WARN(gfPipeline, "Orchestrator::start() called while already running");
        return;
    }

    m_stopping.store(false);
    m_admission->reopen();

    const RecoveryReport report = recover();
    if (report.readmitted + report.interrupted + report.rejected > 0) {
        LOG_INFO(gfPipeline, "Recovered jobs: %d re-admitted, %d interrupted, %d rejected",
                 report.readmitted, report.interrupted, report.rejected);
    }

    m_running.store(true);
    const size_t workers = static_cast<size_t>(std::max(m_options.workerCount, 1));
    m_workers.reserve(workers);
    for (size_t i = 0; i < workers; ++i) {
        m_workers.emplace_back([this, i] { workerLoop(i); });
    }

    LOG_INFO(gfPipeline, "Orchestrator started with %d worker(s)", static_cast<int>(workers));
}

void Orchestrator::stop()
{
    if (!m_running.load() && m_workers.empty()) {
        return;
    }

    LOG_INFO(gfPipeline, "Orchestrator stopping...");

    m_stopping.store(true);
    m_running.store(false);
    m_admission->shutdown();
    {
        std::lock_guard<std::mutex> lock(m_stopMutex);
    }
    m_stopCv.notify_all();

    for (auto& worker : m_workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    m_workers.clear();

    LOG_INFO(gfPipeline, "Orchestrator stopped");
}

RecoveryReport Orchestrator::recover()
{
    RecoveryReport report;
    if (m_running.load()) {
        LOG_WARN(gfPipeline, "Orchestrator::recover() skipped while workers are running");
        return report;
    }

    std::lock_guard<std::mutex> lock(m_submitMutex);
    std::vector<Job> jobs = m_store->nonTerminalJobs();
    for (Job& job : jobs) {
        if (job.status == JobStatus::Queued) {
            if (m_admission->contains(job.id)) {
                continue;
            }
            if (m_admission->tryEnqueue(job.id)) {
                ++report.readmitted;
            } else {
                failJob(job, PipelineStage::Admission, ErrorKind::Capacity,
                        QStringLiteral("capacity_exceeded"),
                        QStringLiteral("Admission queue was full when the job was recovered"));
                ++report.rejected;
            }
            continue;
        }

        failJob(job, job.stage, ErrorKind::Interrupted, QStringLiteral("interrupted"),
                QStringLiteral("Job was interrupted by a service restart"));
        ++report.interrupted;
    }
    return report;
}

// ── Client operations ───────────────────────────────────────

StageResult<JobId> Orchestrator::submit(const QString& photoRef, const StyleParams& params)
{
    if (auto error = m_generation->validateRequest(photoRef, params)) {
        LOG_INFO(gfPipeline, "Rejected submission: %s", qPrintable(error->code));
        return StageResult<JobId>::failure(*error);
    }

    std::lock_guard<std::mutex> lock(m_submitMutex);

    if (m_admission->isFull()) {
        m_admission->recordRejection();
        LOG_WARN(gfPipeline, "Rejected submission: admission queue full");
        return StageResult<JobId>::failure(StageError{
            ErrorKind::Capacity, QStringLiteral("capacity_exceeded"),
            QStringLiteral("Too many jobs are waiting for generation")});
    }

    Job job;
    job.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    job.photoRef = photoRef;
    job.params = params;
    job.stage = PipelineStage::Admission;
    job.status = JobStatus::Queued;
    job.createdAt = nowUtc();
    job.updatedAt = job.createdAt;

    if (!m_store->insertJob(job)) {
        return StageResult<JobId>::failure(StageError::internal(
            QStringLiteral("store_failed"), QStringLiteral("Job could not be recorded")));
    }

    if (!m_admission->tryEnqueue(job.id)) {
        if (!m_store->deleteJob(job.id)) {
            LOG_ERROR(gfPipeline, "Failed to roll back refused job %s", qPrintable(job.id));
        }
        return StageResult<JobId>::failure(StageError{
            ErrorKind::Capacity, QStringLiteral("not_accepting"),
            QStringLiteral("The pipeline is not accepting jobs")});
    }

    LOG_INFO(gfPipeline, "Job %s queued (style=%s)", qPrintable(job.id), qPrintable(params.style));
    return StageResult<JobId>::success(job.id);
}

std::optional<JobSnapshot> Orchestrator::status(const JobId& jobId)
{
    std::optional<Job> job = m_store->loadJob(jobId);
    if (!job) {
        return std::nullopt;
    }

    JobSnapshot snapshot;
    snapshot.job = std::move(*job);
    if (snapshot.job.status == JobStatus::Completed) {
        snapshot.result = m_store->loadResult(jobId);
    }
    return snapshot;
}

CancelOutcome Orchestrator::cancel(const JobId& jobId)
{
    std::optional<Job> job = m_store->loadJob(jobId);
    if (!job) {
        return CancelOutcome::NotFound;
    }
    if (isTerminal(job->status)) {
        return CancelOutcome::AlreadyFinished;
    }

    if (m_admission->remove(jobId)) {
        failJob(*job, PipelineStage::Admission, ErrorKind::Cancelled, QStringLiteral("cancelled"),
                QStringLiteral("Job was cancelled"));
        LOG_INFO(gfPipeline, "Job %s cancelled before admission", qPrintable(jobId));
        return CancelOutcome::Cancelled;
    }

    {
        std::lock_guard<std::mutex> lock(m_cancelMutex);
        m_cancelRequested.insert(jobId);
    }

    // The worker may have finished between the first read and the request.
    const std::optional<Job> latest = m_store->loadJob(jobId);
    if (!latest || isTerminal(latest->status)) {
        clearCancelRequest(jobId);
        return CancelOutcome::AlreadyFinished;
    }

    LOG_INFO(gfPipeline, "Cancellation requested for running job %s", qPrintable(jobId));
    return CancelOutcome::Pending;
}

int Orchestrator::purgeExpired()
{
    if (m_options.retentionDays < 0) {
        return 0;
    }

    const QDateTime cutoff = nowUtc().addDays(-m_options.retentionDays);
    const std::vector<JobId> removed = m_store->purgeTerminalBefore(cutoff);
    if (m_storage) {
        for (const JobId& jobId : removed) {
            if (!m_storage->removeJobArtifacts(jobId)) {
                LOG_WARN(gfPipeline, "Artifacts of purged job %s could not be removed",
                         qPrintable(jobId));
            }
        }
    }
    return static_cast<int>(removed.size());
}

OrchestratorStats Orchestrator::stats()
{
    OrchestratorStats s;
    s.admission = m_admission->stats();
    s.runningJobs = m_runningJobs.load();
    {
        std::lock_guard<std::mutex> lock(m_cancelMutex);
        s.pendingCancels = static_cast<int>(m_cancelRequested.size());
    }
    s.jobsByStatus = m_store->countByStatus();
    return s;
}

// ── Failure helpers ─────────────────────────────────────────

template <typename T>
void Orchestrator::failStage(Job& job, PipelineStage stage, const RetryOutcome<T>& outcome)
{
    const StageError& error = outcome.result.error;

    if (outcome.interrupted) {
        failJob(job, stage, ErrorKind::Interrupted, QStringLiteral("interrupted"),
                QStringLiteral("Service stopped while the stage was retrying"), error.code);
        return;
    }
    if (outcome.exhausted) {
        failJob(job, stage, ErrorKind::TerminalFailure, QStringLiteral("retries_exhausted"),
                QStringLiteral("%1 failed after %2 attempts")
                    .arg(pipelineStageToString(stage))
                    .arg(outcome.attempts),
                error.code);
        return;
    }
    failJob(job, stage, error.kind, error.code, error.message);
}

// ── Worker ──────────────────────────────────────────────────

void Orchestrator::workerLoop(size_t workerIndex)
{
    LOG_DEBUG(gfPipeline, "Worker %d started", static_cast<int>(workerIndex));

    while (auto admitted = m_admission->acquire()) {
        m_runningJobs.fetch_add(1);
        processJob(admitted->jobId, std::move(admitted->permit));
        m_runningJobs.fetch_sub(1);
    }

    LOG_DEBUG(gfPipeline, "Worker %d exiting", static_cast<int>(workerIndex));
}

void Orchestrator::processJob(const JobId& jobId, AdmissionQueue::GenerationPermit permit)
{
    std::optional<Job> loaded = m_store->loadJob(jobId);
    if (!loaded) {
        LOG_WARN(gfPipeline, "Admitted job %s has no record, skipping", qPrintable(jobId));
        clearCancelRequest(jobId);
        return;
    }
    Job job = std::move(*loaded);
    if (job.status != JobStatus::Queued) {
        LOG_WARN(gfPipeline, "Admitted job %s is %s, skipping", qPrintable(jobId),
                 qPrintable(jobStatusToString(job.status)));
        clearCancelRequest(jobId);
        return;
    }
    if (stopAtBoundary(job)) {
        return;
    }

    const RetryPolicy::Sleeper sleeper = [this](int delayMs) { return backoffWait(delayMs); };

    // ── Generation ──────────────────────────────────────────

    if (!advance(job, JobStatus::Generating)) {
        return;
    }
    RetryOutcome<StyledImage> generated = m_generationRetry.run<StyledImage>(
        [&](int) { return m_generation->generate(job.id, job.photoRef, job.params); },
        sleeper,
        [&](int attempt, const StageError& error) {
            ++job.retries.generation;
            job.updatedAt = nowUtc();
            LOG_WARN(gfPipeline, "Job %s generation attempt %d after %s", qPrintable(job.id),
                     attempt, qPrintable(error.code));
            if (!m_store->updateJob(job)) {
                LOG_WARN(gfPipeline, "Retry counter of job %s not persisted", qPrintable(job.id));
            }
        });
    permit.release();

    if (!generated.result.ok()) {
        failStage(job, PipelineStage::Generation, generated);
        return;
    }
    const StyledImage styled = std::move(*generated.result.value);

    if (stopAtBoundary(job)) {
        if (m_storage && !m_storage->removeJobArtifacts(job.id)) {
            LOG_WARN(gfPipeline, "Discarded rendering of job %s not removed", qPrintable(job.id));
        }
        return;
    }
    if (!m_store->saveStyledImage(styled)) {
        failJob(job, PipelineStage::Generation, ErrorKind::Internal, QStringLiteral("store_failed"),
                QStringLiteral("Styled image could not be recorded"));
        return;
    }

    // ── Extraction ──────────────────────────────────────────

    if (!advance(job, JobStatus::Extracting)) {
        return;
    }
    RetryOutcome<std::vector<Region>> extracted = m_extractionRetry.run<std::vector<Region>>(
        [&](int) { return m_extraction->extract(styled); },
        sleeper,
        [&](int attempt, const StageError& error) {
            ++job.retries.extraction;
            job.updatedAt = nowUtc();
            LOG_WARN(gfPipeline, "Job %s extraction attempt %d after %s", qPrintable(job.id),
                     attempt, qPrintable(error.code));
            if (!m_store->updateJob(job)) {
                LOG_WARN(gfPipeline, "Retry counter of job %s not persisted", qPrintable(job.id));
            }
        });

    if (!extracted.result.ok()) {
        failStage(job, PipelineStage::Extraction, extracted);
        return;
    }
    const std::vector<Region> regions = std::move(*extracted.result.value);

    if (!m_store->saveRegions(job.id, regions)) {
        failJob(job, PipelineStage::Extraction, ErrorKind::Internal, QStringLiteral("store_failed"),
                QStringLiteral("Regions could not be recorded"));
        return;
    }
    if (stopAtBoundary(job)) {
        return;
    }

    // ── Matching ────────────────────────────────────────────

    if (!advance(job, JobStatus::Matching)) {
        return;
    }

    std::atomic<int> matchingRetries{0};
    const std::vector<RetryOutcome<Match>> matched = fanOut<RetryOutcome<Match>>(
        regions.size(), m_options.perJobMatchConcurrency,
        [&](size_t index) {
            const Region& region = regions[index];
            return m_matchingRetry.run<Match>(
                [&](int) { return m_matching->match(region, m_options.matchK, job.params); },
                sleeper,
                [&](int, const StageError&) { matchingRetries.fetch_add(1); });
        });
    job.retries.matching += matchingRetries.load();

    std::vector<RegionMatch> regionMatches;
    std::vector<Match> matches;
    regionMatches.reserve(regions.size());
    for (size_t i = 0; i < matched.size(); ++i) {
        if (!matched[i].result.ok()) {
            LOG_WARN(gfPipeline, "Job %s: matching failed for region %s", qPrintable(job.id),
                     qPrintable(regions[i].regionId));
            failStage(job, PipelineStage::Matching, matched[i]);
            return;
        }
        RegionMatch pair;
        pair.region = regions[i];
        pair.match = *matched[i].result.value;
        if (!pair.match.candidates.empty()) {
            matches.push_back(pair.match);
        }
        regionMatches.push_back(std::move(pair));
    }

    if (!m_store->saveMatches(job.id, matches)) {
        failJob(job, PipelineStage::Matching, ErrorKind::Internal, QStringLiteral("store_failed"),
                QStringLiteral("Matches could not be recorded"));
        return;
    }
    if (stopAtBoundary(job)) {
        return;
    }

    // ── Aggregation ─────────────────────────────────────────

    if (!advance(job, JobStatus::Aggregating)) {
        return;
    }
    const MatchResult result = ResultAggregator::aggregate(job, styled, regionMatches);

    job.status = JobStatus::Completed;
    job.stage = PipelineStage::Done;
    job.updatedAt = nowUtc();
    if (!m_store->completeJob(job, result)) {
        job.status = JobStatus::Aggregating;
        job.stage = PipelineStage::Aggregation;
        failJob(job, PipelineStage::Aggregation, ErrorKind::Internal, QStringLiteral("store_failed"),
                QStringLiteral("Result could not be recorded"));
        return;
    }

    clearCancelRequest(job.id);
    LOG_INFO(gfPipeline, "Job %s completed: %d matched, %d unmatched region(s)",
             qPrintable(job.id), static_cast<int>(result.pairs.size()),
             static_cast<int>(result.unmatchedRegionIds.size()));
    emit jobFinished(job.id, jobStatusToString(job.status));
}

// ── State transitions ───────────────────────────────────────

bool Orchestrator::advance(Job& job, JobStatus to)
{
    if (!canTransition(job.status, to)) {
        LOG_ERROR(gfPipeline, "Job %s: illegal transition %s -> %s", qPrintable(job.id),
                  qPrintable(jobStatusToString(job.status)), qPrintable(jobStatusToString(to)));
        failJob(job, job.stage, ErrorKind::Internal, QStringLiteral("invalid_transition"),
                QStringLiteral("Job state is inconsistent"));
        return false;
    }

    job.status = to;
    job.stage = stageForStatus(to);
    job.updatedAt = nowUtc();
    if (!m_store->updateJob(job)) {
        failJob(job, job.stage, ErrorKind::Internal, QStringLiteral("store_failed"),
                QStringLiteral("Job state could not be recorded"));
        return false;
    }
    LOG_DEBUG(gfPipeline, "Job %s -> %s", qPrintable(job.id), qPrintable(jobStatusToString(to)));
    return true;
}

bool Orchestrator::stopAtBoundary(Job& job)
{
    if (isCancelRequested(job.id)) {
        failJob(job, job.stage, ErrorKind::Cancelled, QStringLiteral("cancelled"),
                QStringLiteral("Job was cancelled"));
        LOG_INFO(gfPipeline, "Job %s cancelled at %s boundary", qPrintable(job.id),
                 qPrintable(pipelineStageToString(job.stage)));
        return true;
    }
    if (m_stopping.load()) {
        failJob(job, job.stage, ErrorKind::Interrupted, QStringLiteral("interrupted"),
                QStringLiteral("Service stopped before the job finished"));
        return true;
    }
    return false;
}

void Orchestrator::failJob(Job& job, PipelineStage stage, ErrorKind kind,
                           const QString& code, const QString& message, const QString& cause)
{
    if (!canTransition(job.status, JobStatus::Failed)) {
        LOG_WARN(gfPipeline, "Job %s is already %s, not failing it", qPrintable(job.id),
                 qPrintable(jobStatusToString(job.status)));
        return;
    }

    JobError error;
    error.stage = stage;
    error.kind = kind;
    error.code = code;
    error.message = message;
    error.cause = cause;

    job.error = error;
    job.status = JobStatus::Failed;
    job.stage = stage;
    job.updatedAt = nowUtc();
    if (!m_store->updateJob(job)) {
        LOG_ERROR(gfPipeline, "Failure of job %s could not be recorded", qPrintable(job.id));
    }

    clearCancelRequest(job.id);
    LOG_WARN(gfPipeline, "Job %s failed at %s: %s (%s)", qPrintable(job.id),
             qPrintable(pipelineStageToString(stage)), qPrintable(code),
             qPrintable(errorKindToString(kind)));
    emit jobFinished(job.id, jobStatusToString(job.status));
}

// ── Helpers ─────────────────────────────────────────────────

bool Orchestrator::backoffWait(int delayMs)
{
    std::unique_lock<std::mutex> lock(m_stopMutex);
    return !m_stopCv.wait_for(lock, std::chrono::milliseconds(std::max(delayMs, 0)),
                              [this] { return m_stopping.load(); });
}

bool Orchestrator::isCancelRequested(const JobId& jobId)
{
    std::lock_guard<std::mutex> lock(m_cancelMutex);
    return m_cancelRequested.count(jobId) > 0;
}

void Orchestrator::clearCancelRequest(const JobId& jobId)
{
    std::lock_guard<std::mutex> lock(m_cancelMutex);
    m_cancelRequested.erase(jobId);
}

} // namespace gf
