#pragma once

#include "core/pipeline/admission_queue.h"
#include "core/pipeline/retry_policy.h"
#include "core/shared/types.h"

#include <QObject>
#include <QString>

#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <thread>
#include <vector>

namespace gf {

class FeatureExtractionStage;
class ImageStorage;
class JobStore;
class MatchingStage;
class StyleGenerationStage;
struct Settings;

struct OrchestratorStats {
    AdmissionStats admission;
    int runningJobs = 0;
    int pendingCancels = 0;   // requested, not yet observed by a worker
    std::map<JobStatus, int> jobsByStatus;
};

struct RecoveryReport {
    int readmitted = 0;
    int interrupted = 0;
    int rejected = 0;
};

enum class CancelOutcome {
    Cancelled,       // was waiting for admission, now Failed
    Pending,         // running; fails at the next stage boundary
    AlreadyFinished,
    NotFound,
};

// Orchestrator: owns every job's state machine.
//
// Architecture:
//  1) submit() validates, persists a Queued job and offers it to the
//     admission queue; a full queue refuses synchronously.
//  2) workerCount workers take admitted jobs one at a time and run
//     Generation (holding the generation permit), Extraction, Matching
//     (fanned out per region) and Aggregation in sequence.
//  3) Every stage call goes through its own RetryPolicy; only Transient
//     errors are retried.
//
// Job records are written to the JobStore at every transition, so status()
// reads the store and a restarted process can recover() what it left behind.
class Orchestrator : public QObject {
    Q_OBJECT

public:
    struct Options {
        int workerCount = 4;
        int matchK = 5;
        int perJobMatchConcurrency = 4;
        int retentionDays = 30;
        RetryPolicy::Config generationRetry;
        RetryPolicy::Config extractionRetry;
        RetryPolicy::Config matchingRetry;
    };

    static Options optionsFromSettings(const Settings& settings);

    // |storage| may be null; artifacts are then left on disk.
    Orchestrator(JobStore* store,
                 AdmissionQueue* admission,
                 StyleGenerationStage* generation,
                 FeatureExtractionStage* extraction,
                 MatchingStage* matching,
                 ImageStorage* storage,
                 const Options& options,
                 QObject* parent = nullptr);
    ~Orchestrator() override;

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;
    Orchestrator(Orchestrator&&) = delete;
    Orchestrator& operator=(Orchestrator&&) = delete;

    // Job id, or a Validation / Capacity error. No job record exists after
    // an error.
    StageResult<JobId> submit(const QString& photoRef, const StyleParams& params);

    // Job plus its MatchResult once Completed. nullopt for unknown ids.
    std::optional<JobSnapshot> status(const JobId& jobId);

    CancelOutcome cancel(const JobId& jobId);

    // Re-admits persisted Queued jobs in creation order and fails jobs that
    // were mid-stage when the previous process stopped. Called by start().
    RecoveryReport recover();

    void start();

    // Stops taking jobs and blocks until the workers exit. A running job
    // stops at its next stage boundary and is marked Interrupted; queued jobs
    // stay Queued for the next start().
    void stop();

    bool isRunning() const { return m_running.load(); }

    // Removes terminal jobs older than the retention window. Returns how
    // many were removed.
    int purgeExpired();

    OrchestratorStats stats();

signals:
    // Emitted from a worker thread when a job reaches Completed or Failed.
    void jobFinished(const QString& jobId, const QString& status);

private:
    void workerLoop(size_t workerIndex);
    void processJob(const JobId& jobId, AdmissionQueue::GenerationPermit permit);

    // Moves the job to |to| and persists it. False if the move is illegal or
    // the write failed; the job is then failed with an Internal error.
    bool advance(Job& job, JobStatus to);

    // True when the job must not enter its next stage. Marks it Failed
    // (Cancelled or Interrupted) before returning true.
    bool stopAtBoundary(Job& job);

    template <typename T>
    void failStage(Job& job, PipelineStage stage, const RetryOutcome<T>& outcome);

    void failJob(Job& job, PipelineStage stage, ErrorKind kind,
                 const QString& code, const QString& message, const QString& cause = {});

    bool backoffWait(int delayMs);
    bool isCancelRequested(const JobId& jobId);
    void clearCancelRequest(const JobId& jobId);

    JobStore* m_store = nullptr;
    AdmissionQueue* m_admission = nullptr;
    StyleGenerationStage* m_generation = nullptr;
    FeatureExtractionStage* m_extraction = nullptr;
    MatchingStage* m_matching = nullptr;
    ImageStorage* m_storage = nullptr;
    Options m_options;

    RetryPolicy m_generationRetry;
    RetryPolicy m_extractionRetry;
    RetryPolicy m_matchingRetry;

    std::vector<std::thread> m_workers;
    std::atomic<bool> m_running{false};
    std::atomic<bool> m_stopping{false};
    std::atomic<int> m_runningJobs{0};

    // Serializes submit() and recover() so the capacity check and the enqueue
    // see the same queue.
    std::mutex m_submitMutex;

    std::mutex m_cancelMutex;
    std::set<JobId> m_cancelRequested;

    std::mutex m_stopMutex;
    std::condition_variable m_stopCv;
};

} // namespace gf
