#pragma once

#include "core/shared/types.h"

#include <QDateTime>
#include <QString>

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

struct sqlite3;

namespace gf {

// JobStore: durable record of jobs and everything their stages produced.
//
// One SQLite connection shared by the orchestrator workers; every call takes
// the store mutex. Stage outputs are written once per successful stage
// execution and replaced wholesale if the stage runs again for the same job.
// A job's final MatchResult is stored with its terminal status in a single
// transaction, so a status read never sees Completed without its result.
class JobStore {
public:
    ~JobStore();

    JobStore(const JobStore&) = delete;
    JobStore& operator=(const JobStore&) = delete;
    JobStore(JobStore&&) = delete;
    JobStore& operator=(JobStore&&) = delete;

    static std::unique_ptr<JobStore> open(const QString& dbPath);

    // ── Jobs ────────────────────────────────────────────────

    bool insertJob(const Job& job);

    // Persists stage, status, timestamps, retry counters and error.
    bool updateJob(const Job& job);

    // Persists a Completed job together with its result.
    bool completeJob(const Job& job, const MatchResult& result);

    bool deleteJob(const JobId& jobId);

    std::optional<Job> loadJob(const JobId& jobId);
    std::optional<MatchResult> loadResult(const JobId& jobId);

    // Every job not yet Completed or Failed, oldest first.
    std::vector<Job> nonTerminalJobs();

    std::map<JobStatus, int> countByStatus();

    // Deletes terminal jobs last updated before |cutoff| with their stage
    // records. Returns the removed ids.
    std::vector<JobId> purgeTerminalBefore(const QDateTime& cutoff);

    // ── Stage outputs ───────────────────────────────────────

    bool saveStyledImage(const StyledImage& image);
    std::optional<StyledImage> loadStyledImage(const JobId& jobId);

    bool saveRegions(const JobId& jobId, const std::vector<Region>& regions);
    std::vector<Region> loadRegions(const JobId& jobId);

    bool saveMatches(const JobId& jobId, const std::vector<Match>& matches);
    std::vector<Match> loadMatches(const JobId& jobId);

private:
    JobStore() = default;
    bool init(const QString& dbPath);
    bool execSql(const char* sql);
    bool beginTransaction();
    bool commitTransaction();
    void rollbackTransaction();
    bool writeJobRow(const Job& job, const QString* resultJson);
    std::vector<Job> selectJobs(const char* whereClause, const QString& bindValue);

    sqlite3* m_db = nullptr;
    std::mutex m_mutex;
};

} // namespace gf
