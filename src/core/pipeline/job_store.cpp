#include "core/pipeline/job_store.h"
#include "core/pipeline/job_schema.h"
#include "core/shared/logging.h"

#include <sqlite3.h>

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>

#include <cstring>

namespace gf {

namespace {

constexpr const char* kJobColumns =
    "job_id, photo_ref, params_json, stage, status, created_at, updated_at, "
    "retries_generation, retries_extraction, retries_matching, error_json";

void bindText(sqlite3_stmt* stmt, int index, const QString& value)
{
    const QByteArray utf8 = value.toUtf8();
    sqlite3_bind_text(stmt, index, utf8.constData(), utf8.size(), SQLITE_TRANSIENT);
}

void bindOptionalText(sqlite3_stmt* stmt, int index, const QString& value)
{
    if (value.isEmpty()) {
        sqlite3_bind_null(stmt, index);
    } else {
        bindText(stmt, index, value);
    }
}

QString columnText(sqlite3_stmt* stmt, int column)
{
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
    return text ? QString::fromUtf8(text) : QString();
}

QString compactJson(const QJsonObject& json)
{
    return QString::fromUtf8(QJsonDocument(json).toJson(QJsonDocument::Compact));
}

QJsonObject parseJson(const QString& text)
{
    if (text.isEmpty()) {
        return {};
    }
    return QJsonDocument::fromJson(text.toUtf8()).object();
}

qint64 toMs(const QDateTime& value)
{
    return value.isValid() ? value.toMSecsSinceEpoch() : 0;
}

QDateTime fromMs(qint64 value)
{
    return QDateTime::fromMSecsSinceEpoch(value, Qt::UTC);
}

Job readJobRow(sqlite3_stmt* stmt)
{
    Job job;
    job.id = columnText(stmt, 0);
    job.photoRef = columnText(stmt, 1);
    job.params = styleParamsFromJson(parseJson(columnText(stmt, 2)));
    job.stage = pipelineStageFromString(columnText(stmt, 3));
    job.status = jobStatusFromString(columnText(stmt, 4)).value_or(JobStatus::Failed);
    job.createdAt = fromMs(sqlite3_column_int64(stmt, 5));
    job.updatedAt = fromMs(sqlite3_column_int64(stmt, 6));
    job.retries.generation = sqlite3_column_int(stmt, 7);
    job.retries.extraction = sqlite3_column_int(stmt, 8);
    job.retries.matching = sqlite3_column_int(stmt, 9);
    if (sqlite3_column_type(stmt, 10) != SQLITE_NULL) {
        job.error = jobErrorFromJson(parseJson(columnText(stmt, 10)));
    }
    return job;
}

} // namespace

JobStore::~JobStore()
{
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

std::unique_ptr<JobStore> JobStore::open(const QString& dbPath)
{
    std::unique_ptr<JobStore> store(new JobStore());
    if (!store->init(dbPath)) {
        return nullptr;
    }
    return store;
}

bool JobStore::init(const QString& dbPath)
{
    if (sqlite3_open(dbPath.toUtf8().constData(), &m_db) != SQLITE_OK) {
        LOG_ERROR(gfPipeline, "Failed to open job database %s: %s",
                  qPrintable(dbPath), m_db ? sqlite3_errmsg(m_db) : "out of memory");
        return false;
    }

    sqlite3_busy_timeout(m_db, 30000);

    if (!execSql(kJobConnectionPragmas)) {
        LOG_ERROR(gfPipeline, "Failed to set job database connection pragmas");
        return false;
    }
    if (!execSql(kJobDatabasePragmas) || !execSql(kJobSchemaV1)) {
        LOG_ERROR(gfPipeline, "Failed to create job schema in %s", qPrintable(dbPath));
        return false;
    }

    // Photos and results are private to the user.
    QFile dbFile(dbPath);
    dbFile.setPermissions(QFile::ReadOwner | QFile::WriteOwner);

    LOG_INFO(gfPipeline, "Job database opened: %s", qPrintable(dbPath));
    return true;
}

bool JobStore::execSql(const char* sql)
{
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_ERROR(gfPipeline, "SQL error: %s", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

bool JobStore::beginTransaction()
{
    return execSql("BEGIN IMMEDIATE");
}

bool JobStore::commitTransaction()
{
    return execSql("COMMIT");
}

void JobStore::rollbackTransaction()
{
    if (!execSql("ROLLBACK")) {
        LOG_WARN(gfPipeline, "Rollback failed on job database");
    }
}

// ── Jobs ────────────────────────────────────────────────────

bool JobStore::insertJob(const Job& job)
{
    const char* sql = R"(
        INSERT INTO jobs (job_id, photo_ref, params_json, stage, status, created_at,
                          updated_at, retries_generation, retries_extraction,
                          retries_matching, error_json)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11)
    )";

    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(gfPipeline, "insertJob prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }

    bindText(stmt, 1, job.id);
    bindText(stmt, 2, job.photoRef);
    bindText(stmt, 3, compactJson(styleParamsToJson(job.params)));
    bindText(stmt, 4, pipelineStageToString(job.stage));
    bindText(stmt, 5, jobStatusToString(job.status));
    sqlite3_bind_int64(stmt, 6, toMs(job.createdAt));
    sqlite3_bind_int64(stmt, 7, toMs(job.updatedAt));
    sqlite3_bind_int(stmt, 8, job.retries.generation);
    sqlite3_bind_int(stmt, 9, job.retries.extraction);
    sqlite3_bind_int(stmt, 10, job.retries.matching);
    bindOptionalText(stmt, 11, job.error ? compactJson(jobErrorToJson(*job.error)) : QString());

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(gfPipeline, "Failed to insert job %s: %s", qPrintable(job.id), sqlite3_errmsg(m_db));
        return false;
    }
    return true;
}

bool JobStore::writeJobRow(const Job& job, const QString* resultJson)
{
    const char* sql = resultJson
        ? R"(
            UPDATE jobs SET stage = ?2, status = ?3, updated_at = ?4,
                retries_generation = ?5, retries_extraction = ?6, retries_matching = ?7,
                error_json = ?8, result_json = ?9
            WHERE job_id = ?1
        )"
        : R"(
            UPDATE jobs SET stage = ?2, status = ?3, updated_at = ?4,
                retries_generation = ?5, retries_extraction = ?6, retries_matching = ?7,
                error_json = ?8
            WHERE job_id = ?1
        )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(gfPipeline, "updateJob prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }

    bindText(stmt, 1, job.id);
    bindText(stmt, 2, pipelineStageToString(job.stage));
    bindText(stmt, 3, jobStatusToString(job.status));
    sqlite3_bind_int64(stmt, 4, toMs(job.updatedAt));
    sqlite3_bind_int(stmt, 5, job.retries.generation);
    sqlite3_bind_int(stmt, 6, job.retries.extraction);
    sqlite3_bind_int(stmt, 7, job.retries.matching);
    bindOptionalText(stmt, 8, job.error ? compactJson(jobErrorToJson(*job.error)) : QString());
    if (resultJson) {
        bindText(stmt, 9, *resultJson);
    }

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE || sqlite3_changes(m_db) == 0) {
        LOG_ERROR(gfPipeline, "Failed to update job %s: %s", qPrintable(job.id),
                  rc == SQLITE_DONE ? "no such job" : sqlite3_errmsg(m_db));
        return false;
    }
    return true;
}

bool JobStore::updateJob(const Job& job)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return writeJobRow(job, nullptr);
}

bool JobStore::completeJob(const Job& job, const MatchResult& result)
{
    const QString resultJson = compactJson(matchResultToJson(result));

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!beginTransaction()) {
        return false;
    }
    if (!writeJobRow(job, &resultJson)) {
        rollbackTransaction();
        return false;
    }
    return commitTransaction();
}

bool JobStore::deleteJob(const JobId& jobId)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "DELETE FROM jobs WHERE job_id = ?1", -1, &stmt, nullptr)
        != SQLITE_OK) {
        LOG_ERROR(gfPipeline, "deleteJob prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    bindText(stmt, 1, jobId);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE && sqlite3_changes(m_db) > 0;
}

std::optional<Job> JobStore::loadJob(const JobId& jobId)
{
    std::vector<Job> jobs = selectJobs("job_id = ?1", jobId);
    if (jobs.empty()) {
        return std::nullopt;
    }
    return std::move(jobs.front());
}

std::optional<MatchResult> JobStore::loadResult(const JobId& jobId)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "SELECT result_json FROM jobs WHERE job_id = ?1", -1, &stmt,
                           nullptr) != SQLITE_OK) {
        LOG_ERROR(gfPipeline, "loadResult prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    bindText(stmt, 1, jobId);

    std::optional<MatchResult> result;
    if (sqlite3_step(stmt) == SQLITE_ROW && sqlite3_column_type(stmt, 0) != SQLITE_NULL) {
        result = matchResultFromJson(parseJson(columnText(stmt, 0)));
        if (!result) {
            LOG_WARN(gfPipeline, "Stored result for job %s is unreadable", qPrintable(jobId));
        }
    }
    sqlite3_finalize(stmt);
    return result;
}

std::vector<Job> JobStore::selectJobs(const char* whereClause, const QString& bindValue)
{
    const QByteArray sql = QByteArray("SELECT ") + kJobColumns + " FROM jobs WHERE "
                           + whereClause + " ORDER BY created_at ASC, rowid ASC";

    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<Job> jobs;
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(gfPipeline, "Job query prepare failed: %s", sqlite3_errmsg(m_db));
        return jobs;
    }
    if (!bindValue.isNull()) {
        bindText(stmt, 1, bindValue);
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        jobs.push_back(readJobRow(stmt));
    }
    sqlite3_finalize(stmt);
    return jobs;
}

std::vector<Job> JobStore::nonTerminalJobs()
{
    return selectJobs("status NOT IN ('completed', 'failed')", QString());
}

std::map<JobStatus, int> JobStore::countByStatus()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::map<JobStatus, int> counts;
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "SELECT status, COUNT(*) FROM jobs GROUP BY status", -1, &stmt,
                           nullptr) != SQLITE_OK) {
        LOG_ERROR(gfPipeline, "countByStatus prepare failed: %s", sqlite3_errmsg(m_db));
        return counts;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        if (const auto status = jobStatusFromString(columnText(stmt, 0))) {
            counts[*status] = sqlite3_column_int(stmt, 1);
        }
    }
    sqlite3_finalize(stmt);
    return counts;
}

std::vector<JobId> JobStore::purgeTerminalBefore(const QDateTime& cutoff)
{
    const char* selectSql = R"(
        SELECT job_id FROM jobs
        WHERE status IN ('completed', 'failed') AND updated_at < ?1
        ORDER BY updated_at ASC
    )";

    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<JobId> removed;

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, selectSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(gfPipeline, "purge prepare failed: %s", sqlite3_errmsg(m_db));
        return removed;
    }
    sqlite3_bind_int64(stmt, 1, toMs(cutoff));
    std::vector<JobId> candidates;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        candidates.push_back(columnText(stmt, 0));
    }
    sqlite3_finalize(stmt);

    if (candidates.empty()) {
        return removed;
    }

    if (!beginTransaction()) {
        return removed;
    }
    sqlite3_stmt* deleteStmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "DELETE FROM jobs WHERE job_id = ?1", -1, &deleteStmt, nullptr)
        != SQLITE_OK) {
        LOG_ERROR(gfPipeline, "purge delete prepare failed: %s", sqlite3_errmsg(m_db));
        rollbackTransaction();
        return removed;
    }
    for (const JobId& jobId : candidates) {
        bindText(deleteStmt, 1, jobId);
        if (sqlite3_step(deleteStmt) != SQLITE_DONE) {
            LOG_ERROR(gfPipeline, "Failed to purge job %s: %s", qPrintable(jobId),
                      sqlite3_errmsg(m_db));
            sqlite3_finalize(deleteStmt);
            rollbackTransaction();
            return {};
        }
        sqlite3_reset(deleteStmt);
        sqlite3_clear_bindings(deleteStmt);
    }
    sqlite3_finalize(deleteStmt);

    if (!commitTransaction()) {
        rollbackTransaction();
        return {};
    }
    removed = std::move(candidates);
    LOG_INFO(gfPipeline, "Purged %d expired job(s)", static_cast<int>(removed.size()));
    return removed;
}

// ── Stage outputs ───────────────────────────────────────────

bool JobStore::saveStyledImage(const StyledImage& image)
{
    const char* sql = R"(
        INSERT INTO styled_images (job_id, image_ref, params_json, generation_ms)
        VALUES (?1, ?2, ?3, ?4)
        ON CONFLICT(job_id) DO UPDATE SET
            image_ref = excluded.image_ref,
            params_json = excluded.params_json,
            generation_ms = excluded.generation_ms
    )";

    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(gfPipeline, "saveStyledImage prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    bindText(stmt, 1, image.jobId);
    bindText(stmt, 2, image.imageRef);
    bindText(stmt, 3, compactJson(styleParamsToJson(image.params)));
    sqlite3_bind_int64(stmt, 4, image.generationMs);

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(gfPipeline, "Failed to save styled image for %s: %s",
                  qPrintable(image.jobId), sqlite3_errmsg(m_db));
        return false;
    }
    return true;
}

std::optional<StyledImage> JobStore::loadStyledImage(const JobId& jobId)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db,
                           "SELECT image_ref, params_json, generation_ms FROM styled_images "
                           "WHERE job_id = ?1",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(gfPipeline, "loadStyledImage prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    bindText(stmt, 1, jobId);

    std::optional<StyledImage> image;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        StyledImage row;
        row.jobId = jobId;
        row.imageRef = columnText(stmt, 0);
        row.params = styleParamsFromJson(parseJson(columnText(stmt, 1)));
        row.generationMs = sqlite3_column_int64(stmt, 2);
        image = std::move(row);
    }
    sqlite3_finalize(stmt);
    return image;
}

bool JobStore::saveRegions(const JobId& jobId, const std::vector<Region>& regions)
{
    const char* insertSql = R"(
        INSERT INTO regions (region_id, job_id, ordinal, image_ref, box_x, box_y, box_w, box_h,
                             category_hint, detection_score, embedding)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11)
    )";

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!beginTransaction()) {
        return false;
    }

    sqlite3_stmt* clearStmt = nullptr;
    sqlite3_stmt* insertStmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "DELETE FROM regions WHERE job_id = ?1", -1, &clearStmt, nullptr)
            != SQLITE_OK
        || sqlite3_prepare_v2(m_db, insertSql, -1, &insertStmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(gfPipeline, "saveRegions prepare failed: %s", sqlite3_errmsg(m_db));
        sqlite3_finalize(clearStmt);
        sqlite3_finalize(insertStmt);
        rollbackTransaction();
        return false;
    }

    bindText(clearStmt, 1, jobId);
    bool ok = sqlite3_step(clearStmt) == SQLITE_DONE;
    sqlite3_finalize(clearStmt);

    for (size_t i = 0; ok && i < regions.size(); ++i) {
        const Region& region = regions[i];
        bindText(insertStmt, 1, region.regionId);
        bindText(insertStmt, 2, jobId);
        sqlite3_bind_int(insertStmt, 3, static_cast<int>(i));
        bindText(insertStmt, 4, region.imageRef);
        sqlite3_bind_double(insertStmt, 5, region.box.x);
        sqlite3_bind_double(insertStmt, 6, region.box.y);
        sqlite3_bind_double(insertStmt, 7, region.box.width);
        sqlite3_bind_double(insertStmt, 8, region.box.height);
        bindText(insertStmt, 9, region.categoryHint);
        sqlite3_bind_double(insertStmt, 10, static_cast<double>(region.detectionScore));
        if (region.embedding.empty()) {
            sqlite3_bind_null(insertStmt, 11);
        } else {
            sqlite3_bind_blob(insertStmt, 11, region.embedding.data(),
                              static_cast<int>(region.embedding.size() * sizeof(float)),
                              SQLITE_TRANSIENT);
        }
        ok = sqlite3_step(insertStmt) == SQLITE_DONE;
        sqlite3_reset(insertStmt);
        sqlite3_clear_bindings(insertStmt);
    }
    sqlite3_finalize(insertStmt);

    if (!ok) {
        LOG_ERROR(gfPipeline, "Failed to save regions for %s: %s", qPrintable(jobId),
                  sqlite3_errmsg(m_db));
        rollbackTransaction();
        return false;
    }
    return commitTransaction();
}

std::vector<Region> JobStore::loadRegions(const JobId& jobId)
{
    const char* sql = R"(
        SELECT region_id, image_ref, box_x, box_y, box_w, box_h, category_hint,
               detection_score, embedding
        FROM regions WHERE job_id = ?1 ORDER BY ordinal ASC
    )";

    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<Region> regions;
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(gfPipeline, "loadRegions prepare failed: %s", sqlite3_errmsg(m_db));
        return regions;
    }
    bindText(stmt, 1, jobId);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        Region region;
        region.regionId = columnText(stmt, 0);
        region.imageRef = columnText(stmt, 1);
        region.box.x = sqlite3_column_double(stmt, 2);
        region.box.y = sqlite3_column_double(stmt, 3);
        region.box.width = sqlite3_column_double(stmt, 4);
        region.box.height = sqlite3_column_double(stmt, 5);
        region.categoryHint = columnText(stmt, 6);
        region.detectionScore = static_cast<float>(sqlite3_column_double(stmt, 7));

        const void* blob = sqlite3_column_blob(stmt, 8);
        const int bytes = sqlite3_column_bytes(stmt, 8);
        if (blob && bytes > 0 && bytes % static_cast<int>(sizeof(float)) == 0) {
            region.embedding.resize(static_cast<size_t>(bytes) / sizeof(float));
            std::memcpy(region.embedding.data(), blob, static_cast<size_t>(bytes));
        }
        regions.push_back(std::move(region));
    }
    sqlite3_finalize(stmt);
    return regions;
}

bool JobStore::saveMatches(const JobId& jobId, const std::vector<Match>& matches)
{
    const char* insertSql = R"(
        INSERT INTO matches (region_id, job_id, rank, product_id, similarity, score, metadata_json)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7)
    )";

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!beginTransaction()) {
        return false;
    }

    sqlite3_stmt* clearStmt = nullptr;
    sqlite3_stmt* insertStmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "DELETE FROM matches WHERE job_id = ?1", -1, &clearStmt, nullptr)
            != SQLITE_OK
        || sqlite3_prepare_v2(m_db, insertSql, -1, &insertStmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(gfPipeline, "saveMatches prepare failed: %s", sqlite3_errmsg(m_db));
        sqlite3_finalize(clearStmt);
        sqlite3_finalize(insertStmt);
        rollbackTransaction();
        return false;
    }

    bindText(clearStmt, 1, jobId);
    bool ok = sqlite3_step(clearStmt) == SQLITE_DONE;
    sqlite3_finalize(clearStmt);

    for (const Match& match : matches) {
        for (size_t rank = 0; ok && rank < match.candidates.size(); ++rank) {
            const MatchCandidate& candidate = match.candidates[rank];
            bindText(insertStmt, 1, match.regionId);
            bindText(insertStmt, 2, jobId);
            sqlite3_bind_int(insertStmt, 3, static_cast<int>(rank));
            bindText(insertStmt, 4, candidate.productId);
            sqlite3_bind_double(insertStmt, 5, static_cast<double>(candidate.similarity));
            sqlite3_bind_double(insertStmt, 6, static_cast<double>(candidate.score));
            bindText(insertStmt, 7, compactJson(catalogMetadataToJson(candidate.metadata)));
            ok = sqlite3_step(insertStmt) == SQLITE_DONE;
            sqlite3_reset(insertStmt);
            sqlite3_clear_bindings(insertStmt);
        }
        if (!ok) {
            break;
        }
    }
    sqlite3_finalize(insertStmt);

    if (!ok) {
        LOG_ERROR(gfPipeline, "Failed to save matches for %s: %s", qPrintable(jobId),
                  sqlite3_errmsg(m_db));
        rollbackTransaction();
        return false;
    }
    return commitTransaction();
}

std::vector<Match> JobStore::loadMatches(const JobId& jobId)
{
    const char* sql = R"(
        SELECT m.region_id, m.product_id, m.similarity, m.score, m.metadata_json
        FROM matches m JOIN regions r ON r.region_id = m.region_id
        WHERE m.job_id = ?1
        ORDER BY r.ordinal ASC, m.rank ASC
    )";

    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<Match> matches;
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(gfPipeline, "loadMatches prepare failed: %s", sqlite3_errmsg(m_db));
        return matches;
    }
    bindText(stmt, 1, jobId);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        const QString regionId = columnText(stmt, 0);
        if (matches.empty() || matches.back().regionId != regionId) {
            Match match;
            match.regionId = regionId;
            matches.push_back(std::move(match));
        }
        MatchCandidate candidate;
        candidate.productId = columnText(stmt, 1);
        candidate.similarity = static_cast<float>(sqlite3_column_double(stmt, 2));
        candidate.score = static_cast<float>(sqlite3_column_double(stmt, 3));
        candidate.metadata = catalogMetadataFromJson(parseJson(columnText(stmt, 4)));
        matches.back().candidates.push_back(std::move(candidate));
    }
    sqlite3_finalize(stmt);
    return matches;
}

} // namespace gf
