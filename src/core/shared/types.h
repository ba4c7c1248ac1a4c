#pragma once

#include <QDateTime>
#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace gf {

using JobId = QString;

// Job lifecycle. Completed and Failed are terminal.
enum class JobStatus {
    Queued,
    Generating,
    Extracting,
    Matching,
    Aggregating,
    Completed,
    Failed,
};

QString jobStatusToString(JobStatus status);
std::optional<JobStatus> jobStatusFromString(const QString& str);
bool isTerminal(JobStatus status);

// Monotonic state machine: a job may only move to the next stage in
// Queued → Generating → Extracting → Matching → Aggregating → Completed,
// or from any non-terminal state to Failed.
bool canTransition(JobStatus from, JobStatus to);

enum class PipelineStage {
    Admission,
    Generation,
    Extraction,
    Matching,
    Aggregation,
    Done,
};

QString pipelineStageToString(PipelineStage stage);
PipelineStage pipelineStageFromString(const QString& str);
PipelineStage stageForStatus(JobStatus status);

// Error taxonomy. Only Transient errors are retried.
enum class ErrorKind {
    Validation,
    Transient,
    Capacity,
    TerminalFailure,
    Cancelled,
    Interrupted,
    Internal,
};

QString errorKindToString(ErrorKind kind);
ErrorKind errorKindFromString(const QString& str);

struct StageError {
    ErrorKind kind = ErrorKind::Internal;
    QString code;
    QString message;

    bool isRetryable() const { return kind == ErrorKind::Transient; }

    static StageError validation(const QString& code, const QString& message);
    static StageError transient(const QString& code, const QString& message);
    static StageError internal(const QString& code, const QString& message);
};

// Value-or-error return of every stage call. Exactly one of value / error is
// meaningful: error is only read when ok() is false.
template <typename T>
struct StageResult {
    std::optional<T> value;
    StageError error;

    bool ok() const { return value.has_value(); }

    static StageResult success(T v)
    {
        StageResult result;
        result.value = std::move(v);
        return result;
    }

    static StageResult failure(StageError e)
    {
        StageResult result;
        result.error = std::move(e);
        return result;
    }
};

// ── Request parameters ──────────────────────────────────────

struct StyleParams {
    QString style;
    std::optional<double> strength;
    QString roomCategory;
    std::optional<double> minPrice;
    std::optional<double> maxPrice;
};

const QStringList& knownStyles();
const QStringList& knownRoomCategories();

// Returns the first validation problem, or nullopt when the parameters are usable.
std::optional<StageError> validateStyleParams(const StyleParams& params);

QJsonObject styleParamsToJson(const StyleParams& params);
StyleParams styleParamsFromJson(const QJsonObject& json);

// ── Pipeline records ────────────────────────────────────────

struct StyledImage {
    JobId jobId;
    QString imageRef;
    StyleParams params;
    int64_t generationMs = 0;
};

// Normalized to the image: all values in [0, 1].
struct BoundingBox {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;

    bool isValid() const;
};

struct Region {
    QString regionId;
    QString imageRef;
    BoundingBox box;
    QString categoryHint;
    float detectionScore = 0.0f;
    std::vector<float> embedding;
};

struct CatalogMetadata {
    QString title;
    QString category;
    double price = -1.0;
    QString currency;
    bool inStock = false;
    QString productUrl;
    QString imageUrl;
};

struct MatchCandidate {
    QString productId;
    float similarity = 0.0f;
    float score = 0.0f;
    CatalogMetadata metadata;
};

struct Match {
    QString regionId;
    std::vector<MatchCandidate> candidates;
};

struct RegionMatch {
    Region region;
    Match match;
};

struct MatchResult {
    JobId jobId;
    QString styledImageRef;
    std::vector<RegionMatch> pairs;
    QStringList unmatchedRegionIds;
    JobStatus status = JobStatus::Completed;
};

// ── Job ─────────────────────────────────────────────────────

struct RetryCounters {
    int generation = 0;
    int extraction = 0;
    int matching = 0;
};

struct JobError {
    PipelineStage stage = PipelineStage::Admission;
    ErrorKind kind = ErrorKind::Internal;
    QString code;
    QString message;
    QString cause;
};

struct Job {
    JobId id;
    QString photoRef;
    StyleParams params;
    PipelineStage stage = PipelineStage::Admission;
    JobStatus status = JobStatus::Queued;
    QDateTime createdAt;
    QDateTime updatedAt;
    RetryCounters retries;
    std::optional<JobError> error;
};

struct JobSnapshot {
    Job job;
    std::optional<MatchResult> result;
};

// ── JSON ────────────────────────────────────────────────────

QJsonObject catalogMetadataToJson(const CatalogMetadata& metadata);
CatalogMetadata catalogMetadataFromJson(const QJsonObject& json);

// Embeddings are omitted unless includeEmbedding is set; they are large and
// meaningless to callers.
QJsonObject regionToJson(const Region& region, bool includeEmbedding = false);
Region regionFromJson(const QJsonObject& json);

QJsonObject matchCandidateToJson(const MatchCandidate& candidate);
MatchCandidate matchCandidateFromJson(const QJsonObject& json);

QJsonObject matchResultToJson(const MatchResult& result);
std::optional<MatchResult> matchResultFromJson(const QJsonObject& json);

QJsonObject jobErrorToJson(const JobError& error);
JobError jobErrorFromJson(const QJsonObject& json);

QJsonObject jobToJson(const Job& job);

} // namespace gf
