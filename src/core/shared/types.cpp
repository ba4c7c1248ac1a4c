#include "core/shared/types.h"

#include <QJsonArray>

#include <cmath>

namespace gf {

// ── Enum conversions ────────────────────────────────────────

QString jobStatusToString(JobStatus status)
{
    switch (status) {
    case JobStatus::Queued:      return QStringLiteral("queued");
    case JobStatus::Generating:  return QStringLiteral("generating");
    case JobStatus::Extracting:  return QStringLiteral("extracting");
    case JobStatus::Matching:    return QStringLiteral("matching");
    case JobStatus::Aggregating: return QStringLiteral("aggregating");
    case JobStatus::Completed:   return QStringLiteral("completed");
    case JobStatus::Failed:      return QStringLiteral("failed");
    }
    return QStringLiteral("failed");
}

std::optional<JobStatus> jobStatusFromString(const QString& str)
{
    if (str == QLatin1String("queued"))      return JobStatus::Queued;
    if (str == QLatin1String("generating"))  return JobStatus::Generating;
    if (str == QLatin1String("extracting"))  return JobStatus::Extracting;
    if (str == QLatin1String("matching"))    return JobStatus::Matching;
    if (str == QLatin1String("aggregating")) return JobStatus::Aggregating;
    if (str == QLatin1String("completed"))   return JobStatus::Completed;
    if (str == QLatin1String("failed"))      return JobStatus::Failed;
    return std::nullopt;
}

bool isTerminal(JobStatus status)
{
    return status == JobStatus::Completed || status == JobStatus::Failed;
}

bool canTransition(JobStatus from, JobStatus to)
{
    if (isTerminal(from)) {
        return false;
    }
    if (to == JobStatus::Failed) {
        return true;
    }
    return static_cast<int>(to) == static_cast<int>(from) + 1;
}

QString pipelineStageToString(PipelineStage stage)
{
    switch (stage) {
    case PipelineStage::Admission:   return QStringLiteral("admission");
    case PipelineStage::Generation:  return QStringLiteral("generation");
    case PipelineStage::Extraction:  return QStringLiteral("extraction");
    case PipelineStage::Matching:    return QStringLiteral("matching");
    case PipelineStage::Aggregation: return QStringLiteral("aggregation");
    case PipelineStage::Done:        return QStringLiteral("done");
    }
    return QStringLiteral("admission");
}

PipelineStage pipelineStageFromString(const QString& str)
{
    if (str == QLatin1String("generation"))  return PipelineStage::Generation;
    if (str == QLatin1String("extraction"))  return PipelineStage::Extraction;
    if (str == QLatin1String("matching"))    return PipelineStage::Matching;
    if (str == QLatin1String("aggregation")) return PipelineStage::Aggregation;
    if (str == QLatin1String("done"))        return PipelineStage::Done;
    return PipelineStage::Admission;
}

PipelineStage stageForStatus(JobStatus status)
{
    switch (status) {
    case JobStatus::Queued:      return PipelineStage::Admission;
    case JobStatus::Generating:  return PipelineStage::Generation;
    case JobStatus::Extracting:  return PipelineStage::Extraction;
    case JobStatus::Matching:    return PipelineStage::Matching;
    case JobStatus::Aggregating: return PipelineStage::Aggregation;
    case JobStatus::Completed:   return PipelineStage::Done;
    case JobStatus::Failed:      return PipelineStage::Done;
    }
    return PipelineStage::Admission;
}

QString errorKindToString(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::Validation:      return QStringLiteral("validation");
    case ErrorKind::Transient:       return QStringLiteral("transient");
    case ErrorKind::Capacity:        return QStringLiteral("capacity");
    case ErrorKind::TerminalFailure: return QStringLiteral("terminal_failure");
    case ErrorKind::Cancelled:       return QStringLiteral("cancelled");
    case ErrorKind::Interrupted:     return QStringLiteral("interrupted");
    case ErrorKind::Internal:        return QStringLiteral("internal");
    }
    return QStringLiteral("internal");
}

ErrorKind errorKindFromString(const QString& str)
{
    if (str == QLatin1String("validation"))       return ErrorKind::Validation;
    if (str == QLatin1String("transient"))        return ErrorKind::Transient;
    if (str == QLatin1String("capacity"))         return ErrorKind::Capacity;
    if (str == QLatin1String("terminal_failure")) return ErrorKind::TerminalFailure;
    if (str == QLatin1String("cancelled"))        return ErrorKind::Cancelled;
    if (str == QLatin1String("interrupted"))      return ErrorKind::Interrupted;
    return ErrorKind::Internal;
}

StageError StageError::validation(const QString& code, const QString& message)
{
    return StageError{ErrorKind::Validation, code, message};
}

StageError StageError::transient(const QString& code, const QString& message)
{
    return StageError{ErrorKind::Transient, code, message};
}

StageError StageError::internal(const QString& code, const QString& message)
{
    return StageError{ErrorKind::Internal, code, message};
}

// ── Style parameters ────────────────────────────────────────

const QStringList& knownStyles()
{
    static const QStringList styles = {
        QStringLiteral("scandinavian"),
        QStringLiteral("modern"),
        QStringLiteral("minimalist"),
        QStringLiteral("industrial"),
        QStringLiteral("bohemian"),
        QStringLiteral("mid-century"),
        QStringLiteral("traditional"),
        QStringLiteral("coastal"),
        QStringLiteral("japandi"),
        QStringLiteral("farmhouse"),
    };
    return styles;
}

const QStringList& knownRoomCategories()
{
    static const QStringList rooms = {
        QStringLiteral("living-room"),
        QStringLiteral("bedroom"),
        QStringLiteral("dining-room"),
        QStringLiteral("office"),
        QStringLiteral("kitchen"),
        QStringLiteral("kids-room"),
        QStringLiteral("outdoor"),
    };
    return rooms;
}

std::optional<StageError> validateStyleParams(const StyleParams& params)
{
    if (params.style.isEmpty()) {
        return StageError::validation(QStringLiteral("missing_style"),
                                      QStringLiteral("Style name is required"));
    }
    if (!knownStyles().contains(params.style)) {
        return StageError::validation(QStringLiteral("invalid_style"),
                                      QStringLiteral("Unknown style: %1").arg(params.style));
    }
    if (params.strength.has_value()) {
        const double strength = params.strength.value();
        if (!std::isfinite(strength) || strength < 0.0 || strength > 1.0) {
            return StageError::validation(QStringLiteral("invalid_strength"),
                                          QStringLiteral("Strength must be within [0, 1]"));
        }
    }
    if (!params.roomCategory.isEmpty() && !knownRoomCategories().contains(params.roomCategory)) {
        return StageError::validation(
            QStringLiteral("invalid_room_category"),
            QStringLiteral("Unknown room category: %1").arg(params.roomCategory));
    }
    if ((params.minPrice.has_value() && params.minPrice.value() < 0.0)
        || (params.maxPrice.has_value() && params.maxPrice.value() < 0.0)) {
        return StageError::validation(QStringLiteral("invalid_price_band"),
                                      QStringLiteral("Price band must be non-negative"));
    }
    if (params.minPrice.has_value() && params.maxPrice.has_value()
        && params.minPrice.value() > params.maxPrice.value()) {
        return StageError::validation(QStringLiteral("invalid_price_band"),
                                      QStringLiteral("minPrice exceeds maxPrice"));
    }
    return std::nullopt;
}

QJsonObject styleParamsToJson(const StyleParams& params)
{
    QJsonObject json;
    json.insert(QStringLiteral("style"), params.style);
    if (params.strength.has_value()) {
        json.insert(QStringLiteral("strength"), params.strength.value());
    }
    if (!params.roomCategory.isEmpty()) {
        json.insert(QStringLiteral("roomCategory"), params.roomCategory);
    }
    if (params.minPrice.has_value()) {
        json.insert(QStringLiteral("minPrice"), params.minPrice.value());
    }
    if (params.maxPrice.has_value()) {
        json.insert(QStringLiteral("maxPrice"), params.maxPrice.value());
    }
    return json;
}

StyleParams styleParamsFromJson(const QJsonObject& json)
{
    StyleParams params;
    params.style = json.value(QStringLiteral("style")).toString().trimmed().toLower();
    if (json.contains(QStringLiteral("strength"))) {
        params.strength = json.value(QStringLiteral("strength")).toDouble(-1.0);
    }
    params.roomCategory = json.value(QStringLiteral("roomCategory")).toString().trimmed().toLower();
    if (json.contains(QStringLiteral("minPrice"))) {
        params.minPrice = json.value(QStringLiteral("minPrice")).toDouble(-1.0);
    }
    if (json.contains(QStringLiteral("maxPrice"))) {
        params.maxPrice = json.value(QStringLiteral("maxPrice")).toDouble(-1.0);
    }
    return params;
}

bool BoundingBox::isValid() const
{
    const auto inUnit = [](double v) { return std::isfinite(v) && v >= 0.0 && v <= 1.0; };
    return inUnit(x) && inUnit(y) && inUnit(width) && inUnit(height)
        && width > 0.0 && height > 0.0
        && x + width <= 1.0 + 1e-6 && y + height <= 1.0 + 1e-6;
}

// ── JSON ────────────────────────────────────────────────────

QJsonObject catalogMetadataToJson(const CatalogMetadata& metadata)
{
    QJsonObject json;
    json.insert(QStringLiteral("title"), metadata.title);
    json.insert(QStringLiteral("category"), metadata.category);
    json.insert(QStringLiteral("price"), metadata.price);
    json.insert(QStringLiteral("currency"), metadata.currency);
    json.insert(QStringLiteral("inStock"), metadata.inStock);
    json.insert(QStringLiteral("productUrl"), metadata.productUrl);
    json.insert(QStringLiteral("imageUrl"), metadata.imageUrl);
    return json;
}

CatalogMetadata catalogMetadataFromJson(const QJsonObject& json)
{
    CatalogMetadata metadata;
    metadata.title = json.value(QStringLiteral("title")).toString();
    metadata.category = json.value(QStringLiteral("category")).toString();
    metadata.price = json.value(QStringLiteral("price")).toDouble(-1.0);
    metadata.currency = json.value(QStringLiteral("currency")).toString();
    metadata.inStock = json.value(QStringLiteral("inStock")).toBool(false);
    metadata.productUrl = json.value(QStringLiteral("productUrl")).toString();
    metadata.imageUrl = json.value(QStringLiteral("imageUrl")).toString();
    return metadata;
}

QJsonObject regionToJson(const Region& region, bool includeEmbedding)
{
    QJsonObject box;
    box.insert(QStringLiteral("x"), region.box.x);
    box.insert(QStringLiteral("y"), region.box.y);
    box.insert(QStringLiteral("width"), region.box.width);
    box.insert(QStringLiteral("height"), region.box.height);

    QJsonObject json;
    json.insert(QStringLiteral("regionId"), region.regionId);
    json.insert(QStringLiteral("imageRef"), region.imageRef);
    json.insert(QStringLiteral("box"), box);
    json.insert(QStringLiteral("categoryHint"), region.categoryHint);
    json.insert(QStringLiteral("detectionScore"), static_cast<double>(region.detectionScore));
    if (includeEmbedding) {
        QJsonArray embedding;
        for (float value : region.embedding) {
            embedding.append(static_cast<double>(value));
        }
        json.insert(QStringLiteral("embedding"), embedding);
    }
    return json;
}

Region regionFromJson(const QJsonObject& json)
{
    Region region;
    region.regionId = json.value(QStringLiteral("regionId")).toString();
    region.imageRef = json.value(QStringLiteral("imageRef")).toString();
    const QJsonObject box = json.value(QStringLiteral("box")).toObject();
    region.box.x = box.value(QStringLiteral("x")).toDouble();
    region.box.y = box.value(QStringLiteral("y")).toDouble();
    region.box.width = box.value(QStringLiteral("width")).toDouble();
    region.box.height = box.value(QStringLiteral("height")).toDouble();
    region.categoryHint = json.value(QStringLiteral("categoryHint")).toString();
    region.detectionScore =
        static_cast<float>(json.value(QStringLiteral("detectionScore")).toDouble());
    const QJsonArray embedding = json.value(QStringLiteral("embedding")).toArray();
    region.embedding.reserve(static_cast<size_t>(embedding.size()));
    for (const QJsonValue& value : embedding) {
        region.embedding.push_back(static_cast<float>(value.toDouble()));
    }
    return region;
}

QJsonObject matchCandidateToJson(const MatchCandidate& candidate)
{
    QJsonObject json;
    json.insert(QStringLiteral("productId"), candidate.productId);
    json.insert(QStringLiteral("similarity"), static_cast<double>(candidate.similarity));
    json.insert(QStringLiteral("score"), static_cast<double>(candidate.score));
    json.insert(QStringLiteral("metadata"), catalogMetadataToJson(candidate.metadata));
    return json;
}

MatchCandidate matchCandidateFromJson(const QJsonObject& json)
{
    MatchCandidate candidate;
    candidate.productId = json.value(QStringLiteral("productId")).toString();
    candidate.similarity = static_cast<float>(json.value(QStringLiteral("similarity")).toDouble());
    candidate.score = static_cast<float>(json.value(QStringLiteral("score")).toDouble());
    candidate.metadata = catalogMetadataFromJson(json.value(QStringLiteral("metadata")).toObject());
    return candidate;
}

QJsonObject matchResultToJson(const MatchResult& result)
{
    QJsonArray pairs;
    for (const RegionMatch& pair : result.pairs) {
        QJsonArray candidates;
        for (const MatchCandidate& candidate : pair.match.candidates) {
            candidates.append(matchCandidateToJson(candidate));
        }
        QJsonObject entry;
        entry.insert(QStringLiteral("region"), regionToJson(pair.region));
        entry.insert(QStringLiteral("matches"), candidates);
        pairs.append(entry);
    }

    QJsonObject json;
    json.insert(QStringLiteral("jobId"), result.jobId);
    json.insert(QStringLiteral("styledImageRef"), result.styledImageRef);
    json.insert(QStringLiteral("pairs"), pairs);
    json.insert(QStringLiteral("unmatchedRegionIds"),
                QJsonArray::fromStringList(result.unmatchedRegionIds));
    json.insert(QStringLiteral("status"), jobStatusToString(result.status));
    return json;
}

std::optional<MatchResult> matchResultFromJson(const QJsonObject& json)
{
    if (!json.contains(QStringLiteral("jobId")) || !json.contains(QStringLiteral("pairs"))) {
        return std::nullopt;
    }

    MatchResult result;
    result.jobId = json.value(QStringLiteral("jobId")).toString();
    result.styledImageRef = json.value(QStringLiteral("styledImageRef")).toString();
    result.status = jobStatusFromString(json.value(QStringLiteral("status")).toString())
                        .value_or(JobStatus::Completed);

    const QJsonArray pairs = json.value(QStringLiteral("pairs")).toArray();
    result.pairs.reserve(static_cast<size_t>(pairs.size()));
    for (const QJsonValue& value : pairs) {
        const QJsonObject entry = value.toObject();
        RegionMatch pair;
        pair.region = regionFromJson(entry.value(QStringLiteral("region")).toObject());
        pair.match.regionId = pair.region.regionId;
        const QJsonArray candidates = entry.value(QStringLiteral("matches")).toArray();
        for (const QJsonValue& candidate : candidates) {
            pair.match.candidates.push_back(matchCandidateFromJson(candidate.toObject()));
        }
        result.pairs.push_back(std::move(pair));
    }

    const QJsonArray unmatched = json.value(QStringLiteral("unmatchedRegionIds")).toArray();
    for (const QJsonValue& value : unmatched) {
        result.unmatchedRegionIds.append(value.toString());
    }
    return result;
}

QJsonObject jobErrorToJson(const JobError& error)
{
    QJsonObject json;
    json.insert(QStringLiteral("stage"), pipelineStageToString(error.stage));
    json.insert(QStringLiteral("kind"), errorKindToString(error.kind));
    json.insert(QStringLiteral("code"), error.code);
    json.insert(QStringLiteral("message"), error.message);
    if (!error.cause.isEmpty()) {
        json.insert(QStringLiteral("cause"), error.cause);
    }
    return json;
}

JobError jobErrorFromJson(const QJsonObject& json)
{
    JobError error;
    error.stage = pipelineStageFromString(json.value(QStringLiteral("stage")).toString());
    error.kind = errorKindFromString(json.value(QStringLiteral("kind")).toString());
    error.code = json.value(QStringLiteral("code")).toString();
    error.message = json.value(QStringLiteral("message")).toString();
    error.cause = json.value(QStringLiteral("cause")).toString();
    return error;
}

QJsonObject jobToJson(const Job& job)
{
    QJsonObject retries;
    retries.insert(QStringLiteral("generation"), job.retries.generation);
    retries.insert(QStringLiteral("extraction"), job.retries.extraction);
    retries.insert(QStringLiteral("matching"), job.retries.matching);

    QJsonObject json;
    json.insert(QStringLiteral("jobId"), job.id);
    json.insert(QStringLiteral("photoRef"), job.photoRef);
    json.insert(QStringLiteral("style"), styleParamsToJson(job.params));
    json.insert(QStringLiteral("stage"), pipelineStageToString(job.stage));
    json.insert(QStringLiteral("status"), jobStatusToString(job.status));
    json.insert(QStringLiteral("createdAt"), job.createdAt.toString(Qt::ISODateWithMs));
    json.insert(QStringLiteral("updatedAt"), job.updatedAt.toString(Qt::ISODateWithMs));
    json.insert(QStringLiteral("retries"), retries);
    if (job.error.has_value()) {
        json.insert(QStringLiteral("error"), jobErrorToJson(job.error.value()));
    }
    return json;
}

} // namespace gf
