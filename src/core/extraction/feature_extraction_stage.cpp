#include "core/extraction/feature_extraction_stage.h"
#include "core/extraction/region_detector.h"
#include "core/extraction/region_embedder.h"
#include "core/generation/image_storage.h"
#include "core/shared/logging.h"

#include <algorithm>

namespace gf {

namespace {

bool higherScoreFirst(const DetectedRegion& a, const DetectedRegion& b)
{
    return a.score > b.score;
}

bool readingOrder(const DetectedRegion& a, const DetectedRegion& b)
{
    if (a.box.y != b.box.y) {
        return a.box.y < b.box.y;
    }
    if (a.box.x != b.box.x) {
        return a.box.x < b.box.x;
    }
    return a.category < b.category;
}

} // namespace

FeatureExtractionStage::FeatureExtractionStage(RegionDetector* detector,
                                               RegionEmbedder* embedder,
                                               ImageStorage* storage,
                                               const Options& options)
    : m_detector(detector)
    , m_embedder(embedder)
    , m_storage(storage)
    , m_options(options)
{
}

StageResult<std::vector<Region>> FeatureExtractionStage::extract(const StyledImage& image)
{
    using Result = StageResult<std::vector<Region>>;

    const std::optional<QString> imagePath = m_storage->resolve(image.imageRef);
    if (!imagePath || !m_storage->exists(image.imageRef)) {
        return Result::failure(StageError::validation(
            QStringLiteral("image_not_found"), QStringLiteral("Rendered image is missing")));
    }

    auto detected = m_detector->detect(*imagePath);
    if (!detected.ok()) {
        return Result::failure(detected.error);
    }

    std::vector<DetectedRegion> kept;
    kept.reserve(detected.value->size());
    for (DetectedRegion& region : *detected.value) {
        if (region.score >= m_options.minDetectionScore && region.box.isValid()) {
            kept.push_back(std::move(region));
        }
    }

    // Cap by confidence first so the survivors do not depend on position.
    if (m_options.maxRegions >= 0 && static_cast<int>(kept.size()) > m_options.maxRegions) {
        std::stable_sort(kept.begin(), kept.end(), readingOrder);
        std::stable_sort(kept.begin(), kept.end(), higherScoreFirst);
        kept.resize(static_cast<size_t>(m_options.maxRegions));
    }
    std::stable_sort(kept.begin(), kept.end(), readingOrder);

    std::vector<BoundingBox> missingBoxes;
    std::vector<size_t> missingIndexes;
    for (size_t i = 0; i < kept.size(); ++i) {
        if (kept[i].embedding.empty()) {
            missingBoxes.push_back(kept[i].box);
            missingIndexes.push_back(i);
        }
    }

    if (!missingBoxes.empty()) {
        if (!m_embedder) {
            return Result::failure(StageError::transient(
                QStringLiteral("embedder_unavailable"), QStringLiteral("No region encoder is configured")));
        }
        auto embedded = m_embedder->embed(*imagePath, missingBoxes);
        if (!embedded.ok()) {
            return Result::failure(embedded.error);
        }
        if (embedded.value->size() != missingBoxes.size()) {
            return Result::failure(StageError::internal(
                QStringLiteral("embedding_count_mismatch"),
                QStringLiteral("Region encoder returned the wrong number of embeddings")));
        }
        for (size_t i = 0; i < missingIndexes.size(); ++i) {
            kept[missingIndexes[i]].embedding = std::move((*embedded.value)[i]);
        }
    }

    std::vector<Region> regions;
    regions.reserve(kept.size());
    for (size_t i = 0; i < kept.size(); ++i) {
        DetectedRegion& source = kept[i];
        if (static_cast<int>(source.embedding.size()) != m_options.dimensions) {
            LOG_ERROR(gfExtraction, "Region embedding has %d dimensions, system uses %d",
                      static_cast<int>(source.embedding.size()), m_options.dimensions);
            return Result::failure(StageError::validation(
                QStringLiteral("dimension_mismatch"),
                QStringLiteral("Region embedding dimensionality does not match the catalog")));
        }

        Region region;
        region.regionId = QStringLiteral("%1-r%2").arg(image.jobId).arg(i);
        region.imageRef = image.imageRef;
        region.box = source.box;
        region.categoryHint = source.category;
        region.detectionScore = source.score;
        region.embedding = std::move(source.embedding);
        regions.push_back(std::move(region));
    }

    LOG_INFO(gfExtraction, "Job %s: %d region(s) kept of %d detected",
             qPrintable(image.jobId), static_cast<int>(regions.size()),
             static_cast<int>(detected.value->size()));
    return Result::success(std::move(regions));
}

} // namespace gf
