#include "core/vector/hnsw_index_client.h"
#include "core/vector/catalog_pool.h"
#include "core/vector/vector_index.h"
#include "core/shared/logging.h"
#include "core/shared/settings.h"

#include <QElapsedTimer>

#include <algorithm>
#include <unordered_map>

namespace gf {

HnswIndexClient::HnswIndexClient(std::shared_ptr<VectorIndex> index,
                                 std::unique_ptr<CatalogPool> pool,
                                 const Options& options)
    : m_index(std::move(index))
    , m_pool(std::move(pool))
    , m_options(options)
{
}

HnswIndexClient::~HnswIndexClient() = default;

std::unique_ptr<HnswIndexClient> HnswIndexClient::open(const Settings& settings)
{
    VectorIndex::IndexMetadata metadata;
    metadata.dimensions = settings.embeddingDimensions;
    auto index = std::make_shared<VectorIndex>(metadata);
    index->setEfSearch(settings.indexEfSearch);
    if (!index->load(settings.indexPath.toStdString(), settings.indexMetaPath.toStdString())) {
        LOG_ERROR(gfIndex, "Vector index unavailable at %s", qPrintable(settings.indexPath));
        return nullptr;
    }

    auto pool = CatalogPool::open(settings.catalogDbPath, settings.catalogPoolSize);
    if (!pool) {
        return nullptr;
    }

    Options options;
    options.queryTimeoutMs = settings.indexQueryTimeoutMs;
    options.acquireTimeoutMs = settings.catalogAcquireTimeoutMs;

    LOG_INFO(gfIndex, "Vector index loaded: %d vectors, %d dimensions, model %s",
             index->elementCount(), index->dimensions(), index->metadata().modelId.c_str());
    return std::make_unique<HnswIndexClient>(std::move(index), std::move(pool), options);
}

int HnswIndexClient::dimensions() const
{
    return m_index->dimensions();
}

StageResult<std::vector<IndexCandidate>> HnswIndexClient::query(const std::vector<float>& embedding,
                                                                int kQuery)
{
    using Result = StageResult<std::vector<IndexCandidate>>;

    if (auto error = validateDimensionality(embedding)) {
        return Result::failure(*error);
    }
    if (kQuery <= 0) {
        return Result::success({});
    }

    QElapsedTimer timer;
    timer.start();

    const std::optional<std::vector<VectorIndex::Neighbour>> neighbours =
        m_index->search(normalizeEmbedding(embedding), kQuery);
    if (!neighbours) {
        return Result::failure(StageError::transient(
            QStringLiteral("index_unavailable"), QStringLiteral("Product index search failed")));
    }

    std::vector<uint64_t> labels;
    labels.reserve(neighbours->size());
    std::unordered_map<uint64_t, float> distanceByLabel;
    for (const VectorIndex::Neighbour& neighbour : *neighbours) {
        labels.push_back(neighbour.label);
        distanceByLabel.emplace(neighbour.label, neighbour.distance);
    }

    const int remainingMs = m_options.queryTimeoutMs - static_cast<int>(timer.elapsed());
    if (remainingMs <= 0) {
        LOG_WARN(gfIndex, "Index search exceeded its %dms budget", m_options.queryTimeoutMs);
        return Result::failure(StageError::transient(
            QStringLiteral("index_timeout"), QStringLiteral("Product search timed out")));
    }

    auto rows = m_pool->lookupByLabels(labels, std::min(remainingMs, m_options.acquireTimeoutMs));
    if (!rows.ok()) {
        return Result::failure(rows.error);
    }

    if (timer.elapsed() > m_options.queryTimeoutMs) {
        LOG_WARN(gfIndex, "Index query took %lldms, budget %dms",
                 static_cast<long long>(timer.elapsed()), m_options.queryTimeoutMs);
        return Result::failure(StageError::transient(
            QStringLiteral("index_timeout"), QStringLiteral("Product search timed out")));
    }

    std::vector<IndexCandidate> candidates;
    candidates.reserve(rows.value->size());
    for (CatalogProduct& product : *rows.value) {
        const auto it = distanceByLabel.find(product.label);
        if (it == distanceByLabel.end()) {
            continue;
        }
        IndexCandidate candidate;
        candidate.productId = std::move(product.productId);
        candidate.similarity = std::clamp(1.0f - it->second, -1.0f, 1.0f);
        candidate.metadata = std::move(product.metadata);
        candidates.push_back(std::move(candidate));
    }

    if (candidates.size() < labels.size()) {
        LOG_DEBUG(gfIndex, "%d indexed label(s) have no catalog row",
                  static_cast<int>(labels.size() - candidates.size()));
    }

    sortBySimilarity(candidates);
    return Result::success(std::move(candidates));
}

} // namespace gf
