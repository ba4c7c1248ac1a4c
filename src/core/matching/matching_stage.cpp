#include "core/matching/matching_stage.h"
#include "core/shared/logging.h"
#include "core/vector/vector_index_client.h"

#include <algorithm>

namespace gf {

MatchingStage::MatchingStage(VectorIndexClient* index, CatalogReranker reranker,
                             const Options& options)
    : m_index(index)
    , m_reranker(std::move(reranker))
    , m_options(options)
{
}

int MatchingStage::queryDepth(int k, int overfetchFactor)
{
    return std::max(k + 1, k * std::max(overfetchFactor, 1));
}

StageResult<Match> MatchingStage::match(const Region& region, int k,
                                        const StyleParams& params) const
{
    if (k <= 0) {
        return StageResult<Match>::failure(StageError::validation(
            QStringLiteral("invalid_k"), QStringLiteral("Match count must be positive")));
    }
    if (!m_index) {
        return StageResult<Match>::failure(StageError::internal(
            QStringLiteral("index_missing"), QStringLiteral("No vector index configured")));
    }

    const int kQuery = queryDepth(k, m_options.overfetchFactor);
    auto neighbours = m_index->query(region.embedding, kQuery);
    if (!neighbours.ok()) {
        LOG_WARN(gfMatching, "Index query for region %s failed: %s",
                 qPrintable(region.regionId), qPrintable(neighbours.error.code));
        return StageResult<Match>::failure(neighbours.error);
    }

    const size_t retrieved = neighbours.value->size();

    Match match;
    match.regionId = region.regionId;
    match.candidates = m_reranker.rerank(region, params, std::move(*neighbours.value), k);

    LOG_DEBUG(gfMatching, "Region %s (%s): %d retrieved, %d kept",
              qPrintable(region.regionId), qPrintable(region.categoryHint),
              static_cast<int>(retrieved), static_cast<int>(match.candidates.size()));
    return StageResult<Match>::success(std::move(match));
}

} // namespace gf
