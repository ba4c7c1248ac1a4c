#pragma once

#include "core/matching/catalog_reranker.h"
#include "core/shared/types.h"

namespace gf {

class VectorIndexClient;

// Resolves one region to at most k catalog products: nearest-neighbour query
// over the region embedding, then the catalog re-rank. An empty Match is a
// valid outcome.
class MatchingStage {
public:
    struct Options {
        int overfetchFactor = 4;
    };

    MatchingStage(VectorIndexClient* index, CatalogReranker reranker, const Options& options);

    MatchingStage(const MatchingStage&) = delete;
    MatchingStage& operator=(const MatchingStage&) = delete;

    StageResult<Match> match(const Region& region, int k, const StyleParams& params) const;

    // Neighbour count requested from the index for a final list of k.
    static int queryDepth(int k, int overfetchFactor);

private:
    VectorIndexClient* m_index = nullptr;
    CatalogReranker m_reranker;
    Options m_options;
};

} // namespace gf
