#pragma once

#include "core/vector/vector_index_client.h"

#include <memory>

namespace gf {

class CatalogPool;
class VectorIndex;
struct Settings;

// VectorIndexClient over a loaded hnswlib index and the pooled catalog.
class HnswIndexClient : public VectorIndexClient {
public:
    struct Options {
        int queryTimeoutMs = 2000;
        int acquireTimeoutMs = 1000;
    };

    HnswIndexClient(std::shared_ptr<VectorIndex> index,
                    std::unique_ptr<CatalogPool> pool,
                    const Options& options);
    ~HnswIndexClient() override;

    HnswIndexClient(const HnswIndexClient&) = delete;
    HnswIndexClient& operator=(const HnswIndexClient&) = delete;

    // Loads index, metadata and catalog named by |settings|. Returns nullptr
    // when any of them is missing or the stored dimensionality differs from
    // settings.embeddingDimensions.
    static std::unique_ptr<HnswIndexClient> open(const Settings& settings);

    int dimensions() const override;
    StageResult<std::vector<IndexCandidate>> query(const std::vector<float>& embedding,
                                                   int kQuery) override;

private:
    std::shared_ptr<VectorIndex> m_index;
    std::unique_ptr<CatalogPool> m_pool;
    Options m_options;
};

} // namespace gf
