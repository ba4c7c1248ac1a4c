#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace hnswlib {
class InnerProductSpace;
template <typename dist_t>
class HierarchicalNSW;
} // namespace hnswlib

namespace gf {

// Catalog embedding graph backed by hnswlib.
//
// Vectors are stored unit length in an inner-product space, so a neighbour's
// distance is 1 - cosine. Labels are issued sequentially and never reused;
// the catalog store maps them back to products. The graph is persisted as the
// hnswlib binary plus a JSON sidecar carrying dimensions, encoder id and the
// label counter.
//
// Thread safety: search() and the accessors share a reader lock, mutations
// take it exclusively.
class VectorIndex {
public:
    struct Neighbour {
        uint64_t label = 0;
        float distance = 0.0f;
    };

    struct IndexMetadata {
        int schemaVersion = 1;
        int dimensions = 0;       // 0 = adopt whatever load() finds
        std::string modelId = "unknown";
    };

    static constexpr int kM = 16;
    static constexpr int kEfConstruction = 200;
    static constexpr int kDefaultEfSearch = 64;
    static constexpr int kInitialCapacity = 10000;

    VectorIndex();
    explicit VectorIndex(const IndexMetadata& metadata);
    ~VectorIndex();

    VectorIndex(const VectorIndex&) = delete;
    VectorIndex& operator=(const VectorIndex&) = delete;

    // Empty graph with the configured dimensions.
    bool create(int initialCapacity = kInitialCapacity);

    bool load(const std::string& indexPath, const std::string& metaPath);
    bool save(const std::string& indexPath, const std::string& metaPath);

    void setEfSearch(int ef);

    // Normalizes and inserts; nullopt on a dimension mismatch or when no
    // graph exists.
    std::optional<uint64_t> insert(const std::vector<float>& embedding);
    bool markDeleted(uint64_t label);

    // Nearest first. The query is used as given and should be unit length.
    // nullopt when the search cannot run: no graph, a dimension mismatch or
    // an hnswlib failure. An empty vector means nothing matched.
    std::optional<std::vector<Neighbour>> search(const std::vector<float>& query, int k) const;

    int elementCount() const;
    int deletedCount() const;
    bool isAvailable() const;
    int dimensions() const;
    const IndexMetadata& metadata() const;

private:
    bool ensureCapacityForOneMore();

    IndexMetadata m_metadata;
    std::unique_ptr<hnswlib::InnerProductSpace> m_space;
    std::unique_ptr<hnswlib::HierarchicalNSW<float>> m_index;
    uint64_t m_nextLabel = 0;
    int m_deletedCount = 0;
    int m_efSearch = kDefaultEfSearch;
    mutable std::shared_mutex m_mutex;
};

// Unit-length copy of |embedding|. A zero vector comes back unchanged.
std::vector<float> normalizeEmbedding(std::vector<float> embedding);

} // namespace gf
