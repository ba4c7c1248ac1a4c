#pragma once

#include "core/shared/types.h"

#include <QString>

#include <optional>
#include <vector>

namespace gf {

struct IndexCandidate {
    QString productId;
    float similarity = 0.0f;      // cosine, in [-1, 1]
    CatalogMetadata metadata;
};

// Nearest-neighbour lookup over catalog embeddings. Implementations are
// shared by all jobs and must be safe to query from several threads.
class VectorIndexClient {
public:
    virtual ~VectorIndexClient() = default;

    virtual int dimensions() const = 0;

    // Up to kQuery candidates ordered by similarity descending, ties by
    // product id ascending. Timeouts and unavailability fail Transient;
    // a dimensionality mismatch fails Validation.
    virtual StageResult<std::vector<IndexCandidate>> query(const std::vector<float>& embedding,
                                                           int kQuery) = 0;

    std::optional<StageError> validateDimensionality(const std::vector<float>& embedding) const;
};

// Orders candidates by similarity descending, then product id ascending.
void sortBySimilarity(std::vector<IndexCandidate>& candidates);

} // namespace gf
