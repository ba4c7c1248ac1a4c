#include "core/vector/vector_index_client.h"
#include "core/shared/logging.h"

#include <algorithm>

namespace gf {

std::optional<StageError> VectorIndexClient::validateDimensionality(
    const std::vector<float>& embedding) const
{
    const int expected = dimensions();
    if (static_cast<int>(embedding.size()) == expected) {
        return std::nullopt;
    }
    LOG_ERROR(gfIndex, "Embedding dimensionality %d does not match index dimensionality %d",
              static_cast<int>(embedding.size()), expected);
    return StageError::validation(
        QStringLiteral("dimension_mismatch"),
        QStringLiteral("Embedding has %1 dimensions, index expects %2")
            .arg(embedding.size())
            .arg(expected));
}

void sortBySimilarity(std::vector<IndexCandidate>& candidates)
{
    std::sort(candidates.begin(), candidates.end(),
              [](const IndexCandidate& a, const IndexCandidate& b) {
                  if (a.similarity != b.similarity) {
                      return a.similarity > b.similarity;
                  }
                  return a.productId < b.productId;
              });
}

} // namespace gf
