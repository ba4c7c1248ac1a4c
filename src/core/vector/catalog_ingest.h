#pragma once

#include "core/shared/types.h"

#include <QString>

#include <vector>

namespace gf {

class CatalogStore;
class VectorIndex;

// Adds or replaces one product: the embedding goes into the index, the
// metadata row into the catalog under the new label. A replaced product's
// previous vector is marked deleted.
bool ingestCatalogProduct(VectorIndex& index,
                          CatalogStore& store,
                          const QString& productId,
                          const CatalogMetadata& metadata,
                          const std::vector<float>& embedding);

} // namespace gf
