#include "core/vector/catalog_ingest.h"
#include "core/vector/catalog_store.h"
#include "core/vector/vector_index.h"
#include "core/shared/logging.h"

namespace gf {

bool ingestCatalogProduct(VectorIndex& index,
                          CatalogStore& store,
                          const QString& productId,
                          const CatalogMetadata& metadata,
                          const std::vector<float>& embedding)
{
    const std::optional<CatalogProduct> previous = store.productById(productId);

    const std::optional<uint64_t> label = index.insert(embedding);
    if (!label.has_value()) {
        LOG_WARN(gfIndex, "Product %s not indexed", qPrintable(productId));
        return false;
    }

    if (!store.upsertProduct(productId, label.value(), metadata)) {
        index.markDeleted(label.value());
        return false;
    }

    if (previous.has_value() && !index.markDeleted(previous->label)) {
        LOG_WARN(gfIndex, "Stale vector for %s could not be retired", qPrintable(productId));
    }
    return true;
}

} // namespace gf
