#pragma once

#include "core/shared/types.h"
#include "core/vector/vector_index_client.h"

#include <QString>
#include <QStringList>

#include <vector>

namespace gf {

// Deterministic post-retrieval filter over index candidates:
//   1. drop out-of-stock products,
//   2. drop products outside the requested price band (unknown prices too),
//   3. category compatibility with the region's hint,
//   4. order by score descending, product id ascending, and keep k.
//
// A hint is hard when it names one category and the detector was confident
// (detectionScore >= ambiguousHintScore); incompatible products are then
// excluded. An ambiguous hint ("sofa|armchair" or low confidence) only
// down-weights them. Without a hint no category filter applies.
class CatalogReranker {
public:
    struct Options {
        double categoryMismatchPenalty = 0.7;
        double ambiguousHintScore = 0.5;
    };

    enum class HintStrength {
        None,
        Soft,
        Hard,
    };

    CatalogReranker();
    explicit CatalogReranker(const Options& options);

    std::vector<MatchCandidate> rerank(const Region& region,
                                       const StyleParams& params,
                                       std::vector<IndexCandidate> candidates,
                                       int k) const;

    HintStrength hintStrength(const Region& region) const;

    // Lower-cased alternatives of a hint such as "Sofa | armchair".
    static QStringList hintAlternatives(const QString& hint);

    // True when |productCategory| belongs to the same furniture family as
    // any of |hints|.
    static bool isCompatible(const QString& productCategory, const QStringList& hints);

    // Family key for a category ("loveseat" -> "sofa"); unknown categories
    // are their own family.
    static QString categoryFamily(const QString& category);

    const Options& options() const { return m_options; }

private:
    float downWeight(float similarity) const;

    Options m_options;
};

} // namespace gf
