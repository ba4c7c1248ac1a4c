#include "core/matching/catalog_reranker.h"

#include <QHash>

#include <algorithm>
#include <cmath>

namespace gf {

namespace {

const QHash<QString, QString>& familyByCategory()
{
    static const QHash<QString, QString> families = [] {
        const QList<QPair<QString, QStringList>> groups = {
            {QStringLiteral("sofa"), {QStringLiteral("sofa"), QStringLiteral("sofa-bed"),
                                      QStringLiteral("sectional"), QStringLiteral("loveseat")}},
            {QStringLiteral("chair"), {QStringLiteral("chair"), QStringLiteral("armchair"),
                                       QStringLiteral("dining-chair"), QStringLiteral("office-chair"),
                                       QStringLiteral("stool")}},
            {QStringLiteral("table"), {QStringLiteral("table"), QStringLiteral("coffee-table"),
                                       QStringLiteral("dining-table"), QStringLiteral("side-table"),
                                       QStringLiteral("desk")}},
            {QStringLiteral("lamp"), {QStringLiteral("lamp"), QStringLiteral("floor-lamp"),
                                      QStringLiteral("table-lamp"), QStringLiteral("pendant-lamp")}},
            {QStringLiteral("storage"), {QStringLiteral("storage"), QStringLiteral("bookcase"),
                                         QStringLiteral("shelf"), QStringLiteral("cabinet"),
                                         QStringLiteral("dresser"), QStringLiteral("wardrobe"),
                                         QStringLiteral("tv-unit")}},
            {QStringLiteral("bed"), {QStringLiteral("bed"), QStringLiteral("bed-frame")}},
            {QStringLiteral("rug"), {QStringLiteral("rug"), QStringLiteral("carpet")}},
        };

        QHash<QString, QString> map;
        for (const auto& group : groups) {
            for (const QString& category : group.second) {
                map.insert(category, group.first);
            }
        }
        return map;
    }();
    return families;
}

} // namespace

CatalogReranker::CatalogReranker() = default;

CatalogReranker::CatalogReranker(const Options& options)
    : m_options(options)
{
}

QStringList CatalogReranker::hintAlternatives(const QString& hint)
{
    QStringList alternatives;
    const QStringList parts = hint.split(QLatin1Char('|'), Qt::SkipEmptyParts);
    for (const QString& part : parts) {
        const QString normalized = part.trimmed().toLower();
        if (!normalized.isEmpty() && !alternatives.contains(normalized)) {
            alternatives.append(normalized);
        }
    }
    return alternatives;
}

QString CatalogReranker::categoryFamily(const QString& category)
{
    const QString normalized = category.trimmed().toLower();
    return familyByCategory().value(normalized, normalized);
}

bool CatalogReranker::isCompatible(const QString& productCategory, const QStringList& hints)
{
    const QString family = categoryFamily(productCategory);
    if (family.isEmpty()) {
        return false;
    }
    for (const QString& hint : hints) {
        if (categoryFamily(hint) == family) {
            return true;
        }
    }
    return false;
}

CatalogReranker::HintStrength CatalogReranker::hintStrength(const Region& region) const
{
    const QStringList hints = hintAlternatives(region.categoryHint);
    if (hints.isEmpty()) {
        return HintStrength::None;
    }
    if (hints.size() > 1 || region.detectionScore < m_options.ambiguousHintScore) {
        return HintStrength::Soft;
    }
    return HintStrength::Hard;
}

float CatalogReranker::downWeight(float similarity) const
{
    // Always moves the score down, including for negative similarities.
    const float penalty = static_cast<float>(1.0 - m_options.categoryMismatchPenalty);
    return similarity - penalty * std::fabs(similarity);
}

std::vector<MatchCandidate> CatalogReranker::rerank(const Region& region,
                                                    const StyleParams& params,
                                                    std::vector<IndexCandidate> candidates,
                                                    int k) const
{
    std::vector<MatchCandidate> ranked;
    if (k <= 0) {
        return ranked;
    }

    const QStringList hints = hintAlternatives(region.categoryHint);
    const HintStrength strength = hintStrength(region);
    ranked.reserve(candidates.size());

    for (IndexCandidate& candidate : candidates) {
        const CatalogMetadata& metadata = candidate.metadata;
        if (!metadata.inStock) {
            continue;
        }

        if (params.minPrice.has_value() || params.maxPrice.has_value()) {
            if (metadata.price < 0.0) {
                continue;
            }
            if (params.minPrice.has_value() && metadata.price < params.minPrice.value()) {
                continue;
            }
            if (params.maxPrice.has_value() && metadata.price > params.maxPrice.value()) {
                continue;
            }
        }

        float score = candidate.similarity;
        if (strength != HintStrength::None && !isCompatible(metadata.category, hints)) {
            if (strength == HintStrength::Hard) {
                continue;
            }
            score = downWeight(score);
        }

        MatchCandidate match;
        match.productId = std::move(candidate.productId);
        match.similarity = candidate.similarity;
        match.score = score;
        match.metadata = std::move(candidate.metadata);
        ranked.push_back(std::move(match));
    }

    std::sort(ranked.begin(), ranked.end(), [](const MatchCandidate& a, const MatchCandidate& b) {
        if (a.score != b.score) {
            return a.score > b.score;
        }
        return a.productId < b.productId;
    });

    if (static_cast<int>(ranked.size()) > k) {
        ranked.resize(static_cast<size_t>(k));
    }
    return ranked;
}

} // namespace gf
