#include <QtTest/QtTest>
#include "core/matching/catalog_reranker.h"

namespace {

gf::IndexCandidate candidate(const QString& id, float similarity, const QString& category,
                             double price = 100.0, bool inStock = true)
{
    gf::IndexCandidate c;
    c.productId = id;
    c.similarity = similarity;
    c.metadata.title = id;
    c.metadata.category = category;
    c.metadata.price = price;
    c.metadata.inStock = inStock;
    return c;
}

gf::Region region(const QString& hint, float detectionScore = 0.9f)
{
    gf::Region r;
    r.regionId = QStringLiteral("job-r0");
    r.categoryHint = hint;
    r.detectionScore = detectionScore;
    return r;
}

QStringList ids(const std::vector<gf::MatchCandidate>& ranked)
{
    QStringList out;
    for (const auto& c : ranked) {
        out << c.productId;
    }
    return out;
}

} // namespace

class TestCatalogReranker : public QObject {
    Q_OBJECT

private slots:
    void testOutOfStockDropped();
    void testPriceBand();
    void testUnknownPriceExcludedOnlyWithBand();
    void testHardHintExcludesOtherFamilies();
    void testFamilyMembersAreCompatible();
    void testAmbiguousHintDownWeights();
    void testLowConfidenceHintDownWeights();
    void testNoHintAppliesNoCategoryFilter();
    void testTieBreakByProductId();
    void testTruncatesToK();
    void testNonPositiveKReturnsNothing();
    void testHintAlternatives();
};

void TestCatalogReranker::testOutOfStockDropped()
{
    gf::CatalogReranker reranker;
    std::vector<gf::IndexCandidate> input = {
        candidate(QStringLiteral("A"), 0.95f, QStringLiteral("sofa"), 100.0, false),
        candidate(QStringLiteral("B"), 0.80f, QStringLiteral("sofa")),
    };
    const auto ranked = reranker.rerank(region(QStringLiteral("sofa")), {}, input, 5);
    QCOMPARE(ids(ranked), QStringList{QStringLiteral("B")});
}

void TestCatalogReranker::testPriceBand()
{
    gf::CatalogReranker reranker;
    gf::StyleParams params;
    params.minPrice = 200.0;
    params.maxPrice = 900.0;

    std::vector<gf::IndexCandidate> input = {
        candidate(QStringLiteral("cheap"), 0.99f, QStringLiteral("sofa"), 150.0),
        candidate(QStringLiteral("edge-low"), 0.90f, QStringLiteral("sofa"), 200.0),
        candidate(QStringLiteral("mid"), 0.85f, QStringLiteral("sofa"), 640.0),
        candidate(QStringLiteral("edge-high"), 0.80f, QStringLiteral("sofa"), 900.0),
        candidate(QStringLiteral("luxury"), 0.97f, QStringLiteral("sofa"), 2400.0),
    };
    const auto ranked = reranker.rerank(region(QStringLiteral("sofa")), params, input, 10);
    QCOMPARE(ids(ranked), (QStringList{QStringLiteral("edge-low"), QStringLiteral("mid"),
                                       QStringLiteral("edge-high")}));
}

void TestCatalogReranker::testUnknownPriceExcludedOnlyWithBand()
{
    gf::CatalogReranker reranker;
    std::vector<gf::IndexCandidate> input = {
        candidate(QStringLiteral("unpriced"), 0.9f, QStringLiteral("lamp"), -1.0),
    };

    QCOMPARE(reranker.rerank(region(QStringLiteral("lamp")), {}, input, 3).size(), size_t(1));

    gf::StyleParams params;
    params.maxPrice = 1000.0;
    QVERIFY(reranker.rerank(region(QStringLiteral("lamp")), params, input, 3).empty());
}

void TestCatalogReranker::testHardHintExcludesOtherFamilies()
{
    gf::CatalogReranker reranker;
    std::vector<gf::IndexCandidate> input = {
        candidate(QStringLiteral("rug-1"), 0.99f, QStringLiteral("rug")),
        candidate(QStringLiteral("sofa-1"), 0.70f, QStringLiteral("sofa")),
    };
    const gf::Region sofa = region(QStringLiteral("sofa"), 0.95f);
    QCOMPARE(reranker.hintStrength(sofa), gf::CatalogReranker::HintStrength::Hard);
    QCOMPARE(ids(reranker.rerank(sofa, {}, input, 5)), QStringList{QStringLiteral("sofa-1")});
}

void TestCatalogReranker::testFamilyMembersAreCompatible()
{
    QVERIFY(gf::CatalogReranker::isCompatible(QStringLiteral("loveseat"),
                                              {QStringLiteral("sofa")}));
    QVERIFY(gf::CatalogReranker::isCompatible(QStringLiteral("Floor-Lamp"),
                                              {QStringLiteral("pendant-lamp")}));
    QVERIFY(!gf::CatalogReranker::isCompatible(QStringLiteral("desk"),
                                               {QStringLiteral("armchair")}));
    QVERIFY(!gf::CatalogReranker::isCompatible(QString(), {QStringLiteral("sofa")}));
    QCOMPARE(gf::CatalogReranker::categoryFamily(QStringLiteral("wardrobe")),
             QStringLiteral("storage"));
    QCOMPARE(gf::CatalogReranker::categoryFamily(QStringLiteral("mirror")),
             QStringLiteral("mirror"));
}

void TestCatalogReranker::testAmbiguousHintDownWeights()
{
    gf::CatalogReranker reranker;
    const gf::Region ambiguous = region(QStringLiteral("sofa|armchair"), 0.9f);
    QCOMPARE(reranker.hintStrength(ambiguous), gf::CatalogReranker::HintStrength::Soft);

    std::vector<gf::IndexCandidate> input = {
        candidate(QStringLiteral("table-1"), 0.90f, QStringLiteral("coffee-table")),
        candidate(QStringLiteral("chair-1"), 0.80f, QStringLiteral("armchair")),
    };
    const auto ranked = reranker.rerank(ambiguous, {}, input, 5);
    QCOMPARE(ids(ranked), (QStringList{QStringLiteral("chair-1"), QStringLiteral("table-1")}));

    // 0.90 * 0.7 with the default penalty; similarity itself is untouched.
    QVERIFY(qAbs(ranked[1].score - 0.63f) < 1e-5f);
    QCOMPARE(ranked[1].similarity, 0.90f);
    QCOMPARE(ranked[0].score, ranked[0].similarity);
}

void TestCatalogReranker::testLowConfidenceHintDownWeights()
{
    gf::CatalogReranker::Options options;
    options.categoryMismatchPenalty = 0.5;
    gf::CatalogReranker reranker(options);

    const gf::Region unsure = region(QStringLiteral("lamp"), 0.3f);
    QCOMPARE(reranker.hintStrength(unsure), gf::CatalogReranker::HintStrength::Soft);

    std::vector<gf::IndexCandidate> input = {
        candidate(QStringLiteral("vase"), 0.8f, QStringLiteral("decor")),
        candidate(QStringLiteral("negative"), -0.4f, QStringLiteral("decor")),
    };
    const auto ranked = reranker.rerank(unsure, {}, input, 5);
    QCOMPARE(ranked.size(), size_t(2));
    QVERIFY(qAbs(ranked[0].score - 0.4f) < 1e-5f);
    // Negative similarities move further down, never up.
    QVERIFY(ranked[1].score < -0.4f);
}

void TestCatalogReranker::testNoHintAppliesNoCategoryFilter()
{
    gf::CatalogReranker reranker;
    const gf::Region unlabeled = region(QString());
    QCOMPARE(reranker.hintStrength(unlabeled), gf::CatalogReranker::HintStrength::None);

    std::vector<gf::IndexCandidate> input = {
        candidate(QStringLiteral("rug-1"), 0.6f, QStringLiteral("rug")),
        candidate(QStringLiteral("lamp-1"), 0.7f, QStringLiteral("lamp")),
    };
    const auto ranked = reranker.rerank(unlabeled, {}, input, 5);
    QCOMPARE(ids(ranked), (QStringList{QStringLiteral("lamp-1"), QStringLiteral("rug-1")}));
    QCOMPARE(ranked[0].score, 0.7f);
}

void TestCatalogReranker::testTieBreakByProductId()
{
    gf::CatalogReranker reranker;
    std::vector<gf::IndexCandidate> input = {
        candidate(QStringLiteral("P-2"), 0.91f, QStringLiteral("sofa")),
        candidate(QStringLiteral("P-3"), 0.88f, QStringLiteral("sofa")),
        candidate(QStringLiteral("P-1"), 0.91f, QStringLiteral("sofa")),
    };
    const auto ranked = reranker.rerank(region(QStringLiteral("sofa")), {}, input, 3);
    QCOMPARE(ids(ranked), (QStringList{QStringLiteral("P-1"), QStringLiteral("P-2"),
                                       QStringLiteral("P-3")}));
}

void TestCatalogReranker::testTruncatesToK()
{
    gf::CatalogReranker reranker;
    std::vector<gf::IndexCandidate> input;
    for (int i = 0; i < 10; ++i) {
        input.push_back(candidate(QStringLiteral("P-%1").arg(i), 0.9f - 0.01f * i,
                                  QStringLiteral("chair")));
    }
    const auto ranked = reranker.rerank(region(QStringLiteral("armchair")), {}, input, 4);
    QCOMPARE(ranked.size(), size_t(4));
    QCOMPARE(ranked.front().productId, QStringLiteral("P-0"));
    QCOMPARE(ranked.back().productId, QStringLiteral("P-3"));
}

void TestCatalogReranker::testNonPositiveKReturnsNothing()
{
    gf::CatalogReranker reranker;
    std::vector<gf::IndexCandidate> input = {
        candidate(QStringLiteral("A"), 0.9f, QStringLiteral("sofa")),
    };
    QVERIFY(reranker.rerank(region(QStringLiteral("sofa")), {}, input, 0).empty());
    QVERIFY(reranker.rerank(region(QStringLiteral("sofa")), {}, input, -3).empty());
}

void TestCatalogReranker::testHintAlternatives()
{
    QCOMPARE(gf::CatalogReranker::hintAlternatives(QStringLiteral(" Sofa | armchair |sofa")),
             (QStringList{QStringLiteral("sofa"), QStringLiteral("armchair")}));
    QVERIFY(gf::CatalogReranker::hintAlternatives(QStringLiteral(" | ")).isEmpty());
}

QTEST_MAIN(TestCatalogReranker)
#include "test_catalog_reranker.moc"
