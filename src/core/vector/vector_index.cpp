#include "core/vector/vector_index.h"

#include "core/shared/logging.h"

#include "hnswlib/hnswlib.h"

#include <QDateTime>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSaveFile>

#include <algorithm>
#include <cmath>
#include <limits>
#include <mutex>

namespace gf {

namespace {

const QString kMetaFormat = QStringLiteral("ghurfati-catalog-index");
constexpr int kMetaVersion = 1;

// Smaller than any header hnswlib writes.
constexpr qint64 kMinIndexFileBytes = 96;

// Grow before the graph is this full (percent).
constexpr size_t kGrowThresholdPercent = 80;

struct StoredMeta {
    VectorIndex::IndexMetadata metadata;
    uint64_t labelsIssued = 0;
    uint64_t elementCount = 0;
    int tombstones = 0;
};

bool readStoredMeta(const QString& path, StoredMeta& out)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_ERROR(gfIndex, "Cannot open index metadata %s", qUtf8Printable(path));
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_ERROR(gfIndex, "Index metadata %s is not a JSON object: %s",
                  qUtf8Printable(path), qUtf8Printable(parseError.errorString()));
        return false;
    }

    const QJsonObject obj = doc.object();
    out.metadata.dimensions = obj.value(QStringLiteral("dimensions")).toInt(0);
    if (out.metadata.dimensions <= 0) {
        LOG_ERROR(gfIndex, "Index metadata %s has no usable dimensions", qUtf8Printable(path));
        return false;
    }
    out.metadata.schemaVersion = obj.value(QStringLiteral("version")).toInt(kMetaVersion);
    out.metadata.modelId = obj.value(QStringLiteral("model_id"))
                               .toString(QStringLiteral("unknown")).toStdString();
    out.labelsIssued = obj.value(QStringLiteral("labels_issued")).toVariant().toULongLong();
    out.elementCount = obj.value(QStringLiteral("element_count")).toVariant().toULongLong();
    out.tombstones = std::max(obj.value(QStringLiteral("tombstones")).toInt(0), 0);
    return true;
}

} // namespace

std::vector<float> normalizeEmbedding(std::vector<float> embedding)
{
    double norm = 0.0;
    for (const float v : embedding) {
        norm += static_cast<double>(v) * v;
    }
    norm = std::sqrt(norm);
    if (norm <= 0.0) {
        return embedding;
    }
    std::transform(embedding.begin(), embedding.end(), embedding.begin(),
                   [norm](float v) { return static_cast<float>(v / norm); });
    return embedding;
}

VectorIndex::VectorIndex() = default;

VectorIndex::VectorIndex(const IndexMetadata& metadata)
    : m_metadata(metadata)
{
}

VectorIndex::~VectorIndex() = default;

bool VectorIndex::create(int initialCapacity)
{
    if (m_metadata.dimensions <= 0) {
        LOG_ERROR(gfIndex, "Cannot create a catalog index without dimensions");
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(m_mutex);
    auto space = std::make_unique<hnswlib::InnerProductSpace>(
        static_cast<size_t>(m_metadata.dimensions));
    try {
        m_index = std::make_unique<hnswlib::HierarchicalNSW<float>>(
            space.get(), static_cast<size_t>(std::max(initialCapacity, 1)),
            static_cast<size_t>(kM), static_cast<size_t>(kEfConstruction));
    } catch (const std::exception& e) {
        LOG_ERROR(gfIndex, "hnswlib refused to allocate the index: %s", e.what());
        m_index.reset();
        m_space.reset();
        return false;
    }
    m_space = std::move(space);
    m_index->setEf(static_cast<size_t>(m_efSearch));
    m_nextLabel = 0;
    m_deletedCount = 0;
    return true;
}

bool VectorIndex::load(const std::string& indexPath, const std::string& metaPath)
{
    const QFileInfo indexFile(QString::fromStdString(indexPath));
    if (!indexFile.isFile()) {
        LOG_ERROR(gfIndex, "Catalog index %s does not exist", qUtf8Printable(indexFile.filePath()));
        return false;
    }
    if (indexFile.size() < kMinIndexFileBytes) {
        LOG_ERROR(gfIndex, "Catalog index %s is truncated (%lld bytes)",
                  qUtf8Printable(indexFile.filePath()), static_cast<long long>(indexFile.size()));
        return false;
    }

    StoredMeta stored;
    if (!readStoredMeta(QString::fromStdString(metaPath), stored)) {
        return false;
    }
    if (m_metadata.dimensions > 0 && stored.metadata.dimensions != m_metadata.dimensions) {
        LOG_ERROR(gfIndex, "Catalog index has %d dimensions, configured for %d",
                  stored.metadata.dimensions, m_metadata.dimensions);
        return false;
    }

    // Leave headroom so the first inserts after a load do not force a resize.
    const uint64_t capacity = std::max<uint64_t>(
        {static_cast<uint64_t>(kInitialCapacity), stored.labelsIssued + 1, stored.elementCount * 2});
    if (capacity > std::numeric_limits<size_t>::max()) {
        LOG_ERROR(gfIndex, "Catalog index capacity %llu is out of range",
                  static_cast<unsigned long long>(capacity));
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(m_mutex);
    auto space = std::make_unique<hnswlib::InnerProductSpace>(
        static_cast<size_t>(stored.metadata.dimensions));
    std::unique_ptr<hnswlib::HierarchicalNSW<float>> graph;
    try {
        graph = std::make_unique<hnswlib::HierarchicalNSW<float>>(
            space.get(), indexPath, false, static_cast<size_t>(capacity));
    } catch (const std::exception& e) {
        LOG_ERROR(gfIndex, "Catalog index %s failed to load: %s", indexPath.c_str(), e.what());
        m_index.reset();
        m_space.reset();
        return false;
    }

    m_space = std::move(space);
    m_index = std::move(graph);
    m_index->setEf(static_cast<size_t>(m_efSearch));
    m_metadata = stored.metadata;
    m_nextLabel = stored.labelsIssued;
    m_deletedCount = stored.tombstones;
    LOG_INFO(gfIndex, "Loaded catalog index: %zu vectors, %d deleted",
             m_index->getCurrentElementCount(), m_deletedCount);
    return true;
}

bool VectorIndex::save(const std::string& indexPath, const std::string& metaPath)
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    if (!m_index) {
        LOG_WARN(gfIndex, "Nothing to save: catalog index was never created or loaded");
        return false;
    }

    try {
        m_index->saveIndex(indexPath);
    } catch (const std::exception& e) {
        LOG_ERROR(gfIndex, "Writing %s failed: %s", indexPath.c_str(), e.what());
        return false;
    }

    const QJsonObject meta{
        {QStringLiteral("format"), kMetaFormat},
        {QStringLiteral("version"), kMetaVersion},
        {QStringLiteral("space"), QStringLiteral("ip")},
        {QStringLiteral("model_id"), QString::fromStdString(m_metadata.modelId)},
        {QStringLiteral("dimensions"), m_metadata.dimensions},
        {QStringLiteral("element_count"), static_cast<qint64>(m_index->getCurrentElementCount())},
        {QStringLiteral("tombstones"), m_deletedCount},
        {QStringLiteral("labels_issued"), static_cast<qint64>(m_nextLabel)},
        {QStringLiteral("m"), kM},
        {QStringLiteral("ef_construction"), kEfConstruction},
        {QStringLiteral("saved_at"), QDateTime::currentDateTimeUtc().toString(Qt::ISODate)},
    };

    // The sidecar is replaced atomically so a crash never pairs a new graph
    // with half-written metadata.
    QSaveFile metaFile(QString::fromStdString(metaPath));
    if (!metaFile.open(QIODevice::WriteOnly)) {
        LOG_ERROR(gfIndex, "Cannot open %s for writing", metaPath.c_str());
        return false;
    }
    metaFile.write(QJsonDocument(meta).toJson(QJsonDocument::Indented));
    if (!metaFile.commit()) {
        LOG_ERROR(gfIndex, "Writing %s failed: %s", metaPath.c_str(),
                  qUtf8Printable(metaFile.errorString()));
        return false;
    }
    return true;
}

void VectorIndex::setEfSearch(int ef)
{
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_efSearch = std::max(ef, 1);
    if (m_index) {
        m_index->setEf(static_cast<size_t>(m_efSearch));
    }
}

std::optional<uint64_t> VectorIndex::insert(const std::vector<float>& embedding)
{
    if (static_cast<int>(embedding.size()) != m_metadata.dimensions) {
        LOG_ERROR(gfIndex, "Rejecting %zu-d vector for a %d-d index",
                  embedding.size(), m_metadata.dimensions);
        return std::nullopt;
    }
    const std::vector<float> unit = normalizeEmbedding(embedding);

    std::unique_lock<std::shared_mutex> lock(m_mutex);
    if (!m_index || !ensureCapacityForOneMore()) {
        return std::nullopt;
    }

    try {
        m_index->addPoint(unit.data(), static_cast<hnswlib::labeltype>(m_nextLabel));
    } catch (const std::exception& e) {
        LOG_ERROR(gfIndex, "Inserting label %llu failed: %s",
                  static_cast<unsigned long long>(m_nextLabel), e.what());
        return std::nullopt;
    }
    return m_nextLabel++;
}

bool VectorIndex::markDeleted(uint64_t label)
{
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    if (!m_index) {
        return false;
    }

    try {
        m_index->markDelete(static_cast<hnswlib::labeltype>(label));
    } catch (const std::exception& e) {
        LOG_WARN(gfIndex, "Cannot delete label %llu: %s",
                 static_cast<unsigned long long>(label), e.what());
        return false;
    }
    ++m_deletedCount;
    return true;
}

std::optional<std::vector<VectorIndex::Neighbour>> VectorIndex::search(const std::vector<float>& query,
                                                                      int k) const
{
    if (static_cast<int>(query.size()) != m_metadata.dimensions) {
        LOG_WARN(gfIndex, "Catalog search with %zu dimensions, index has %d",
                 query.size(), m_metadata.dimensions);
        return std::nullopt;
    }

    std::shared_lock<std::shared_mutex> lock(m_mutex);
    if (!m_index) {
        return std::nullopt;
    }
    if (k <= 0) {
        return std::vector<Neighbour>{};
    }

    std::vector<Neighbour> results;
    try {
        // searchKnn yields a max-heap on distance; draining it gives the
        // farthest first, so fill from the back.
        auto heap = m_index->searchKnn(query.data(), static_cast<size_t>(k));
        results.resize(heap.size());
        for (auto slot = results.rbegin(); slot != results.rend(); ++slot) {
            *slot = Neighbour{static_cast<uint64_t>(heap.top().second), heap.top().first};
            heap.pop();
        }
    } catch (const std::exception& e) {
        LOG_ERROR(gfIndex, "Catalog search failed: %s", e.what());
        return std::nullopt;
    }
    return results;
}

int VectorIndex::elementCount() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_index ? static_cast<int>(m_index->getCurrentElementCount()) : 0;
}

int VectorIndex::deletedCount() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_deletedCount;
}

bool VectorIndex::isAvailable() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_index != nullptr;
}

int VectorIndex::dimensions() const
{
    return m_metadata.dimensions;
}

const VectorIndex::IndexMetadata& VectorIndex::metadata() const
{
    return m_metadata;
}

bool VectorIndex::ensureCapacityForOneMore()
{
    const size_t capacity = m_index->getMaxElements();
    if (m_index->getCurrentElementCount() * 100 < capacity * kGrowThresholdPercent) {
        return true;
    }

    const size_t grown = std::max<size_t>(capacity * 2, 16);
    try {
        m_index->resizeIndex(grown);
    } catch (const std::exception& e) {
        LOG_ERROR(gfIndex, "Growing catalog index to %zu failed: %s", grown, e.what());
        return false;
    }
    LOG_INFO(gfIndex, "Catalog index grown to %zu slots", grown);
    return true;
}

} // namespace gf
