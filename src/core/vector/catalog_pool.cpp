#include "core/vector/catalog_pool.h"
#include "core/vector/catalog_schema.h"
#include "core/shared/logging.h"

#include <sqlite3.h>

#include <algorithm>
#include <chrono>
#include <limits>

namespace gf {

CatalogPool::~CatalogPool()
{
    for (const auto& connection : m_connections) {
        sqlite3_finalize(connection->byLabelStmt);
        sqlite3_close(connection->db);
    }
}

std::unique_ptr<CatalogPool> CatalogPool::open(const QString& dbPath, int poolSize)
{
    if (poolSize <= 0) {
        LOG_ERROR(gfIndex, "Catalog pool size must be positive, got %d", poolSize);
        return nullptr;
    }

    std::unique_ptr<CatalogPool> pool(new CatalogPool());
    const QByteArray path = dbPath.toUtf8();
    const QByteArray byLabelSql = QByteArray("SELECT ") + kCatalogSelectColumns
                                  + " FROM products WHERE hnsw_label = ?1";

    for (int i = 0; i < poolSize; ++i) {
        auto connection = std::make_unique<Connection>();
        const int rc = sqlite3_open_v2(path.constData(), &connection->db,
                                       SQLITE_OPEN_READONLY | SQLITE_OPEN_NOMUTEX, nullptr);
        if (rc != SQLITE_OK) {
            LOG_ERROR(gfIndex, "Failed to open catalog %s read-only: %s", path.constData(),
                      connection->db ? sqlite3_errmsg(connection->db) : "out of memory");
            sqlite3_close(connection->db);
            return nullptr;
        }

        sqlite3_busy_timeout(connection->db, 30000);
        char* errMsg = nullptr;
        if (sqlite3_exec(connection->db, kCatalogConnectionPragmas, nullptr, nullptr, &errMsg)
            != SQLITE_OK) {
            LOG_WARN(gfIndex, "Catalog pragmas not applied: %s", errMsg ? errMsg : "unknown");
            sqlite3_free(errMsg);
        }

        if (sqlite3_prepare_v2(connection->db, byLabelSql.constData(), -1,
                               &connection->byLabelStmt, nullptr) != SQLITE_OK) {
            LOG_ERROR(gfIndex, "Catalog at %s has no usable products table: %s",
                      path.constData(), sqlite3_errmsg(connection->db));
            sqlite3_close(connection->db);
            return nullptr;
        }

        pool->m_idle.push_back(connection.get());
        pool->m_connections.push_back(std::move(connection));
    }

    LOG_INFO(gfIndex, "Catalog pool ready: %d read-only connection(s) on %s",
             poolSize, path.constData());
    return pool;
}

CatalogPool::Connection* CatalogPool::acquire(int timeoutMs)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    const bool available = m_released.wait_for(
        lock, std::chrono::milliseconds(std::max(timeoutMs, 0)),
        [this] { return !m_idle.empty(); });
    if (!available) {
        return nullptr;
    }
    Connection* connection = m_idle.back();
    m_idle.pop_back();
    return connection;
}

void CatalogPool::release(Connection* connection)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_idle.push_back(connection);
    }
    m_released.notify_one();
}

StageResult<std::vector<CatalogProduct>> CatalogPool::lookupByLabels(
    const std::vector<uint64_t>& labels, int acquireTimeoutMs)
{
    using Result = StageResult<std::vector<CatalogProduct>>;

    Connection* connection = acquire(acquireTimeoutMs);
    if (!connection) {
        LOG_WARN(gfIndex, "No catalog connection free within %dms", acquireTimeoutMs);
        return Result::failure(StageError::transient(
            QStringLiteral("pool_exhausted"), QStringLiteral("Catalog is busy")));
    }

    std::vector<CatalogProduct> products;
    products.reserve(labels.size());
    bool failed = false;

    for (const uint64_t label : labels) {
        if (label > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            continue;
        }
        sqlite3_stmt* stmt = connection->byLabelStmt;
        sqlite3_bind_int64(stmt, 1, static_cast<int64_t>(label));
        const int rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) {
            products.push_back(readCatalogRow(stmt));
        } else if (rc != SQLITE_DONE) {
            LOG_WARN(gfIndex, "Catalog lookup failed for label %llu: %s",
                     static_cast<unsigned long long>(label), sqlite3_errmsg(connection->db));
            failed = true;
        }
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
        if (failed) {
            break;
        }
    }

    release(connection);

    if (failed) {
        return Result::failure(StageError::transient(
            QStringLiteral("catalog_unavailable"), QStringLiteral("Catalog lookup failed")));
    }
    return Result::success(std::move(products));
}

int CatalogPool::size() const
{
    return static_cast<int>(m_connections.size());
}

int CatalogPool::idleConnections() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<int>(m_idle.size());
}

} // namespace gf
