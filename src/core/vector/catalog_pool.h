#pragma once

#include "core/shared/types.h"
#include "core/vector/catalog_store.h"

#include <QString>

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace gf {

// Fixed set of read-only catalog connections shared by every matching task.
// A connection is held only for the duration of one lookup.
class CatalogPool {
public:
    ~CatalogPool();

    CatalogPool(const CatalogPool&) = delete;
    CatalogPool& operator=(const CatalogPool&) = delete;
    CatalogPool(CatalogPool&&) = delete;
    CatalogPool& operator=(CatalogPool&&) = delete;

    static std::unique_ptr<CatalogPool> open(const QString& dbPath, int poolSize);

    // Rows for the labels that exist in the catalog, in label order of the
    // request. Unknown labels are skipped. Fails Transient/pool_exhausted when
    // no connection frees up within |acquireTimeoutMs|.
    StageResult<std::vector<CatalogProduct>> lookupByLabels(const std::vector<uint64_t>& labels,
                                                            int acquireTimeoutMs);

    int size() const;
    int idleConnections() const;

private:
    struct Connection {
        sqlite3* db = nullptr;
        sqlite3_stmt* byLabelStmt = nullptr;
    };

    CatalogPool() = default;
    Connection* acquire(int timeoutMs);
    void release(Connection* connection);

    std::vector<std::unique_ptr<Connection>> m_connections;
    std::vector<Connection*> m_idle;
    mutable std::mutex m_mutex;
    std::condition_variable m_released;
};

} // namespace gf
