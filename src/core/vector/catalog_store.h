#pragma once

#include "core/shared/types.h"

#include <QString>

#include <cstdint>
#include <optional>

struct sqlite3;
struct sqlite3_stmt;

namespace gf {

struct CatalogProduct {
    QString productId;
    uint64_t label = 0;
    CatalogMetadata metadata;
};

// Read-write handle on the product catalog. The matcher itself only reads
// through CatalogPool; this class populates the catalog for fixtures and
// ingestion tools and owns schema creation.
class CatalogStore {
public:
    ~CatalogStore();

    CatalogStore(CatalogStore&& other) noexcept;
    CatalogStore& operator=(CatalogStore&& other) noexcept;
    CatalogStore(const CatalogStore&) = delete;
    CatalogStore& operator=(const CatalogStore&) = delete;

    static std::optional<CatalogStore> open(const QString& dbPath);

    // Inserts or replaces the product row. The label must already exist in the index.
    bool upsertProduct(const QString& productId, uint64_t label, const CatalogMetadata& metadata);
    bool removeProduct(const QString& productId);

    std::optional<CatalogProduct> productById(const QString& productId);
    int countProducts();

private:
    CatalogStore() = default;
    bool init(const QString& dbPath);
    bool execSql(const char* sql);
    void finalizeStatements();

    sqlite3* m_db = nullptr;
    sqlite3_stmt* m_upsertStmt = nullptr;
    sqlite3_stmt* m_removeStmt = nullptr;
    sqlite3_stmt* m_byIdStmt = nullptr;
};

// Reads one product row from a statement positioned on a row produced by
// kCatalogSelectColumns.
CatalogProduct readCatalogRow(sqlite3_stmt* stmt);

} // namespace gf
