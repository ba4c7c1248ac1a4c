#include "core/vector/catalog_store.h"
#include "core/vector/catalog_schema.h"
#include "core/shared/logging.h"

#include <sqlite3.h>

#include <QDateTime>

#include <limits>
#include <utility>

namespace gf {

namespace {

constexpr const char* kUpsertSql = R"(
    INSERT INTO products (
        product_id, hnsw_label, title, category, price, currency, in_stock,
        product_url, image_url, updated_at
    ) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10)
    ON CONFLICT(product_id) DO UPDATE SET
        hnsw_label = excluded.hnsw_label,
        title = excluded.title,
        category = excluded.category,
        price = excluded.price,
        currency = excluded.currency,
        in_stock = excluded.in_stock,
        product_url = excluded.product_url,
        image_url = excluded.image_url,
        updated_at = excluded.updated_at
)";

constexpr const char* kRemoveSql = "DELETE FROM products WHERE product_id = ?1";

QString columnText(sqlite3_stmt* stmt, int column)
{
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
    return text ? QString::fromUtf8(text) : QString();
}

void bindText(sqlite3_stmt* stmt, int index, const QString& value)
{
    const QByteArray utf8 = value.toUtf8();
    sqlite3_bind_text(stmt, index, utf8.constData(), utf8.size(), SQLITE_TRANSIENT);
}

void resetStatement(sqlite3_stmt* stmt)
{
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
}

} // namespace

CatalogProduct readCatalogRow(sqlite3_stmt* stmt)
{
    CatalogProduct product;
    product.productId = columnText(stmt, 0);
    product.label = static_cast<uint64_t>(sqlite3_column_int64(stmt, 1));
    product.metadata.title = columnText(stmt, 2);
    product.metadata.category = columnText(stmt, 3);
    product.metadata.price = sqlite3_column_double(stmt, 4);
    product.metadata.currency = columnText(stmt, 5);
    product.metadata.inStock = sqlite3_column_int(stmt, 6) != 0;
    product.metadata.productUrl = columnText(stmt, 7);
    product.metadata.imageUrl = columnText(stmt, 8);
    return product;
}

CatalogStore::~CatalogStore()
{
    finalizeStatements();
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

CatalogStore::CatalogStore(CatalogStore&& other) noexcept
    : m_db(std::exchange(other.m_db, nullptr))
    , m_upsertStmt(std::exchange(other.m_upsertStmt, nullptr))
    , m_removeStmt(std::exchange(other.m_removeStmt, nullptr))
    , m_byIdStmt(std::exchange(other.m_byIdStmt, nullptr))
{
}

CatalogStore& CatalogStore::operator=(CatalogStore&& other) noexcept
{
    if (this != &other) {
        finalizeStatements();
        if (m_db) {
            sqlite3_close(m_db);
        }
        m_db = std::exchange(other.m_db, nullptr);
        m_upsertStmt = std::exchange(other.m_upsertStmt, nullptr);
        m_removeStmt = std::exchange(other.m_removeStmt, nullptr);
        m_byIdStmt = std::exchange(other.m_byIdStmt, nullptr);
    }
    return *this;
}

std::optional<CatalogStore> CatalogStore::open(const QString& dbPath)
{
    CatalogStore store;
    if (!store.init(dbPath)) {
        return std::nullopt;
    }
    return store;
}

bool CatalogStore::init(const QString& dbPath)
{
    if (sqlite3_open(dbPath.toUtf8().constData(), &m_db) != SQLITE_OK) {
        LOG_ERROR(gfIndex, "Failed to open catalog database %s: %s",
                  qPrintable(dbPath), m_db ? sqlite3_errmsg(m_db) : "out of memory");
        return false;
    }

    sqlite3_busy_timeout(m_db, 30000);
    if (!execSql(kCatalogConnectionPragmas)
        || !execSql(kCatalogDatabasePragmas)
        || !execSql(kCatalogSchemaV1)) {
        LOG_ERROR(gfIndex, "Failed to initialize catalog schema in %s", qPrintable(dbPath));
        return false;
    }

    const QByteArray byIdSql = QByteArray("SELECT ") + kCatalogSelectColumns
                               + " FROM products WHERE product_id = ?1";
    if (sqlite3_prepare_v2(m_db, kUpsertSql, -1, &m_upsertStmt, nullptr) != SQLITE_OK
        || sqlite3_prepare_v2(m_db, kRemoveSql, -1, &m_removeStmt, nullptr) != SQLITE_OK
        || sqlite3_prepare_v2(m_db, byIdSql.constData(), -1, &m_byIdStmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(gfIndex, "Failed to prepare catalog statements: %s", sqlite3_errmsg(m_db));
        return false;
    }

    LOG_INFO(gfIndex, "Catalog opened: %s", qPrintable(dbPath));
    return true;
}

bool CatalogStore::execSql(const char* sql)
{
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_ERROR(gfIndex, "SQL error: %s", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

void CatalogStore::finalizeStatements()
{
    sqlite3_finalize(m_upsertStmt);
    sqlite3_finalize(m_removeStmt);
    sqlite3_finalize(m_byIdStmt);
    m_upsertStmt = nullptr;
    m_removeStmt = nullptr;
    m_byIdStmt = nullptr;
}

bool CatalogStore::upsertProduct(const QString& productId, uint64_t label,
                                 const CatalogMetadata& metadata)
{
    if (productId.isEmpty()
        || label > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return false;
    }

    bindText(m_upsertStmt, 1, productId);
    sqlite3_bind_int64(m_upsertStmt, 2, static_cast<int64_t>(label));
    bindText(m_upsertStmt, 3, metadata.title);
    bindText(m_upsertStmt, 4, metadata.category.trimmed().toLower());
    sqlite3_bind_double(m_upsertStmt, 5, metadata.price);
    bindText(m_upsertStmt, 6, metadata.currency);
    sqlite3_bind_int(m_upsertStmt, 7, metadata.inStock ? 1 : 0);
    bindText(m_upsertStmt, 8, metadata.productUrl);
    bindText(m_upsertStmt, 9, metadata.imageUrl);
    sqlite3_bind_double(m_upsertStmt, 10,
                        static_cast<double>(QDateTime::currentSecsSinceEpoch()));

    const int rc = sqlite3_step(m_upsertStmt);
    resetStatement(m_upsertStmt);
    if (rc != SQLITE_DONE) {
        LOG_WARN(gfIndex, "Failed to upsert product %s: %s",
                 qPrintable(productId), sqlite3_errmsg(m_db));
        return false;
    }
    return true;
}

bool CatalogStore::removeProduct(const QString& productId)
{
    bindText(m_removeStmt, 1, productId);
    const int rc = sqlite3_step(m_removeStmt);
    resetStatement(m_removeStmt);
    return rc == SQLITE_DONE && sqlite3_changes(m_db) > 0;
}

std::optional<CatalogProduct> CatalogStore::productById(const QString& productId)
{
    bindText(m_byIdStmt, 1, productId);
    std::optional<CatalogProduct> product;
    if (sqlite3_step(m_byIdStmt) == SQLITE_ROW) {
        product = readCatalogRow(m_byIdStmt);
    }
    resetStatement(m_byIdStmt);
    return product;
}

int CatalogStore::countProducts()
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "SELECT COUNT(*) FROM products", -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }
    int count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return count;
}

} // namespace gf
