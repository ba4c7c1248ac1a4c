#pragma once

namespace gf {

// Per-connection pragmas for the catalog database. Readers share the file
// with an external ingestion process, hence the long busy timeout.
constexpr const char* kCatalogConnectionPragmas = R"(
PRAGMA busy_timeout = 30000;
PRAGMA synchronous = NORMAL;
PRAGMA cache_size = -16384;
PRAGMA mmap_size = 30000000;
)";

constexpr const char* kCatalogDatabasePragmas = R"(
PRAGMA journal_mode = WAL;
PRAGMA application_id = 0x474643;
PRAGMA user_version = 1;
)";

constexpr const char* kCatalogSchemaV1 = R"(
CREATE TABLE IF NOT EXISTS products (
    product_id TEXT PRIMARY KEY,
    hnsw_label INTEGER NOT NULL UNIQUE,
    title TEXT NOT NULL DEFAULT '',
    category TEXT NOT NULL DEFAULT '',
    price REAL NOT NULL DEFAULT -1,
    currency TEXT NOT NULL DEFAULT '',
    in_stock INTEGER NOT NULL DEFAULT 0,
    product_url TEXT NOT NULL DEFAULT '',
    image_url TEXT NOT NULL DEFAULT '',
    updated_at REAL NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_products_category ON products(category);
)";

constexpr const char* kCatalogSelectColumns =
    "product_id, hnsw_label, title, category, price, currency, in_stock, "
    "product_url, image_url";

} // namespace gf
