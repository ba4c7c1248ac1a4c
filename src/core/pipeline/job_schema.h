#pragma once

namespace gf {

constexpr const char* kJobConnectionPragmas = R"(
PRAGMA busy_timeout = 30000;
PRAGMA synchronous = NORMAL;
PRAGMA foreign_keys = ON;
PRAGMA wal_autocheckpoint = 1000;
)";

constexpr const char* kJobDatabasePragmas = R"(
PRAGMA journal_mode = WAL;
PRAGMA application_id = 0x47464A;
PRAGMA user_version = 1;
)";

// Timestamps are UTC milliseconds since the epoch.
constexpr const char* kJobSchemaV1 = R"(
CREATE TABLE IF NOT EXISTS jobs (
    job_id TEXT PRIMARY KEY,
    photo_ref TEXT NOT NULL,
    params_json TEXT NOT NULL,
    stage TEXT NOT NULL,
    status TEXT NOT NULL,
    created_at INTEGER NOT NULL,
    updated_at INTEGER NOT NULL,
    retries_generation INTEGER NOT NULL DEFAULT 0,
    retries_extraction INTEGER NOT NULL DEFAULT 0,
    retries_matching INTEGER NOT NULL DEFAULT 0,
    error_json TEXT,
    result_json TEXT
);

CREATE INDEX IF NOT EXISTS idx_jobs_status ON jobs(status, created_at);
CREATE INDEX IF NOT EXISTS idx_jobs_updated_at ON jobs(updated_at);

CREATE TABLE IF NOT EXISTS styled_images (
    job_id TEXT PRIMARY KEY REFERENCES jobs(job_id) ON DELETE CASCADE,
    image_ref TEXT NOT NULL,
    params_json TEXT NOT NULL,
    generation_ms INTEGER NOT NULL DEFAULT 0
);

CREATE TABLE IF NOT EXISTS regions (
    region_id TEXT PRIMARY KEY,
    job_id TEXT NOT NULL REFERENCES jobs(job_id) ON DELETE CASCADE,
    ordinal INTEGER NOT NULL,
    image_ref TEXT NOT NULL,
    box_x REAL NOT NULL,
    box_y REAL NOT NULL,
    box_w REAL NOT NULL,
    box_h REAL NOT NULL,
    category_hint TEXT NOT NULL DEFAULT '',
    detection_score REAL NOT NULL DEFAULT 0,
    embedding BLOB,
    UNIQUE(job_id, ordinal)
);

CREATE INDEX IF NOT EXISTS idx_regions_job_id ON regions(job_id);

CREATE TABLE IF NOT EXISTS matches (
    region_id TEXT NOT NULL REFERENCES regions(region_id) ON DELETE CASCADE,
    job_id TEXT NOT NULL REFERENCES jobs(job_id) ON DELETE CASCADE,
    rank INTEGER NOT NULL,
    product_id TEXT NOT NULL,
    similarity REAL NOT NULL,
    score REAL NOT NULL,
    metadata_json TEXT NOT NULL,
    PRIMARY KEY (region_id, rank)
);

CREATE INDEX IF NOT EXISTS idx_matches_job_id ON matches(job_id);
)";

} // namespace gf
