// src/core/metadata/InitDb.cpp
#include "InitDb.hpp"
#include <sqlite3.h>
#include <filesystem>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "core/Errors.hpp"

namespace psm {

namespace {

constexpr int kSchemaVersion = 1;

constexpr const char* kSchema = R"SQL(
  CREATE TABLE IF NOT EXISTS images (
    file_name         TEXT PRIMARY KEY,
    rating            INTEGER,
    aperture          REAL,
    lens_id           TEXT,
    capture_time      TEXT,
    focal_length      REAL,
    exposure_time     REAL,
    color_temperature INTEGER
  );
)SQL";

} // namespace

void execAll(sqlite3* db, const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "unknown error";
    sqlite3_free(err);
    throw StorageError("SQLite exec failed: " + msg);
  }
}

void ensureSchema(sqlite3* db) {
  // Pragmas: concurrency + durability
  execAll(db, "PRAGMA journal_mode=WAL;");
  execAll(db, "PRAGMA synchronous=NORMAL;");
  execAll(db, "PRAGMA busy_timeout=5000;");

  execAll(db, kSchema);
  execAll(db, "PRAGMA user_version=" + std::to_string(kSchemaVersion) + ";");
}

bool initDatabase(const std::string& dbPath) {
  auto parent = std::filesystem::path(dbPath).parent_path();
  if (!parent.empty()) std::filesystem::create_directories(parent);

  sqlite3* db = nullptr;
  int rc = sqlite3_open_v2(
    dbPath.c_str(),
    &db,
    SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
    nullptr
  );
  if (rc != SQLITE_OK) {
    std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    throw StorageError("Failed to open DB " + dbPath + ": " + msg);
  }

  try {
    ensureSchema(db);
    sqlite3_close(db);
    spdlog::info("catalog schema v{} ready at {}", kSchemaVersion, dbPath);
    return true;
  } catch (...) {
    sqlite3_close(db);
    throw;
  }
}

} // namespace psm
