#pragma once
#include <string>

struct sqlite3;

namespace psm {

// Runs one or more statements; throws StorageError with SQLite's message.
void execAll(sqlite3* db, const std::string& sql);

// Connection pragmas plus CREATE TABLE IF NOT EXISTS. Safe to run against an
// already initialized store.
void ensureSchema(sqlite3* db);

// Opens (creating parent directories and the file as needed), ensures the
// schema and closes again. Used by `--init`.
bool initDatabase(const std::string& dbPath);

} // namespace psm
