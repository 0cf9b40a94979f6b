#include "Catalog.hpp"

#include <filesystem>
#include <sqlite3.h>

#include <spdlog/spdlog.h>

#include "core/Errors.hpp"
#include "InitDb.hpp"
#include "MetadataExtractor.hpp"

namespace psm {

namespace {

// Finalized on scope exit.
class Statement {
public:
  Statement(sqlite3* db, const char* sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
      std::string err = sqlite3_errmsg(db);
      sqlite3_finalize(st_);
      throw StorageError("prepare failed: " + err);
    }
  }
  ~Statement() { sqlite3_finalize(st_); }

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const { return st_; }

  bool step(const char* op) {
    int rc = sqlite3_step(st_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw StorageError(std::string(op) + " failed: " + sqlite3_errmsg(db_));
  }

  void reset() {
    sqlite3_reset(st_);
    sqlite3_clear_bindings(st_);
  }

private:
  sqlite3*      db_;
  sqlite3_stmt* st_ = nullptr;
};

// Rolled back unless commit() ran.
class Transaction {
public:
  explicit Transaction(sqlite3* db) : db_(db) { execAll(db_, "BEGIN IMMEDIATE;"); }
  ~Transaction() {
    if (!done_ && sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
      spdlog::error("rollback failed: {}", sqlite3_errmsg(db_));
    }
  }
  void commit() {
    execAll(db_, "COMMIT;");
    done_ = true;
  }

private:
  sqlite3* db_;
  bool     done_ = false;
};

void bind_text(sqlite3_stmt* st, int i, const std::string& s) {
  sqlite3_bind_text(st, i, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

// Binds the seven non-key fields starting at parameter `i`.
void bind_fingerprint(sqlite3_stmt* st, int i, const MetadataRecord& r) {
  sqlite3_bind_int(st, i++, r.rating);
  sqlite3_bind_double(st, i++, r.aperture);
  bind_text(st, i++, r.lens_id);
  bind_text(st, i++, r.capture_time);
  sqlite3_bind_double(st, i++, r.focal_length);
  sqlite3_bind_double(st, i++, r.exposure_time);
  sqlite3_bind_int(st, i++, r.color_temperature);
}

std::string column_text(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? std::string(reinterpret_cast<const char*>(t)) : std::string();
}

MetadataRecord read_row(sqlite3_stmt* st) {
  MetadataRecord r;
  r.file_name         = column_text(st, 0);
  r.rating            = sqlite3_column_int(st, 1);
  r.aperture          = sqlite3_column_double(st, 2);
  r.lens_id           = column_text(st, 3);
  r.capture_time      = column_text(st, 4);
  r.focal_length      = sqlite3_column_double(st, 5);
  r.exposure_time     = sqlite3_column_double(st, 6);
  r.color_temperature = sqlite3_column_int(st, 7);
  return r;
}

constexpr const char* kSelectColumns =
  "SELECT file_name, rating, aperture, lens_id, capture_time, "
  "focal_length, exposure_time, color_temperature FROM images";

} // namespace

Catalog::Catalog(const std::string& dbPath) : db_(nullptr), path_(dbPath) {
  if (dbPath != ":memory:") {
    auto parent = std::filesystem::path(dbPath).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent);
  }

  sqlite3* db = nullptr;
  if (sqlite3_open_v2(dbPath.c_str(), &db,
                      SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                      nullptr) != SQLITE_OK) {
    std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    throw StorageError("failed to open catalog " + dbPath + ": " + msg);
  }
  try {
    ensureSchema(db);
  } catch (...) {
    sqlite3_close(db);
    throw;
  }
  db_ = db;
  spdlog::debug("catalog opened: {}", dbPath);
}

Catalog::~Catalog() {
  sqlite3_close(static_cast<sqlite3*>(db_));
}

void Catalog::upsertAll(const std::vector<MetadataRecord>& records) {
  auto* db = static_cast<sqlite3*>(db_);
  std::lock_guard<std::mutex> lock(writeMutex_);

  Transaction tx(db);
  Statement st(db, R"SQL(
    INSERT OR REPLACE INTO images
      (file_name, rating, aperture, lens_id, capture_time,
       focal_length, exposure_time, color_temperature)
    VALUES (?,?,?,?,?,?,?,?)
  )SQL");
  for (const auto& r : records) {
    bind_text(st.get(), 1, r.file_name);
    bind_fingerprint(st.get(), 2, r);
    st.step("upsert");
    st.reset();
  }
  tx.commit();
  spdlog::debug("upserted {} records", records.size());
}

bool Catalog::containsByFingerprint(const MetadataRecord& r) const {
  auto* db = static_cast<sqlite3*>(db_);
  Statement st(db, R"SQL(
    SELECT 1 FROM images
    WHERE rating = ?
      AND aperture = ?
      AND lens_id = ?
      AND capture_time = ?
      AND focal_length = ?
      AND exposure_time = ?
      AND color_temperature = ?
    LIMIT 1
  )SQL");
  bind_fingerprint(st.get(), 1, r);
  return st.step("containsByFingerprint");
}

void Catalog::clear() {
  auto* db = static_cast<sqlite3*>(db_);
  std::lock_guard<std::mutex> lock(writeMutex_);
  Transaction tx(db);
  execAll(db, "DELETE FROM images;");
  tx.commit();
}

std::size_t Catalog::rebuild(const std::vector<std::string>& localPaths,
                             const MetadataExtractor& extractor,
                             std::size_t concurrency) {
  clear();

  ExtractionPool pool(extractor, concurrency);
  const auto outcomes = pool.run(localPaths);
  const auto records = ExtractionPool::successes(localPaths, outcomes);
  upsertAll(records);

  spdlog::info("catalog rebuilt: {} of {} files stored", records.size(), localPaths.size());
  return records.size();
}

std::optional<MetadataRecord> Catalog::find(const std::string& fileName) const {
  auto* db = static_cast<sqlite3*>(db_);
  Statement st(db, (std::string(kSelectColumns) + " WHERE file_name = ?").c_str());
  bind_text(st.get(), 1, fileName);
  if (!st.step("find")) return std::nullopt;
  return read_row(st.get());
}

std::vector<MetadataRecord> Catalog::all() const {
  auto* db = static_cast<sqlite3*>(db_);
  Statement st(db, (std::string(kSelectColumns) + " ORDER BY file_name").c_str());
  std::vector<MetadataRecord> out;
  while (st.step("all")) out.push_back(read_row(st.get()));
  return out;
}

std::size_t Catalog::count() const {
  auto* db = static_cast<sqlite3*>(db_);
  Statement st(db, "SELECT COUNT(*) FROM images");
  if (!st.step("count")) return 0;
  return static_cast<std::size_t>(sqlite3_column_int64(st.get(), 0));
}

} // namespace psm
