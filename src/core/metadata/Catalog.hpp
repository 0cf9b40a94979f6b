#pragma once
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "ExtractionPool.hpp"
#include "MetadataRecord.hpp"

namespace psm {

class MetadataExtractor;

// Durable metadata store keyed by file name. Owns one SQLite connection for
// its whole lifetime; the schema is ensured when it opens.
class Catalog {
public:
  explicit Catalog(const std::string& dbPath);
  ~Catalog();

  Catalog(const Catalog&) = delete;
  Catalog& operator=(const Catalog&) = delete;

  // Insert-or-replace by file name, all records in one transaction.
  void upsertAll(const std::vector<MetadataRecord>& records);

  // True if some stored record matches every non-key field of `r`,
  // whatever its file name.
  bool containsByFingerprint(const MetadataRecord& r) const;

  void clear();

  // clear(), then extract every path concurrently and store the successes
  // in one batch. Returns the number of stored records.
  std::size_t rebuild(const std::vector<std::string>& localPaths,
                      const MetadataExtractor& extractor,
                      std::size_t concurrency = ExtractionPool::kDefaultWidth);

  std::optional<MetadataRecord> find(const std::string& fileName) const;
  std::vector<MetadataRecord> all() const;
  std::size_t count() const;

  const std::string& path() const { return path_; }

private:
  void*       db_; // sqlite3*
  std::string path_;
  std::mutex  writeMutex_;
};

} // namespace psm
