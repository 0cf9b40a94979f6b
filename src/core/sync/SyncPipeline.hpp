#pragma once
#include <cstddef>
#include <ctime>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "core/device/DeviceGateway.hpp"
#include "core/metadata/ExtractionPool.hpp"
#include "core/metadata/MetadataRecord.hpp"
#include "core/storage/LocalFSBackend.hpp"

namespace psm {

class Catalog;
class MetadataExtractor;

constexpr std::time_t kSecondsPerDay = 86400;

// One synced file as offered to the selection surface.
struct Candidate {
  std::string                   path;
  std::optional<MetadataRecord> record;  // empty if extraction failed
  bool                          preselected = false;        // rating > 0
  bool                          already_cataloged = false;  // fingerprint seen before this sync
};

struct SyncOptions {
  CollisionPolicy collision = CollisionPolicy::Overwrite;
  std::size_t     workers = ExtractionPool::kDefaultWidth;
};

class SyncPipeline {
public:
  using Clock = std::function<std::time_t()>;

  SyncPipeline(DeviceGateway& gateway,
               Catalog& catalog,
               const MetadataExtractor& extractor,
               SyncOptions options = {},
               Clock clock = {});

  // Files with mtime >= now - windowDays * 86400, order preserved.
  static std::vector<RemoteFile> filterRecent(const std::vector<RemoteFile>& files,
                                              std::time_t now, int windowDays);

  // Copies the device's recent files to destinationDir/<basename> and returns
  // the local paths in discovery order. With nothing recent, neither the
  // destination nor a second device session is touched. Any fetch or write
  // failure aborts the whole sync.
  std::vector<std::string> syncRecent(const DeviceHandle& device, int windowDays,
                                      const std::string& destinationDir);

  // Extracts concurrently, flags content already in the catalog, stores the
  // batch and returns one candidate per path in input order.
  std::vector<Candidate> catalogFiles(const std::vector<std::string>& localPaths);

  std::vector<Candidate> syncAndCatalog(const DeviceHandle& device, int windowDays,
                                        const std::string& destinationDir);

private:
  DeviceGateway&           gateway_;
  Catalog&                 catalog_;
  const MetadataExtractor& extractor_;
  SyncOptions              options_;
  Clock                    clock_;
};

} // namespace psm
