#include "SyncPipeline.hpp"

#include <utility>

#include <spdlog/spdlog.h>

#include "core/Errors.hpp"
#include "core/metadata/Catalog.hpp"
#include "core/metadata/MetadataExtractor.hpp"

namespace psm {

SyncPipeline::SyncPipeline(DeviceGateway& gateway,
                           Catalog& catalog,
                           const MetadataExtractor& extractor,
                           SyncOptions options,
                           Clock clock)
  : gateway_(gateway),
    catalog_(catalog),
    extractor_(extractor),
    options_(options),
    clock_(clock ? std::move(clock) : Clock([] { return std::time(nullptr); })) {}

std::vector<RemoteFile> SyncPipeline::filterRecent(const std::vector<RemoteFile>& files,
                                                   std::time_t now, int windowDays) {
  if (windowDays < 0) throw ConfigError("days must be >= 0, got " + std::to_string(windowDays));
  const std::time_t cutoff = now - static_cast<std::time_t>(windowDays) * kSecondsPerDay;

  std::vector<RemoteFile> recent;
  for (const auto& f : files) {
    if (f.mtime >= cutoff) recent.push_back(f);
  }
  return recent;
}

std::vector<std::string> SyncPipeline::syncRecent(const DeviceHandle& device, int windowDays,
                                                  const std::string& destinationDir) {
  const auto recent = filterRecent(gateway_.listFiles(device), clock_(), windowDays);
  if (recent.empty()) {
    spdlog::info("no files from the last {} days on {}", windowDays, describe(device));
    return {};
  }

  LocalFSBackend dest(destinationDir, options_.collision);
  dest.ensureRoot();

  std::vector<std::string> written;
  written.reserve(recent.size());
  gateway_.fetchEach(device, recent, [&](const RemoteFile& f, const std::string& bytes) {
    const auto name = split_remote(f.path).second;
    written.push_back(dest.put(name, bytes));
  });

  spdlog::info("downloaded {} files to {}", written.size(), destinationDir);
  return written;
}

std::vector<Candidate> SyncPipeline::catalogFiles(const std::vector<std::string>& localPaths) {
  if (localPaths.empty()) return {};

  ExtractionPool pool(extractor_, options_.workers);
  const auto outcomes = pool.run(localPaths);

  std::vector<Candidate> candidates;
  std::vector<MetadataRecord> batch;
  candidates.reserve(localPaths.size());

  for (const auto& path : localPaths) {
    Candidate c;
    c.path = path;
    const auto& outcome = outcomes.at(path);
    if (outcome.record) {
      c.record = outcome.record;
      c.preselected = outcome.record->rating > 0;
      c.already_cataloged = catalog_.containsByFingerprint(*outcome.record);
      if (c.already_cataloged) {
        spdlog::warn("{} matches a capture already in the catalog", path);
      }
      batch.push_back(*outcome.record);
    } else {
      spdlog::warn("no metadata for {}: {}", path, outcome.error);
    }
    candidates.push_back(std::move(c));
  }

  catalog_.upsertAll(batch);
  spdlog::info("cataloged {} of {} files ({} total in catalog)",
               batch.size(), localPaths.size(), catalog_.count());
  return candidates;
}

std::vector<Candidate> SyncPipeline::syncAndCatalog(const DeviceHandle& device, int windowDays,
                                                    const std::string& destinationDir) {
  return catalogFiles(syncRecent(device, windowDays, destinationDir));
}

} // namespace psm
