#include "ExtractionPool.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <thread>

#include <spdlog/spdlog.h>

#include "core/Errors.hpp"
#include "MetadataExtractor.hpp"

namespace psm {

ExtractionPool::ExtractionPool(const MetadataExtractor& extractor, std::size_t width)
  : extractor_(extractor), width_(std::max<std::size_t>(1, width)) {}

std::map<std::string, ExtractionOutcome> ExtractionPool::run(
    const std::vector<std::string>& paths) const {
  // Unique jobs; each worker writes only its own slot.
  std::vector<std::string> jobs(paths);
  std::sort(jobs.begin(), jobs.end());
  jobs.erase(std::unique(jobs.begin(), jobs.end()), jobs.end());

  std::vector<ExtractionOutcome> slots(jobs.size());
  std::atomic<std::size_t> next{0};

  auto worker = [&]() {
    for (;;) {
      const std::size_t idx = next.fetch_add(1);
      if (idx >= jobs.size()) break;
      auto& slot = slots[idx];
      try {
        slot.record = extractor_.extract(jobs[idx]);
      } catch (const ExtractionError& e) {
        slot.error = e.what();
      } catch (const std::exception& e) {
        slot.error = std::string("unexpected: ") + e.what();
      }
    }
  };

  const std::size_t n = std::min(width_, jobs.size());
  spdlog::debug("extracting {} files with {} workers", jobs.size(), n);
  std::vector<std::thread> workers;
  workers.reserve(n);
  for (std::size_t i = 0; i < n; ++i) workers.emplace_back(worker);
  for (auto& w : workers) w.join();

  std::map<std::string, ExtractionOutcome> out;
  for (std::size_t i = 0; i < jobs.size(); ++i) out.emplace(jobs[i], std::move(slots[i]));
  return out;
}

std::vector<MetadataRecord> ExtractionPool::successes(
    const std::vector<std::string>& paths,
    const std::map<std::string, ExtractionOutcome>& outcomes) {
  std::vector<MetadataRecord> records;
  records.reserve(paths.size());
  for (const auto& p : paths) {
    auto it = outcomes.find(p);
    if (it == outcomes.end()) continue;
    if (it->second.record) {
      records.push_back(*it->second.record);
    } else {
      spdlog::warn("skipping {}: {}", p, it->second.error);
    }
  }
  return records;
}

} // namespace psm
