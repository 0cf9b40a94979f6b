#pragma once
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "MetadataRecord.hpp"

namespace psm {

class MetadataExtractor;

struct ExtractionOutcome {
  std::optional<MetadataRecord> record;  // empty on failure
  std::string                   error;
};

// Bounded set of worker threads running MetadataExtractor::extract. Outcomes
// are keyed by path, so completion order never shows in the result. run()
// returns only after every worker has joined.
class ExtractionPool {
public:
  static constexpr std::size_t kDefaultWidth = 4;

  explicit ExtractionPool(const MetadataExtractor& extractor,
                          std::size_t width = kDefaultWidth);

  std::size_t width() const { return width_; }

  std::map<std::string, ExtractionOutcome> run(const std::vector<std::string>& paths) const;

  // Successful records in `paths` order; failures are logged and dropped.
  static std::vector<MetadataRecord> successes(
      const std::vector<std::string>& paths,
      const std::map<std::string, ExtractionOutcome>& outcomes);

private:
  const MetadataExtractor& extractor_;
  std::size_t              width_;
};

} // namespace psm
