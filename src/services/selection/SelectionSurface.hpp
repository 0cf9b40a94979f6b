#pragma once
#include <string>
#include <vector>

#include "core/sync/SyncPipeline.hpp"

namespace psm {

// Presents synced candidates to an operator and returns the chosen paths.
class SelectionSurface {
public:
  virtual ~SelectionSurface() = default;
  virtual std::vector<std::string> choose(const std::vector<Candidate>& candidates) = 0;
};

std::vector<std::string> preselected_paths(const std::vector<Candidate>& candidates);

} // namespace psm
