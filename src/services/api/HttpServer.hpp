#pragma once
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "services/selection/SelectionSurface.hpp"

namespace psm {

class Catalog;

nlohmann::json candidates_json(const std::vector<Candidate>& candidates);

// Review endpoint for a remote operator. Blocks in choose() until a valid
// POST /selection arrives, then stops listening.
//   GET  /health
//   GET  /candidates
//   GET  /catalog
//   POST /selection   body: ["path", ...] or {"paths": [...]}
// apiKey: if empty, auth is disabled.
class HttpSelection : public SelectionSurface {
public:
  HttpSelection(Catalog& catalog, int port, std::string apiKey)
    : catalog_(catalog), port_(port), apiKey_(std::move(apiKey)) {}

  std::vector<std::string> choose(const std::vector<Candidate>& candidates) override;

private:
  Catalog&    catalog_;
  int         port_;
  std::string apiKey_;
};

} // namespace psm
