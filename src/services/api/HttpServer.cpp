#include "HttpServer.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "core/Errors.hpp"
#include "core/metadata/Catalog.hpp"

using nlohmann::json;

// -------- helpers --------

static bool check_api_key(const httplib::Request& req,
                          const std::string& apiKey,
                          httplib::Response& res) {
  if (apiKey.empty()) return true;
  auto k = req.get_header_value("X-API-Key");
  if (k == apiKey) return true;
  res.status = 401;
  res.set_content("unauthorized", "text/plain");
  return false;
}

static json record_json(const psm::MetadataRecord& r) {
  return {
    {"file_name", r.file_name},
    {"rating", r.rating},
    {"aperture", r.aperture},
    {"lens_id", r.lens_id},
    {"capture_time", r.capture_time},
    {"focal_length", r.focal_length},
    {"exposure_time", r.exposure_time},
    {"color_temperature", r.color_temperature}
  };
}

// -------- server --------

namespace psm {

json candidates_json(const std::vector<Candidate>& candidates) {
  json out = json::array();
  for (size_t i = 0; i < candidates.size(); ++i) {
    const auto& c = candidates[i];
    out.push_back({
      {"index", i + 1},
      {"path", c.path},
      {"preselected", c.preselected},
      {"already_cataloged", c.already_cataloged},
      {"metadata", c.record ? record_json(*c.record) : json(nullptr)}
    });
  }
  return out;
}

std::vector<std::string> HttpSelection::choose(const std::vector<Candidate>& candidates) {
  if (candidates.empty()) return {};

  httplib::Server svr;
  std::mutex mtx;
  std::vector<std::string> chosen;
  bool done = false;

  std::set<std::string> known;
  for (const auto& c : candidates) known.insert(c.path);

  svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
    res.status = 200;
    res.set_content("ok", "text/plain");
  });

  svr.Get("/candidates", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey_, res)) return;
    res.status = 200;
    res.set_content(candidates_json(candidates).dump(), "application/json");
  });

  svr.Get("/catalog", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey_, res)) return;
    json out = json::array();
    try {
      for (const auto& r : catalog_.all()) out.push_back(record_json(r));
    } catch (const StorageError& e) {
      spdlog::error("catalog read failed: {}", e.what());
      res.status = 500;
      res.set_content("catalog read failed", "text/plain");
      return;
    }
    res.status = 200;
    res.set_content(out.dump(), "application/json");
  });

  svr.Post("/selection", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey_, res)) return;

    json body;
    try { body = json::parse(req.body); }
    catch (const json::parse_error&) {
      res.status = 400; res.set_content("invalid JSON", "text/plain"); return;
    }
    if (body.is_object() && body.contains("paths")) body = body["paths"];
    if (!body.is_array()) {
      res.status = 400; res.set_content("expected an array of paths", "text/plain"); return;
    }

    std::vector<std::string> picked;
    for (const auto& p : body) {
      if (!p.is_string() || !known.count(p.get<std::string>())) {
        res.status = 422;
        res.set_content("unknown path: " + p.dump(), "text/plain");
        return;
      }
      picked.push_back(p.get<std::string>());
    }

    const size_t n = picked.size();
    {
      std::lock_guard<std::mutex> lock(mtx);
      if (done) {
        res.status = 409; res.set_content("selection already submitted", "text/plain"); return;
      }
      chosen = std::move(picked);
      done = true;
    }
    spdlog::info("operator selected {} of {} candidates", n, candidates.size());
    res.status = 200;
    res.set_content(json({{"selected", n}}).dump(), "application/json");
    svr.stop();
  });

  svr.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (res.status == 404) res.set_content("not found", "text/plain");
  });

  spdlog::info("review server listening on http://0.0.0.0:{} ({} candidates)",
               port_, candidates.size());
  if (!svr.listen("0.0.0.0", port_)) {
    std::lock_guard<std::mutex> lock(mtx);
    if (!done) throw Error("failed to bind review server on port " + std::to_string(port_));
  }

  std::lock_guard<std::mutex> lock(mtx);
  return chosen;
}

} // namespace psm
