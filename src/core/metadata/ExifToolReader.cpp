#include "ExifToolReader.hpp"

#include <filesystem>
#include <stdexcept>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "core/Errors.hpp"
#include "core/util/Process.hpp"

namespace psm {

ExifToolReader::ExifToolReader(std::string executable, std::chrono::milliseconds timeout)
  : executable_(std::move(executable)), timeout_(timeout) {}

nlohmann::json ExifToolReader::readTags(const std::string& path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    throw ExtractionError("not a regular file: " + path);
  }

  // exiftool would read a leading '-' as an option
  const std::string arg = (!path.empty() && path[0] == '-') ? "./" + path : path;

  ProcessResult r;
  try {
    r = run_process({executable_, "-G", "-n", "-j", arg}, timeout_);
  } catch (const std::runtime_error& e) {
    throw ExtractionError("cannot run " + executable_ + " for " + path + ": " + e.what());
  }

  if (r.timed_out) {
    throw ExtractionError(executable_ + " timed out after " + std::to_string(timeout_.count()) +
                          " ms on " + path);
  }
  if (r.exit_code == 127 && r.stdout_str.empty()) {
    throw ExtractionError(executable_ + " not found (reading " + path + ")");
  }
  if (r.stdout_str.empty()) {
    throw ExtractionError(executable_ + " exited " + std::to_string(r.exit_code) + " on " +
                          path + ": " + r.stderr_str);
  }

  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(r.stdout_str);
  } catch (const nlohmann::json::parse_error& e) {
    throw ExtractionError("invalid exiftool output for " + path + ": " + e.what());
  }
  if (!doc.is_array() || doc.empty() || !doc[0].is_object()) {
    throw ExtractionError("unexpected exiftool output for " + path);
  }

  nlohmann::json tags = doc[0];
  if (auto it = tags.find("ExifTool:Error"); it != tags.end()) {
    throw ExtractionError("exiftool cannot read " + path + ": " + it->dump());
  }
  if (auto it = tags.find("ExifTool:Warning"); it != tags.end()) {
    spdlog::debug("exiftool warning on {}: {}", path, it->dump());
  }
  return tags;
}

} // namespace psm
