#pragma once
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

#include "core/storage/LocalFSBackend.hpp"

namespace psm {

enum class Command { None, Init, ListDevices, Sync, Rebuild };

struct AppConfig {
  Command     command = Command::None;
  std::string db_path = "data/photo-catalog.db";
  std::string dest_dir = "data/incoming";
  int         days = 2;
  std::size_t workers = 4;
  std::chrono::milliseconds extract_timeout{30000};
  std::string exiftool = "exiftool";
  CollisionPolicy collision = CollisionPolicy::Overwrite;
  std::optional<int> device;  // ordinal; empty selects the last one enumerated
  std::string folder;         // non-empty: sync from this directory instead of USB
  int         review_port = 0;  // 0: console selection
  std::string api_key;          // empty: review server without auth
  std::string log_level = "info";
  std::string rebuild_dir;
};

std::string get_env_or(const char* key, const std::string& defval);

// Parses a whole decimal integer within [min, max]; throws ConfigError
// naming `what` otherwise.
int parse_int(const std::string& s, const char* what, int min, int max);

// Environment (PSM_*) first, then command-line flags on top.
AppConfig load_config(int argc, char** argv);

} // namespace psm
