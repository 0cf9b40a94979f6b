#include "Config.hpp"

#include <cstdlib>
#include <limits>
#include <stdexcept>

#include "core/Errors.hpp"

namespace psm {

namespace {

void check_log_level(const std::string& level) {
  for (const char* l : {"trace", "debug", "info", "warn", "error", "critical", "off"}) {
    if (level == l) return;
  }
  throw ConfigError("unknown log level '" + level + "'");
}

std::string need_value(int argc, char** argv, int& i) {
  const std::string flag = argv[i];
  if (i + 1 >= argc) throw ConfigError(flag + " needs a value");
  return argv[++i];
}

} // namespace

std::string get_env_or(const char* key, const std::string& defval) {
#ifdef _WIN32
  size_t len = 0;
  char* buf = nullptr;
  if (_dupenv_s(&buf, &len, key) == 0 && buf) {
    std::string v(buf);
    free(buf);
    return v;
  }
  return defval;
#else
  if (const char* v = std::getenv(key)) return std::string(v);
  return defval;
#endif
}

int parse_int(const std::string& s, const char* what, int min, int max) {
  size_t pos = 0;
  long long v = 0;
  try {
    v = std::stoll(s, &pos);
  } catch (const std::logic_error&) {
    throw ConfigError(std::string(what) + ": not a number: '" + s + "'");
  }
  if (pos != s.size()) throw ConfigError(std::string(what) + ": not a number: '" + s + "'");
  if (v < min || v > max) {
    throw ConfigError(std::string(what) + " out of range [" + std::to_string(min) + ", " +
                      std::to_string(max) + "]: " + s);
  }
  return static_cast<int>(v);
}

AppConfig load_config(int argc, char** argv) {
  constexpr int kMaxInt = std::numeric_limits<int>::max();
  AppConfig c;

  c.db_path   = get_env_or("PSM_DB_PATH", c.db_path);
  c.dest_dir  = get_env_or("PSM_DEST_DIR", c.dest_dir);
  c.days      = parse_int(get_env_or("PSM_DAYS", std::to_string(c.days)), "PSM_DAYS", 0, 36500);
  c.workers   = static_cast<std::size_t>(
      parse_int(get_env_or("PSM_WORKERS", std::to_string(c.workers)), "PSM_WORKERS", 1, 256));
  c.extract_timeout = std::chrono::milliseconds(parse_int(
      get_env_or("PSM_EXTRACT_TIMEOUT_MS", std::to_string(c.extract_timeout.count())),
      "PSM_EXTRACT_TIMEOUT_MS", 1, kMaxInt));
  c.exiftool  = get_env_or("PSM_EXIFTOOL", c.exiftool);
  c.collision = parse_collision_policy(get_env_or("PSM_COLLISION_POLICY", "overwrite"));
  c.folder    = get_env_or("PSM_FOLDER", c.folder);
  c.review_port = parse_int(get_env_or("PSM_REVIEW_PORT", "0"), "PSM_REVIEW_PORT", 0, 65535);
  c.api_key   = get_env_or("PSM_API_KEY", "");
  c.log_level = get_env_or("PSM_LOG_LEVEL", c.log_level);
  if (auto d = get_env_or("PSM_DEVICE", ""); !d.empty()) {
    c.device = parse_int(d, "PSM_DEVICE", 0, kMaxInt);
  }

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--init") {
      c.command = Command::Init;
    } else if (arg == "--list-devices") {
      c.command = Command::ListDevices;
    } else if (arg == "--sync") {
      c.command = Command::Sync;
    } else if (arg == "--rebuild") {
      c.command = Command::Rebuild;
      c.rebuild_dir = need_value(argc, argv, i);
    } else if (arg == "--days") {
      c.days = parse_int(need_value(argc, argv, i), "--days", 0, 36500);
    } else if (arg == "--dest") {
      c.dest_dir = need_value(argc, argv, i);
    } else if (arg == "--device") {
      c.device = parse_int(need_value(argc, argv, i), "--device", 0, kMaxInt);
    } else if (arg == "--folder") {
      c.folder = need_value(argc, argv, i);
    } else if (arg == "--review-port") {
      c.review_port = parse_int(need_value(argc, argv, i), "--review-port", 0, 65535);
    } else {
      throw ConfigError("unknown argument '" + arg + "'");
    }
  }

  check_log_level(c.log_level);
  return c;
}

} // namespace psm
