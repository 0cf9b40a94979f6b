#include "LocalFSBackend.hpp"
#include <filesystem>
#include <fstream>
#include <system_error>

#include "core/Errors.hpp"

namespace psm {

namespace fs = std::filesystem;

CollisionPolicy parse_collision_policy(const std::string& s) {
  if (s == "overwrite") return CollisionPolicy::Overwrite;
  if (s == "disambiguate") return CollisionPolicy::Disambiguate;
  throw ConfigError("unknown collision policy '" + s + "' (expected overwrite|disambiguate)");
}

const char* to_string(CollisionPolicy p) {
  return p == CollisionPolicy::Overwrite ? "overwrite" : "disambiguate";
}

void LocalFSBackend::ensureRoot() const {
  std::error_code ec;
  fs::create_directories(root_, ec);
  if (ec) throw StorageError("cannot create " + root_ + ": " + ec.message());
}

std::string LocalFSBackend::chooseName(const std::string& name) const {
  if (policy_ == CollisionPolicy::Overwrite) return name;

  auto taken = [&](const std::string& n) {
    std::error_code ec;
    return written_.count(n) > 0 || fs::exists(fs::path(root_) / n, ec);
  };
  if (!taken(name)) return name;

  const fs::path p(name);
  const std::string stem = p.stem().string();
  const std::string ext = p.extension().string();
  for (int i = 1;; ++i) {
    std::string candidate = stem + "_" + std::to_string(i) + ext;
    if (!taken(candidate)) return candidate;
  }
}

std::string LocalFSBackend::put(const std::string& name, std::string_view bytes) {
  const std::string chosen = chooseName(name);
  const fs::path file = fs::path(root_) / chosen;

  std::ofstream os(file, std::ios::binary | std::ios::trunc);
  if (!os) throw StorageError("cannot open " + file.string() + " for writing");
  os.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  os.flush();
  if (!os) throw StorageError("write failed: " + file.string());

  written_.insert(chosen);
  return file.string();
}

} // namespace psm
