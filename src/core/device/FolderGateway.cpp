#include "FolderGateway.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

#include <sys/stat.h>

#include <spdlog/spdlog.h>

#include "core/Errors.hpp"

namespace psm {

namespace fs = std::filesystem;

namespace {

class FolderSession : public DeviceSession {
public:
  explicit FolderSession(fs::path root) : root_(std::move(root)) {
    spdlog::debug("opened folder session on {}", root_.string());
  }

  std::vector<std::string> listFileNames(const std::string& folder) override {
    return entries(folder, false);
  }

  std::vector<std::string> listFolderNames(const std::string& folder) override {
    return entries(folder, true);
  }

  std::time_t fileMtime(const std::string& folder, const std::string& name) override {
    const fs::path p = local(folder) / name;
    struct stat st {};
    if (::stat(p.c_str(), &st) != 0) {
      throw TransportError("stat failed for " + join_remote(folder, name) + ": " +
                           std::strerror(errno));
    }
    return st.st_mtime;
  }

  std::string readFile(const std::string& folder, const std::string& name) override {
    const fs::path p = local(folder) / name;
    std::ifstream in(p, std::ios::binary);
    if (!in) throw TransportError("cannot open " + join_remote(folder, name) + " on " + root_.string());
    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) throw TransportError("read failed for " + join_remote(folder, name));
    return bytes;
  }

private:
  fs::path root_;

  fs::path local(const std::string& folder) const {
    return folder.empty() || folder == "/" ? root_ : root_ / fs::path(folder).relative_path();
  }

  std::vector<std::string> entries(const std::string& folder, bool directories) const {
    std::vector<std::string> names;
    std::error_code ec;
    for (fs::directory_iterator it(local(folder), ec), end; !ec && it != end; it.increment(ec)) {
      // Links are never followed, so each file is reached by one path only.
      std::error_code st_ec;
      const fs::file_status st = it->symlink_status(st_ec);
      if (st_ec) {
        spdlog::debug("skipping {}: {}", it->path().string(), st_ec.message());
        continue;
      }
      if (fs::is_symlink(st)) {
        spdlog::debug("skipping symlink {}", it->path().string());
        continue;
      }
      const bool wanted = directories ? fs::is_directory(st) : fs::is_regular_file(st);
      if (wanted) names.push_back(it->path().filename().string());
    }
    if (ec) {
      throw TransportError("listing " + folder + " on " + root_.string() + " failed: " + ec.message());
    }
    std::sort(names.begin(), names.end());
    return names;
  }
};

} // namespace

FolderGateway::FolderGateway(std::string root) : root_(std::move(root)) {}

std::vector<DeviceHandle> FolderGateway::enumerate() {
  std::error_code ec;
  if (!fs::is_directory(root_, ec)) return {};

  DeviceHandle d;
  d.index = 0;
  d.manufacturer = "Local";
  d.product = fs::path(root_).filename().string();
  if (d.product.empty()) d.product = root_;
  d.model = "folder";
  d.port = "disk:" + root_;
  return {d};
}

std::unique_ptr<DeviceSession> FolderGateway::openSession(const DeviceHandle&) {
  return std::make_unique<FolderSession>(fs::path(root_));
}

} // namespace psm
