#pragma once

// Shared fakes for the unit tests: an in-memory device, a scripted tag
// reader and a self-deleting temporary directory.

#include <atomic>
#include <chrono>
#include <filesystem>
#include <ctime>
#include <fstream>
#include <iterator>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/Errors.hpp"
#include "core/device/DeviceGateway.hpp"
#include "core/metadata/ExifToolReader.hpp"

#include <unistd.h>

namespace psm_test {

namespace fs = std::filesystem;

class TempDir {
public:
  TempDir() {
    static std::atomic<int> counter{0};
    path_ = fs::temp_directory_path() /
            ("psm_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
    fs::remove_all(path_);
    fs::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const fs::path& path() const { return path_; }
  std::string str(const std::string& child = "") const {
    return child.empty() ? path_.string() : (path_ / child).string();
  }

private:
  fs::path path_;
};

inline void write_file(const fs::path& p, const std::string& bytes) {
  fs::create_directories(p.parent_path());
  std::ofstream os(p, std::ios::binary);
  os << bytes;
}

inline std::string read_file(const fs::path& p) {
  std::ifstream in(p, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

// In-memory device tree. Folders and files keep insertion order so the
// walk order is predictable; sessions are counted so tests can check that
// every one of them was closed.
class FakeGateway : public psm::DeviceGateway {
public:
  FakeGateway() {
    psm::DeviceHandle d;
    d.index = 0;
    d.bus = 1;
    d.address = 5;
    d.manufacturer = "Nikon Corp.";
    d.product = "Z 6";
    d.model = "Nikon DSC Z6";
    d.port = "usb:001,005";
    devices.push_back(d);
  }

  void addFile(const std::string& path, std::time_t mtime, const std::string& bytes) {
    auto [folder, name] = psm::split_remote(path);
    registerFolder(folder);
    files_[folder].push_back(name);
    contents_[path] = {mtime, bytes};
  }

  std::vector<psm::DeviceHandle> enumerate() override {
    ++enumerations;
    return devices;
  }

  std::vector<psm::DeviceHandle> devices;
  std::set<std::string>          failing_reads;
  int                            sessions_opened = 0;
  int                            sessions_live = 0;
  int                            enumerations = 0;

protected:
  std::unique_ptr<psm::DeviceSession> openSession(const psm::DeviceHandle&) override {
    return std::make_unique<Session>(*this);
  }

private:
  class Session : public psm::DeviceSession {
  public:
    explicit Session(FakeGateway& gw) : gw_(gw) {
      ++gw_.sessions_opened;
      ++gw_.sessions_live;
    }
    ~Session() override { --gw_.sessions_live; }

    std::vector<std::string> listFileNames(const std::string& folder) override {
      auto it = gw_.files_.find(folder);
      return it == gw_.files_.end() ? std::vector<std::string>{} : it->second;
    }
    std::vector<std::string> listFolderNames(const std::string& folder) override {
      auto it = gw_.folders_.find(folder);
      return it == gw_.folders_.end() ? std::vector<std::string>{} : it->second;
    }
    std::time_t fileMtime(const std::string& folder, const std::string& name) override {
      return gw_.contents_.at(psm::join_remote(folder, name)).first;
    }
    std::string readFile(const std::string& folder, const std::string& name) override {
      const auto path = psm::join_remote(folder, name);
      if (gw_.failing_reads.count(path)) throw psm::TransportError("file_get failed: " + path);
      auto it = gw_.contents_.find(path);
      if (it == gw_.contents_.end()) throw psm::TransportError("no such file: " + path);
      return it->second.second;
    }

  private:
    FakeGateway& gw_;
  };

  std::map<std::string, std::vector<std::string>> files_;
  std::map<std::string, std::vector<std::string>> folders_;
  std::map<std::string, std::pair<std::time_t, std::string>> contents_;

  void registerFolder(const std::string& folder) {
    if (folder == "/" || folder.empty()) return;
    auto [parent, name] = psm::split_remote(folder);
    registerFolder(parent);
    auto& subs = folders_[parent];
    for (const auto& s : subs) {
      if (s == name) return;
    }
    subs.push_back(name);
  }
};

// Tags keyed by file base name; unknown files fail like an unreadable image.
class FakeReader : public psm::MetadataReader {
public:
  std::map<std::string, nlohmann::json>           tags;
  std::map<std::string, std::chrono::milliseconds> delays;
  std::atomic<int> calls{0};
  std::atomic<int> active{0};
  std::atomic<int> peak{0};

  nlohmann::json readTags(const std::string& path) override {
    ++calls;
    int now = ++active;
    int seen = peak.load();
    while (now > seen && !peak.compare_exchange_weak(seen, now)) {}

    const std::string name = fs::path(path).filename().string();
    if (auto d = delays.find(name); d != delays.end()) std::this_thread::sleep_for(d->second);
    --active;

    auto it = tags.find(name);
    if (it == tags.end()) throw psm::ExtractionError("unreadable: " + path);
    return it->second;
  }
};

inline nlohmann::json sample_tags(int rating = 0) {
  return {
    {"SourceFile", "ignored"},
    {"XMP:Rating", rating},
    {"EXIF:FNumber", 2.8},
    {"Composite:LensSpec", "24 70 2.8 2.8"},
    {"EXIF:DateTimeOriginal", "2024:05:01 10:11:12"},
    {"EXIF:FocalLength", 50.0},
    {"EXIF:ExposureTime", 0.004},
    {"EXIF:WhiteBalance", 1}
  };
}

} // namespace psm_test
