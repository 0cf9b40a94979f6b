#include "DeviceGateway.hpp"

#include <spdlog/spdlog.h>

#include "core/Errors.hpp"

namespace psm {

std::string describe(const DeviceHandle& d) {
  return "#" + std::to_string(d.index) + " " + d.manufacturer + " " + d.product +
         " (bus " + std::to_string(d.bus) + ", address " + std::to_string(d.address) + ")";
}

std::string join_remote(const std::string& folder, const std::string& name) {
  if (folder.empty() || folder == "/") return "/" + name;
  if (folder.back() == '/') return folder + name;
  return folder + "/" + name;
}

std::pair<std::string, std::string> split_remote(const std::string& path) {
  auto slash = path.find_last_of('/');
  if (slash == std::string::npos) return {"/", path};
  if (slash == 0) return {"/", path.substr(1)};
  return {path.substr(0, slash), path.substr(slash + 1)};
}

DeviceHandle DeviceGateway::resolve(const DeviceHandle& handle) {
  const auto current = enumerate();
  if (handle.index < 0 || static_cast<size_t>(handle.index) >= current.size()) {
    throw DeviceIndexError("device index " + std::to_string(handle.index) +
                           " out of range (" + std::to_string(current.size()) +
                           " devices attached): " + describe(handle));
  }
  for (const auto& d : current) {
    if (d.bus == handle.bus && d.address == handle.address) return d;
  }
  throw DeviceIndexError("device no longer attached: " + describe(handle));
}

std::vector<RemoteFile> DeviceGateway::listFiles(const DeviceHandle& handle) {
  const DeviceHandle device = resolve(handle);
  auto session = openSession(device);

  std::vector<RemoteFile> files;
  walk(*session, "/", files);
  spdlog::info("listed {} files on {}", files.size(), describe(device));
  return files;
}

void DeviceGateway::walk(DeviceSession& session, const std::string& folder,
                         std::vector<RemoteFile>& out) {
  for (const auto& name : session.listFileNames(folder)) {
    out.push_back(RemoteFile{join_remote(folder, name), session.fileMtime(folder, name)});
  }
  for (const auto& sub : session.listFolderNames(folder)) {
    walk(session, join_remote(folder, sub), out);
  }
}

std::string DeviceGateway::fetch(const DeviceHandle& handle, const RemoteFile& file) {
  const DeviceHandle device = resolve(handle);
  auto session = openSession(device);
  const auto [folder, name] = split_remote(file.path);
  return session->readFile(folder, name);
}

void DeviceGateway::fetchEach(const DeviceHandle& handle,
                              const std::vector<RemoteFile>& files,
                              const FetchSink& sink) {
  if (files.empty()) return;
  const DeviceHandle device = resolve(handle);
  auto session = openSession(device);
  for (const auto& f : files) {
    const auto [folder, name] = split_remote(f.path);
    const std::string bytes = session->readFile(folder, name);
    spdlog::debug("fetched {} ({} bytes)", f.path, bytes.size());
    sink(f, bytes);
  }
}

} // namespace psm
