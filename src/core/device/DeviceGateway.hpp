#pragma once
#include <cstdint>
#include <ctime>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace psm {

// One connected capture device as seen by one enumeration. `index` is only
// meaningful against the enumeration that produced it; (bus, address) is the
// stable key used to find the device again.
struct DeviceHandle {
  int         index = 0;
  int         bus = 0;
  int         address = 0;
  std::string manufacturer;
  std::string product;
  std::string model;  // transport model name, e.g. "Nikon DSC Z6"
  std::string port;   // transport locator, e.g. "usb:001,005"
};

std::string describe(const DeviceHandle& d);

struct RemoteFile {
  std::string path;       // posix, rooted at "/"
  std::time_t mtime = 0;  // device-reported, seconds since epoch
};

// Joins a device folder and an entry name ("/" + "a" -> "/a").
std::string join_remote(const std::string& folder, const std::string& name);

// Splits "/DCIM/100/IMG.JPG" into ("/DCIM/100", "IMG.JPG").
std::pair<std::string, std::string> split_remote(const std::string& path);

// An open device. The destructor closes it, so a session can never outlive
// the gateway call that opened it.
class DeviceSession {
public:
  virtual ~DeviceSession() = default;

  virtual std::vector<std::string> listFileNames(const std::string& folder) = 0;
  virtual std::vector<std::string> listFolderNames(const std::string& folder) = 0;
  virtual std::time_t fileMtime(const std::string& folder, const std::string& name) = 0;
  virtual std::string readFile(const std::string& folder, const std::string& name) = 0;
};

class DeviceGateway {
public:
  using FetchSink = std::function<void(const RemoteFile&, const std::string& bytes)>;

  virtual ~DeviceGateway() = default;

  // Fresh, ordinal-indexed list on every call.
  virtual std::vector<DeviceHandle> enumerate() = 0;

  // Depth-first walk from "/": a folder's files first, then its subfolders.
  std::vector<RemoteFile> listFiles(const DeviceHandle& handle);

  std::string fetch(const DeviceHandle& handle, const RemoteFile& file);

  // Fetches `files` in order within a single session. Opens nothing when
  // `files` is empty.
  void fetchEach(const DeviceHandle& handle,
                 const std::vector<RemoteFile>& files,
                 const FetchSink& sink);

  // Re-enumerates and returns the current handle for the same physical
  // device. Throws DeviceIndexError if the index is out of range for the
  // new enumeration or the device is gone.
  DeviceHandle resolve(const DeviceHandle& handle);

protected:
  virtual std::unique_ptr<DeviceSession> openSession(const DeviceHandle& handle) = 0;

private:
  void walk(DeviceSession& session, const std::string& folder,
            std::vector<RemoteFile>& out);
};

} // namespace psm
