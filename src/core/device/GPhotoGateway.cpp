#include "GPhotoGateway.hpp"

#include <map>
#include <stdexcept>
#include <utility>

#include <gphoto2/gphoto2.h>
#include <gphoto2/gphoto2-port-info-list.h>
#include <libusb-1.0/libusb.h>
#include <spdlog/spdlog.h>

#include "core/Errors.hpp"

namespace psm {

namespace {

constexpr const char* kUnknown = "Unknown";

struct ListDeleter {
  void operator()(CameraList* l) const { gp_list_free(l); }
};
using ListPtr = std::unique_ptr<CameraList, ListDeleter>;

struct FileDeleter {
  void operator()(CameraFile* f) const { gp_file_unref(f); }
};
using FilePtr = std::unique_ptr<CameraFile, FileDeleter>;

ListPtr new_list() {
  CameraList* raw = nullptr;
  int rc = gp_list_new(&raw);
  if (rc < GP_OK) {
    throw TransportError(std::string("gp_list_new failed: ") + gp_result_as_string(rc));
  }
  return ListPtr(raw);
}

std::vector<std::string> list_names(CameraList* list) {
  std::vector<std::string> names;
  int n = gp_list_count(list);
  for (int i = 0; i < n; ++i) {
    const char* name = nullptr;
    if (gp_list_get_name(list, i, &name) == GP_OK && name) names.emplace_back(name);
  }
  return names;
}

struct UsbIdentity {
  std::string manufacturer = kUnknown;
  std::string product = kUnknown;
};

std::string read_usb_string(libusb_device_handle* h, uint8_t idx) {
  if (idx == 0) return {};
  unsigned char buf[256];
  int n = libusb_get_string_descriptor_ascii(h, idx, buf, sizeof(buf));
  if (n <= 0) return {};
  return std::string(reinterpret_cast<const char*>(buf), static_cast<size_t>(n));
}

// (bus, address) -> descriptor strings. Devices we cannot open keep the
// placeholder identity.
std::map<std::pair<int, int>, UsbIdentity> usb_identities() {
  std::map<std::pair<int, int>, UsbIdentity> out;

  libusb_context* usb = nullptr;
  if (libusb_init(&usb) != 0) {
    spdlog::warn("libusb_init failed; device identities unavailable");
    return out;
  }

  libusb_device** devs = nullptr;
  ssize_t count = libusb_get_device_list(usb, &devs);
  for (ssize_t i = 0; i < count; ++i) {
    libusb_device* dev = devs[i];
    UsbIdentity id;
    libusb_device_descriptor desc{};
    libusb_device_handle* h = nullptr;
    if (libusb_get_device_descriptor(dev, &desc) == 0 && libusb_open(dev, &h) == 0) {
      auto m = read_usb_string(h, desc.iManufacturer);
      auto p = read_usb_string(h, desc.iProduct);
      if (!m.empty()) id.manufacturer = m;
      if (!p.empty()) id.product = p;
      libusb_close(h);
    }
    out[{libusb_get_bus_number(dev), libusb_get_device_address(dev)}] = id;
  }
  if (count >= 0) libusb_free_device_list(devs, 1);
  libusb_exit(usb);
  return out;
}

class GPhotoSession : public DeviceSession {
public:
  GPhotoSession(GPContext* ctx, const DeviceHandle& device)
    : ctx_(ctx), device_(device) {
    try {
      check(gp_camera_new(&camera_), "camera_new", "");
      selectAbilities();
      selectPort();
      check(gp_camera_init(camera_, ctx_), "camera_init", "");
      initialized_ = true;
      spdlog::debug("opened session on {}", describe(device_));
    } catch (...) {
      release();
      throw;
    }
  }

  ~GPhotoSession() override { release(); }

  std::vector<std::string> listFileNames(const std::string& folder) override {
    auto list = new_list();
    check(gp_camera_folder_list_files(camera_, folder.c_str(), list.get(), ctx_),
          "folder_list_files", folder);
    return list_names(list.get());
  }

  std::vector<std::string> listFolderNames(const std::string& folder) override {
    auto list = new_list();
    check(gp_camera_folder_list_folders(camera_, folder.c_str(), list.get(), ctx_),
          "folder_list_folders", folder);
    return list_names(list.get());
  }

  std::time_t fileMtime(const std::string& folder, const std::string& name) override {
    CameraFileInfo info;
    check(gp_camera_file_get_info(camera_, folder.c_str(), name.c_str(), &info, ctx_),
          "file_get_info", join_remote(folder, name));
    if (info.file.fields & GP_FILE_INFO_MTIME) return info.file.mtime;
    return 0;
  }

  std::string readFile(const std::string& folder, const std::string& name) override {
    const std::string path = join_remote(folder, name);
    CameraFile* raw = nullptr;
    check(gp_file_new(&raw), "file_new", path);
    FilePtr file(raw);
    check(gp_camera_file_get(camera_, folder.c_str(), name.c_str(), GP_FILE_TYPE_NORMAL,
                             file.get(), ctx_),
          "file_get", path);
    const char* data = nullptr;
    unsigned long size = 0;
    check(gp_file_get_data_and_size(file.get(), &data, &size), "file_get_data", path);
    return std::string(data ? data : "", data ? size : 0);
  }

private:
  GPContext*      ctx_;
  DeviceHandle    device_;
  Camera*         camera_ = nullptr;
  GPPortInfoList* ports_ = nullptr;
  bool            initialized_ = false;

  void check(int rc, const char* op, const std::string& path) const {
    if (rc >= GP_OK) return;
    std::string msg = std::string("gphoto ") + op + " failed on " + describe(device_);
    if (!path.empty()) msg += " path " + path;
    msg += ": ";
    msg += gp_result_as_string(rc);
    throw TransportError(msg);
  }

  void selectAbilities() {
    CameraAbilitiesList* abilities = nullptr;
    check(gp_abilities_list_new(&abilities), "abilities_list_new", "");
    int rc = gp_abilities_list_load(abilities, ctx_);
    int m = rc >= GP_OK ? gp_abilities_list_lookup_model(abilities, device_.model.c_str())
                        : rc;
    if (m >= GP_OK) {
      CameraAbilities a;
      rc = gp_abilities_list_get_abilities(abilities, m, &a);
      if (rc >= GP_OK) rc = gp_camera_set_abilities(camera_, a);
    } else {
      rc = m;
    }
    gp_abilities_list_free(abilities);
    check(rc, "set_abilities", "");
  }

  void selectPort() {
    check(gp_port_info_list_new(&ports_), "port_info_list_new", "");
    check(gp_port_info_list_load(ports_), "port_info_list_load", "");
    int p = gp_port_info_list_lookup_path(ports_, device_.port.c_str());
    check(p, "port_lookup", "");
    GPPortInfo info;
    check(gp_port_info_list_get_info(ports_, p, &info), "port_get_info", "");
    check(gp_camera_set_port_info(camera_, info), "set_port_info", "");
  }

  void release() {
    if (camera_) {
      if (initialized_) gp_camera_exit(camera_, ctx_);
      gp_camera_unref(camera_);
      camera_ = nullptr;
      initialized_ = false;
    }
    if (ports_) {
      gp_port_info_list_free(ports_);
      ports_ = nullptr;
    }
  }
};

} // namespace

bool parse_usb_port(const std::string& port, int& bus, int& address) {
  const std::string prefix = "usb:";
  if (port.compare(0, prefix.size(), prefix) != 0) return false;
  auto comma = port.find(',', prefix.size());
  if (comma == std::string::npos) return false;
  const std::string b = port.substr(prefix.size(), comma - prefix.size());
  const std::string a = port.substr(comma + 1);
  if (b.empty() || a.empty()) return false;
  for (char c : b + a) {
    if (c < '0' || c > '9') return false;
  }
  try {
    bus = std::stoi(b);
    address = std::stoi(a);
  } catch (const std::out_of_range&) {
    return false;
  }
  return true;
}

GPhotoGateway::GPhotoGateway() : ctx_(gp_context_new()) {
  if (!ctx_) throw TransportError("gp_context_new failed");
}

GPhotoGateway::~GPhotoGateway() {
  gp_context_unref(static_cast<GPContext*>(ctx_));
}

std::vector<DeviceHandle> GPhotoGateway::enumerate() {
  auto* ctx = static_cast<GPContext*>(ctx_);
  auto list = new_list();
  int rc = gp_camera_autodetect(list.get(), ctx);
  if (rc < GP_OK) {
    throw TransportError(std::string("gphoto autodetect failed: ") + gp_result_as_string(rc));
  }

  const auto identities = usb_identities();
  std::vector<DeviceHandle> devices;
  int n = gp_list_count(list.get());
  for (int i = 0; i < n; ++i) {
    const char* model = nullptr;
    const char* port = nullptr;
    gp_list_get_name(list.get(), i, &model);
    gp_list_get_value(list.get(), i, &port);

    DeviceHandle d;
    if (!port || !parse_usb_port(port, d.bus, d.address)) {
      spdlog::debug("skipping camera '{}' on port '{}'", model ? model : "", port ? port : "");
      continue;
    }
    d.index = static_cast<int>(devices.size());
    d.model = model ? model : "";
    d.port = port;
    auto it = identities.find({d.bus, d.address});
    UsbIdentity id = it != identities.end() ? it->second : UsbIdentity{};
    d.manufacturer = id.manufacturer;
    d.product = id.product;
    devices.push_back(std::move(d));
  }
  return devices;
}

std::unique_ptr<DeviceSession> GPhotoGateway::openSession(const DeviceHandle& handle) {
  return std::make_unique<GPhotoSession>(static_cast<GPContext*>(ctx_), handle);
}

} // namespace psm
