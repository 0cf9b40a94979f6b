#pragma once
#include <memory>
#include <string>
#include <vector>

#include "DeviceGateway.hpp"

namespace psm {

// Parses a gphoto port path of the form "usb:BBB,DDD".
bool parse_usb_port(const std::string& port, int& bus, int& address);

// Cameras attached over USB, driven through libgphoto2. Identity strings come
// from the USB descriptors via libusb.
class GPhotoGateway : public DeviceGateway {
public:
  GPhotoGateway();
  ~GPhotoGateway() override;

  GPhotoGateway(const GPhotoGateway&) = delete;
  GPhotoGateway& operator=(const GPhotoGateway&) = delete;

  std::vector<DeviceHandle> enumerate() override;

protected:
  std::unique_ptr<DeviceSession> openSession(const DeviceHandle& handle) override;

private:
  void* ctx_; // GPContext*
};

} // namespace psm
