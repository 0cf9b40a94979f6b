#pragma once
#include <memory>
#include <string>
#include <vector>

#include "DeviceGateway.hpp"

namespace psm {

// A mounted memory card (or any directory) exposed as a single device.
// Entries are listed in name order so walks are deterministic.
class FolderGateway : public DeviceGateway {
public:
  explicit FolderGateway(std::string root);

  // One device while the root directory exists, none otherwise.
  std::vector<DeviceHandle> enumerate() override;

protected:
  std::unique_ptr<DeviceSession> openSession(const DeviceHandle& handle) override;

private:
  std::string root_;
};

} // namespace psm
