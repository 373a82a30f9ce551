#pragma once

#include <filesystem>
#include <optional>

namespace medsync::connection {

// Coarse link-layer reachability reported by the operating system.
class PlatformSignal {
 public:
  virtual ~PlatformSignal() = default;

  // nullopt when the platform cannot tell.
  virtual std::optional<bool> IsOnline() = 0;
};

/*
  Linux: online when any non-loopback interface under /sys/class/net reports
  carrier (or operstate "up").
*/
class SysfsCarrierSignal final : public PlatformSignal {
 public:
  explicit SysfsCarrierSignal(std::filesystem::path root = "/sys/class/net");

  std::optional<bool> IsOnline() override;

 private:
  std::filesystem::path root_;
};

} // namespace medsync::connection
