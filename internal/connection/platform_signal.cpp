#include "internal/connection/platform_signal.hpp"

#include <fstream>
#include <string>
#include <system_error>

namespace medsync::connection {

namespace fs = std::filesystem;

namespace {

std::optional<std::string> ReadFirstLine(const fs::path& path) {
  std::ifstream in(path);
  if (!in.good()) {
    return std::nullopt;
  }
  std::string line;
  std::getline(in, line);
  return line;
}

} // namespace

SysfsCarrierSignal::SysfsCarrierSignal(fs::path root) : root_(std::move(root)) {
}

std::optional<bool> SysfsCarrierSignal::IsOnline() {
  std::error_code ec;
  fs::directory_iterator it(root_, ec);
  if (ec) {
    return std::nullopt;
  }

  bool seen_interface = false;
  for (const auto& entry : it) {
    const auto name = entry.path().filename().string();
    if (name == "lo") {
      continue;
    }

    // carrier is unreadable while the interface is administratively down
    if (auto carrier = ReadFirstLine(entry.path() / "carrier")) {
      seen_interface = true;
      if (*carrier == "1") {
        return true;
      }
      continue;
    }
    if (auto state = ReadFirstLine(entry.path() / "operstate")) {
      seen_interface = true;
      if (*state == "up") {
        return true;
      }
    }
  }

  if (!seen_interface) {
    return std::nullopt;
  }
  return false;
}

} // namespace medsync::connection
