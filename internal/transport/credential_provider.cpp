#include "internal/transport/credential_provider.hpp"

#include <fstream>
#include <sstream>

#include "internal/observability/logging.hpp"

namespace medsync::transport {

namespace {

std::string Trim(const std::string& value) {
  const auto begin = value.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return {};
  }
  const auto end = value.find_last_not_of(" \t\r\n");
  return value.substr(begin, end - begin + 1);
}

} // namespace

StaticCredentialProvider::StaticCredentialProvider(std::string token) : token_(Trim(token)) {
}

std::optional<std::string> StaticCredentialProvider::BearerToken() {
  std::lock_guard lock(mutex_);
  if (token_.empty()) {
    return std::nullopt;
  }
  return token_;
}

void StaticCredentialProvider::Update(std::string token) {
  std::lock_guard lock(mutex_);
  token_ = Trim(token);
}

FileCredentialProvider::FileCredentialProvider(std::string path) : path_(std::move(path)) {
}

std::optional<std::string> FileCredentialProvider::BearerToken() {
  std::ifstream in(path_);
  if (!in) {
    MEDSYNC_LOG_WARN("token file unreadable", {observability::StringField("path", path_)});
    return std::nullopt;
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  auto token = Trim(buffer.str());
  if (token.empty()) {
    return std::nullopt;
  }
  return token;
}

} // namespace medsync::transport
