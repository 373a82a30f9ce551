#pragma once

#include <mutex>
#include <optional>
#include <string>

namespace medsync::transport {

class CredentialProvider {
 public:
  virtual ~CredentialProvider() = default;

  // Bearer token for the next request; nullopt when none is configured.
  virtual std::optional<std::string> BearerToken() = 0;
};

class StaticCredentialProvider final : public CredentialProvider {
 public:
  explicit StaticCredentialProvider(std::string token);

  std::optional<std::string> BearerToken() override;

  void Update(std::string token);

 private:
  std::mutex  mutex_;
  std::string token_;
};

/*
  Reads the token from a file on every call so that an external agent can
  rotate it; ResumeAfterReauth picks up the new value without a restart.
*/
class FileCredentialProvider final : public CredentialProvider {
 public:
  explicit FileCredentialProvider(std::string path);

  std::optional<std::string> BearerToken() override;

 private:
  std::string path_;
};

} // namespace medsync::transport
