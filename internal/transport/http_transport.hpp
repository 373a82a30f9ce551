#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "internal/connection/health_probe.hpp"
#include "internal/transport/credential_provider.hpp"
#include "internal/transport/error_mapping.hpp"
#include "internal/transport/upload_transport.hpp"

namespace medsync::transport {

struct HttpTransportOptions {
  std::string               base_url;
  std::string               health_path = "/api/health";
  std::chrono::milliseconds connect_timeout{10000};
  bool                      verify_tls = true;
};

/*
  libcurl implementation of the upload protocol.

    POST  {base}/api/uploads/{modality}            create session
    PATCH {base}/api/uploads/sessions/{id}         append one chunk (Upload-Offset)
    POST  {base}/api/uploads/sessions/{id}/complete
    GET   {base}/api/uploads/sessions/{id}
    POST  {base}/api/uploads/sessions/{id}/cancel
    GET   {base}{health_path}                      probe, HEAD {base} as fallback

  One easy handle per request; safe to call from several workers at once.
*/
class HttpUploadTransport final : public UploadTransport, public connection::HealthProbe {
 public:
  HttpUploadTransport(HttpTransportOptions options, std::shared_ptr<CredentialProvider> credentials);

  Response<SessionInfo> CreateSession(const model::TransferDescriptor& descriptor, uint64_t chunk_size,
                                      const RequestOptions& options) override;

  Response<ChunkAck> SendChunk(const ChunkRequest& chunk, const RequestOptions& options) override;

  Response<CompletionInfo> Complete(const std::string& session_id, const RequestOptions& options) override;

  Response<SessionStatus> QueryStatus(const std::string& session_id, const RequestOptions& options) override;

  model::TransferError CancelSession(const std::string& session_id, const RequestOptions& options) override;

  bool Probe(std::chrono::milliseconds timeout) override;

 private:
  struct HttpRequest {
    std::string                    method = "GET";
    std::string                    url;
    std::vector<std::string>       headers;
    const char*                    body      = nullptr;
    std::size_t                    body_size = 0;
    std::chrono::milliseconds      timeout{60000};
    const util::CancellationToken* cancel = nullptr;
  };

  struct HttpResponse {
    int         curl_code = 0;
    std::string curl_error;
    long        status = 0;
    std::string body;
    std::string upload_offset; // Upload-Offset response header
  };

  HttpResponse Perform(const HttpRequest& request) const;

  HttpRequest JsonRequest(std::string method, std::string url, const RequestOptions& options) const;

  // Transport failure or non-2xx status, classified; OK otherwise.
  model::TransferError Classify(const HttpResponse& response, RequestKind kind) const;

  std::string SessionUrl(const std::string& session_id) const;

  HttpTransportOptions                options_;
  std::shared_ptr<CredentialProvider> credentials_;
};

} // namespace medsync::transport
