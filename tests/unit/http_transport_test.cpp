#include <curl/curl.h>

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>

#include "fake_upload_server.hpp"
#include "internal/transport/credential_provider.hpp"
#include "internal/transport/error_mapping.hpp"
#include "internal/transport/http_transport.hpp"

namespace {

using namespace medsync;
using model::ErrorKind;
using transport::ClassifyCurlResult;
using transport::ClassifyHttpStatus;
using transport::RequestKind;

ErrorKind Kind(long status, RequestKind kind = RequestKind::kChunk) {
  return ClassifyHttpStatus(status, kind, "", "").kind;
}

void TestHttpStatusClassification() {
  assert(Kind(200) == ErrorKind::kNone);
  assert(Kind(201, RequestKind::kCreateSession) == ErrorKind::kNone);
  assert(Kind(204) == ErrorKind::kNone);

  assert(Kind(401) == ErrorKind::kAuthExpired);
  assert(Kind(403, RequestKind::kComplete) == ErrorKind::kAuthExpired);

  assert(Kind(408) == ErrorKind::kNetworkTransient);
  assert(Kind(429) == ErrorKind::kNetworkTransient);
  assert(Kind(500) == ErrorKind::kNetworkTransient);
  assert(Kind(503, RequestKind::kCreateSession) == ErrorKind::kNetworkTransient);

  assert(Kind(409) == ErrorKind::kProtocolDesync);
  assert(Kind(404) == ErrorKind::kProtocolDesync);
  assert(Kind(410, RequestKind::kComplete) == ErrorKind::kProtocolDesync);
  assert(Kind(404, RequestKind::kCreateSession) == ErrorKind::kPayloadInvalid);

  assert(Kind(400, RequestKind::kCreateSession) == ErrorKind::kPayloadInvalid);
  assert(Kind(413) == ErrorKind::kPayloadInvalid);
  assert(Kind(422, RequestKind::kCreateSession) == ErrorKind::kPayloadInvalid);
}

void TestHttpErrorCarriesStatusAndDetail() {
  const auto error = ClassifyHttpStatus(409, RequestKind::kChunk, "offset_mismatch", "expected 1024");
  assert(error.http_status == 409);
  assert(error.message == "HTTP 409 offset_mismatch: expected 1024");
}

void TestCurlResultClassification() {
  assert(ClassifyCurlResult(CURLE_OK, "").ok());
  assert(ClassifyCurlResult(CURLE_COULDNT_CONNECT, "").kind == ErrorKind::kNetworkTransient);
  assert(ClassifyCurlResult(CURLE_COULDNT_RESOLVE_HOST, "").kind == ErrorKind::kNetworkTransient);
  assert(ClassifyCurlResult(CURLE_OPERATION_TIMEDOUT, "").kind == ErrorKind::kNetworkTransient);
  assert(ClassifyCurlResult(CURLE_SSL_CONNECT_ERROR, "").kind == ErrorKind::kNetworkTransient);
  assert(ClassifyCurlResult(CURLE_ABORTED_BY_CALLBACK, "").kind == ErrorKind::kCancelled);
  assert(ClassifyCurlResult(CURLE_UNSUPPORTED_PROTOCOL, "").kind == ErrorKind::kEndpointInvalid);
  assert(ClassifyCurlResult(CURLE_URL_MALFORMAT, "").kind == ErrorKind::kEndpointInvalid);
}

void TestUnreachableServer() {
  transport::HttpTransportOptions options;
  // nothing listens on the discard port
  options.base_url        = "http://127.0.0.1:9";
  options.connect_timeout = std::chrono::milliseconds(500);

  transport::HttpUploadTransport http(options, std::make_shared<transport::StaticCredentialProvider>("t0k3n"));
  assert(!http.Probe(std::chrono::milliseconds(500)));

  transport::RequestOptions request;
  request.timeout = std::chrono::milliseconds(500);

  auto status = http.QueryStatus("session-1", request);
  assert(!status);
  assert(status.error.kind == ErrorKind::kNetworkTransient);

  util::CancellationToken cancel;
  cancel.Cancel(util::CancelReason::kUser);
  request.cancel = &cancel;
  auto cancelled = http.QueryStatus("session-1", request);
  assert(!cancelled);
}

void TestMisconfiguredScheme() {
  transport::HttpTransportOptions options;
  options.base_url = "gopherx://uploads.example";

  transport::HttpUploadTransport http(options, std::make_shared<transport::StaticCredentialProvider>(""));

  transport::RequestOptions request;
  request.timeout = std::chrono::milliseconds(500);
  auto status     = http.QueryStatus("session-1", request);
  assert(!status);
  assert(status.error.kind == ErrorKind::kEndpointInvalid);
}

void TestStaticCredentials() {
  transport::StaticCredentialProvider provider("  abc.def \n");
  assert(provider.BearerToken() == std::optional<std::string>("abc.def"));

  provider.Update("");
  assert(!provider.BearerToken().has_value());

  provider.Update("rotated");
  assert(provider.BearerToken() == std::optional<std::string>("rotated"));
}

void TestFileCredentialsReread() {
  const auto dir  = medsync::testing::TempDir("token_file");
  const auto path = dir / "token";

  transport::FileCredentialProvider provider(path.string());
  assert(!provider.BearerToken().has_value());

  medsync::testing::WriteFile(path, "first-token\n");
  assert(provider.BearerToken() == std::optional<std::string>("first-token"));

  medsync::testing::WriteFile(path, "second-token");
  assert(provider.BearerToken() == std::optional<std::string>("second-token"));

  medsync::testing::WriteFile(path, "   \n");
  assert(!provider.BearerToken().has_value());
}

} // namespace

int main() {
  TestHttpStatusClassification();
  TestHttpErrorCarriesStatusAndDetail();
  TestCurlResultClassification();
  TestUnreachableServer();
  TestMisconfiguredScheme();
  TestStaticCredentials();
  TestFileCredentialsReread();

  std::cout << "http_transport_unit_test: pass\n";
  return 0;
}
