#include "internal/transport/http_transport.hpp"

#include <curl/curl.h>
#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <mutex>
#include <string_view>

#include "internal/observability/logging.hpp"
#include "medsync/upload/v1.hpp"

namespace medsync::transport {

namespace v1 = medsync::upload::v1;

using model::ErrorKind;
using model::TransferError;

namespace {

constexpr std::string_view kUploadOffsetHeader = "upload-offset:";
constexpr const char*      kAlreadyCompleted   = "already_completed";

void EnsureCurlInitialized() {
  static std::once_flag once;
  std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t OnBody(char* data, size_t size, size_t nmemb, void* userdata) {
  auto* body = static_cast<std::string*>(userdata);
  body->append(data, size * nmemb);
  return size * nmemb;
}

size_t OnHeader(char* data, size_t size, size_t nitems, void* userdata) {
  const std::string_view line(data, size * nitems);
  if (line.size() > kUploadOffsetHeader.size()) {
    const auto name = line.substr(0, kUploadOffsetHeader.size());
    const bool match =
        std::equal(name.begin(), name.end(), kUploadOffsetHeader.begin(), [](char a, char b) {
          return std::tolower(static_cast<unsigned char>(a)) == b;
        });
    if (match) {
      auto value       = line.substr(kUploadOffsetHeader.size());
      const auto begin = value.find_first_not_of(" \t");
      const auto end   = value.find_last_not_of(" \t\r\n");
      if (begin != std::string_view::npos && end != std::string_view::npos) {
        static_cast<std::string*>(userdata)->assign(value.substr(begin, end - begin + 1));
      }
    }
  }
  return size * nitems;
}

int OnTransferInfo(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
  const auto* cancel = static_cast<const util::CancellationToken*>(clientp);
  return cancel != nullptr && cancel->IsCancelled() ? 1 : 0;
}

template <typename Message>
bool ParseJson(const std::string& body, Message* out) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  return google::protobuf::util::JsonStringToMessage(body, out, options).ok();
}

std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string out;
  const auto  status = google::protobuf::util::MessageToJsonString(message, &out, options);
  if (!status.ok()) {
    MEDSYNC_LOG_ERROR("failed to encode request body", {observability::StringField("error", std::string(status.message()))});
  }
  return out;
}

std::string ServerErrorCode(const std::string& body) {
  v1::ErrorResponse error;
  if (body.empty() || !ParseJson(body, &error)) {
    return {};
  }
  return error.error();
}

bool ParseOffset(const std::string& text, uint64_t* out) {
  if (text.empty()) {
    return false;
  }
  const auto* end    = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, *out);
  return ec == std::errc() && ptr == end;
}

std::string TrimTrailingSlash(std::string url) {
  while (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  return url;
}

} // namespace

HttpUploadTransport::HttpUploadTransport(HttpTransportOptions options, std::shared_ptr<CredentialProvider> credentials)
    : options_(std::move(options)), credentials_(std::move(credentials)) {
  options_.base_url = TrimTrailingSlash(options_.base_url);
  EnsureCurlInitialized();
}

Response<SessionInfo> HttpUploadTransport::CreateSession(const model::TransferDescriptor& descriptor, uint64_t chunk_size,
                                                         const RequestOptions& options) {
  v1::CreateSessionRequest body;
  body.set_transfer_id(descriptor.id);
  body.set_file_name(descriptor.payload.file_name);
  body.set_content_type(descriptor.payload.content_type);
  body.set_total_size(descriptor.payload.total_size);
  body.set_chunk_size(chunk_size);
  body.set_model_id(descriptor.destination.model_id);
  body.set_image_type(model::ToString(descriptor.destination.modality));
  for (const auto& [key, value] : descriptor.destination.metadata) {
    (*body.mutable_metadata())[key] = value;
  }
  const auto json = ToJson(body);

  auto request =
      JsonRequest("POST", options_.base_url + "/api/uploads/" + model::ToString(descriptor.destination.modality), options);
  request.body      = json.data();
  request.body_size = json.size();

  const auto response = Perform(request);
  if (auto error = Classify(response, RequestKind::kCreateSession); !error.ok()) {
    return Response<SessionInfo>::Err(std::move(error));
  }

  v1::CreateSessionResponse created;
  if (!ParseJson(response.body, &created) || created.session_id().empty()) {
    return Response<SessionInfo>::Err(
        TransferError::Make(ErrorKind::kProtocolDesync, "create session: response has no session id", response.status));
  }
  return Response<SessionInfo>::Ok({created.session_id(), created.offset()});
}

Response<ChunkAck> HttpUploadTransport::SendChunk(const ChunkRequest& chunk, const RequestOptions& options) {
  HttpRequest request;
  request.method = "PATCH";
  request.url    = SessionUrl(chunk.session_id);
  request.headers.push_back("Content-Type: application/offset+octet-stream");
  request.headers.push_back("Upload-Offset: " + std::to_string(chunk.offset));
  request.headers.push_back("Upload-Length: " + std::to_string(chunk.total_size));
  request.body      = reinterpret_cast<const char*>(chunk.data);
  request.body_size = chunk.size;
  request.timeout   = options.timeout;
  request.cancel    = options.cancel;

  const auto response = Perform(request);
  if (response.curl_code == CURLE_OK && response.status == 409 && ServerErrorCode(response.body) == kAlreadyCompleted) {
    ChunkAck ack;
    ack.offset            = chunk.total_size;
    ack.session_completed = true;
    return Response<ChunkAck>::Ok(ack);
  }
  if (auto error = Classify(response, RequestKind::kChunk); !error.ok()) {
    return Response<ChunkAck>::Err(std::move(error));
  }

  ChunkAck    ack;
  v1::ChunkAck body;
  if (!response.body.empty() && ParseJson(response.body, &body)) {
    ack.offset = body.offset();
  }
  if (ack.offset == 0 && !ParseOffset(response.upload_offset, &ack.offset)) {
    return Response<ChunkAck>::Err(
        TransferError::Make(ErrorKind::kProtocolDesync, "chunk acknowledgement carries no offset", response.status));
  }
  return Response<ChunkAck>::Ok(ack);
}

Response<CompletionInfo> HttpUploadTransport::Complete(const std::string& session_id, const RequestOptions& options) {
  auto request      = JsonRequest("POST", SessionUrl(session_id) + "/complete", options);
  request.body      = "{}";
  request.body_size = 2;

  const auto response = Perform(request);
  if (response.curl_code == CURLE_OK && response.status == 409 && ServerErrorCode(response.body) == kAlreadyCompleted) {
    CompletionInfo info;
    info.already_completed = true;
    v1::CompleteResponse body;
    if (ParseJson(response.body, &body)) {
      info.result_id = body.result_id();
    }
    return Response<CompletionInfo>::Ok(std::move(info));
  }
  if (auto error = Classify(response, RequestKind::kComplete); !error.ok()) {
    return Response<CompletionInfo>::Err(std::move(error));
  }

  CompletionInfo       info;
  v1::CompleteResponse body;
  if (!response.body.empty() && ParseJson(response.body, &body)) {
    info.result_id = body.result_id();
  }
  return Response<CompletionInfo>::Ok(std::move(info));
}

Response<SessionStatus> HttpUploadTransport::QueryStatus(const std::string& session_id, const RequestOptions& options) {
  const auto response = Perform(JsonRequest("GET", SessionUrl(session_id), options));
  if (auto error = Classify(response, RequestKind::kStatus); !error.ok()) {
    return Response<SessionStatus>::Err(std::move(error));
  }

  v1::SessionStatus body;
  if (!ParseJson(response.body, &body)) {
    return Response<SessionStatus>::Err(
        TransferError::Make(ErrorKind::kProtocolDesync, "session status: unparseable response", response.status));
  }
  SessionStatus status;
  status.session_id = body.session_id().empty() ? session_id : body.session_id();
  status.offset     = body.offset();
  status.total_size = body.total_size();
  status.state      = body.state();
  return Response<SessionStatus>::Ok(std::move(status));
}

TransferError HttpUploadTransport::CancelSession(const std::string& session_id, const RequestOptions& options) {
  auto request      = JsonRequest("POST", SessionUrl(session_id) + "/cancel", options);
  request.body      = "{}";
  request.body_size = 2;
  return Classify(Perform(request), RequestKind::kCancel);
}

bool HttpUploadTransport::Probe(std::chrono::milliseconds timeout) {
  HttpRequest health;
  health.url     = options_.base_url + options_.health_path;
  health.timeout = timeout;

  const auto response = Perform(health);
  if (response.curl_code != CURLE_OK) {
    return false;
  }
  if (response.status >= 200 && response.status < 300) {
    return true;
  }

  // No health endpoint: any answer from the server short of a 5xx counts.
  HttpRequest head;
  head.method  = "HEAD";
  head.url     = options_.base_url;
  head.timeout = timeout;

  const auto fallback = Perform(head);
  return fallback.curl_code == CURLE_OK && fallback.status > 0 && fallback.status < 500;
}

HttpUploadTransport::HttpResponse HttpUploadTransport::Perform(const HttpRequest& request) const {
  HttpResponse response;

  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> easy(curl_easy_init(), &curl_easy_cleanup);
  if (!easy) {
    response.curl_code  = CURLE_FAILED_INIT;
    response.curl_error = "curl_easy_init failed";
    return response;
  }

  std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(nullptr, &curl_slist_free_all);
  auto append_header = [&](const std::string& line) {
    if (auto* next = curl_slist_append(headers.get(), line.c_str())) {
      headers.release();
      headers.reset(next);
    }
  };
  for (const auto& line : request.headers) {
    append_header(line);
  }
  if (auto token = credentials_ ? credentials_->BearerToken() : std::nullopt) {
    append_header("Authorization: Bearer " + *token);
  }
  // libcurl adds "Expect: 100-continue" to large bodies otherwise
  append_header("Expect:");

  char error_buffer[CURL_ERROR_SIZE] = {0};

  CURL* h = easy.get();
  curl_easy_setopt(h, CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(h, CURLOPT_ERRORBUFFER, error_buffer);
  curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
  curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options_.connect_timeout.count()));
  curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, options_.verify_tls ? 1L : 0L);
  curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, options_.verify_tls ? 2L : 0L);
  curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, OnBody);
  curl_easy_setopt(h, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, OnHeader);
  curl_easy_setopt(h, CURLOPT_HEADERDATA, &response.upload_offset);
  curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, OnTransferInfo);
  curl_easy_setopt(h, CURLOPT_XFERINFODATA, const_cast<util::CancellationToken*>(request.cancel));

  if (request.method == "HEAD") {
    curl_easy_setopt(h, CURLOPT_NOBODY, 1L);
  } else if (request.method != "GET") {
    if (request.method == "POST") {
      curl_easy_setopt(h, CURLOPT_POST, 1L);
    } else {
      curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }
    curl_easy_setopt(h, CURLOPT_POSTFIELDS, request.body != nullptr ? request.body : "");
    curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body_size));
  }

  const CURLcode rc  = curl_easy_perform(h);
  response.curl_code = rc;
  if (rc != CURLE_OK) {
    response.curl_error = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(rc);
    return response;
  }
  curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &response.status);
  return response;
}

HttpUploadTransport::HttpRequest HttpUploadTransport::JsonRequest(std::string method, std::string url,
                                                                  const RequestOptions& options) const {
  HttpRequest request;
  request.method  = std::move(method);
  request.url     = std::move(url);
  request.timeout = options.timeout;
  request.cancel  = options.cancel;
  request.headers.push_back("Accept: application/json");
  if (request.method != "GET") {
    request.headers.push_back("Content-Type: application/json");
  }
  return request;
}

TransferError HttpUploadTransport::Classify(const HttpResponse& response, RequestKind kind) const {
  if (response.curl_code != CURLE_OK) {
    return ClassifyCurlResult(response.curl_code, response.curl_error);
  }
  if (response.status >= 200 && response.status < 300) {
    return {};
  }
  v1::ErrorResponse error;
  std::string       detail;
  if (!response.body.empty() && ParseJson(response.body, &error)) {
    detail = error.message();
  }
  return ClassifyHttpStatus(response.status, kind, error.error(), detail);
}

std::string HttpUploadTransport::SessionUrl(const std::string& session_id) const {
  return options_.base_url + "/api/uploads/sessions/" + session_id;
}

} // namespace medsync::transport
