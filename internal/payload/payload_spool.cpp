#include "internal/payload/payload_spool.hpp"

#include <arrow/io/file.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>

#include "internal/observability/logging.hpp"

namespace medsync::payload {

namespace fs = std::filesystem;

namespace {

// The queue row that points at the file commits right after this returns,
// so the bytes must be on disk first.
arrow::Status WriteDurably(const std::string& path, const std::shared_ptr<arrow::Buffer>& buffer) {
  ARROW_ASSIGN_OR_RAISE(auto out, arrow::io::FileOutputStream::Open(path));
  ARROW_RETURN_NOT_OK(out->Write(buffer));
  ARROW_RETURN_NOT_OK(out->Flush());
  if (::fsync(out->file_descriptor()) != 0) {
    const int err = errno;
    ARROW_RETURN_NOT_OK(out->Close());
    return arrow::Status::IOError("fsync ", path, ": ", std::strerror(err));
  }
  return out->Close();
}

} // namespace

PayloadSpool::PayloadSpool(std::string directory) : directory_(std::move(directory)) {
}

arrow::Result<std::string> PayloadSpool::Write(const std::string& transfer_id, const std::shared_ptr<arrow::Buffer>& buffer) {
  std::error_code ec;
  fs::create_directories(directory_, ec);
  if (ec) {
    return arrow::Status::IOError("cannot create spool directory ", directory_, ": ", ec.message());
  }

  const auto final_path = fs::path(directory_) / (transfer_id + ".bin");
  const auto temp_path  = fs::path(directory_) / (transfer_id + ".bin.partial");

  auto written = WriteDurably(temp_path.string(), buffer);
  if (!written.ok()) {
    fs::remove(temp_path, ec);
    return written;
  }

  fs::rename(temp_path, final_path, ec);
  if (ec) {
    fs::remove(temp_path, ec);
    return arrow::Status::IOError("cannot publish spooled payload ", final_path.string());
  }
  return final_path.string();
}

void PayloadSpool::Discard(const model::PayloadRef& payload) const {
  if (!payload.spooled || payload.path.empty()) {
    return;
  }
  std::error_code ec;
  fs::remove(payload.path, ec);
  if (ec) {
    MEDSYNC_LOG_WARN("failed to remove spooled payload", {observability::StringField("path", payload.path),
                                                          observability::StringField("error", ec.message())});
  }
}

} // namespace medsync::payload
