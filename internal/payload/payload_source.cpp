#include "internal/payload/payload_source.hpp"

#include <arrow/io/file.h>
#include <arrow/io/memory.h>

namespace medsync::payload {

PayloadSource::PayloadSource(std::shared_ptr<arrow::io::RandomAccessFile> file, uint64_t size)
    : file_(std::move(file)), size_(size) {
}

arrow::Result<std::shared_ptr<PayloadSource>> PayloadSource::OpenFile(const std::string& path) {
  ARROW_ASSIGN_OR_RAISE(auto file, arrow::io::ReadableFile::Open(path));
  ARROW_ASSIGN_OR_RAISE(auto size, file->GetSize());
  if (size < 0) {
    return arrow::Status::IOError("negative size reported for ", path);
  }
  return std::shared_ptr<PayloadSource>(new PayloadSource(std::move(file), static_cast<uint64_t>(size)));
}

std::shared_ptr<PayloadSource> PayloadSource::FromBuffer(std::shared_ptr<arrow::Buffer> buffer) {
  const auto size = static_cast<uint64_t>(buffer->size());
  return std::shared_ptr<PayloadSource>(new PayloadSource(std::make_shared<arrow::io::BufferReader>(std::move(buffer)), size));
}

arrow::Result<std::shared_ptr<arrow::Buffer>> PayloadSource::ReadAt(uint64_t offset, uint64_t length) const {
  if (offset > size_ || length > size_ - offset) {
    return arrow::Status::IndexError("read [", offset, ", ", offset + length, ") past end of payload (", size_, " bytes)");
  }
  ARROW_ASSIGN_OR_RAISE(auto buffer, file_->ReadAt(static_cast<int64_t>(offset), static_cast<int64_t>(length)));
  if (static_cast<uint64_t>(buffer->size()) != length) {
    return arrow::Status::IOError("short read at offset ", offset, ": wanted ", length, " got ", buffer->size());
  }
  return buffer;
}

arrow::Status PayloadSource::Close() {
  return file_->Close();
}

} // namespace medsync::payload
