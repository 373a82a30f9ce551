#pragma once

#include <arrow/buffer.h>
#include <arrow/io/interfaces.h>
#include <arrow/result.h>
#include <arrow/status.h>

#include <cstdint>
#include <memory>
#include <string>

namespace medsync::payload {

/*
  Random-access view over the bytes of one transfer.

  Backed by an arrow::io::RandomAccessFile, so a chunk read is a positional
  read (no shared cursor) and a source may be reopened at any offset after a
  restart.
*/
class PayloadSource {
 public:
  static arrow::Result<std::shared_ptr<PayloadSource>> OpenFile(const std::string& path);
  static std::shared_ptr<PayloadSource>                 FromBuffer(std::shared_ptr<arrow::Buffer> buffer);

  uint64_t size() const {
    return size_;
  }

  arrow::Result<std::shared_ptr<arrow::Buffer>> ReadAt(uint64_t offset, uint64_t length) const;

  arrow::Status Close();

 private:
  PayloadSource(std::shared_ptr<arrow::io::RandomAccessFile> file, uint64_t size);

  std::shared_ptr<arrow::io::RandomAccessFile> file_;
  uint64_t                                     size_ = 0;
};

} // namespace medsync::payload
