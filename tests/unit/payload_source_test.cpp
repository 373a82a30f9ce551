#include "internal/payload/payload_source.hpp"

#include <arrow/buffer.h>

#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>

#include "fake_upload_server.hpp"
#include "internal/payload/payload_spool.hpp"

namespace {

using namespace medsync;

std::string AsString(const std::shared_ptr<arrow::Buffer>& buffer) {
  return buffer->ToString();
}

void TestPositionalReadsFromFile() {
  const auto dir   = medsync::testing::TempDir("payload_source_file");
  const auto bytes = medsync::testing::PatternBytes(10'000);
  const auto path  = medsync::testing::WriteFile(dir / "scan.dcm", bytes);

  auto opened = payload::PayloadSource::OpenFile(path);
  assert(opened.ok());
  auto source = opened.ValueOrDie();
  assert(source->size() == bytes.size());

  // reads do not depend on each other's position
  auto tail = source->ReadAt(9000, 1000);
  auto head = source->ReadAt(0, 4096);
  assert(tail.ok() && head.ok());
  assert(AsString(*tail) == bytes.substr(9000, 1000));
  assert(AsString(*head) == bytes.substr(0, 4096));

  assert(!source->ReadAt(9000, 1001).ok());
  assert(!source->ReadAt(10'001, 0).ok());
  assert(source->ReadAt(10'000, 0).ok());

  assert(source->Close().ok());
}

void TestMissingFile() {
  const auto dir = medsync::testing::TempDir("payload_source_missing");
  assert(!payload::PayloadSource::OpenFile((dir / "absent.dcm").string()).ok());
}

void TestBufferSource() {
  auto source = payload::PayloadSource::FromBuffer(arrow::Buffer::FromString("0123456789"));
  assert(source->size() == 10);

  auto middle = source->ReadAt(3, 4);
  assert(middle.ok());
  assert(AsString(*middle) == "3456");
  assert(!source->ReadAt(8, 3).ok());
}

void TestSpoolWriteAndDiscard() {
  const auto dir = medsync::testing::TempDir("payload_spool") / "nested" / "spool";
  payload::PayloadSpool spool(dir.string());
  assert(spool.Directory() == dir.string());

  auto written = spool.Write("transfer-1", arrow::Buffer::FromString("spooled payload"));
  assert(written.ok());
  const auto path = *written;
  assert(std::filesystem::exists(path));
  assert(!std::filesystem::exists(path + ".partial"));

  auto reread = payload::PayloadSource::OpenFile(path);
  assert(reread.ok());
  assert(AsString(*reread.ValueOrDie()->ReadAt(0, 15)) == "spooled payload");

  // caller-owned files are never touched
  model::PayloadRef owned;
  owned.path    = path;
  owned.spooled = false;
  spool.Discard(owned);
  assert(std::filesystem::exists(path));

  model::PayloadRef spooled = owned;
  spooled.spooled           = true;
  spool.Discard(spooled);
  assert(!std::filesystem::exists(path));

  // already gone is fine
  spool.Discard(spooled);
}

void TestFailedSpoolWriteLeavesNothingBehind() {
  const auto dir = medsync::testing::TempDir("payload_spool_failure");
  payload::PayloadSpool spool(dir.string());

  // the temp path is taken by a directory, so the output stream cannot open
  const auto partial = dir / "transfer-2.bin.partial";
  std::filesystem::create_directories(partial);

  auto written = spool.Write("transfer-2", arrow::Buffer::FromString("never lands"));
  assert(!written.ok());
  assert(!std::filesystem::exists(partial));
  assert(!std::filesystem::exists(dir / "transfer-2.bin"));

  // the id is usable again once the path is clear
  auto retried = spool.Write("transfer-2", arrow::Buffer::FromString("lands"));
  assert(retried.ok());
  assert(std::filesystem::file_size(*retried) == 5);
  assert(!std::filesystem::exists(partial));
}

} // namespace

int main() {
  TestPositionalReadsFromFile();
  TestMissingFile();
  TestBufferSource();
  TestSpoolWriteAndDiscard();
  TestFailedSpoolWriteLeavesNothingBehind();

  std::cout << "payload_source_unit_test: pass\n";
  return 0;
}
