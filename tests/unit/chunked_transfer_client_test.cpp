#include "internal/transfer/chunked_transfer_client.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "fake_upload_server.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/queue/transfer_queue.hpp"

namespace {

using namespace medsync;
using medsync::testing::FakeUploadServer;

constexpr uint64_t kMiB = 1024 * 1024;

struct Harness {
  std::shared_ptr<FakeUploadServer>                server;
  std::shared_ptr<queue::TransferQueue>            queue;
  std::shared_ptr<retry::RetryScheduler>           retry;
  std::shared_ptr<transfer::ChunkedTransferClient> client;
};

Harness MakeHarness(uint64_t chunk_size, uint32_t chunk_retry_attempts = 3) {
  Harness h;
  h.server = std::make_shared<FakeUploadServer>();
  h.queue  = std::make_shared<queue::TransferQueue>(std::make_shared<db::memory::MemoryTransferRepository>());
  h.queue->Load();

  config::RetryOptions retry_options;
  retry_options.chunk_retry_base = std::chrono::milliseconds(1);
  h.retry                        = std::make_shared<retry::RetryScheduler>(retry_options, 42);

  config::TransferOptions options;
  options.chunk_size_bytes     = chunk_size;
  options.chunk_retry_attempts = chunk_retry_attempts;

  h.client = std::make_shared<transfer::ChunkedTransferClient>(options, h.server, h.queue, h.retry,
                                                               [] { return model::ConnectionQuality::kGood; });
  return h;
}

// Enqueues a descriptor for `path` and claims it the way the engine does.
model::TransferDescriptor Claim(Harness& h, const std::string& path, uint64_t size) {
  model::TransferDescriptor descriptor;
  descriptor.payload.path       = path;
  descriptor.payload.total_size = size;
  descriptor.payload.file_name  = "scan.dcm";
  descriptor.destination.modality = model::Modality::kCt;
  h.queue->Enqueue(descriptor);

  auto claimed = h.queue->DequeueNext(util::Now());
  assert(claimed.has_value());
  assert(claimed->status == model::TransferStatus::kUploading);
  return *claimed;
}

model::TransferDescriptor Reclaim(Harness& h, const std::string& id) {
  h.queue->ReleaseClaim(id, util::Now());
  auto claimed = h.queue->DequeueNext(util::Now());
  assert(claimed.has_value());
  assert(claimed->id == id);
  return *claimed;
}

void TestTwelveMegabytesInThreeChunks() {
  auto       h     = MakeHarness(5 * kMiB);
  const auto dir   = medsync::testing::TempDir("client_three_chunks");
  const auto bytes = medsync::testing::PatternBytes(12 * kMiB);
  const auto path  = medsync::testing::WriteFile(dir / "scan.dcm", bytes);

  auto                  descriptor = Claim(h, path, bytes.size());
  util::CancellationToken cancel;
  std::vector<uint64_t> progress;

  auto result = h.client->Upload(descriptor, cancel, [&](uint64_t sent, uint64_t total) {
    assert(total == bytes.size());
    progress.push_back(sent);
  });

  assert(result);
  assert(!result.value.already_completed);
  assert(result.value.bytes_sent == bytes.size());

  const auto calls = h.server->ChunkCalls();
  assert(calls.size() == 3);
  assert(calls[0].offset == 0 && calls[0].size == 5 * kMiB);
  assert(calls[1].offset == 5 * kMiB && calls[1].size == 5 * kMiB);
  assert(calls[2].offset == 10 * kMiB && calls[2].size == 2 * kMiB);
  assert(h.server->CreateCalls() == 1);
  assert(h.server->CompleteCalls() == 1);

  assert((progress == std::vector<uint64_t>{5 * kMiB, 10 * kMiB, 12 * kMiB}));

  const auto stored = h.queue->Get(descriptor.id);
  assert(stored.has_value());
  assert(stored->offset == bytes.size());
  assert(stored->session_id == descriptor.session_id);
}

void TestReassembledBytesMatchSource() {
  auto       h     = MakeHarness(64 * 1024);
  const auto dir   = medsync::testing::TempDir("client_checksum");
  const auto bytes = medsync::testing::PatternBytes(1'000'003, 11);
  const auto path  = medsync::testing::WriteFile(dir / "report.pdf", bytes);

  auto                    descriptor = Claim(h, path, bytes.size());
  util::CancellationToken cancel;

  // transient failures inside the chunk retry budget are invisible to the caller
  h.server->FailNextChunks(2, model::ErrorKind::kNetworkTransient);

  auto result = h.client->Upload(descriptor, cancel, {});
  assert(result);

  const auto sessions = h.server->Sessions();
  const auto& session = sessions.at(descriptor.session_id);
  assert(session.completed);
  assert(session.bytes.size() == bytes.size());
  assert(medsync::testing::Checksum(session.bytes) == medsync::testing::Checksum(bytes));
}

void TestResumeStartsAtCheckpointedOffset() {
  auto       h     = MakeHarness(5 * kMiB, 2);
  const auto dir   = medsync::testing::TempDir("client_resume");
  const auto bytes = medsync::testing::PatternBytes(12 * kMiB, 3);
  const auto path  = medsync::testing::WriteFile(dir / "scan.dcm", bytes);

  auto                    descriptor = Claim(h, path, bytes.size());
  util::CancellationToken cancel;

  // first chunk lands, then the link drops for longer than the chunk retry budget
  std::size_t acked = 0;
  auto        first = h.client->Upload(descriptor, cancel, [&](uint64_t, uint64_t) {
    if (++acked == 1) {
      h.server->FailNextChunks(2, model::ErrorKind::kNetworkTransient);
    }
  });
  assert(!first);
  assert(first.error.kind == model::ErrorKind::kNetworkTransient);
  assert(h.queue->Get(descriptor.id)->offset == 5 * kMiB);

  const auto calls_before = h.server->ChunkCalls().size();

  auto resumed = Reclaim(h, descriptor.id);
  assert(resumed.offset == 5'242'880);
  assert(!resumed.session_id.empty());

  auto second = h.client->Upload(resumed, cancel, {});
  assert(second);
  assert(second.value.bytes_sent == 7 * kMiB);

  const auto calls = h.server->ChunkCalls();
  assert(calls[calls_before].offset == 5'242'880);
  assert(h.server->CreateCalls() == 1);

  const auto& session = h.server->Sessions().at(resumed.session_id);
  assert(medsync::testing::Checksum(session.bytes) == medsync::testing::Checksum(bytes));
}

void TestDesyncRestartsFromZero() {
  auto       h     = MakeHarness(1024);
  const auto dir   = medsync::testing::TempDir("client_desync");
  const auto bytes = medsync::testing::PatternBytes(4096, 5);
  const auto path  = medsync::testing::WriteFile(dir / "scan.dcm", bytes);

  auto                    descriptor = Claim(h, path, bytes.size());
  util::CancellationToken cancel;

  // server claims to have received more than was sent
  h.server->SetAckSkew(17);
  auto result = h.client->Upload(descriptor, cancel, {});
  assert(!result);
  assert(result.error.kind == model::ErrorKind::kProtocolDesync);
  assert(descriptor.offset == 0);
  assert(descriptor.session_id.empty());

  const auto stored = h.queue->Get(descriptor.id);
  assert(stored->offset == 0);
  assert(stored->session_id.empty());

  // next attempt opens a fresh session and succeeds
  h.server->SetAckSkew(0);
  auto retried = Reclaim(h, descriptor.id);
  auto again   = h.client->Upload(retried, cancel, {});
  assert(again);
  assert(h.server->CreateCalls() == 2);
  assert(h.server->ChunkCalls().back().offset == 3072);
}

void TestServerDesyncErrorRestarts() {
  auto       h     = MakeHarness(1024);
  const auto dir   = medsync::testing::TempDir("client_desync_409");
  const auto bytes = medsync::testing::PatternBytes(2048, 9);
  const auto path  = medsync::testing::WriteFile(dir / "scan.dcm", bytes);

  auto                    descriptor = Claim(h, path, bytes.size());
  util::CancellationToken cancel;

  h.server->FailNextChunks(1, model::ErrorKind::kProtocolDesync, 409);
  auto result = h.client->Upload(descriptor, cancel, {});
  assert(!result);
  assert(result.error.kind == model::ErrorKind::kProtocolDesync);
  assert(result.error.http_status == 409);
  assert(h.queue->Get(descriptor.id)->session_id.empty());
}

void TestChunkRetryBudgetExhausted() {
  auto       h     = MakeHarness(1024, 3);
  const auto dir   = medsync::testing::TempDir("client_retry_budget");
  const auto bytes = medsync::testing::PatternBytes(2048);
  const auto path  = medsync::testing::WriteFile(dir / "scan.dcm", bytes);

  auto                    descriptor = Claim(h, path, bytes.size());
  util::CancellationToken cancel;

  h.server->FailNextChunks(3, model::ErrorKind::kNetworkTransient);
  auto result = h.client->Upload(descriptor, cancel, {});
  assert(!result);
  assert(result.error.kind == model::ErrorKind::kNetworkTransient);
  // K sends of the first chunk, nothing after
  assert(h.server->ChunkCalls().size() == 3);
  assert(h.queue->Get(descriptor.id)->offset == 0);
}

void TestCompletionOnlyWhenAllBytesSent() {
  auto       h     = MakeHarness(1024);
  const auto dir   = medsync::testing::TempDir("client_completion_only");
  const auto bytes = medsync::testing::PatternBytes(3000);
  const auto path  = medsync::testing::WriteFile(dir / "scan.dcm", bytes);

  auto                    descriptor = Claim(h, path, bytes.size());
  util::CancellationToken cancel;

  // every byte is acknowledged but the completion call never answers
  h.server->FailNextCompletes(3, model::ErrorKind::kNetworkTransient);
  auto first = h.client->Upload(descriptor, cancel, {});
  assert(!first);
  assert(first.error.kind == model::ErrorKind::kNetworkTransient);
  assert(h.queue->Get(descriptor.id)->offset == bytes.size());

  const auto chunk_calls = h.server->ChunkCalls().size();

  auto resumed = Reclaim(h, descriptor.id);
  auto second  = h.client->Upload(resumed, cancel, {});
  assert(second);
  assert(second.value.bytes_sent == 0);
  assert(h.server->ChunkCalls().size() == chunk_calls);
}

void TestAlreadyCompletedSessionIsSuccess() {
  auto       h     = MakeHarness(1024);
  const auto dir   = medsync::testing::TempDir("client_already_completed");
  const auto bytes = medsync::testing::PatternBytes(4096);
  const auto path  = medsync::testing::WriteFile(dir / "scan.dcm", bytes);

  auto                    descriptor = Claim(h, path, bytes.size());
  util::CancellationToken cancel;

  h.server->FailNextChunks(3, model::ErrorKind::kNetworkTransient);
  auto first = h.client->Upload(descriptor, cancel, {});
  assert(!first);
  assert(!descriptor.session_id.empty());

  // another client finished the session while we were away
  auto resumed = Reclaim(h, descriptor.id);
  h.server->CompleteOutOfBand(resumed.session_id);

  auto second = h.client->Upload(resumed, cancel, {});
  assert(second);
  assert(second.value.already_completed);
  assert(h.server->Completed() == 1);
}

void TestCancelledBeforeAnyRequest() {
  auto       h     = MakeHarness(1024);
  const auto dir   = medsync::testing::TempDir("client_cancel");
  const auto bytes = medsync::testing::PatternBytes(4096);
  const auto path  = medsync::testing::WriteFile(dir / "scan.dcm", bytes);

  auto                    descriptor = Claim(h, path, bytes.size());
  util::CancellationToken cancel;
  cancel.Cancel(util::CancelReason::kUser);

  auto result = h.client->Upload(descriptor, cancel, {});
  assert(!result);
  assert(result.error.kind == model::ErrorKind::kCancelled);
  assert(h.server->CreateCalls() == 0);
  assert(h.server->ChunkCalls().empty());
}

void TestCancelledBetweenChunks() {
  auto       h     = MakeHarness(1024);
  const auto dir   = medsync::testing::TempDir("client_cancel_mid");
  const auto bytes = medsync::testing::PatternBytes(4096);
  const auto path  = medsync::testing::WriteFile(dir / "scan.dcm", bytes);

  auto                    descriptor = Claim(h, path, bytes.size());
  util::CancellationToken cancel;

  auto result = h.client->Upload(descriptor, cancel, [&](uint64_t sent, uint64_t) {
    if (sent == 2048) {
      cancel.Cancel(util::CancelReason::kShutdown);
    }
  });
  assert(!result);
  assert(result.error.kind == model::ErrorKind::kCancelled);
  assert(h.server->ChunkCalls().size() == 2);
  // the acknowledged prefix is durable
  assert(h.queue->Get(descriptor.id)->offset == 2048);
}

void TestMissingOrChangedPayloadIsInvalid() {
  auto       h   = MakeHarness(1024);
  const auto dir = medsync::testing::TempDir("client_invalid");

  auto                    missing = Claim(h, (dir / "gone.dcm").string(), 10);
  util::CancellationToken cancel;
  auto                    result = h.client->Upload(missing, cancel, {});
  assert(!result);
  assert(result.error.kind == model::ErrorKind::kPayloadInvalid);

  const auto path    = medsync::testing::WriteFile(dir / "short.dcm", medsync::testing::PatternBytes(100));
  auto       changed = Claim(h, path, 200);
  result             = h.client->Upload(changed, cancel, {});
  assert(!result);
  assert(result.error.kind == model::ErrorKind::kPayloadInvalid);
  assert(h.server->CreateCalls() == 0);
}

void TestChunkTimeoutScalesWithQuality() {
  const std::chrono::milliseconds base(1000);
  assert(transfer::ChunkTimeoutFor(base, model::ConnectionQuality::kGood) == base);
  assert(transfer::ChunkTimeoutFor(base, model::ConnectionQuality::kFair) == base * 2);
  assert(transfer::ChunkTimeoutFor(base, model::ConnectionQuality::kPoor) == base * 4);
}

} // namespace

int main() {
  TestTwelveMegabytesInThreeChunks();
  TestReassembledBytesMatchSource();
  TestResumeStartsAtCheckpointedOffset();
  TestDesyncRestartsFromZero();
  TestServerDesyncErrorRestarts();
  TestChunkRetryBudgetExhausted();
  TestCompletionOnlyWhenAllBytesSent();
  TestAlreadyCompletedSessionIsSuccess();
  TestCancelledBeforeAnyRequest();
  TestCancelledBetweenChunks();
  TestMissingOrChangedPayloadIsInvalid();
  TestChunkTimeoutScalesWithQuality();

  std::cout << "chunked_transfer_client_unit_test: pass\n";
  return 0;
}
