#include "internal/core/upload_manager.hpp"

#include <arrow/buffer.h>

#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "fake_upload_server.hpp"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace medsync;
using model::TransferStatus;

struct Fixture {
  std::shared_ptr<medsync::testing::FakeUploadServer> server;
  factory::Application                                app;
  std::filesystem::path                               dir;
};

// Nothing is started: submissions stay queued where the tests can see them.
Fixture MakeFixture(const std::string& name) {
  Fixture f;
  f.dir    = medsync::testing::TempDir(name);
  f.server = std::make_shared<medsync::testing::FakeUploadServer>();

  config::UploadOptions options;
  options.queue.backend                   = config::QueueOptions::Backend::kMemory;
  options.queue.spool_dir                 = (f.dir / "spool").string();
  options.monitor.platform_signal_enabled = false;

  factory::Collaborators collaborators;
  collaborators.transport = f.server;
  collaborators.probe     = f.server;
  f.app                   = factory::Build(options, collaborators);
  return f;
}

model::Destination Ct() {
  model::Destination destination;
  destination.modality = model::Modality::kCt;
  destination.model_id = "lung-nodule-v4";
  destination.metadata = {{"patient_ref", "anon-17"}};
  return destination;
}

template <typename E, typename F>
void ExpectThrows(F&& f) {
  bool threw = false;
  try {
    f();
  } catch (const E&) {
    threw = true;
  }
  assert(threw);
}

void FailPermanently(Fixture& f, const std::string& id) {
  auto claimed = f.app.queue->DequeueNext(util::Now());
  assert(claimed && claimed->id == id);

  queue::FailureUpdate update;
  update.error         = model::TransferError::Make(model::ErrorKind::kNetworkTransient, "gateway timeout", 504);
  update.attempt_count = 1;
  update.max_attempts  = 1;
  f.app.queue->ApplyFailure(id, update);
}

void TestSubmitFile() {
  auto       f    = MakeFixture("manager_submit_file");
  const auto path = medsync::testing::WriteFile(f.dir / "CHEST.DCM", medsync::testing::PatternBytes(4321));

  const auto id = f.app.manager->SubmitUpload(path, Ct());
  const auto d  = f.app.manager->Get(id);
  assert(d.has_value());
  assert(d->status == TransferStatus::kPending);
  assert(d->payload.total_size == 4321);
  assert(d->payload.file_name == "CHEST.DCM");
  assert(d->payload.content_type == "application/dicom");
  assert(!d->payload.spooled);
  assert(std::filesystem::path(d->payload.path).is_absolute());
  assert(d->destination.model_id == "lung-nodule-v4");
  assert(d->destination.metadata.at("patient_ref") == "anon-17");
  assert(d->offset == 0);
  assert(d->attempt_count == 0);

  core::SubmitOptions options;
  options.file_name    = "renamed.png";
  options.content_type = "image/x-custom";
  options.priority     = 4;
  const auto second    = f.app.manager->SubmitUpload(path, Ct(), options);
  assert(f.app.manager->Get(second)->payload.file_name == "renamed.png");
  assert(f.app.manager->Get(second)->payload.content_type == "image/x-custom");

  // priority first, then submission order
  const auto listed = f.app.manager->List();
  assert(listed.size() == 2);
  assert(listed[0].id == second);
  assert(listed[1].id == id);
}

void TestSubmitRejectsBadPayloads() {
  auto f = MakeFixture("manager_bad_payloads");

  ExpectThrows<util::InvalidPayload>([&] { f.app.manager->SubmitUpload((f.dir / "missing.dcm").string(), Ct()); });
  ExpectThrows<util::InvalidPayload>([&] { f.app.manager->SubmitUpload(f.dir.string(), Ct()); });

  const auto empty = medsync::testing::WriteFile(f.dir / "empty.dcm", "");
  ExpectThrows<util::InvalidPayload>([&] { f.app.manager->SubmitUpload(empty, Ct()); });

  ExpectThrows<util::InvalidPayload>([&] {
    f.app.manager->SubmitUpload(std::shared_ptr<arrow::Buffer>(), Ct());
  });
  ExpectThrows<util::InvalidPayload>([&] { f.app.manager->SubmitUpload(arrow::Buffer::FromString(""), Ct()); });

  assert(f.app.manager->Counts().total() == 0);
}

void TestSubmitBufferIsSpooled() {
  auto       f     = MakeFixture("manager_spool");
  const auto bytes = medsync::testing::PatternBytes(777);

  const auto id = f.app.manager->SubmitUpload(arrow::Buffer::FromString(bytes), Ct());
  const auto d  = f.app.manager->Get(id);
  assert(d->payload.spooled);
  assert(d->payload.total_size == bytes.size());
  assert(d->payload.file_name == id + ".bin");
  assert(d->payload.content_type == "application/octet-stream");
  assert(std::filesystem::exists(d->payload.path));
  assert(std::filesystem::file_size(d->payload.path) == bytes.size());
  assert(std::filesystem::path(d->payload.path).parent_path() == f.dir / "spool");

  f.app.manager->Cancel(id);
  assert(!std::filesystem::exists(d->payload.path));
  assert(!f.app.manager->Get(id).has_value());
}

void TestOfflineSubmissionIsHeld() {
  auto f = MakeFixture("manager_offline");
  f.app.monitor->OnPlatformSignal(false);
  assert(!f.app.manager->Connection().is_online);

  const auto path = medsync::testing::WriteFile(f.dir / "knee.dcm", medsync::testing::PatternBytes(100));
  const auto id   = f.app.manager->SubmitUpload(path, Ct());
  assert(f.app.manager->Get(id)->status == TransferStatus::kPendingOffline);
  assert(f.app.manager->Counts().pending_offline == 1);
}

void TestRetryAndClear() {
  auto       f    = MakeFixture("manager_retry_clear");
  const auto path = medsync::testing::WriteFile(f.dir / "scan.dcm", medsync::testing::PatternBytes(100));

  const auto a = f.app.manager->SubmitUpload(path, Ct());
  const auto b = f.app.manager->SubmitUpload(arrow::Buffer::FromString("spooled bytes"), Ct());
  const auto c = f.app.manager->SubmitUpload(path, Ct());

  ExpectThrows<util::InvalidState>([&] { f.app.manager->Retry(a); });
  ExpectThrows<util::InvalidState>([&] { f.app.manager->Clear(a); });
  ExpectThrows<util::NotFound>([&] { f.app.manager->Retry("nope"); });
  ExpectThrows<util::NotFound>([&] { f.app.manager->Clear("nope"); });

  FailPermanently(f, a);
  assert(f.app.manager->Counts().failed_permanently == 1);
  assert(f.app.manager->Get(a)->last_error == "gateway timeout");

  f.app.manager->Retry(a);
  auto retried = f.app.manager->Get(a);
  assert(retried->status == TransferStatus::kPending);
  assert(retried->attempt_count == 0);
  assert(f.app.manager->List().front().id == a);

  FailPermanently(f, a);
  f.app.manager->Clear(a);
  assert(!f.app.manager->Get(a).has_value());

  const auto spooled = f.app.manager->Get(b)->payload.path;
  FailPermanently(f, b);
  FailPermanently(f, c);
  assert(f.app.manager->ClearFailed() == 2);
  assert(!std::filesystem::exists(spooled));
  assert(f.app.manager->Counts().total() == 0);
}

void TestQueryServerStatus() {
  auto       f    = MakeFixture("manager_status");
  const auto path = medsync::testing::WriteFile(f.dir / "scan.dcm", medsync::testing::PatternBytes(100));
  const auto id   = f.app.manager->SubmitUpload(path, Ct());

  ExpectThrows<util::NotFound>([&] { f.app.manager->QueryServerStatus("nope"); });
  ExpectThrows<util::InvalidState>([&] { f.app.manager->QueryServerStatus(id); });

  auto claimed = f.app.queue->DequeueNext(util::Now());
  auto session = f.server->CreateSession(*claimed, 1024, {});
  assert(session);
  f.app.queue->Checkpoint(id, 0, session.value.session_id);

  auto status = f.app.manager->QueryServerStatus(id);
  assert(status);
  assert(status.value.session_id == session.value.session_id);
  assert(status.value.offset == 0);
  assert(status.value.total_size == 100);
}

void TestGuessContentType() {
  assert(core::GuessContentType("a.dcm") == "application/dicom");
  assert(core::GuessContentType("a.DICOM") == "application/dicom");
  assert(core::GuessContentType("x.jpeg") == "image/jpeg");
  assert(core::GuessContentType("x.tif") == "image/tiff");
  assert(core::GuessContentType("report.pdf") == "application/pdf");
  assert(core::GuessContentType("volume.nii") == "application/octet-stream");
  assert(core::GuessContentType("noext") == "application/octet-stream");
}

} // namespace

int main() {
  TestSubmitFile();
  TestSubmitRejectsBadPayloads();
  TestSubmitBufferIsSpooled();
  TestOfflineSubmissionIsHeld();
  TestRetryAndClear();
  TestQueryServerStatus();
  TestGuessContentType();

  std::cout << "upload_manager_unit_test: pass\n";
  return 0;
}
