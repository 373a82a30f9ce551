#include "factory.hpp"

#include <memory>
#include <stdexcept>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/payload/payload_spool.hpp"
#include "internal/retry/retry_scheduler.hpp"
#include "internal/transfer/chunked_transfer_client.hpp"
#include "internal/transport/http_transport.hpp"

namespace medsync::factory {

void Application::Start() {
  monitor->Start();
  engine->Start();
  MEDSYNC_LOG_INFO("upload engine running", {observability::UintField("queued", queue->Counts().total())});
}

void Application::Stop() {
  engine->Stop();
  monitor->Stop();
  events->Close();
  MEDSYNC_LOG_INFO("upload engine stopped");
}

std::shared_ptr<db::TransferRepository> BuildRepository(const config::QueueOptions& options) {
  switch (options.backend) {
    case config::QueueOptions::Backend::kSqlite: {
      auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(options.sqlite_path, options.synchronous);
      db::sqlite::SqliteTransferRepository::BootstrapSchema(*sqlite_db);
      return std::make_shared<db::sqlite::SqliteTransferRepository>(std::move(sqlite_db));
    }
    case config::QueueOptions::Backend::kMemory:
      return std::make_shared<db::memory::MemoryTransferRepository>();
  }
  throw std::runtime_error("unknown queue backend");
}

std::shared_ptr<transport::CredentialProvider> BuildCredentials(const config::AuthOptions& options) {
  if (!options.token_file.empty()) {
    return std::make_shared<transport::FileCredentialProvider>(options.token_file);
  }
  return std::make_shared<transport::StaticCredentialProvider>(options.token);
}

Application Build(const config::UploadOptions& options, Collaborators collaborators) {
  Application app;

  // ------------------------------------------------------------------
  // Persistence
  // ------------------------------------------------------------------
  if (!collaborators.repository) {
    if (options.queue.backend == config::QueueOptions::Backend::kSqlite) {
      app.queue_lock = std::make_shared<queue::QueueLock>(options.queue.sqlite_path);
    }
    collaborators.repository = BuildRepository(options.queue);
  }
  app.queue       = std::make_shared<queue::TransferQueue>(collaborators.repository);
  app.load_report = app.queue->Load();

  auto spool = std::make_shared<payload::PayloadSpool>(options.queue.spool_dir);

  // ------------------------------------------------------------------
  // Network edge
  // ------------------------------------------------------------------
  if (!collaborators.transport) {
    if (options.server.base_url.empty()) {
      throw std::invalid_argument("server.base_url is required");
    }
    transport::HttpTransportOptions http;
    http.base_url        = options.server.base_url;
    http.health_path     = options.server.health_path;
    http.connect_timeout = options.server.connect_timeout;
    http.verify_tls      = options.server.verify_tls;

    auto http_transport     = std::make_shared<transport::HttpUploadTransport>(http, BuildCredentials(options.auth));
    collaborators.transport = http_transport;
    if (!collaborators.probe) {
      collaborators.probe = http_transport;
    }
  }
  if (!collaborators.platform && options.monitor.platform_signal_enabled) {
    collaborators.platform = std::make_shared<connection::SysfsCarrierSignal>();
  }

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  app.events  = std::make_shared<events::TransferEventChannel>(options.reconcile.event_capacity);
  app.monitor = std::make_shared<connection::ConnectionMonitor>(options.monitor, collaborators.probe, collaborators.platform);

  auto retry   = std::make_shared<retry::RetryScheduler>(options.retry);
  auto monitor = app.monitor;
  auto client  = std::make_shared<transfer::ChunkedTransferClient>(
      options.transfer, collaborators.transport, app.queue, retry,
      [monitor] { return monitor->CurrentState().quality; });

  app.engine = std::make_shared<reconcile::ReconciliationEngine>(options.reconcile, options.transfer.max_attempts,
                                                                 app.queue, client, retry, app.monitor, app.events,
                                                                 collaborators.transport, spool);

  app.manager = std::make_shared<core::UploadManager>(options.transfer, app.queue, app.engine, app.monitor, spool,
                                                      app.events, collaborators.transport);
  return app;
}

} // namespace medsync::factory
