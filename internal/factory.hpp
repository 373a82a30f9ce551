#pragma once

#include <memory>

#include "internal/config/upload_options.hpp"
#include "internal/connection/connection_monitor.hpp"
#include "internal/connection/health_probe.hpp"
#include "internal/connection/platform_signal.hpp"
#include "internal/core/upload_manager.hpp"
#include "internal/db/api/transfer_repository.hpp"
#include "internal/events/transfer_event_channel.hpp"
#include "internal/queue/queue_lock.hpp"
#include "internal/queue/transfer_queue.hpp"
#include "internal/reconcile/reconciliation_engine.hpp"
#include "internal/transport/credential_provider.hpp"
#include "internal/transport/upload_transport.hpp"

namespace medsync::factory {

/*
  Everything the upload engine needs for the lifetime of the process.

  Start()/Stop() own the background threads (monitor probe loop,
  coordinator, workers); nothing runs before Start().
*/
struct Application {
  // held for the sqlite backend so medsyncctl cannot edit a live queue
  std::shared_ptr<queue::QueueLock>                queue_lock;
  std::shared_ptr<queue::TransferQueue>            queue;
  std::shared_ptr<connection::ConnectionMonitor>   monitor;
  std::shared_ptr<reconcile::ReconciliationEngine> engine;
  std::shared_ptr<core::UploadManager>             manager;
  std::shared_ptr<events::TransferEventChannel>    events;

  queue::LoadReport load_report;

  void Start();
  void Stop();
};

/*
  Overrides for the collaborators that touch the outside world. Null members
  are built from the options (repository, HTTP transport, sysfs signal).
*/
struct Collaborators {
  std::shared_ptr<db::TransferRepository>      repository;
  std::shared_ptr<transport::UploadTransport>  transport;
  std::shared_ptr<connection::HealthProbe>     probe;
  std::shared_ptr<connection::PlatformSignal>  platform;
};

/*
  BuildRepository

  The ONLY place allowed to know concrete DB types.
*/
std::shared_ptr<db::TransferRepository> BuildRepository(const config::QueueOptions& options);

std::shared_ptr<transport::CredentialProvider> BuildCredentials(const config::AuthOptions& options);

/*
  Composition root. Loads the persisted queue; does not start anything.
*/
Application Build(const config::UploadOptions& options, Collaborators collaborators = {});

} // namespace medsync::factory
