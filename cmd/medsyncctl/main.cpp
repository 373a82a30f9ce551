#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

#include "internal/factory.hpp"
#include "internal/payload/payload_spool.hpp"
#include "internal/queue/queue_lock.hpp"
#include "internal/queue/transfer_queue.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

using medsync::model::TransferDescriptor;

static void Usage() {
  std::cout << "Usage (retry, prioritize and clear* need medsync-uploader stopped):\n"
            << "  medsyncctl <queue.db> list\n"
            << "  medsyncctl <queue.db> counts\n"
            << "  medsyncctl <queue.db> show <transfer_id>\n"
            << "  medsyncctl <queue.db> retry <transfer_id>\n"
            << "  medsyncctl <queue.db> prioritize <transfer_id>\n"
            << "  medsyncctl <queue.db> clear <transfer_id>\n"
            << "  medsyncctl <queue.db> clear-failed\n";
}

static void PrintRow(const TransferDescriptor& d) {
  std::cout << std::left << std::setw(38) << d.id << std::setw(20) << medsync::model::ToString(d.status)
            << std::setw(8) << medsync::model::ToString(d.destination.modality) << d.offset << "/"
            << d.payload.total_size << " attempts=" << d.attempt_count;
  if (!d.last_error.empty()) {
    std::cout << " error=" << medsync::model::ToString(d.last_error_kind) << ": " << d.last_error;
  }
  std::cout << "\n";
}

static void PrintDetail(const TransferDescriptor& d) {
  std::cout << "id:            " << d.id << "\n"
            << "status:        " << medsync::model::ToString(d.status) << "\n"
            << "file:          " << d.payload.path << (d.payload.spooled ? " (spooled)" : "") << "\n"
            << "content type:  " << d.payload.content_type << "\n"
            << "progress:      " << d.offset << "/" << d.payload.total_size << "\n"
            << "destination:   " << medsync::model::ToString(d.destination.modality);
  if (!d.destination.model_id.empty()) {
    std::cout << " model=" << d.destination.model_id;
  }
  std::cout << "\n"
            << "session:       " << (d.session_id.empty() ? "-" : d.session_id) << "\n"
            << "attempts:      " << d.attempt_count << "\n"
            << "priority:      " << d.priority << "\n"
            << "created (ms):  " << medsync::util::ToUnixMillis(d.created_at) << "\n"
            << "next try (ms): " << medsync::util::ToUnixMillis(d.next_eligible_at) << "\n";
  if (!d.last_error.empty()) {
    std::cout << "last error:    " << medsync::model::ToString(d.last_error_kind) << ": " << d.last_error << "\n";
  }
  for (const auto& [key, value] : d.destination.metadata) {
    std::cout << "meta:          " << key << "=" << value << "\n";
  }
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  medsync::config::QueueOptions options;
  options.backend     = medsync::config::QueueOptions::Backend::kSqlite;
  options.sqlite_path = argv[1];
  const std::string cmd = argv[2];

  const bool inspect = cmd == "list" || cmd == "counts" || cmd == "show";

  try {
    std::unique_ptr<medsync::queue::QueueLock> lock;
    if (!inspect) {
      lock = std::make_unique<medsync::queue::QueueLock>(options.sqlite_path);
    }

    medsync::queue::TransferQueue queue(medsync::factory::BuildRepository(options));
    const auto report = queue.Load(inspect ? medsync::queue::LoadMode::kInspect : medsync::queue::LoadMode::kRecover);
    if (report.skipped > 0) {
      std::cerr << "warning: " << report.skipped << " unreadable record(s) skipped\n";
    }

    // ------------------------------------------------------------

    if (cmd == "list") {
      for (const auto& d : queue.ListAll()) {
        PrintRow(d);
      }
      return 0;
    }

    if (cmd == "counts") {
      const auto counts = queue.Counts();
      std::cout << "pending:            " << counts.pending << "\n"
                << "uploading:          " << counts.uploading << "\n"
                << "pending_offline:    " << counts.pending_offline << "\n"
                << "failed_permanently: " << counts.failed_permanently << "\n";
      return 0;
    }

    if (cmd == "clear-failed") {
      const auto removed = queue.RemoveFailed();
      for (const auto& d : removed) {
        medsync::payload::PayloadSpool(options.spool_dir).Discard(d.payload);
      }
      std::cout << "cleared " << removed.size() << " failed transfer(s)\n";
      return 0;
    }

    if (argc < 4) {
      Usage();
      return 1;
    }
    const std::string id = argv[3];

    if (cmd == "show") {
      auto d = queue.Get(id);
      if (!d) {
        std::cerr << "not found: " << id << "\n";
        return 1;
      }
      PrintDetail(*d);
      return 0;
    }

    if (cmd == "retry") {
      PrintRow(queue.ResetFailed(id, medsync::util::Now()));
      return 0;
    }

    if (cmd == "prioritize") {
      PrintRow(queue.Prioritize(id, medsync::util::Now()));
      return 0;
    }

    if (cmd == "clear") {
      auto d = queue.Get(id);
      if (!d) {
        std::cerr << "not found: " << id << "\n";
        return 1;
      }
      if (d->status != medsync::model::TransferStatus::kFailedPermanently) {
        std::cerr << "transfer is " << medsync::model::ToString(d->status) << "; only failed transfers can be cleared\n";
        return 1;
      }
      if (auto removed = queue.Remove(id)) {
        medsync::payload::PayloadSpool(options.spool_dir).Discard(removed->payload);
      }
      std::cout << "cleared " << id << "\n";
      return 0;
    }
  } catch (const medsync::util::NotFound& e) {
    std::cerr << "not found: " << e.what() << "\n";
    return 1;
  } catch (const medsync::util::InvalidState& e) {
    std::cerr << "rejected: " << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 2;
  }

  Usage();
  return 1;
}
