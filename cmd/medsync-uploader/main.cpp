#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

using medsync::config::ConfigLoader;

static volatile std::sig_atomic_t g_running = 1;
static volatile std::sig_atomic_t g_reauth  = 0;

void HandleSignal(int) {
  g_running = 0;
}

void HandleReauth(int) {
  g_reauth = 1;
}

static void Usage() {
  std::cerr << "Usage: medsync-uploader --config <config.yaml> [--modality xray|mri|ct|report] [--model-id <id>]\n"
            << "                        [--meta key=value]... [--exit-when-idle] [file...]\n";
}

static void LogEvent(const medsync::events::TransferEvent& event) {
  using medsync::events::TransferEventType;
  namespace obs = medsync::observability;

  switch (event.type) {
    case TransferEventType::kProgress:
      MEDSYNC_LOG_DEBUG("progress", {obs::StringField("transfer_id", event.transfer_id),
                                     obs::UintField("bytes_sent", event.bytes_sent),
                                     obs::UintField("total_bytes", event.total_bytes)});
      break;
    case TransferEventType::kCompleted:
      std::cout << "completed " << event.transfer_id << " result=" << event.result_id << std::endl;
      break;
    case TransferEventType::kFailed:
      std::cout << "failed " << event.transfer_id << " kind=" << medsync::model::ToString(event.error_kind) << " "
                << event.message << std::endl;
      break;
    case TransferEventType::kCancelled:
      std::cout << "cancelled " << event.transfer_id << std::endl;
      break;
    case TransferEventType::kAuthRequired:
      std::cout << "authentication required; update the token and send SIGHUP" << std::endl;
      break;
    case TransferEventType::kQueuePaused:
      std::cout << "uploads paused: " << event.message << "; fix server.base_url and restart" << std::endl;
      break;
    case TransferEventType::kRetryScheduled:
      break;
  }
}

int main(int argc, char** argv) {
  std::string              config_path;
  std::vector<std::string> files;
  medsync::model::Destination destination;
  destination.modality = medsync::model::Modality::kXray;
  bool exit_when_idle  = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--modality" && i + 1 < argc) {
      auto parsed = medsync::model::ParseModality(argv[++i]);
      if (!parsed) {
        std::cerr << "unsupported modality: " << argv[i] << "\n";
        return 1;
      }
      destination.modality = *parsed;
    } else if (arg == "--model-id" && i + 1 < argc) {
      destination.model_id = argv[++i];
    } else if (arg == "--meta" && i + 1 < argc) {
      const std::string kv = argv[++i];
      const auto        eq = kv.find('=');
      if (eq == std::string::npos || eq == 0) {
        std::cerr << "metadata must be key=value: " << kv << "\n";
        return 1;
      }
      destination.metadata[kv.substr(0, eq)] = kv.substr(eq + 1);
    } else if (arg == "--exit-when-idle") {
      exit_when_idle = true;
    } else if (!arg.empty() && arg[0] == '-') {
      Usage();
      return 1;
    } else {
      files.push_back(arg);
    }
  }
  if (config_path.empty()) {
    Usage();
    return 1;
  }

  // ------------------------------------------------------------
  // Load configuration
  // ------------------------------------------------------------
  medsync::runtime::config::RuntimeConfig config;
  medsync::config::UploadOptions          options;
  try {
    config  = ConfigLoader::LoadFromYaml(config_path);
    options = ConfigLoader::ToUploadOptions(config);
  } catch (const std::exception& e) {
    std::cerr << "invalid configuration: " << e.what() << std::endl;
    return 1;
  }

  medsync::observability::LoggingScope logging(config);

  try {
    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = medsync::factory::Build(options);

    // Register signal handlers before starting threads to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);
    std::signal(SIGHUP, HandleReauth);

    app.Start();

    for (const auto& file : files) {
      try {
        const auto id = app.manager->SubmitUpload(file, destination);
        std::cout << "queued " << id << " " << file << std::endl;
      } catch (const medsync::util::InvalidPayload& e) {
        std::cerr << "rejected " << file << ": " << e.what() << std::endl;
      }
    }

    while (g_running) {
      if (g_reauth) {
        g_reauth = 0;
        app.manager->ResumeAfterReauth();
      }
      if (auto event = app.events->WaitPop(std::chrono::milliseconds(500))) {
        LogEvent(*event);
      }
      if (exit_when_idle) {
        const auto counts = app.manager->Counts();
        if (counts.pending + counts.uploading + counts.pending_offline == 0) {
          break;
        }
      }
    }

    MEDSYNC_LOG_INFO("Shutting down medsync uploader");
    app.Stop();

    const auto counts = app.manager->Counts();
    return counts.failed_permanently == 0 ? 0 : 3;
  } catch (const std::exception& e) {
    MEDSYNC_LOG_ERROR("Fatal error", {medsync::observability::StringField("error", e.what())});
    return 2;
  }
}
