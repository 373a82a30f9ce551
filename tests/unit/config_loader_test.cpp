#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using medsync::config::ConfigLoader;
using medsync::config::QueueOptions;
using std::chrono::milliseconds;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "medsync_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& yaml) {
  try {
    (void)ConfigLoader::ToUploadOptions(ConfigLoader::LoadFromYamlString(yaml));
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestEmptyConfigKeepsDefaults() {
  const auto options = ConfigLoader::ToUploadOptions(ConfigLoader::LoadFromYamlString(""));

  assert(options.server.base_url.empty());
  assert(options.server.health_path == "/api/health");
  assert(options.server.verify_tls);
  assert(options.queue.backend == QueueOptions::Backend::kSqlite);
  assert(options.queue.synchronous == "FULL");
  assert(options.transfer.chunk_size_bytes == 5ull * 1024 * 1024);
  assert(options.transfer.chunk_retry_attempts == 3);
  assert(options.retry.base_delay == milliseconds(1000));
  assert(options.retry.jitter_ratio == 0.2);
  assert(options.reconcile.concurrency == 3);
  assert(options.monitor.online_probe_interval == milliseconds(30'000));
  assert(options.monitor.platform_signal_enabled);
}

void TestFullConfigFromFile() {
  const auto yaml_path = WriteYaml("full", R"(server:
  base_url: "https://pacs-gateway.example/"
  health_path: /healthz
  connect_timeout_ms: 2500
  verify_tls: false
auth:
  token_file: /run/medsync/token
queue:
  sqlite:
    path: /var/lib/medsync/queue.db
    synchronous: NORMAL
  spool_dir: /var/lib/medsync/spool
transfer:
  chunk_size_bytes: 1048576
  chunk_retry_attempts: 5
  max_attempts: 12
  chunk_timeout_ms: 45000
retry:
  base_delay_ms: 500
  reconnect_max_delay_ms: 15000
  failure_max_delay_ms: 300000
  jitter_ratio: 0.1
reconcile:
  concurrency: 2
  event_capacity: 64
monitor:
  online_probe_interval_ms: 10000
  offline_probe_initial_ms: 250
  offline_probe_max_ms: 8000
  window_size: 30
  offline_failure_threshold: 10
  platform_signal: none
logging:
  level: debug
  flush_interval_ms: 1000
)");

  const auto config  = ConfigLoader::LoadFromYaml(yaml_path.string());
  const auto options = ConfigLoader::ToUploadOptions(config);

  assert(options.server.base_url == "https://pacs-gateway.example/");
  assert(options.server.health_path == "/healthz");
  assert(options.server.connect_timeout == milliseconds(2500));
  assert(!options.server.verify_tls);
  assert(options.auth.token_file == "/run/medsync/token");
  assert(options.queue.sqlite_path == "/var/lib/medsync/queue.db");
  assert(options.queue.synchronous == "NORMAL");
  assert(options.queue.spool_dir == "/var/lib/medsync/spool");
  assert(options.transfer.chunk_size_bytes == 1048576);
  assert(options.transfer.chunk_retry_attempts == 5);
  assert(options.transfer.max_attempts == 12);
  assert(options.transfer.chunk_timeout == milliseconds(45'000));
  assert(options.transfer.session_timeout == milliseconds(15'000));
  assert(options.retry.base_delay == milliseconds(500));
  assert(options.retry.reconnect_max_delay == milliseconds(15'000));
  assert(options.retry.failure_max_delay == milliseconds(300'000));
  assert(options.retry.jitter_ratio == 0.1);
  assert(options.reconcile.concurrency == 2);
  assert(options.reconcile.event_capacity == 64);
  assert(options.monitor.online_probe_interval == milliseconds(10'000));
  assert(options.monitor.offline_probe_initial == milliseconds(250));
  assert(options.monitor.offline_probe_max == milliseconds(8000));
  assert(options.monitor.window_size == 30);
  assert(options.monitor.offline_failure_threshold == 10);
  assert(!options.monitor.platform_signal_enabled);

  assert(config.logging().level() == "debug");
  assert(config.logging().flush_interval_ms() == 1000);
}

void TestMemoryBackendAndQuotedScalars() {
  const auto config = ConfigLoader::LoadFromYamlString(R"(auth:
  token: "0001"
queue:
  memory: {}
  spool_dir: "C:\\medsync\\\"spool\""
)");
  const auto options = ConfigLoader::ToUploadOptions(config);
  assert(options.queue.backend == QueueOptions::Backend::kMemory);
  assert(options.auth.token == "0001");
  assert(options.queue.spool_dir == "C:\\medsync\\\"spool\"");
}

void TestTokenFromEnvironment() {
  setenv("MEDSYNC_TOKEN", "from-env", 1);
  const auto options = ConfigLoader::ToUploadOptions(ConfigLoader::LoadFromYamlString("auth:\n  token: from-file\n"));
  unsetenv("MEDSYNC_TOKEN");
  assert(options.auth.token == "from-env");
}

void TestInvalidConfigsAreRejected() {
  assert(Rejects("server:\n  base_url: https://x\nunknown_field: 123\n"));
  assert(Rejects("transfer:\n  chunk_sise_bytes: 10\n"));
  assert(Rejects("retry:\n  jitter_ratio: 1.5\n"));
  assert(Rejects("monitor:\n  platform_signal: netlink\n"));
  assert(Rejects("reconcile:\n  concurrency: lots\n"));
  assert(Rejects("server: [unclosed\n"));

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/medsync.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw && "ConfigLoader must report unreadable files.");
}

void TestServerBaseUrlIsValidated() {
  assert(Rejects("server:\n  base_url: gopherx://uploads.example\n"));
  assert(Rejects("server:\n  base_url: htps://uploads.example\n"));
  assert(Rejects("server:\n  base_url: uploads.example/api\n"));
  assert(Rejects("server:\n  base_url: \"https://\"\n"));
  assert(Rejects("server:\n  base_url: \"https://:8443/api\"\n"));
  assert(Rejects("server:\n  base_url: \"http://user@/\"\n"));

  assert(!Rejects("server:\n  base_url: HTTPS://uploads.example:8443/api\n"));
  assert(!Rejects("server:\n  base_url: \"http://[::1]:8080\"\n"));
  assert(!Rejects("server:\n  base_url: http://127.0.0.1\n"));
}

} // namespace

int main() {
  unsetenv("MEDSYNC_TOKEN");

  TestEmptyConfigKeepsDefaults();
  TestFullConfigFromFile();
  TestMemoryBackendAndQuotedScalars();
  TestTokenFromEnvironment();
  TestInvalidConfigsAreRejected();
  TestServerBaseUrlIsValidated();

  std::cout << "medsync_unit_config_loader: pass\n";
  return 0;
}
