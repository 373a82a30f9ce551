#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace medsync::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("0001" is a path, not a number)
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static medsync::runtime::config::RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  medsync::runtime::config::RuntimeConfig config;
  if (!yaml || yaml.IsNull()) {
    return config;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

medsync::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

medsync::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml_text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

namespace {

template <typename T>
void KeepDefaultUnlessSet(T& target, T value) {
  if (value != T{}) {
    target = value;
  }
}

void SetMillis(std::chrono::milliseconds& target, uint32_t value) {
  if (value > 0) {
    target = std::chrono::milliseconds(value);
  }
}

// Accepts http(s)://host[:port][/path]. Every request is built on this URL,
// so a bad one would fail each transfer the same way.
void ValidateBaseUrl(const std::string& url) {
  const auto scheme_end = url.find("://");
  if (scheme_end == std::string::npos) {
    throw std::runtime_error("Invalid configuration: server.base_url '" + url + "' has no scheme");
  }

  std::string scheme = url.substr(0, scheme_end);
  std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (scheme != "http" && scheme != "https") {
    throw std::runtime_error("Invalid configuration: server.base_url scheme must be http or https, got '" + scheme + "'");
  }

  const auto authority_begin = scheme_end + 3;
  const auto authority_end   = url.find_first_of("/?#", authority_begin);
  // npos - begin still clamps to the end of the string
  std::string host = url.substr(authority_begin, authority_end - authority_begin);
  if (const auto at = host.rfind('@'); at != std::string::npos) {
    host.erase(0, at + 1);
  }
  if (!host.empty() && host.front() == '[') {
    // [v6]:port
    const auto close = host.find(']');
    host             = close == std::string::npos ? std::string() : host.substr(1, close - 1);
  } else if (const auto colon = host.find(':'); colon != std::string::npos) {
    host.erase(colon);
  }
  if (host.empty() || host.find(' ') != std::string::npos) {
    throw std::runtime_error("Invalid configuration: server.base_url '" + url + "' has no host");
  }
}

} // namespace

UploadOptions ConfigLoader::ToUploadOptions(const medsync::runtime::config::RuntimeConfig& config) {
  UploadOptions options;

  const auto& server = config.server();
  options.server.base_url = server.base_url();
  if (!options.server.base_url.empty()) {
    ValidateBaseUrl(options.server.base_url);
  }
  KeepDefaultUnlessSet(options.server.health_path, server.health_path());
  SetMillis(options.server.connect_timeout, server.connect_timeout_ms());
  // proto3 bools default to false; TLS verification is only disabled explicitly
  options.server.verify_tls = !server.has_verify_tls() || server.verify_tls();

  const auto& auth = config.auth();
  if (auth.has_token()) options.auth.token = auth.token();
  if (auth.has_token_file()) options.auth.token_file = auth.token_file();
  if (const char* token = std::getenv("MEDSYNC_TOKEN")) {
    options.auth.token = token;
  }

  const auto& queue = config.queue();
  if (queue.has_memory()) {
    options.queue.backend = QueueOptions::Backend::kMemory;
  } else if (queue.has_sqlite()) {
    options.queue.backend = QueueOptions::Backend::kSqlite;
    KeepDefaultUnlessSet(options.queue.sqlite_path, queue.sqlite().path());
    KeepDefaultUnlessSet(options.queue.synchronous, queue.sqlite().synchronous());
  }
  KeepDefaultUnlessSet(options.queue.spool_dir, queue.spool_dir());

  const auto& transfer = config.transfer();
  KeepDefaultUnlessSet(options.transfer.chunk_size_bytes, static_cast<uint64_t>(transfer.chunk_size_bytes()));
  KeepDefaultUnlessSet(options.transfer.chunk_retry_attempts, transfer.chunk_retry_attempts());
  KeepDefaultUnlessSet(options.transfer.max_attempts, transfer.max_attempts());
  SetMillis(options.transfer.chunk_timeout, transfer.chunk_timeout_ms());
  SetMillis(options.transfer.session_timeout, transfer.session_timeout_ms());
  SetMillis(options.transfer.completion_timeout, transfer.completion_timeout_ms());

  const auto& retry = config.retry();
  SetMillis(options.retry.base_delay, retry.base_delay_ms());
  SetMillis(options.retry.reconnect_max_delay, retry.reconnect_max_delay_ms());
  SetMillis(options.retry.failure_max_delay, retry.failure_max_delay_ms());
  SetMillis(options.retry.chunk_retry_base, retry.chunk_retry_base_ms());
  if (retry.jitter_ratio() > 0.0) {
    if (retry.jitter_ratio() >= 1.0) {
      throw std::runtime_error("Invalid configuration: retry.jitter_ratio must be below 1.0");
    }
    options.retry.jitter_ratio = retry.jitter_ratio();
  }

  const auto& reconcile = config.reconcile();
  KeepDefaultUnlessSet(options.reconcile.concurrency, reconcile.concurrency());
  KeepDefaultUnlessSet(options.reconcile.event_capacity, static_cast<std::size_t>(reconcile.event_capacity()));

  const auto& monitor = config.monitor();
  SetMillis(options.monitor.online_probe_interval, monitor.online_probe_interval_ms());
  SetMillis(options.monitor.offline_probe_initial, monitor.offline_probe_initial_ms());
  SetMillis(options.monitor.offline_probe_max, monitor.offline_probe_max_ms());
  SetMillis(options.monitor.probe_timeout, monitor.probe_timeout_ms());
  KeepDefaultUnlessSet(options.monitor.window_size, monitor.window_size());
  KeepDefaultUnlessSet(options.monitor.offline_failure_threshold, monitor.offline_failure_threshold());
  if (!monitor.platform_signal().empty()) {
    if (monitor.platform_signal() == "none") {
      options.monitor.platform_signal_enabled = false;
    } else if (monitor.platform_signal() == "sysfs") {
      options.monitor.platform_signal_enabled = true;
    } else {
      throw std::runtime_error("Invalid configuration: unknown monitor.platform_signal '" + monitor.platform_signal() + "'");
    }
  }

  if (options.transfer.chunk_size_bytes == 0) {
    throw std::runtime_error("Invalid configuration: transfer.chunk_size_bytes must be positive");
  }

  return options;
}

} // namespace medsync::config
