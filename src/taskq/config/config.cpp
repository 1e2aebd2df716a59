#include "taskq/config/config.hpp"

#include "taskq/config/yaml_utils.hpp"
#include "taskq/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

namespace YAML {

template <>
struct convert<taskq::StorageConfig> {
  static bool decode(const Node& node, taskq::StorageConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    s.db_file = taskq::yaml_get_or<std::string>(node, "db_file", "taskq.db");
    s.busy_timeout = taskq::yaml_get_ms(node, "busy_timeout_ms",
                                        taskq::timing::kBusyTimeout);
    return true;
  }
};

template <>
struct convert<taskq::CoordinatorConfig> {
  static bool decode(const Node& node, taskq::CoordinatorConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    c.log_level = taskq::yaml_get_or<std::string>(node, "log_level", "info");
    c.log_file = taskq::yaml_get_or<std::string>(node, "log_file", "");
    c.pid_file = taskq::yaml_get_or<std::string>(node, "pid_file", "");
    c.recover_on_start = taskq::yaml_get_or(node, "recover_on_start", true);
    return true;
  }
};

template <>
struct convert<taskq::LivenessConfig> {
  static bool decode(const Node& node, taskq::LivenessConfig& l) {
    if (!node.IsMap()) {
      return false;
    }
    l.heartbeat_timeout = taskq::yaml_get_ms(node, "heartbeat_timeout_ms",
                                             taskq::timing::kHeartbeatTimeout);
    l.death_timeout = taskq::yaml_get_ms(node, "death_timeout_ms",
                                         taskq::timing::kDeathTimeout);
    l.sweep_interval = taskq::yaml_get_ms(node, "sweep_interval_ms",
                                          std::chrono::milliseconds(0));
    return true;
  }
};

template <>
struct convert<taskq::DispatcherConfig> {
  static bool decode(const Node& node, taskq::DispatcherConfig& d) {
    if (!node.IsMap()) {
      return false;
    }
    d.poll_interval = taskq::yaml_get_ms(node, "poll_interval_ms",
                                         taskq::timing::kDispatchPollInterval);
    d.batch_size = taskq::yaml_get_or<std::size_t>(
        node, "batch_size", taskq::limits::kDispatchBatchSize);
    d.max_in_flight_per_worker =
        taskq::yaml_get_or<std::size_t>(node, "max_in_flight_per_worker", 0);
    d.publish_max_attempts = taskq::yaml_get_or(
        node, "publish_max_attempts", taskq::limits::kPublishMaxAttempts);
    d.publish_backoff = taskq::yaml_get_ms(node, "publish_backoff_ms",
                                           taskq::timing::kPublishBackoff);
    d.publish_backoff_max = taskq::yaml_get_ms(
        node, "publish_backoff_max_ms", taskq::timing::kPublishBackoffMax);
    return true;
  }
};

template <>
struct convert<taskq::TransportConfig> {
  static bool decode(const Node& node, taskq::TransportConfig& t) {
    if (!node.IsMap()) {
      return false;
    }
    t.queue_prefix = taskq::yaml_get_or<std::string>(
        node, "queue_prefix", std::string(taskq::queues::kDispatchPrefix));
    t.results_queue = taskq::yaml_get_or<std::string>(
        node, "results_queue", std::string(taskq::queues::kResults));
    t.receive_timeout = taskq::yaml_get_ms(node, "receive_timeout_ms",
                                           taskq::timing::kReceiveTimeout);
    t.retry_backoff = taskq::yaml_get_ms(node, "retry_backoff_ms",
                                         taskq::timing::kRetryBackoff);
    t.retry_backoff_max = taskq::yaml_get_ms(node, "retry_backoff_max_ms",
                                             taskq::timing::kRetryBackoffMax);
    return true;
  }
};

template <>
struct convert<taskq::SystemConfig> {
  static bool decode(const Node& node, taskq::SystemConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    if (auto storage = node["storage"]) {
      c.storage = storage.as<taskq::StorageConfig>();
    }
    if (auto coordinator = node["coordinator"]) {
      c.coordinator = coordinator.as<taskq::CoordinatorConfig>();
    }
    if (auto liveness = node["liveness"]) {
      c.liveness = liveness.as<taskq::LivenessConfig>();
    }
    if (auto dispatcher = node["dispatcher"]) {
      c.dispatcher = dispatcher.as<taskq::DispatcherConfig>();
    }
    if (auto transport = node["transport"]) {
      c.transport = transport.as<taskq::TransportConfig>();
    }
    if (auto types = node["task_types"]) {
      if (!types.IsSequence()) {
        return false;
      }
      c.task_types = types.as<std::vector<std::string>>();
    }
    return true;
  }
};

}  // namespace YAML

namespace taskq {

namespace {

void to_yaml(YAML::Emitter& out, const StorageConfig& s) {
  out << YAML::BeginMap;
  yaml_emit(out, "db_file", s.db_file);
  yaml_emit(out, "busy_timeout_ms", s.busy_timeout.count());
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const CoordinatorConfig& c) {
  out << YAML::BeginMap;
  yaml_emit(out, "log_level", c.log_level);
  yaml_emit_if_not_empty(out, "log_file", c.log_file);
  yaml_emit_if_not_empty(out, "pid_file", c.pid_file);
  if (!c.recover_on_start) {
    yaml_emit(out, "recover_on_start", c.recover_on_start);
  }
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const LivenessConfig& l) {
  out << YAML::BeginMap;
  yaml_emit(out, "heartbeat_timeout_ms", l.heartbeat_timeout.count());
  yaml_emit(out, "death_timeout_ms", l.death_timeout.count());
  yaml_emit(out, "sweep_interval_ms", l.effective_sweep_interval().count());
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const DispatcherConfig& d) {
  out << YAML::BeginMap;
  yaml_emit(out, "poll_interval_ms", d.poll_interval.count());
  yaml_emit(out, "batch_size", d.batch_size);
  if (d.max_in_flight_per_worker != 0) {
    yaml_emit(out, "max_in_flight_per_worker", d.max_in_flight_per_worker);
  }
  yaml_emit(out, "publish_max_attempts", d.publish_max_attempts);
  yaml_emit(out, "publish_backoff_ms", d.publish_backoff.count());
  yaml_emit(out, "publish_backoff_max_ms", d.publish_backoff_max.count());
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const TransportConfig& t) {
  out << YAML::BeginMap;
  yaml_emit(out, "queue_prefix", t.queue_prefix);
  yaml_emit(out, "results_queue", t.results_queue);
  yaml_emit(out, "receive_timeout_ms", t.receive_timeout.count());
  yaml_emit(out, "retry_backoff_ms", t.retry_backoff.count());
  yaml_emit(out, "retry_backoff_max_ms", t.retry_backoff_max.count());
  out << YAML::EndMap;
}

}  // namespace

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<SystemConfig> {
  SystemConfig config;
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      log::error("Failed to parse YAML: empty or invalid content");
      return fail(Error::ParseError);
    }
    config = root.as<SystemConfig>();
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }

  if (auto r = validate(config); !r) {
    return fail(r.error());
  }
  return ok(std::move(config));
}

auto ConfigLoader::validate(const SystemConfig& config) -> Result<void> {
  const auto& l = config.liveness;
  if (l.heartbeat_timeout.count() <= 0) {
    log::error("liveness.heartbeat_timeout_ms must be positive");
    return fail(Error::InvalidArgument);
  }
  if (l.death_timeout <= l.heartbeat_timeout) {
    log::error("liveness.death_timeout_ms ({}) must exceed "
               "heartbeat_timeout_ms ({})",
               l.death_timeout.count(), l.heartbeat_timeout.count());
    return fail(Error::InvalidArgument);
  }
  if (l.sweep_interval.count() < 0) {
    log::error("liveness.sweep_interval_ms must not be negative");
    return fail(Error::InvalidArgument);
  }
  if (l.effective_sweep_interval().count() <= 0) {
    log::error("liveness sweep interval resolves to 0ms; raise "
               "heartbeat_timeout_ms or set sweep_interval_ms");
    return fail(Error::InvalidArgument);
  }

  const auto& d = config.dispatcher;
  if (d.poll_interval.count() <= 0 || d.batch_size == 0) {
    log::error("dispatcher.poll_interval_ms and batch_size must be positive");
    return fail(Error::InvalidArgument);
  }
  if (d.publish_max_attempts < 1) {
    log::error("dispatcher.publish_max_attempts must be at least 1");
    return fail(Error::InvalidArgument);
  }
  if (d.publish_backoff.count() < 0 ||
      d.publish_backoff_max < d.publish_backoff) {
    log::error("dispatcher publish backoff bounds are inconsistent");
    return fail(Error::InvalidArgument);
  }

  if (config.transport.results_queue.empty()) {
    log::error("transport.results_queue must not be empty");
    return fail(Error::InvalidArgument);
  }
  if (config.transport.receive_timeout.count() <= 0) {
    log::error("transport.receive_timeout_ms must be positive");
    return fail(Error::InvalidArgument);
  }
  if (config.transport.retry_backoff.count() <= 0 ||
      config.transport.retry_backoff_max < config.transport.retry_backoff) {
    log::error("transport retry backoff bounds are inconsistent");
    return fail(Error::InvalidArgument);
  }
  for (const auto& name : config.task_types) {
    if (name.empty()) {
      log::error("task_types entries must not be empty");
      return fail(Error::InvalidArgument);
    }
  }
  return ok();
}

auto ConfigLoader::to_string(const SystemConfig& config) -> std::string {
  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "storage" << YAML::Value;
  to_yaml(out, config.storage);
  out << YAML::Key << "coordinator" << YAML::Value;
  to_yaml(out, config.coordinator);
  out << YAML::Key << "liveness" << YAML::Value;
  to_yaml(out, config.liveness);
  out << YAML::Key << "dispatcher" << YAML::Value;
  to_yaml(out, config.dispatcher);
  out << YAML::Key << "transport" << YAML::Value;
  to_yaml(out, config.transport);
  if (!config.task_types.empty()) {
    out << YAML::Key << "task_types" << YAML::Value << YAML::Flow
        << config.task_types;
  }
  out << YAML::EndMap;
  return out.c_str();
}

}  // namespace taskq
