#pragma once

#include "discovery.hpp"
#include "message.hpp"

#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace hapticlink {

struct client_options {
  int service_port = kDefaultServicePort;
  int discovery_port = kDefaultDiscoveryPort;
  int discovery_attempts = 5;
  int discovery_window_ms = 1000;
  int discovery_pause_ms = 500;
  std::vector<std::string> broadcast_addresses;
  int connect_timeout_ms = 3000;
  int liveness_interval_ms = 5000;
  int retry_interval_ms = 3000;
  bool auto_retry = true;
  /// 0 keeps pending commands until answered or disconnected.
  int command_timeout_ms = 0;
  size_t max_datagram_size = kMaxDatagramSize;
  std::string log_level = "info";

  discovery_options discovery_settings() const {
    discovery_options d;
    d.discovery_port = discovery_port;
    d.fallback_service_port = service_port;
    d.attempts = discovery_attempts;
    d.window_ms = discovery_window_ms;
    d.pause_ms = discovery_pause_ms;
    d.broadcast_addresses = broadcast_addresses;
    return d;
  }
};

struct responder_options {
  std::string bind_host = "0.0.0.0";
  int service_port = kDefaultServicePort;
  int discovery_port = kDefaultDiscoveryPort;
  /// Empty generates a random id.
  std::string server_id;
  std::string api_version = std::string(kApiVersion);
  int status_interval_ms = 10000;
  size_t max_datagram_size = kMaxDatagramSize;
  std::string log_level = "info";
};

namespace detail {

inline json read_json_file(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open())
    throw std::runtime_error("cannot open: " + path);
  json doc = json::parse(file, nullptr, false);
  if (doc.is_discarded())
    throw std::runtime_error(path + ": invalid JSON");
  if (!doc.is_object())
    throw std::runtime_error(path + ": top level must be an object");
  return doc;
}

template <typename T>
void read_key(const json &doc, const char *key, T &out,
              const std::string &path) {
  auto it = doc.find(key);
  if (it == doc.end())
    return;
  try {
    out = it->get<T>();
  } catch (const json::exception &) {
    throw std::runtime_error(path + ": bad value for '" + key + "'");
  }
}

} // namespace detail

inline client_options client_options_from_json(const json &doc,
                                               const std::string &origin) {
  client_options o;
  detail::read_key(doc, "service_port", o.service_port, origin);
  detail::read_key(doc, "discovery_port", o.discovery_port, origin);
  detail::read_key(doc, "discovery_attempts", o.discovery_attempts, origin);
  detail::read_key(doc, "discovery_window_ms", o.discovery_window_ms, origin);
  detail::read_key(doc, "discovery_pause_ms", o.discovery_pause_ms, origin);
  detail::read_key(doc, "broadcast_addresses", o.broadcast_addresses, origin);
  detail::read_key(doc, "connect_timeout_ms", o.connect_timeout_ms, origin);
  detail::read_key(doc, "liveness_interval_ms", o.liveness_interval_ms, origin);
  detail::read_key(doc, "retry_interval_ms", o.retry_interval_ms, origin);
  detail::read_key(doc, "auto_retry", o.auto_retry, origin);
  detail::read_key(doc, "command_timeout_ms", o.command_timeout_ms, origin);
  detail::read_key(doc, "max_datagram_size", o.max_datagram_size, origin);
  detail::read_key(doc, "log_level", o.log_level, origin);
  if (o.discovery_attempts < 1)
    throw std::runtime_error(origin + ": discovery_attempts must be positive");
  if (o.liveness_interval_ms <= 0 || o.connect_timeout_ms <= 0)
    throw std::runtime_error(origin + ": intervals must be positive");
  return o;
}

/// Load client options from a JSON file. Missing keys keep their defaults.
inline client_options load_client_options(const std::string &path) {
  return client_options_from_json(detail::read_json_file(path), path);
}

inline responder_options load_responder_options(const std::string &path) {
  json doc = detail::read_json_file(path);
  responder_options o;
  detail::read_key(doc, "bind_host", o.bind_host, path);
  detail::read_key(doc, "service_port", o.service_port, path);
  detail::read_key(doc, "discovery_port", o.discovery_port, path);
  detail::read_key(doc, "server_id", o.server_id, path);
  detail::read_key(doc, "api_version", o.api_version, path);
  detail::read_key(doc, "status_interval_ms", o.status_interval_ms, path);
  detail::read_key(doc, "max_datagram_size", o.max_datagram_size, path);
  detail::read_key(doc, "log_level", o.log_level, path);
  return o;
}

/// Value following `flag` in args, or fallback.
inline std::string flag_value(const std::vector<std::string> &args,
                              const std::string &flag,
                              const std::string &fallback = "") {
  for (size_t i = 0; i < args.size(); ++i) {
    if (args[i] == flag && i + 1 < args.size())
      return args[i + 1];
  }
  return fallback;
}

inline bool has_flag(const std::vector<std::string> &args,
                     const std::string &flag) {
  for (const auto &a : args) {
    if (a == flag)
      return true;
  }
  return false;
}

/// Apply --config, --port, --discovery-port, --broadcast, --log-level.
inline client_options parse_client_flags(const std::vector<std::string> &args) {
  auto config = flag_value(args, "--config");
  client_options o = config.empty() ? client_options{} : load_client_options(config);
  auto port = flag_value(args, "--port");
  if (!port.empty())
    o.service_port = std::stoi(port);
  auto dport = flag_value(args, "--discovery-port");
  if (!dport.empty())
    o.discovery_port = std::stoi(dport);
  auto bcast = flag_value(args, "--broadcast");
  if (!bcast.empty())
    o.broadcast_addresses = {bcast};
  o.log_level = flag_value(args, "--log-level", o.log_level);
  return o;
}

inline responder_options
parse_responder_flags(const std::vector<std::string> &args) {
  auto config = flag_value(args, "--config");
  responder_options o =
      config.empty() ? responder_options{} : load_responder_options(config);
  o.bind_host = flag_value(args, "--bind", o.bind_host);
  auto port = flag_value(args, "--port");
  if (!port.empty())
    o.service_port = std::stoi(port);
  auto dport = flag_value(args, "--discovery-port");
  if (!dport.empty())
    o.discovery_port = std::stoi(dport);
  o.server_id = flag_value(args, "--server-id", o.server_id);
  o.log_level = flag_value(args, "--log-level", o.log_level);
  return o;
}

} // namespace hapticlink
