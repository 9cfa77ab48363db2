#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <nlohmann/json.hpp>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unistd.h>
#include <variant>

namespace hapticlink {

using json = nlohmann::json;

/// Fixed payload broadcast by clients looking for a responder.
constexpr std::string_view kDiscoveryProbe = "UNITY_HAPTICS_DISCOVERY_REQUEST";
/// `type` marker carried by a responder's announce.
constexpr std::string_view kAnnounceType = "UNITY_HAPTICS_SERVER";

constexpr int kDefaultServicePort = 9128;
constexpr int kDefaultDiscoveryPort = 9129;
constexpr std::size_t kMaxDatagramSize = 8192;
constexpr std::string_view kApiVersion = "1.0.0";

struct command_message {
  std::string command;
  std::string command_id;
  std::string client_id;
  std::string timestamp;
  json params = nullptr;
};

struct response_message {
  std::string command_id;
  json result = json::object();
  std::string timestamp;
};

struct error_message {
  std::string command_id;
  std::string error;
  std::string details;
  std::string timestamp;
};

struct status_update_message {
  json status = json::object();
  std::string timestamp;
};

struct event_message {
  std::string event_type;
  json data = json::object();
  std::string timestamp;
};

struct discovery_probe {};

struct discovery_announce {
  std::string server_id;
  int api_port = 0;
  std::string api_version;
  std::string timestamp;
};

using message =
    std::variant<command_message, response_message, error_message,
                 status_update_message, event_message, discovery_probe,
                 discovery_announce>;

enum class decode_error_kind { malformed_payload, unknown_type };

class decode_error : public std::runtime_error {
public:
  decode_error(decode_error_kind kind, const std::string &what)
      : std::runtime_error(what), kind_(kind) {}

  decode_error_kind kind() const { return kind_; }

private:
  decode_error_kind kind_;
};

/// Wire name of the message alternative, for logs.
inline const char *type_name(const message &msg) {
  switch (msg.index()) {
  case 0:
    return "command";
  case 1:
    return "response";
  case 2:
    return "error";
  case 3:
    return "status_update";
  case 4:
    return "event";
  case 5:
    return "discovery_probe";
  default:
    return "discovery_announce";
  }
}

/// Current UTC time as ISO-8601 with milliseconds.
inline std::string iso_timestamp() {
  auto now = std::chrono::system_clock::now();
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch())
                .count() %
            1000;
  std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  ::gmtime_r(&t, &tm);
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                tm.tm_min, tm.tm_sec, static_cast<int>(ms));
  return buf;
}

inline std::string random_hex(std::size_t digits) {
  static const char kHex[] = "0123456789abcdef";
  std::mt19937 rng{std::random_device{}()};
  std::uniform_int_distribution<int> dist(0, 15);
  std::string out;
  out.reserve(digits);
  for (std::size_t i = 0; i < digits; ++i)
    out.push_back(kHex[dist(rng)]);
  return out;
}

/// Stable host part plus a random part, unique per client instance.
inline std::string make_client_identity() {
  char host[256] = {0};
  if (::gethostname(host, sizeof(host) - 1) != 0 || host[0] == '\0')
    std::snprintf(host, sizeof(host), "%s", "host");
  return std::string(host) + "-" + random_hex(16);
}

namespace detail {

inline std::string string_field(const json &obj, const char *key) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null())
    return "";
  if (it->is_string())
    return it->get<std::string>();
  return it->dump();
}

inline json object_field(const json &obj, const char *key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_object())
    return json::object();
  return *it;
}

inline void put_timestamp(json &obj, const std::string &timestamp) {
  obj["timestamp"] = timestamp.empty() ? iso_timestamp() : timestamp;
}

} // namespace detail

inline std::string encode(const message &msg) {
  json out;
  if (auto *cmd = std::get_if<command_message>(&msg)) {
    out = {{"command", cmd->command},
           {"command_id", cmd->command_id},
           {"client_id", cmd->client_id}};
    detail::put_timestamp(out, cmd->timestamp);
    if (cmd->params.is_object() && !cmd->params.empty())
      out["params"] = cmd->params;
  } else if (auto *res = std::get_if<response_message>(&msg)) {
    out = {{"type", "response"},
           {"command_id", res->command_id},
           {"result", res->result.is_object() ? res->result : json::object()}};
    detail::put_timestamp(out, res->timestamp);
  } else if (auto *err = std::get_if<error_message>(&msg)) {
    out = {{"type", "error"}, {"error", err->error}};
    if (!err->command_id.empty())
      out["command_id"] = err->command_id;
    if (!err->details.empty())
      out["details"] = err->details;
    detail::put_timestamp(out, err->timestamp);
  } else if (auto *st = std::get_if<status_update_message>(&msg)) {
    out = {{"type", "status_update"}, {"status", st->status}};
    detail::put_timestamp(out, st->timestamp);
  } else if (auto *ev = std::get_if<event_message>(&msg)) {
    out = {{"type", "event"}, {"event_type", ev->event_type}, {"data", ev->data}};
    detail::put_timestamp(out, ev->timestamp);
  } else if (std::holds_alternative<discovery_probe>(msg)) {
    return std::string(kDiscoveryProbe);
  } else {
    const auto &an = std::get<discovery_announce>(msg);
    out = {{"type", std::string(kAnnounceType)},
           {"server_id", an.server_id},
           {"api_port", an.api_port},
           {"api_version", an.api_version}};
    detail::put_timestamp(out, an.timestamp);
  }
  return out.dump();
}

/// Decode one datagram. Throws decode_error, never the parser's exception.
inline message decode(std::string_view bytes) {
  auto first = bytes.find_first_not_of(" \t\r\n");
  auto last = bytes.find_last_not_of(" \t\r\n");
  std::string_view trimmed =
      first == std::string_view::npos ? std::string_view()
                                      : bytes.substr(first, last - first + 1);
  if (trimmed == kDiscoveryProbe)
    return discovery_probe{};

  json obj = json::parse(trimmed.begin(), trimmed.end(), nullptr, false);
  if (obj.is_discarded())
    throw decode_error(decode_error_kind::malformed_payload, "invalid JSON");
  if (!obj.is_object())
    throw decode_error(decode_error_kind::malformed_payload,
                       "payload is not a JSON object");

  std::string type = detail::string_field(obj, "type");
  if (type.empty() && obj.contains("command"))
    type = "command";
  if (type.empty())
    throw decode_error(decode_error_kind::malformed_payload,
                       "missing type field");

  std::string timestamp = detail::string_field(obj, "timestamp");

  if (type == "command") {
    command_message cmd;
    cmd.command = detail::string_field(obj, "command");
    if (cmd.command.empty())
      throw decode_error(decode_error_kind::malformed_payload,
                         "command without a name");
    cmd.command_id = detail::string_field(obj, "command_id");
    cmd.client_id = detail::string_field(obj, "client_id");
    cmd.timestamp = timestamp;
    auto it = obj.find("params");
    if (it != obj.end() && it->is_object())
      cmd.params = *it;
    return cmd;
  }
  if (type == "response") {
    return response_message{detail::string_field(obj, "command_id"),
                            detail::object_field(obj, "result"), timestamp};
  }
  if (type == "error") {
    return error_message{detail::string_field(obj, "command_id"),
                         detail::string_field(obj, "error"),
                         detail::string_field(obj, "details"), timestamp};
  }
  if (type == "status_update") {
    return status_update_message{detail::object_field(obj, "status"),
                                 timestamp};
  }
  if (type == "event") {
    event_message ev{detail::string_field(obj, "event_type"),
                     detail::object_field(obj, "data"), timestamp};
    if (ev.event_type.empty())
      throw decode_error(decode_error_kind::malformed_payload,
                         "event without event_type");
    return ev;
  }
  if (type == kAnnounceType) {
    discovery_announce an;
    an.server_id = detail::string_field(obj, "server_id");
    // Absent api_port stays 0 and the listener falls back to its default.
    auto it = obj.find("api_port");
    if (it != obj.end() && !it->is_null()) {
      long long port = 0;
      if (it->is_number_integer()) {
        port = it->get<long long>();
      } else if (it->is_string()) {
        try {
          port = std::stoll(it->get<std::string>());
        } catch (const std::exception &) {
          throw decode_error(decode_error_kind::malformed_payload,
                             "announce api_port is not a number");
        }
      } else {
        throw decode_error(decode_error_kind::malformed_payload,
                           "announce api_port is not a number");
      }
      if (port < 1 || port > 65535)
        throw decode_error(decode_error_kind::malformed_payload,
                           "announce api_port out of range: " +
                               std::to_string(port));
      an.api_port = static_cast<int>(port);
    }
    an.api_version = detail::string_field(obj, "api_version");
    an.timestamp = timestamp;
    return an;
  }

  throw decode_error(decode_error_kind::unknown_type,
                     "unknown message type: " + type);
}

} // namespace hapticlink
