#pragma once

#include "message.hpp"
#include "options.hpp"
#include "udp.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <functional>
#include <map>
#include <mutex>
#include <poll.h>
#include <set>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace hapticlink {

/// Service side of the protocol: answers discovery probes, runs commands
/// and pushes status and events to known clients.
class responder {
public:
  /// Runs any command the responder does not handle itself. Throw to reply
  /// with an error.
  using executor_fn = std::function<json(const std::string &, const json &)>;

  struct counters {
    uint64_t commands = 0;
    uint64_t errors_sent = 0;
    uint64_t probes_answered = 0;
    uint64_t events_sent = 0;
    uint64_t status_pushes = 0;
    uint64_t clients_dropped = 0;
  };

  explicit responder(responder_options opts, executor_fn executor = nullptr)
      : opts_(std::move(opts)), executor_(std::move(executor)) {
    server_id_ = opts_.server_id.empty() ? "haptics-" + random_hex(8)
                                         : opts_.server_id;
  }

  ~responder() { stop(); }

  responder(const responder &) = delete;
  responder &operator=(const responder &) = delete;

  /// Bind both sockets and start serving. Port 0 picks an ephemeral port.
  void start() {
    if (running_.load())
      return;
    service_fd_ = open_udp_socket(opts_.service_port, false, opts_.bind_host);
    try {
      discovery_fd_ =
          open_udp_socket(opts_.discovery_port, false, opts_.bind_host);
    } catch (const std::exception &) {
      close_udp_socket(service_fd_);
      throw;
    }
    service_port_ = bound_port(service_fd_);
    discovery_port_ = bound_port(discovery_fd_);
    started_at_ = std::chrono::steady_clock::now();

    stop_.store(false);
    running_.store(true);
    io_thread_ = std::thread([this]() { io_loop(); });
    spdlog::info("[responder] {} serving on {}:{} (discovery {})", server_id_,
                 opts_.bind_host, service_port_, discovery_port_);
  }

  void stop() {
    stop_.store(true);
    if (io_thread_.joinable())
      io_thread_.join();
    if (running_.exchange(false))
      spdlog::info("[responder] stopped");
    close_udp_socket(service_fd_);
    close_udp_socket(discovery_fd_);
  }

  bool running() const { return running_.load(); }
  int service_port() const { return service_port_; }
  int discovery_port() const { return discovery_port_; }
  const std::string &server_id() const { return server_id_; }

  /// Send an event to every client registered for event_type, or only to
  /// target when it is registered. Returns the number of datagrams sent.
  size_t publish_event(const std::string &event_type, const json &data,
                       const std::string &target = "") {
    if (event_type.empty())
      throw std::invalid_argument("event_type is required");

    std::vector<endpoint> recipients;
    {
      std::lock_guard<std::mutex> lock(mu_);
      for (const auto &kv : clients_) {
        if (!target.empty() && kv.first != target)
          continue;
        if (kv.second.events.count(event_type) != 0)
          recipients.push_back(kv.second.address);
      }
    }

    json body = data.is_object() ? data : json{{"value", data}};
    const std::string payload = encode(event_message{event_type, body, ""});
    size_t sent = 0;
    for (const auto &ep : recipients) {
      if (send_to(ep, payload))
        ++sent;
    }
    std::lock_guard<std::mutex> lock(mu_);
    counters_.events_sent += sent;
    return sent;
  }

  size_t client_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return clients_.size();
  }

  std::vector<std::string> registered_events(const std::string &client_id) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = clients_.find(client_id);
    if (it == clients_.end())
      return {};
    return {it->second.events.begin(), it->second.events.end()};
  }

  counters stats() const {
    std::lock_guard<std::mutex> lock(mu_);
    return counters_;
  }

  /// Server state as returned by get_status and pushed in status updates.
  json status() const {
    double uptime = std::chrono::duration<double>(
                        std::chrono::steady_clock::now() - started_at_)
                        .count();
    long total = static_cast<long>(uptime);
    char text[64];
    std::snprintf(text, sizeof(text), "%ldd %ldh %ldm %lds", total / 86400,
                  (total % 86400) / 3600, (total % 3600) / 60, total % 60);

    json events = json::object();
    size_t clients = 0;
    {
      std::lock_guard<std::mutex> lock(mu_);
      clients = clients_.size();
      for (const auto &kv : clients_) {
        for (const auto &type : kv.second.events)
          events[type] = events.value(type, 0) + 1;
      }
    }
    return {{"server_id", server_id_},
            {"api_version", opts_.api_version},
            {"uptime", std::string(text)},
            {"uptime_seconds", uptime},
            {"connected_clients", clients},
            {"registered_events", events}};
  }

private:
  struct client_entry {
    endpoint address;
    std::set<std::string> events;
  };

  void io_loop() {
    auto next_status = std::chrono::steady_clock::now() +
                       std::chrono::milliseconds(opts_.status_interval_ms);
    std::string datagram;
    while (!stop_.load()) {
      pollfd fds[2] = {{discovery_fd_, POLLIN, 0}, {service_fd_, POLLIN, 0}};
      int rc = ::poll(fds, 2, 50);
      if (rc < 0 && errno != EINTR) {
        spdlog::error("[responder] poll failed: {}", std::strerror(errno));
        break;
      }

      if (rc > 0 && (fds[0].revents & POLLIN) != 0)
        read_one(discovery_fd_, datagram, true);
      if (rc > 0 && (fds[1].revents & POLLIN) != 0)
        read_one(service_fd_, datagram, false);

      if (opts_.status_interval_ms > 0 &&
          std::chrono::steady_clock::now() >= next_status) {
        push_status();
        next_status = std::chrono::steady_clock::now() +
                      std::chrono::milliseconds(opts_.status_interval_ms);
      }
    }
    running_.store(false);
  }

  void read_one(int fd, std::string &datagram, bool discovery_socket) {
    endpoint from;
    int err = 0;
    auto status = recv_datagram(fd, 0, datagram, &from, &err);
    if (status != recv_status::ok) {
      if (status != recv_status::timeout)
        spdlog::trace("[responder] read error: {}", std::strerror(err));
      return;
    }
    try {
      if (discovery_socket)
        handle_discovery(datagram, from);
      else
        handle_command(datagram, from);
    } catch (const std::exception &e) {
      spdlog::error("[responder] handling datagram from {} failed: {}",
                    from.str(), e.what());
    }
  }

  void handle_discovery(const std::string &datagram, const endpoint &from) {
    message msg;
    try {
      msg = decode(datagram);
    } catch (const decode_error &e) {
      spdlog::debug("[responder] ignoring discovery datagram from {}: {}",
                    from.str(), e.what());
      return;
    }
    if (!std::holds_alternative<discovery_probe>(msg))
      return;

    spdlog::info("[responder] discovery request from {}", from.str());
    discovery_announce an{server_id_, service_port_, opts_.api_version, ""};
    if (!send_datagram_to(discovery_fd_, from, encode(an))) {
      spdlog::warn("[responder] announce to {} failed: {}", from.str(),
                   std::strerror(errno));
      return;
    }
    std::lock_guard<std::mutex> lock(mu_);
    ++counters_.probes_answered;
  }

  void handle_command(const std::string &datagram, const endpoint &from) {
    message msg;
    try {
      msg = decode(datagram);
    } catch (const decode_error &e) {
      spdlog::error("[responder] invalid payload from {}: {}", from.str(),
                    e.what());
      send_error(from, "", "Invalid JSON format", e.what());
      return;
    }
    auto *cmd = std::get_if<command_message>(&msg);
    if (cmd == nullptr) {
      spdlog::debug("[responder] ignoring {} from {}", type_name(msg),
                    from.str());
      return;
    }

    std::string client_id =
        cmd->client_id.empty() ? from.str() : cmd->client_id;
    const std::string command_id =
        cmd->command_id.empty() ? random_hex(16) : cmd->command_id;
    const json params = cmd->params.is_object() ? cmd->params : json::object();
    {
      std::lock_guard<std::mutex> lock(mu_);
      ++counters_.commands;
      auto it = clients_.find(client_id);
      if (it == clients_.end()) {
        spdlog::info("[responder] new client {} at {}", client_id, from.str());
        clients_[client_id].address = from;
      } else {
        it->second.address = from;
      }
    }
    spdlog::debug("[responder] {} from {} ({})", cmd->command, client_id,
                  command_id);

    json result;
    try {
      result = run_command(cmd->command, params, client_id);
    } catch (const std::exception &e) {
      spdlog::error("[responder] {} failed: {}", cmd->command, e.what());
      send_error(from, command_id, e.what(), "");
      return;
    }
    if (!result.is_object())
      result = {{"success", true}, {"result", result}};
    send_to(from, encode(response_message{command_id, result, ""}));
  }

  json run_command(const std::string &command, const json &params,
                   const std::string &client_id) {
    if (command == "ping") {
      return {{"success", true},
              {"message", "Pong"},
              {"timestamp", iso_timestamp()},
              {"echo", params.value("message", std::string())}};
    }
    if (command == "get_status")
      return status();
    if (command == "register_event_callback") {
      std::string type = detail::string_field(params, "event_type");
      if (type.empty())
        return {{"success", false}, {"error", "Missing event_type parameter"}};
      std::lock_guard<std::mutex> lock(mu_);
      clients_[client_id].events.insert(type);
      return {{"success", true}, {"message", "Registered for event: " + type}};
    }
    if (command == "unregister_event_callback") {
      std::string type = detail::string_field(params, "event_type");
      std::lock_guard<std::mutex> lock(mu_);
      auto &events = clients_[client_id].events;
      if (type.empty()) {
        events.clear();
        return {{"success", true}, {"message", "Unregistered from all events"}};
      }
      events.erase(type);
      return {{"success", true}, {"message", "Unregistered from event: " + type}};
    }
    if (!executor_)
      throw std::runtime_error("Unknown command: " + command);
    return executor_(command, params);
  }

  /// Send a status update to every known client. Clients that cannot be
  /// reached are forgotten.
  void push_status() {
    std::vector<std::pair<std::string, endpoint>> targets;
    {
      std::lock_guard<std::mutex> lock(mu_);
      for (const auto &kv : clients_)
        targets.emplace_back(kv.first, kv.second.address);
    }
    if (targets.empty())
      return;
    const std::string payload = encode(status_update_message{status(), ""});
    std::vector<std::pair<std::string, endpoint>> unreachable;
    for (const auto &target : targets) {
      if (!send_to(target.second, payload))
        unreachable.push_back(target);
    }
    std::lock_guard<std::mutex> lock(mu_);
    ++counters_.status_pushes;
    for (const auto &target : unreachable) {
      auto it = clients_.find(target.first);
      // Keep clients that sent a command from a new address since the snapshot.
      if (it == clients_.end() || it->second.address != target.second)
        continue;
      spdlog::warn("[responder] dropping unreachable client {}", target.first);
      clients_.erase(it);
      ++counters_.clients_dropped;
    }
  }

  void send_error(const endpoint &to, const std::string &command_id,
                  const std::string &error, const std::string &details) {
    if (send_to(to, encode(error_message{command_id, error, details, ""}))) {
      std::lock_guard<std::mutex> lock(mu_);
      ++counters_.errors_sent;
    }
  }

  bool send_to(const endpoint &to, const std::string &payload) {
    if (payload.size() > opts_.max_datagram_size) {
      spdlog::error("[responder] {} byte reply to {} exceeds the datagram limit",
                    payload.size(), to.str());
      return false;
    }
    if (!send_datagram_to(service_fd_, to, payload)) {
      spdlog::warn("[responder] send to {} failed: {}", to.str(),
                   std::strerror(errno));
      return false;
    }
    return true;
  }

  responder_options opts_;
  executor_fn executor_;
  std::string server_id_;

  int service_fd_ = -1;
  int discovery_fd_ = -1;
  int service_port_ = 0;
  int discovery_port_ = 0;
  std::chrono::steady_clock::time_point started_at_ =
      std::chrono::steady_clock::now();

  std::atomic<bool> stop_{false};
  std::atomic<bool> running_{false};
  std::thread io_thread_;

  mutable std::mutex mu_;
  std::map<std::string, client_entry> clients_;
  counters counters_;
};

} // namespace hapticlink
