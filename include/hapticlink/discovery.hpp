#pragma once

#include "message.hpp"
#include "udp.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <spdlog/spdlog.h>
#include <string>
#include <thread>
#include <vector>

namespace hapticlink {

struct discovery_options {
  int discovery_port = kDefaultDiscoveryPort;
  /// Used when an announce carries no usable api_port.
  int fallback_service_port = kDefaultServicePort;
  int attempts = 5;
  int window_ms = 1000;
  int pause_ms = 500;
  /// Empty means enumerate local interfaces.
  std::vector<std::string> broadcast_addresses;
};

struct discovery_result {
  bool found = false;
  bool cancelled = false;
  int attempts = 0;
  endpoint service;
  std::string server_id;
  std::string api_version;
  /// Set when the probe socket failed and the round was abandoned.
  std::string error;
};

/// One broadcast-and-listen round, optionally on its own thread.
class discovery {
public:
  using done_fn = std::function<void(const discovery_result &)>;

  explicit discovery(discovery_options opts) : opts_(std::move(opts)) {}
  ~discovery() { cancel(); }

  discovery(const discovery &) = delete;
  discovery &operator=(const discovery &) = delete;

  /// Run a round in the background; done is called from that thread.
  void start(done_fn done) {
    cancel();
    cancel_.store(false);
    running_.store(true);
    thread_ = std::thread([this, done = std::move(done)]() {
      auto result = run();
      running_.store(false);
      if (done)
        done(result);
    });
  }

  /// Stop a background round and wait for its thread.
  void cancel() {
    cancel_.store(true);
    if (thread_.joinable())
      thread_.join();
    running_.store(false);
  }

  bool running() const { return running_.load(); }

  /// Blocking round on the calling thread.
  discovery_result run() {
    int fd = -1;
    try {
      fd = open_udp_socket(0, true);
    } catch (const std::exception &e) {
      spdlog::error("[discovery] cannot open probe socket: {}", e.what());
      discovery_result result;
      result.error = e.what();
      return result;
    }
    auto result = run_on(fd);
    close_udp_socket(fd);
    return result;
  }

  /// Blocking round over an already open probe socket, which the caller
  /// keeps ownership of.
  discovery_result run_on(int fd) {
    discovery_result result;
    auto targets = opts_.broadcast_addresses.empty()
                       ? local_broadcast_addresses()
                       : opts_.broadcast_addresses;
    const std::string probe = encode(discovery_probe{});
    spdlog::info("[discovery] looking for a responder on port {} ({} address(es))",
                 opts_.discovery_port, targets.size());

    while (result.attempts < opts_.attempts && !cancel_.load()) {
      ++result.attempts;
      spdlog::debug("[discovery] attempt {}/{}", result.attempts, opts_.attempts);

      for (const auto &addr : targets) {
        if (!send_datagram_to(fd, {addr, opts_.discovery_port}, probe))
          spdlog::trace("[discovery] probe to {} failed: {}", addr,
                        std::strerror(errno));
      }

      if (listen_window(fd, result) || !result.error.empty())
        break;

      if (result.attempts < opts_.attempts)
        sleep_interruptible(opts_.pause_ms);
    }

    result.cancelled = cancel_.load() && !result.found;
    if (result.found) {
      spdlog::info("[discovery] found responder {} at {}", result.server_id,
                   result.service.str());
    } else if (!result.error.empty()) {
      spdlog::error("[discovery] round abandoned: {}", result.error);
    } else if (!result.cancelled) {
      spdlog::warn("[discovery] no responder after {} attempt(s)",
                   result.attempts);
    }
    return result;
  }

private:
  bool listen_window(int fd, discovery_result &result) {
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(opts_.window_ms);
    std::string datagram;
    while (!cancel_.load()) {
      auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                      deadline - std::chrono::steady_clock::now())
                      .count();
      if (left <= 0)
        return false;

      endpoint from;
      int err = 0;
      auto status = recv_datagram(fd, static_cast<int>(std::min<long long>(left, 50)),
                                  datagram, &from, &err);
      if (status == recv_status::timeout)
        continue;
      if (status == recv_status::fatal) {
        result.error = std::strerror(err);
        return false;
      }
      if (status != recv_status::ok) {
        spdlog::trace("[discovery] receive error: {}", std::strerror(err));
        continue;
      }

      try {
        auto msg = decode(datagram);
        auto *announce = std::get_if<discovery_announce>(&msg);
        if (announce == nullptr) {
          spdlog::trace("[discovery] ignoring {} from {}", type_name(msg),
                        from.str());
          continue;
        }
        result.found = true;
        result.server_id = announce->server_id;
        result.api_version = announce->api_version;
        result.service = {from.host, announce->api_port > 0
                                         ? announce->api_port
                                         : opts_.fallback_service_port};
        return true;
      } catch (const decode_error &e) {
        spdlog::debug("[discovery] malformed reply from {}: {}", from.str(),
                      e.what());
      }
    }
    return false;
  }

  void sleep_interruptible(int duration_ms) const {
    int slept = 0;
    while (!cancel_.load() && slept < duration_ms) {
      int step = std::min(50, duration_ms - slept);
      std::this_thread::sleep_for(std::chrono::milliseconds(step));
      slept += step;
    }
  }

  discovery_options opts_;
  std::atomic<bool> cancel_{false};
  std::atomic<bool> running_{false};
  std::thread thread_;
};

} // namespace hapticlink
