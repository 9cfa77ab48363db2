#pragma once

#include "message.hpp"
#include "udp.hpp"
#include "work_queue.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>
#include <vector>

namespace hapticlink {

/// Normalized failure handed to continuations for error replies.
inline json failure_result(const std::string &error) {
  return {{"success", false}, {"error", error}};
}

struct channel_counters {
  uint64_t sent = 0;
  uint64_t matched = 0;
  uint64_t unmatched = 0;
  uint64_t expired = 0;
};

/// Correlates commands with their replies over the command socket.
class command_channel {
public:
  using continuation = std::function<void(const json &)>;
  using clock = std::chrono::steady_clock;

  command_channel(std::string client_id, work_queue &queue,
                  size_t max_datagram_size = kMaxDatagramSize)
      : client_id_(std::move(client_id)), queue_(queue),
        max_datagram_size_(max_datagram_size) {}

  ~command_channel() { close(); }

  command_channel(const command_channel &) = delete;
  command_channel &operator=(const command_channel &) = delete;

  /// Open the command socket towards ep. Any previous socket is closed and
  /// its pending commands discarded.
  void open(const endpoint &ep) {
    close();
    int fd = open_udp_socket(0);
    try {
      connect_udp_socket(fd, ep);
    } catch (const std::exception &) {
      close_udp_socket(fd);
      throw;
    }
    std::lock_guard<std::mutex> lock(sock_mu_);
    fd_ = fd;
    remote_ = ep;
    spdlog::debug("[channel] command socket open towards {} (local port {})",
                  ep.str(), bound_port(fd));
  }

  /// Release the socket. The receive loop must already be stopped.
  void close() {
    {
      std::lock_guard<std::mutex> lock(sock_mu_);
      close_udp_socket(fd_);
      remote_.reset();
    }
    discard_pending();
  }

  bool is_open() const {
    std::lock_guard<std::mutex> lock(sock_mu_);
    return fd_ >= 0;
  }

  int fd() const {
    std::lock_guard<std::mutex> lock(sock_mu_);
    return fd_;
  }

  std::optional<endpoint> remote() const {
    std::lock_guard<std::mutex> lock(sock_mu_);
    return remote_;
  }

  const std::string &client_id() const { return client_id_; }

  /// Send a command. Returns its correlation id, or nullopt when no endpoint
  /// is set or the datagram could not be sent.
  std::optional<std::string> send(const std::string &command,
                                  const json &params = nullptr,
                                  continuation cb = nullptr) {
    if (command.empty())
      throw std::invalid_argument("command is required");

    int fd = this->fd();
    if (fd < 0) {
      spdlog::warn("[channel] cannot send '{}': no endpoint", command);
      return std::nullopt;
    }

    command_message cmd;
    cmd.command = command;
    cmd.command_id = client_id_ + ":" + std::to_string(next_id_.fetch_add(1));
    cmd.client_id = client_id_;
    cmd.timestamp = iso_timestamp();
    if (params.is_object())
      cmd.params = params;

    std::string payload = encode(cmd);
    if (payload.size() > max_datagram_size_) {
      spdlog::error("[channel] '{}' is {} bytes, over the {} byte datagram limit",
                    command, payload.size(), max_datagram_size_);
      return std::nullopt;
    }

    if (cb) {
      std::lock_guard<std::mutex> lock(pending_mu_);
      pending_[cmd.command_id] =
          pending_command{command, clock::now(), std::move(cb)};
    }

    if (!send_datagram(fd, payload)) {
      spdlog::warn("[channel] send of '{}' failed: {}", command,
                   std::strerror(errno));
      remove_pending(cmd.command_id);
      return std::nullopt;
    }

    sent_.fetch_add(1);
    spdlog::trace("[channel] sent {} ({})", command, cmd.command_id);
    return cmd.command_id;
  }

  /// Match a response. Returns false for unknown ids.
  bool handle_response(const response_message &res) {
    return complete(res.command_id, res.result.is_object() ? res.result
                                                           : json::object());
  }

  bool handle_error(const error_message &err) {
    if (err.command_id.empty()) {
      spdlog::warn("[channel] uncorrelated error from server: {}", err.error);
      return false;
    }
    return complete(err.command_id, failure_result(err.error));
  }

  /// Drop all pending commands without running their continuations.
  size_t discard_pending() {
    std::lock_guard<std::mutex> lock(pending_mu_);
    size_t n = pending_.size();
    pending_.clear();
    if (n > 0)
      spdlog::debug("[channel] discarded {} pending command(s)", n);
    return n;
  }

  /// Fail every pending command older than max_age.
  size_t expire_older_than(std::chrono::milliseconds max_age) {
    auto cutoff = clock::now() - max_age;
    std::vector<std::pair<std::string, pending_command>> expired;
    {
      std::lock_guard<std::mutex> lock(pending_mu_);
      for (auto it = pending_.begin(); it != pending_.end();) {
        if (it->second.created <= cutoff) {
          expired.emplace_back(it->first, std::move(it->second));
          it = pending_.erase(it);
        } else {
          ++it;
        }
      }
    }
    for (auto &kv : expired) {
      spdlog::warn("[channel] '{}' ({}) timed out", kv.second.command, kv.first);
      auto cb = std::move(kv.second.cb);
      queue_.post([cb]() { cb(failure_result("command timed out")); });
    }
    expired_.fetch_add(expired.size());
    return expired.size();
  }

  size_t pending_count() const {
    std::lock_guard<std::mutex> lock(pending_mu_);
    return pending_.size();
  }

  bool is_pending(const std::string &id) const {
    std::lock_guard<std::mutex> lock(pending_mu_);
    return pending_.count(id) != 0;
  }

  channel_counters counters() const {
    return {sent_.load(), matched_.load(), unmatched_.load(), expired_.load()};
  }

private:
  struct pending_command {
    std::string command;
    clock::time_point created;
    continuation cb;
  };

  bool complete(const std::string &id, json result) {
    pending_command entry;
    {
      std::lock_guard<std::mutex> lock(pending_mu_);
      auto it = pending_.find(id);
      if (it == pending_.end()) {
        unmatched_.fetch_add(1);
        spdlog::warn("[channel] reply for unknown command id {}", id);
        return false;
      }
      entry = std::move(it->second);
      pending_.erase(it);
    }
    matched_.fetch_add(1);
    spdlog::trace("[channel] reply for {} ({})", entry.command, id);
    queue_.post([cb = std::move(entry.cb), result = std::move(result)]() {
      cb(result);
    });
    return true;
  }

  void remove_pending(const std::string &id) {
    std::lock_guard<std::mutex> lock(pending_mu_);
    pending_.erase(id);
  }

  std::string client_id_;
  work_queue &queue_;
  size_t max_datagram_size_;

  mutable std::mutex sock_mu_;
  int fd_ = -1;
  std::optional<endpoint> remote_;

  mutable std::mutex pending_mu_;
  std::unordered_map<std::string, pending_command> pending_;

  std::atomic<uint64_t> next_id_{0};
  std::atomic<uint64_t> sent_{0};
  std::atomic<uint64_t> matched_{0};
  std::atomic<uint64_t> unmatched_{0};
  std::atomic<uint64_t> expired_{0};
};

} // namespace hapticlink
