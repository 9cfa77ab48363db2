#pragma once

#include "command_channel.hpp"
#include "discovery.hpp"
#include "event_dispatcher.hpp"
#include "message.hpp"
#include "options.hpp"
#include "receive_loop.hpp"
#include "udp.hpp"
#include "work_queue.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <thread>

namespace hapticlink {

enum class connection_state { disconnected, discovering, connecting, connected };

inline const char *to_string(connection_state s) {
  switch (s) {
  case connection_state::disconnected:
    return "disconnected";
  case connection_state::discovering:
    return "discovering";
  case connection_state::connecting:
    return "connecting";
  case connection_state::connected:
    return "connected";
  }
  return "unknown";
}

struct client_stats {
  uint64_t commands_sent = 0;
  uint64_t responses_matched = 0;
  uint64_t unmatched_responses = 0;
  uint64_t expired_commands = 0;
  uint64_t decode_errors = 0;
  uint64_t discovery_rounds = 0;
  uint64_t discovery_attempts = 0;
  uint64_t retries_scheduled = 0;
  uint64_t connects = 0;
  uint64_t disconnects = 0;
};

/// Client side of the haptics control protocol.
///
/// All callbacks (command continuations, event handlers, notifications) run
/// on the thread that calls poll(). Background threads only read the socket
/// and run discovery rounds.
class haptic_client {
public:
  using clock = std::chrono::steady_clock;
  using continuation = command_channel::continuation;
  using handler_fn = event_dispatcher::handler_fn;

  explicit haptic_client(client_options opts = {})
      : opts_(std::move(opts)), client_id_(make_client_identity()),
        channel_(client_id_, queue_, opts_.max_datagram_size),
        events_(channel_, queue_, [this]() { return is_connected(); }),
        receiver_(channel_, events_, make_hooks()) {
    spdlog::debug("[client] identity {}", client_id_);
  }

  ~haptic_client() { shutdown(false); }

  haptic_client(const haptic_client &) = delete;
  haptic_client &operator=(const haptic_client &) = delete;

  /// Start discovery. No-op unless disconnected.
  void connect() {
    {
      std::lock_guard<std::mutex> lock(state_mu_);
      if (state_ != connection_state::disconnected) {
        spdlog::debug("[client] connect ignored while {}", to_string(state_));
        return;
      }
      user_disconnect_ = false;
      direct_.reset();
      retry_at_.reset();
    }
    spdlog::info("[client] connecting to haptics server");
    begin_discovery();
  }

  /// Skip discovery and probe host:port directly. port < 0 uses the
  /// configured service port.
  void connect_direct(const std::string &host, int port = -1) {
    endpoint ep{host, port < 0 ? opts_.service_port : port};
    if (!is_ipv4_literal(ep.host))
      throw std::invalid_argument("invalid IPv4 host: " + ep.host);
    if (ep.port < 1 || ep.port > 65535)
      throw std::invalid_argument("invalid port: " + std::to_string(ep.port));
    {
      std::lock_guard<std::mutex> lock(state_mu_);
      if (state_ != connection_state::disconnected) {
        spdlog::debug("[client] connect ignored while {}", to_string(state_));
        return;
      }
      user_disconnect_ = false;
      direct_ = ep;
      retry_at_.reset();
    }
    spdlog::info("[client] connecting directly to {}", ep.str());
    begin_connecting(ep, "connection_check");
  }

  /// Drop the connection from any state and cancel the pending retry.
  /// Pending continuations, and callbacks already queued for poll(), are
  /// discarded without being called. on_disconnected runs before returning.
  void disconnect() { shutdown(true); }

  /// Run queued callbacks and timers. Call regularly from the owning loop.
  size_t poll() {
    size_t ran = queue_.drain();
    auto now = clock::now();

    fire_due_retry(now);
    check_connect_timeout(now);
    check_liveness(now);

    if (opts_.command_timeout_ms > 0)
      channel_.expire_older_than(std::chrono::milliseconds(opts_.command_timeout_ms));
    return ran;
  }

  /// poll() until done() holds or timeout passes.
  bool poll_until(const std::function<bool()> &done,
                  std::chrono::milliseconds timeout,
                  std::chrono::milliseconds step = std::chrono::milliseconds(5)) {
    auto deadline = clock::now() + timeout;
    while (true) {
      poll();
      if (done())
        return true;
      if (clock::now() >= deadline)
        return false;
      std::this_thread::sleep_for(step);
    }
  }

  /// Send a command while connected. Returns the correlation id, or nullopt
  /// when not connected or the send failed.
  std::optional<std::string> send(const std::string &command,
                                  const json &params = nullptr,
                                  continuation cb = nullptr) {
    if (!is_connected()) {
      spdlog::warn("[client] rejected '{}': not connected", command);
      return std::nullopt;
    }
    return channel_.send(command, params, std::move(cb));
  }

  void subscribe(const std::string &event_type, handler_fn handler) {
    events_.subscribe(event_type, std::move(handler));
  }

  void unsubscribe(const std::string &event_type) {
    events_.unsubscribe(event_type);
  }

  void on_connected(std::function<void()> fn) { on_connected_ = std::move(fn); }
  void on_disconnected(std::function<void()> fn) {
    on_disconnected_ = std::move(fn);
  }
  void on_status(std::function<void(const json &)> fn) {
    on_status_ = std::move(fn);
  }
  void on_error(std::function<void(const std::string &)> fn) {
    on_error_ = std::move(fn);
  }

  connection_state state() const {
    std::lock_guard<std::mutex> lock(state_mu_);
    return state_;
  }

  bool is_connected() const { return state() == connection_state::connected; }

  std::optional<endpoint> current_endpoint() const { return channel_.remote(); }

  std::string server_id() const {
    std::lock_guard<std::mutex> lock(state_mu_);
    return server_id_;
  }

  const std::string &client_id() const { return client_id_; }
  const client_options &options() const { return opts_; }
  size_t pending_count() const { return channel_.pending_count(); }

  client_stats stats() const {
    client_stats s;
    {
      std::lock_guard<std::mutex> lock(state_mu_);
      s = stats_;
    }
    auto c = channel_.counters();
    s.commands_sent = c.sent;
    s.responses_matched = c.matched;
    s.unmatched_responses = c.unmatched;
    s.expired_commands = c.expired;
    s.decode_errors = receiver_.decode_errors();
    return s;
  }

  // Convenience wrappers for the responder's command set.

  std::optional<std::string> ping(const std::string &text = "",
                                  continuation cb = nullptr) {
    return send("ping", {{"message", text}}, std::move(cb));
  }

  std::optional<std::string> get_status(continuation cb = nullptr) {
    return send("get_status", nullptr, std::move(cb));
  }

  std::optional<std::string> get_device_status(const std::string &device_type,
                                               continuation cb = nullptr) {
    json params = json::object();
    if (!device_type.empty())
      params["device_type"] = device_type;
    return send("get_device_status", params, std::move(cb));
  }

  std::optional<std::string> play_pattern(const std::string &pattern_file,
                                          const std::string &key = "",
                                          continuation cb = nullptr) {
    json params = {{"pattern_file", pattern_file}};
    if (!key.empty())
      params["key"] = key;
    return send("play_pattern", params, std::move(cb));
  }

  std::optional<std::string> stop_pattern(const std::string &key = "",
                                          continuation cb = nullptr) {
    json params = json::object();
    if (!key.empty())
      params["key"] = key;
    return send("stop_pattern", params, std::move(cb));
  }

  std::optional<std::string> is_pattern_playing(const std::string &key = "",
                                                continuation cb = nullptr) {
    json params = json::object();
    if (!key.empty())
      params["key"] = key;
    return send("is_pattern_playing", params, std::move(cb));
  }

  std::optional<std::string> shutdown_server(continuation cb = nullptr) {
    return send("shutdown", nullptr, std::move(cb));
  }

private:
  receive_loop::hooks make_hooks() {
    receive_loop::hooks h;
    h.on_traffic = [this]() {
      std::lock_guard<std::mutex> lock(state_mu_);
      last_heard_ = clock::now();
    };
    h.on_status = [this](const status_update_message &st) {
      {
        std::lock_guard<std::mutex> lock(state_mu_);
        auto it = st.status.find("server_id");
        if (it != st.status.end() && it->is_string())
          server_id_ = it->get<std::string>();
      }
      queue_.post([this, status = st.status]() {
        if (on_status_)
          on_status_(status);
      });
    };
    h.on_server_error = [this](const error_message &err) {
      queue_.post([this, text = err.error]() {
        if (on_error_)
          on_error_(text);
      });
    };
    h.on_fatal = [this](const std::string &reason) {
      uint64_t gen = 0;
      connection_state was;
      {
        std::lock_guard<std::mutex> lock(state_mu_);
        was = state_;
        if (was != connection_state::connecting &&
            was != connection_state::connected)
          return;
        state_ = connection_state::disconnected;
        gen = generation_;
      }
      queue_.post([this, gen, was, reason]() {
        {
          std::lock_guard<std::mutex> lock(state_mu_);
          if (gen != generation_)
            return;
        }
        finish_drop(was, reason);
      });
    };
    return h;
  }

  void begin_discovery() {
    teardown_connection();
    uint64_t gen = 0;
    {
      std::lock_guard<std::mutex> lock(state_mu_);
      state_ = connection_state::discovering;
      gen = ++generation_;
      ++stats_.discovery_rounds;
    }
    discovery_ = std::make_unique<discovery>(opts_.discovery_settings());
    discovery_->start([this, gen](const discovery_result &result) {
      queue_.post([this, gen, result]() { on_discovery_done(gen, result); });
    });
  }

  void on_discovery_done(uint64_t gen, const discovery_result &result) {
    {
      std::lock_guard<std::mutex> lock(state_mu_);
      stats_.discovery_attempts += static_cast<uint64_t>(result.attempts);
      if (gen != generation_ || state_ != connection_state::discovering)
        return;
      if (!result.found) {
        state_ = connection_state::disconnected;
      } else {
        server_id_ = result.server_id;
      }
    }
    if (!result.found) {
      schedule_retry(result.error.empty() ? "no responder found"
                                          : "discovery failed: " + result.error);
      return;
    }
    begin_connecting(result.service, "discovery_connection");
  }

  void begin_connecting(const endpoint &ep, const std::string &marker) {
    teardown_connection();
    try {
      channel_.open(ep);
    } catch (const std::exception &e) {
      spdlog::error("[client] cannot open command socket to {}: {}", ep.str(),
                    e.what());
      {
        std::lock_guard<std::mutex> lock(state_mu_);
        state_ = connection_state::disconnected;
        ++generation_;
      }
      schedule_retry(e.what());
      return;
    }

    uint64_t gen = 0;
    {
      std::lock_guard<std::mutex> lock(state_mu_);
      state_ = connection_state::connecting;
      gen = ++generation_;
      connect_deadline_ =
          clock::now() + std::chrono::milliseconds(opts_.connect_timeout_ms);
      probe_outstanding_ = false;
      last_heard_ = clock::now();
    }
    receiver_.start();

    auto id = channel_.send("ping", {{"message", marker}},
                            [this, gen](const json &result) {
                              on_connect_probe(gen, result);
                            });
    if (!id)
      drop_connection(gen, "liveness probe could not be sent");
  }

  void on_connect_probe(uint64_t gen, const json &result) {
    {
      std::lock_guard<std::mutex> lock(state_mu_);
      if (gen != generation_ || state_ != connection_state::connecting)
        return;
      if (result.value("success", false)) {
        state_ = connection_state::connected;
        connect_deadline_.reset();
        last_heard_ = clock::now();
        ++stats_.connects;
      }
    }
    if (!result.value("success", false)) {
      drop_connection(gen, "probe rejected: " +
                               result.value("error", std::string("no success flag")));
      return;
    }

    auto ep = channel_.remote();
    spdlog::info("[client] connected to haptics server at {}",
                 ep ? ep->str() : std::string("?"));
    events_.register_all();
    channel_.send("get_status", nullptr, [](const json &) {
      spdlog::debug("[client] received server status");
    });
    if (on_connected_)
      on_connected_();
  }

  /// Transition gen's connection to disconnected, then clean up.
  void drop_connection(uint64_t gen, const std::string &reason) {
    connection_state was;
    {
      std::lock_guard<std::mutex> lock(state_mu_);
      if (gen != generation_)
        return;
      was = state_;
      if (was == connection_state::disconnected)
        return;
      state_ = connection_state::disconnected;
    }
    finish_drop(was, reason);
  }

  void finish_drop(connection_state was, const std::string &reason) {
    teardown_connection();
    {
      std::lock_guard<std::mutex> lock(state_mu_);
      ++generation_;
      if (was == connection_state::connected)
        ++stats_.disconnects;
    }
    if (was == connection_state::connected) {
      spdlog::warn("[client] connection lost: {}", reason);
      if (on_disconnected_)
        on_disconnected_();
    } else {
      spdlog::warn("[client] connection attempt failed: {}", reason);
    }
    schedule_retry(reason);
  }

  void schedule_retry(const std::string &reason) {
    {
      std::lock_guard<std::mutex> lock(state_mu_);
      if (user_disconnect_ || !opts_.auto_retry)
        return;
      retry_at_ = clock::now() + std::chrono::milliseconds(opts_.retry_interval_ms);
      ++stats_.retries_scheduled;
    }
    spdlog::info("[client] retrying in {} ms ({})", opts_.retry_interval_ms,
                 reason);
  }

  void fire_due_retry(clock::time_point now) {
    std::optional<endpoint> direct;
    {
      std::lock_guard<std::mutex> lock(state_mu_);
      if (!retry_at_ || now < *retry_at_)
        return;
      retry_at_.reset();
      if (user_disconnect_ || state_ != connection_state::disconnected)
        return;
      direct = direct_;
    }
    if (direct)
      begin_connecting(*direct, "connection_check");
    else
      begin_discovery();
  }

  void check_connect_timeout(clock::time_point now) {
    uint64_t gen = 0;
    {
      std::lock_guard<std::mutex> lock(state_mu_);
      if (state_ != connection_state::connecting || !connect_deadline_ ||
          now < *connect_deadline_)
        return;
      gen = generation_;
    }
    drop_connection(gen, "no answer to the connection probe");
  }

  void check_liveness(clock::time_point now) {
    auto interval = std::chrono::milliseconds(opts_.liveness_interval_ms);
    uint64_t gen = 0;
    bool lost = false;
    bool probe = false;
    {
      std::lock_guard<std::mutex> lock(state_mu_);
      if (state_ != connection_state::connected)
        return;
      gen = generation_;
      if (probe_outstanding_) {
        if (last_heard_ > probe_sent_at_)
          probe_outstanding_ = false;
        else if (now - probe_sent_at_ >= interval)
          lost = true;
      } else if (now - last_heard_ >= interval) {
        probe = true;
        probe_outstanding_ = true;
        probe_sent_at_ = now;
      }
    }

    if (lost) {
      drop_connection(gen, "liveness probe unanswered");
      return;
    }
    if (probe) {
      spdlog::trace("[client] sending liveness probe");
      channel_.send("ping", {{"message", "status_check"}},
                    [this, gen](const json &) {
                      std::lock_guard<std::mutex> lock(state_mu_);
                      if (gen == generation_)
                        probe_outstanding_ = false;
                    });
    }
  }

  /// Stop background work and release the command socket. Never call with
  /// state_mu_ held: the reader takes it from its hooks.
  void teardown_connection() {
    if (discovery_) {
      discovery_->cancel();
      discovery_.reset();
    }
    receiver_.stop();
    channel_.close();
  }

  void shutdown(bool notify) {
    connection_state was;
    {
      std::lock_guard<std::mutex> lock(state_mu_);
      user_disconnect_ = true;
      retry_at_.reset();
      connect_deadline_.reset();
      probe_outstanding_ = false;
      was = state_;
      state_ = connection_state::disconnected;
      ++generation_;
      if (was == connection_state::connected)
        ++stats_.disconnects;
    }
    // Background threads are joined, so nothing can be posted after this.
    teardown_connection();
    queue_.clear();
    if (!notify)
      return;
    if (was != connection_state::disconnected)
      spdlog::info("[client] disconnected from haptics server");
    if (was == connection_state::connected && on_disconnected_)
      on_disconnected_();
  }

  client_options opts_;
  std::string client_id_;
  work_queue queue_;
  command_channel channel_;
  event_dispatcher events_;
  receive_loop receiver_;
  std::unique_ptr<discovery> discovery_;

  mutable std::mutex state_mu_;
  connection_state state_ = connection_state::disconnected;
  uint64_t generation_ = 0;
  bool user_disconnect_ = false;
  std::optional<endpoint> direct_;
  std::optional<clock::time_point> retry_at_;
  std::optional<clock::time_point> connect_deadline_;
  clock::time_point last_heard_{};
  clock::time_point probe_sent_at_{};
  bool probe_outstanding_ = false;
  std::string server_id_;
  client_stats stats_;

  std::function<void()> on_connected_;
  std::function<void()> on_disconnected_;
  std::function<void(const json &)> on_status_;
  std::function<void(const std::string &)> on_error_;
};

} // namespace hapticlink
