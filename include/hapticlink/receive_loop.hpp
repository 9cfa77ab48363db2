#pragma once

#include "command_channel.hpp"
#include "event_dispatcher.hpp"
#include "message.hpp"
#include "udp.hpp"

#include <atomic>
#include <cstring>
#include <functional>
#include <spdlog/spdlog.h>
#include <string>
#include <thread>

namespace hapticlink {

/// Background reader for the command socket.
class receive_loop {
public:
  struct hooks {
    /// Any decoded datagram from the server; used as a sign of life.
    std::function<void()> on_traffic;
    std::function<void(const status_update_message &)> on_status;
    std::function<void(const error_message &)> on_server_error;
    /// The socket is unusable; the loop has ended.
    std::function<void(const std::string &)> on_fatal;
  };

  receive_loop(command_channel &channel, event_dispatcher &events, hooks h,
               int poll_interval_ms = 100)
      : channel_(channel), events_(events), hooks_(std::move(h)),
        poll_interval_ms_(poll_interval_ms) {}

  ~receive_loop() { stop(); }

  receive_loop(const receive_loop &) = delete;
  receive_loop &operator=(const receive_loop &) = delete;

  void start() {
    stop();
    stop_.store(false);
    running_.store(true);
    thread_ = std::thread([this]() { run(); });
  }

  /// Cancel and join. Safe to call when not running.
  void stop() {
    stop_.store(true);
    if (thread_.joinable())
      thread_.join();
    running_.store(false);
  }

  bool running() const { return running_.load(); }

  /// Classify one datagram and hand it on. Runs on the reader thread.
  void dispatch(const std::string &datagram) {
    message msg;
    try {
      msg = decode(datagram);
    } catch (const decode_error &e) {
      decode_errors_.fetch_add(1);
      spdlog::warn("[receiver] dropping datagram: {}", e.what());
      return;
    }

    if (hooks_.on_traffic)
      hooks_.on_traffic();

    if (auto *res = std::get_if<response_message>(&msg)) {
      channel_.handle_response(*res);
    } else if (auto *err = std::get_if<error_message>(&msg)) {
      spdlog::warn("[receiver] server error: {}", err->error);
      channel_.handle_error(*err);
      if (hooks_.on_server_error)
        hooks_.on_server_error(*err);
    } else if (auto *st = std::get_if<status_update_message>(&msg)) {
      if (hooks_.on_status)
        hooks_.on_status(*st);
    } else if (auto *ev = std::get_if<event_message>(&msg)) {
      events_.dispatch(*ev);
    } else {
      spdlog::debug("[receiver] ignoring {} on the command channel",
                    type_name(msg));
    }
  }

  uint64_t decode_errors() const { return decode_errors_.load(); }

private:
  void run() {
    spdlog::debug("[receiver] started");
    std::string datagram;
    while (!stop_.load()) {
      int fd = channel_.fd();
      if (fd < 0) {
        fail("command socket closed");
        return;
      }

      int err = 0;
      auto status = recv_datagram(fd, poll_interval_ms_, datagram, nullptr, &err);
      if (stop_.load())
        break;

      switch (status) {
      case recv_status::ok:
        try {
          dispatch(datagram);
        } catch (const std::exception &e) {
          spdlog::error("[receiver] dispatch failed: {}", e.what());
        }
        break;
      case recv_status::timeout:
        break;
      case recv_status::transient:
        spdlog::trace("[receiver] transient read error: {}", std::strerror(err));
        break;
      case recv_status::fatal:
        fail(std::strerror(err));
        return;
      }
    }
    running_.store(false);
    spdlog::debug("[receiver] stopped");
  }

  void fail(const std::string &reason) {
    running_.store(false);
    spdlog::error("[receiver] transport failure: {}", reason);
    if (hooks_.on_fatal)
      hooks_.on_fatal(reason);
  }

  command_channel &channel_;
  event_dispatcher &events_;
  hooks hooks_;
  int poll_interval_ms_;

  std::atomic<bool> stop_{false};
  std::atomic<bool> running_{false};
  std::atomic<uint64_t> decode_errors_{0};
  std::thread thread_;
};

} // namespace hapticlink
