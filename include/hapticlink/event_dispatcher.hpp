#pragma once

#include "command_channel.hpp"
#include "message.hpp"
#include "work_queue.hpp"

#include <functional>
#include <mutex>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>
#include <vector>

namespace hapticlink {

/// One handler per server-pushed event type.
class event_dispatcher {
public:
  using handler_fn = std::function<void(const json &)>;

  event_dispatcher(command_channel &channel, work_queue &queue,
                   std::function<bool()> is_connected)
      : channel_(channel), queue_(queue),
        is_connected_(std::move(is_connected)) {}

  /// Replace any handler for event_type. Registers remotely when connected.
  void subscribe(const std::string &event_type, handler_fn handler) {
    if (event_type.empty())
      throw std::invalid_argument("event_type is required");
    if (!handler)
      throw std::invalid_argument("handler is required");
    {
      std::lock_guard<std::mutex> lock(mu_);
      handlers_[event_type] = std::move(handler);
    }
    if (is_connected_())
      register_remote(event_type);
  }

  void unsubscribe(const std::string &event_type) {
    if (event_type.empty())
      throw std::invalid_argument("event_type is required");
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (handlers_.erase(event_type) == 0)
        return;
    }
    if (is_connected_())
      channel_.send("unregister_event_callback", {{"event_type", event_type}});
  }

  bool has_handler(const std::string &event_type) const {
    std::lock_guard<std::mutex> lock(mu_);
    return handlers_.count(event_type) != 0;
  }

  std::vector<std::string> registered_types() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<std::string> out;
    out.reserve(handlers_.size());
    for (const auto &kv : handlers_)
      out.push_back(kv.first);
    return out;
  }

  /// Announce every subscribed type to a freshly connected server.
  void register_all() {
    for (const auto &type : registered_types())
      register_remote(type);
  }

  /// Queue the handler for ev on the foreground. Returns false when nobody
  /// is subscribed, which is not an error.
  bool dispatch(const event_message &ev) {
    handler_fn handler;
    {
      std::lock_guard<std::mutex> lock(mu_);
      auto it = handlers_.find(ev.event_type);
      if (it == handlers_.end()) {
        spdlog::trace("[events] no handler for '{}'", ev.event_type);
        return false;
      }
      handler = it->second;
    }
    queue_.post([handler, data = ev.data]() { handler(data); });
    return true;
  }

private:
  void register_remote(const std::string &event_type) {
    auto id = channel_.send("register_event_callback",
                            {{"event_type", event_type}},
                            [event_type](const json &result) {
                              if (!result.value("success", false))
                                spdlog::warn("[events] server refused '{}': {}",
                                             event_type,
                                             result.value("error", "unknown"));
                            });
    if (!id)
      spdlog::warn("[events] could not register '{}' with the server",
                   event_type);
  }

  command_channel &channel_;
  work_queue &queue_;
  std::function<bool()> is_connected_;

  mutable std::mutex mu_;
  std::unordered_map<std::string, handler_fn> handlers_;
};

} // namespace hapticlink
