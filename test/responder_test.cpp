#include "../include/hapticlink/responder.hpp"

#include <cassert>
#include <chrono>
#include <cstdio>
#include <string>
#include <thread>

using hapticlink::json;

namespace {

/// Raw socket speaking the wire protocol to a responder.
class raw_client {
public:
  raw_client() : fd_(hapticlink::open_udp_socket(0, false, "127.0.0.1")) {}
  ~raw_client() { hapticlink::close_udp_socket(fd_); }

  void send(const hapticlink::endpoint &to, const std::string &payload) {
    bool ok = hapticlink::send_datagram_to(fd_, to, payload);
    assert(ok);
    (void)ok;
  }

  void command(const hapticlink::endpoint &to, const std::string &name,
               const std::string &id, const json &params = nullptr) {
    hapticlink::command_message cmd;
    cmd.command = name;
    cmd.command_id = id;
    cmd.client_id = "raw";
    cmd.params = params;
    send(to, hapticlink::encode(cmd));
  }

  /// Next datagram of the wanted type, skipping status pushes.
  hapticlink::message next(int timeout_ms = 2000) {
    std::string datagram;
    for (int waited = 0; waited < timeout_ms; waited += 20) {
      if (hapticlink::recv_datagram(fd_, 20, datagram) !=
          hapticlink::recv_status::ok)
        continue;
      auto msg = hapticlink::decode(datagram);
      if (!std::holds_alternative<hapticlink::status_update_message>(msg))
        return msg;
    }
    assert(false && "no reply from responder");
    return hapticlink::discovery_probe{};
  }

  json result(int timeout_ms = 2000) {
    auto msg = next(timeout_ms);
    auto *res = std::get_if<hapticlink::response_message>(&msg);
    assert(res != nullptr);
    return res->result;
  }

private:
  int fd_;
};

} // namespace

int main() {
  int passed = 0;

  hapticlink::responder_options opts;
  opts.bind_host = "127.0.0.1";
  opts.service_port = 0;
  opts.discovery_port = 0;
  opts.status_interval_ms = 0;
  hapticlink::responder server(opts);
  assert(server.server_id().rfind("haptics-", 0) == 0);
  ++passed;
  server.start();
  assert(server.running());
  ++passed;

  hapticlink::endpoint service{"127.0.0.1", server.service_port()};
  hapticlink::endpoint disco{"127.0.0.1", server.discovery_port()};
  raw_client client;

  // --- probe is answered with an announce ---
  {
    client.send(disco, "UNITY_HAPTICS_DISCOVERY_REQUEST");
    auto msg = client.next();
    auto *an = std::get_if<hapticlink::discovery_announce>(&msg);
    assert(an != nullptr);
    ++passed;
    assert(an->api_port == server.service_port());
    assert(an->server_id == server.server_id());
    assert(an->api_version == "1.0.0");
    ++passed;
    assert(server.stats().probes_answered == 1);
    ++passed;
  }

  // --- ping echoes ---
  {
    client.command(service, "ping", "raw:1", {{"message", "hi"}});
    auto msg = client.next();
    auto *res = std::get_if<hapticlink::response_message>(&msg);
    assert(res != nullptr && res->command_id == "raw:1");
    ++passed;
    assert(res->result["message"] == "Pong" && res->result["echo"] == "hi");
    ++passed;
    assert(server.client_count() == 1);
    ++passed;
  }

  // --- invalid JSON gets an uncorrelated error ---
  {
    client.send(service, "{\"command\": ");
    auto msg = client.next();
    auto *err = std::get_if<hapticlink::error_message>(&msg);
    assert(err != nullptr);
    assert(err->error == "Invalid JSON format" && err->command_id.empty());
    ++passed;
  }

  // --- no executor: other commands are errors ---
  {
    client.command(service, "play_pattern", "raw:2", {{"pattern_file", "x"}});
    auto msg = client.next();
    auto *err = std::get_if<hapticlink::error_message>(&msg);
    assert(err != nullptr && err->command_id == "raw:2");
    assert(err->error == "Unknown command: play_pattern");
    ++passed;
  }

  // --- event registration ---
  {
    client.command(service, "register_event_callback", "raw:3");
    auto r = client.result();
    assert(r["success"] == false);
    ++passed;

    client.command(service, "register_event_callback", "raw:4",
                   {{"event_type", "pattern_completed"}});
    r = client.result();
    assert(r["success"] == true);
    client.command(service, "register_event_callback", "raw:5",
                   {{"event_type", "pattern_error"}});
    client.result();
    assert(server.registered_events("raw").size() == 2);
    ++passed;

    assert(server.publish_event("pattern_completed", {{"key", "a"}}) == 1);
    auto msg = client.next();
    auto *ev = std::get_if<hapticlink::event_message>(&msg);
    assert(ev != nullptr && ev->event_type == "pattern_completed");
    assert(ev->data["key"] == "a");
    ++passed;

    assert(server.publish_event("pattern_error", {{"key", "a"}}, "someone-else") == 0);
    ++passed;

    auto status = server.status();
    assert(status["registered_events"]["pattern_completed"] == 1);
    ++passed;

    client.command(service, "unregister_event_callback", "raw:6");
    r = client.result();
    assert(r["success"] == true);
    assert(server.registered_events("raw").empty());
    ++passed;
  }

  // --- get_status ---
  {
    client.command(service, "get_status", "raw:7");
    auto r = client.result();
    assert(r["server_id"] == server.server_id());
    assert(r["connected_clients"] == 1);
    assert(r["uptime"].is_string() && r["uptime_seconds"].is_number());
    ++passed;
  }

  server.stop();
  assert(!server.running());
  ++passed;

  // --- clients that cannot be sent a status push are dropped ---
  {
    hapticlink::responder_options small = opts;
    // Status carries the id, so every push overflows while a Pong still fits.
    small.server_id = std::string(300, 's');
    small.max_datagram_size = 300;
    small.status_interval_ms = 50;
    hapticlink::responder narrow(small);
    narrow.start();
    hapticlink::endpoint narrow_service{"127.0.0.1", narrow.service_port()};

    raw_client listener;
    listener.command(narrow_service, "ping", "raw:1");
    auto r = listener.result();
    assert(r["message"] == "Pong");
    ++passed;

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (narrow.client_count() != 0 &&
           std::chrono::steady_clock::now() < deadline)
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    assert(narrow.client_count() == 0);
    ++passed;
    assert(narrow.stats().clients_dropped == 1);
    ++passed;
    narrow.stop();
  }

  std::printf("%d passed, 0 failed\n", passed);
  return 0;
}
