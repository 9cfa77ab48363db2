#include "../include/hapticlink/message.hpp"

#include <cassert>
#include <cstdio>
#include <string>
#include <vector>

using hapticlink::decode;
using hapticlink::decode_error;
using hapticlink::decode_error_kind;
using hapticlink::encode;
using hapticlink::json;

namespace {

decode_error_kind decode_failure(const std::string &bytes) {
  try {
    (void)decode(bytes);
  } catch (const decode_error &e) {
    return e.kind();
  }
  std::fprintf(stderr, "expected decode_error for: %s\n", bytes.c_str());
  assert(false);
  return decode_error_kind::malformed_payload;
}

} // namespace

int main() {
  int passed = 0;

  // --- constants ---
  assert(hapticlink::kDefaultServicePort == 9128);
  ++passed;
  assert(hapticlink::kDefaultDiscoveryPort == 9129);
  ++passed;
  assert(hapticlink::kDiscoveryProbe == "UNITY_HAPTICS_DISCOVERY_REQUEST");
  ++passed;

  // --- command encoding ---
  {
    hapticlink::command_message cmd;
    cmd.command = "play_pattern";
    cmd.command_id = "host-ab:1";
    cmd.client_id = "host-ab";
    cmd.params = {{"pattern_file", "wave.tact"}};
    json wire = json::parse(encode(cmd));
    assert(!wire.contains("type"));
    ++passed;
    assert(wire["command"] == "play_pattern");
    ++passed;
    assert(wire["command_id"] == "host-ab:1");
    ++passed;
    assert(wire["params"]["pattern_file"] == "wave.tact");
    ++passed;
    assert(wire["timestamp"].is_string() && !wire["timestamp"].get<std::string>().empty());
    ++passed;

    auto back = decode(wire.dump());
    auto *decoded = std::get_if<hapticlink::command_message>(&back);
    assert(decoded != nullptr);
    assert(decoded->command == "play_pattern");
    assert(decoded->client_id == "host-ab");
    ++passed;
  }

  // --- commands without params omit the member ---
  {
    hapticlink::command_message cmd;
    cmd.command = "get_status";
    cmd.command_id = "c:2";
    cmd.client_id = "c";
    json wire = json::parse(encode(cmd));
    assert(!wire.contains("params"));
    ++passed;
  }

  // --- response ---
  {
    auto msg = decode(
        R"({"type":"response","command_id":"c:1","result":{"success":true,"message":"Pong"}})");
    auto *res = std::get_if<hapticlink::response_message>(&msg);
    assert(res != nullptr);
    assert(res->command_id == "c:1");
    assert(res->result["message"] == "Pong");
    ++passed;
  }

  // --- error ---
  {
    auto msg = decode(
        R"({"type":"error","command_id":"c:7","error":"device unreachable"})");
    auto *err = std::get_if<hapticlink::error_message>(&msg);
    assert(err != nullptr);
    assert(err->error == "device unreachable");
    assert(err->details.empty());
    ++passed;
  }

  // --- status update and event ---
  {
    auto msg = decode(R"({"type":"status_update","status":{"server_id":"s1"}})");
    auto *st = std::get_if<hapticlink::status_update_message>(&msg);
    assert(st != nullptr && st->status["server_id"] == "s1");
    ++passed;

    msg = decode(R"({"type":"event","event_type":"pattern_completed","data":{"key":"k"}})");
    auto *ev = std::get_if<hapticlink::event_message>(&msg);
    assert(ev != nullptr && ev->event_type == "pattern_completed");
    assert(ev->data["key"] == "k");
    ++passed;
  }

  // --- discovery probe and announce ---
  {
    assert(encode(hapticlink::discovery_probe{}) ==
           "UNITY_HAPTICS_DISCOVERY_REQUEST");
    ++passed;
    auto msg = decode("UNITY_HAPTICS_DISCOVERY_REQUEST\n");
    assert(std::holds_alternative<hapticlink::discovery_probe>(msg));
    ++passed;

    msg = decode(
        R"({"type":"UNITY_HAPTICS_SERVER","server_id":"lab","api_port":9128,"api_version":"1.0.0"})");
    auto *an = std::get_if<hapticlink::discovery_announce>(&msg);
    assert(an != nullptr);
    assert(an->server_id == "lab" && an->api_port == 9128);
    ++passed;

    msg = decode(R"({"type":"UNITY_HAPTICS_SERVER","server_id":"lab","api_port":"9200"})");
    an = std::get_if<hapticlink::discovery_announce>(&msg);
    assert(an != nullptr && an->api_port == 9200);
    ++passed;

    msg = decode(R"({"type":"UNITY_HAPTICS_SERVER","server_id":"lab"})");
    an = std::get_if<hapticlink::discovery_announce>(&msg);
    assert(an != nullptr && an->api_port == 0);
    ++passed;
  }

  // --- announce ports outside 1..65535 are rejected ---
  {
    const char *bad_ports[] = {"70000", "0", "-5", "\"99999\"", "\"abc\"",
                               "true", "9128.5"};
    for (const char *port : bad_ports) {
      std::string wire =
          std::string(R"({"type":"UNITY_HAPTICS_SERVER","server_id":"lab","api_port":)") +
          port + "}";
      assert(decode_failure(wire) == decode_error_kind::malformed_payload);
      ++passed;
    }
    auto msg = decode(R"({"type":"UNITY_HAPTICS_SERVER","api_port":65535})");
    assert(std::get<hapticlink::discovery_announce>(msg).api_port == 65535);
    ++passed;
  }

  // --- decode failures ---
  assert(decode_failure(R"({"type":"telemetry"})") ==
         decode_error_kind::unknown_type);
  ++passed;
  assert(decode_failure("{not json") == decode_error_kind::malformed_payload);
  ++passed;
  assert(decode_failure("[1,2,3]") == decode_error_kind::malformed_payload);
  ++passed;
  assert(decode_failure(R"({"command_id":"x"})") ==
         decode_error_kind::malformed_payload);
  ++passed;
  assert(decode_failure(R"({"type":"event","data":{}})") ==
         decode_error_kind::malformed_payload);
  ++passed;
  assert(decode_failure("") == decode_error_kind::malformed_payload);
  ++passed;

  // --- decoded messages encode back to the same document ---
  {
    const std::vector<std::string> samples = {
        R"({"command":"play_pattern","command_id":"c:3","client_id":"c","params":{"pattern_file":"wave.tact"},"timestamp":"2026-01-01T00:00:00.000Z"})",
        R"({"type":"response","command_id":"c:1","result":{"success":true,"message":"Pong"},"timestamp":"2026-01-01T00:00:00.000Z"})",
        R"({"type":"error","command_id":"c:7","error":"Invalid JSON format","details":"line 1","timestamp":"2026-01-01T00:00:00.000Z"})",
        R"({"type":"error","error":"device unreachable","timestamp":"2026-01-01T00:00:00.000Z"})",
        R"({"type":"status_update","status":{"server_id":"s1","connected_clients":2},"timestamp":"2026-01-01T00:00:00.000Z"})",
        R"({"type":"event","event_type":"pattern_completed","data":{"key":"k1"},"timestamp":"2026-01-01T00:00:00.000Z"})",
        R"({"type":"UNITY_HAPTICS_SERVER","server_id":"lab","api_port":9128,"api_version":"1.0.0","timestamp":"2026-01-01T00:00:00.000Z"})",
    };
    for (const auto &sample : samples) {
      assert(json::parse(encode(decode(sample))) == json::parse(sample));
      ++passed;
    }
  }

  // --- identity ---
  {
    auto a = hapticlink::make_client_identity();
    auto b = hapticlink::make_client_identity();
    assert(a != b);
    ++passed;
    assert(a.size() > 17 && a[a.size() - 17] == '-');
    ++passed;
  }

  std::printf("%d passed, 0 failed\n", passed);
  return 0;
}
