#include "../include/hapticlink/options.hpp"

#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

std::string write_temp(const std::string &contents) {
  char tmpl[] = "/tmp/hapticlink_options_XXXXXX";
  int fd = ::mkstemp(tmpl);
  assert(fd >= 0);
  ::close(fd);
  std::ofstream out(tmpl);
  out << contents;
  return tmpl;
}

bool load_fails(const std::string &path) {
  try {
    (void)hapticlink::load_client_options(path);
  } catch (const std::runtime_error &) {
    return true;
  }
  return false;
}

} // namespace

int main() {
  int passed = 0;

  // --- defaults ---
  {
    hapticlink::client_options o;
    assert(o.service_port == 9128 && o.discovery_port == 9129);
    ++passed;
    assert(o.discovery_attempts == 5 && o.discovery_window_ms == 1000 &&
           o.discovery_pause_ms == 500);
    ++passed;
    assert(o.liveness_interval_ms == 5000 && o.retry_interval_ms == 3000);
    ++passed;
    assert(o.command_timeout_ms == 0 && o.auto_retry);
    ++passed;

    auto d = o.discovery_settings();
    assert(d.attempts == 5 && d.fallback_service_port == 9128);
    ++passed;

    hapticlink::responder_options r;
    assert(r.status_interval_ms == 10000 && r.api_version == "1.0.0");
    ++passed;
  }

  // --- file overrides, unknown keys ignored ---
  {
    auto path = write_temp(R"({
      "service_port": 9300,
      "discovery_attempts": 2,
      "broadcast_addresses": ["10.0.0.255"],
      "auto_retry": false,
      "log_level": "debug",
      "colour": "blue"
    })");
    auto o = hapticlink::load_client_options(path);
    assert(o.service_port == 9300);
    ++passed;
    assert(o.discovery_attempts == 2);
    ++passed;
    assert(o.broadcast_addresses.size() == 1 &&
           o.broadcast_addresses[0] == "10.0.0.255");
    ++passed;
    assert(!o.auto_retry && o.log_level == "debug");
    ++passed;
    assert(o.discovery_port == 9129);
    ++passed;

    // Flags win over the file.
    std::vector<std::string> args = {"--config", path, "--port", "9400",
                                     "--broadcast", "127.0.0.1"};
    auto f = hapticlink::parse_client_flags(args);
    assert(f.service_port == 9400 && f.discovery_attempts == 2);
    ++passed;
    assert(f.broadcast_addresses.size() == 1 &&
           f.broadcast_addresses[0] == "127.0.0.1");
    ++passed;
    std::remove(path.c_str());
  }

  // --- responder file and flags ---
  {
    auto path = write_temp(R"({"server_id": "lab-1", "status_interval_ms": 2500})");
    auto r = hapticlink::load_responder_options(path);
    assert(r.server_id == "lab-1" && r.status_interval_ms == 2500);
    ++passed;

    std::vector<std::string> args = {"--config", path, "--bind", "127.0.0.1",
                                     "--discovery-port", "0"};
    auto f = hapticlink::parse_responder_flags(args);
    assert(f.bind_host == "127.0.0.1" && f.discovery_port == 0);
    assert(f.server_id == "lab-1");
    ++passed;
    std::remove(path.c_str());
  }

  // --- rejected files ---
  {
    auto broken = write_temp("{\"service_port\": ");
    assert(load_fails(broken));
    ++passed;
    std::remove(broken.c_str());

    auto array = write_temp("[1, 2]");
    assert(load_fails(array));
    ++passed;
    std::remove(array.c_str());

    auto typed = write_temp(R"({"service_port": "high"})");
    assert(load_fails(typed));
    ++passed;
    std::remove(typed.c_str());

    auto zero = write_temp(R"({"discovery_attempts": 0})");
    assert(load_fails(zero));
    ++passed;
    std::remove(zero.c_str());

    assert(load_fails("/nonexistent/hapticlink.json"));
    ++passed;
  }

  // --- flag helpers ---
  {
    std::vector<std::string> args = {"send", "ping", "--host", "10.1.1.1"};
    assert(hapticlink::flag_value(args, "--host") == "10.1.1.1");
    ++passed;
    assert(hapticlink::flag_value(args, "--port", "9128") == "9128");
    ++passed;
    assert(hapticlink::has_flag(args, "--host") &&
           !hapticlink::has_flag(args, "--params"));
    ++passed;
  }

  std::printf("%d passed, 0 failed\n", passed);
  return 0;
}
