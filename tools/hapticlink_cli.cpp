#include "../include/hapticlink/hapticlink.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <spdlog/spdlog.h>
#include <string>
#include <thread>
#include <vector>

namespace {

std::atomic<bool> g_stop{false};

void handle_signal(int) { g_stop.store(true); }

void usage() {
  std::fprintf(
      stderr,
      "usage:\n"
      "  hapticlink_cli serve [--config FILE] [--bind HOST] [--port N]\n"
      "                       [--discovery-port N] [--server-id ID]\n"
      "                       [--log-level LEVEL]\n"
      "  hapticlink_cli send <command> [--params JSON] [--host HOST]\n"
      "                      [--config FILE] [--port N] [--discovery-port N]\n"
      "                      [--broadcast ADDR] [--timeout MS]\n"
      "                      [--log-level LEVEL]\n");
}

void apply_log_level(const std::string &level) {
  spdlog::set_level(spdlog::level::from_str(level));
}

int run_serve(const std::vector<std::string> &args) {
  auto opts = hapticlink::parse_responder_flags(args);
  apply_log_level(opts.log_level);

  hapticlink::responder server(
      opts, [](const std::string &command, const hapticlink::json &params) {
        spdlog::info("[serve] {} {}", command, params.dump());
        if (command == "shutdown") {
          g_stop.store(true);
          return hapticlink::json{{"success", true},
                                  {"message", "Server shutting down"}};
        }
        return hapticlink::json{
            {"success", true}, {"command", command}, {"params", params}};
      });
  server.start();

  std::signal(SIGINT, handle_signal);
  std::signal(SIGTERM, handle_signal);
  while (!g_stop.load() && server.running())
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

  // Let the shutdown reply leave before the sockets close.
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  server.stop();
  return 0;
}

int run_send(const std::vector<std::string> &args) {
  if (args.empty() || args[0].rfind("--", 0) == 0) {
    usage();
    return 2;
  }
  const std::string command = args[0];

  auto opts = hapticlink::parse_client_flags(args);
  opts.auto_retry = false;
  apply_log_level(opts.log_level);

  hapticlink::json params = nullptr;
  auto raw = hapticlink::flag_value(args, "--params");
  if (!raw.empty()) {
    params = hapticlink::json::parse(raw, nullptr, false);
    if (params.is_discarded() || !params.is_object()) {
      std::fprintf(stderr, "--params must be a JSON object\n");
      return 2;
    }
  }
  int timeout_ms = std::stoi(hapticlink::flag_value(args, "--timeout", "10000"));

  hapticlink::haptic_client client(opts);
  bool done = false;
  hapticlink::json result;
  client.on_connected([&]() {
    auto id = client.send(command, params, [&](const hapticlink::json &r) {
      result = r;
      done = true;
    });
    if (!id) {
      result = hapticlink::failure_result("send failed");
      done = true;
    }
  });

  auto host = hapticlink::flag_value(args, "--host");
  if (host.empty())
    client.connect();
  else
    client.connect_direct(host);

  // Retries are off, so falling back to disconnected means the attempt failed.
  client.poll_until(
      [&]() {
        return done ||
               client.state() == hapticlink::connection_state::disconnected;
      },
      std::chrono::milliseconds(timeout_ms));
  auto state = client.state();
  client.disconnect();

  if (!done) {
    std::fprintf(stderr, "no reply from a haptics server (state: %s)\n",
                 hapticlink::to_string(state));
    return 1;
  }
  std::printf("%s\n", result.dump(2).c_str());
  return result.value("success", false) ? 0 : 1;
}

} // namespace

int main(int argc, char **argv) {
  if (argc < 2) {
    usage();
    return 2;
  }
  std::string verb = argv[1];
  std::vector<std::string> args(argv + 2, argv + argc);
  if (verb == "--help" || hapticlink::has_flag(args, "--help")) {
    usage();
    return 0;
  }

  try {
    if (verb == "serve")
      return run_serve(args);
    if (verb == "send")
      return run_send(args);
  } catch (const std::exception &e) {
    std::fprintf(stderr, "hapticlink_cli: %s\n", e.what());
    return 1;
  }
  usage();
  return 2;
}
