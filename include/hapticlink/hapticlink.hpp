#pragma once

/// hapticlink: UDP control plane for haptics servers.
/// Header-only; requires C++17, nlohmann::json and spdlog.

#include "client.hpp"
#include "command_channel.hpp"
#include "discovery.hpp"
#include "event_dispatcher.hpp"
#include "message.hpp"
#include "options.hpp"
#include "receive_loop.hpp"
#include "responder.hpp"
#include "udp.hpp"
#include "work_queue.hpp"
