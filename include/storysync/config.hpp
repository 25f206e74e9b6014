#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace storysync {

/// HTTP path of the sync endpoint.
constexpr std::string_view kSyncPath = "/sync";

/// Default round-trip budget for listing stories.
constexpr std::chrono::milliseconds kListTimeout{10000};

/// Default round-trip budget for pulling or pushing one story.
constexpr std::chrono::milliseconds kTransferTimeout{30000};

/// Request header block limit, shared by both HTTP directions.
constexpr std::size_t kMaxHeaderBytes = 16384;

struct server_options {
  std::string bind_host = "0.0.0.0";
  std::uint16_t bind_port = 0;
  std::size_t max_body_bytes = 64 * 1024 * 1024;
  /// Deadline for reading one request and writing its response.
  std::chrono::milliseconds io_timeout{30000};
  /// Slice used by blocking waits to notice cancellation.
  std::chrono::milliseconds poll_interval{100};
};

struct client_options {
  std::chrono::milliseconds list_timeout = kListTimeout;
  std::chrono::milliseconds transfer_timeout = kTransferTimeout;
  std::size_t max_response_bytes = 64 * 1024 * 1024;
};

/// Split "host:port". An empty host means all interfaces.
inline std::tuple<std::string, std::uint16_t>
split_host_port(const std::string &addr, std::uint16_t default_port) {
  if (addr.empty())
    return {"0.0.0.0", default_port};

  auto pos = addr.rfind(':');
  if (pos == std::string::npos)
    return {addr, default_port};

  std::string host = addr.substr(0, pos);
  if (host.empty())
    host = "0.0.0.0";
  std::string port_text = addr.substr(pos + 1);
  if (port_text.empty())
    return {host, default_port};

  int port = std::stoi(port_text);
  if (port < 0 || port > 65535)
    throw std::invalid_argument("port out of range: " + port_text);
  return {host, static_cast<std::uint16_t>(port)};
}

/// Options recognised by the command line tool.
struct cli_flags {
  server_options server;
  client_options client;
  std::optional<std::string> log_level;
  std::optional<std::string> pairing;
  std::optional<std::string> out_dir;
  std::vector<std::string> positional;
};

/// Parse --bind, --timeout-ms, --log-level, --pairing and --out; everything
/// else is kept as a positional argument, in order.
inline cli_flags parse_flags(const std::vector<std::string> &args) {
  cli_flags flags;
  for (size_t i = 0; i < args.size(); ++i) {
    const auto &arg = args[i];
    bool has_value = i + 1 < args.size();
    if (arg == "--bind" && has_value) {
      auto [host, port] = split_host_port(args[++i], 0);
      flags.server.bind_host = host;
      flags.server.bind_port = port;
    } else if (arg == "--timeout-ms" && has_value) {
      std::chrono::milliseconds timeout{std::stol(args[++i])};
      flags.client.list_timeout = timeout;
      flags.client.transfer_timeout = timeout;
    } else if (arg == "--log-level" && has_value) {
      flags.log_level = args[++i];
    } else if (arg == "--pairing" && has_value) {
      flags.pairing = args[++i];
    } else if (arg == "--out" && has_value) {
      flags.out_dir = args[++i];
    } else {
      flags.positional.push_back(arg);
    }
  }
  return flags;
}

} // namespace storysync
