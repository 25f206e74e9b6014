#include "storysync/storysync.hpp"

#include <cstdio>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr const char kUsage[] =
    "usage:\n"
    "  storysync serve [--bind HOST:PORT] [--out DIR] FILE...\n"
    "  storysync list  (IP PORT TOKEN | --pairing JSON)\n"
    "  storysync pull  (IP PORT TOKEN | --pairing JSON) STORY_ID [FILE]\n"
    "  storysync push  (IP PORT TOKEN | --pairing JSON) FILE\n"
    "options: --timeout-ms N, --log-level LEVEL\n";

struct usage_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

std::string read_file(const std::string &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open())
    throw std::runtime_error("cannot open: " + path);
  return std::string((std::istreambuf_iterator<char>(file)),
                     std::istreambuf_iterator<char>());
}

void write_file(const std::string &path, const std::string &data) {
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file.is_open())
    throw std::runtime_error("cannot write: " + path);
  file << data;
}

/// Peer address either from --pairing or from the first three positionals,
/// which are consumed.
storysync::pairing_payload take_peer(storysync::cli_flags &flags) {
  if (flags.pairing)
    return storysync::parse_pairing(*flags.pairing);

  auto &pos = flags.positional;
  if (pos.size() < 3)
    throw usage_error("expected IP PORT TOKEN or --pairing JSON");
  auto [ip, port] = storysync::split_host_port(pos[0] + ":" + pos[1], 0);
  storysync::pairing_payload peer{ip, port, pos[2]};
  pos.erase(pos.begin(), pos.begin() + 3);
  return peer;
}

int run_serve(storysync::cli_flags &flags) {
  std::vector<std::string> stories;
  for (const auto &path : flags.positional)
    stories.push_back(read_file(path));

  storysync::sync_server server(flags.server);
  auto info = server.start(stories);
  storysync::pairing_payload pairing{info.ip, info.port, info.token};
  std::printf("%s\n", storysync::serialize_pairing(pairing).c_str());
  std::fflush(stdout);

  std::string line;
  std::getline(std::cin, line);

  auto received = server.clear_received_stories();
  server.stop();
  if (flags.out_dir) {
    for (size_t i = 0; i < received.size(); ++i) {
      write_file(*flags.out_dir + "/received-" + std::to_string(i + 1) +
                     ".json",
                 received[i]);
    }
  }
  std::printf("%zu stories received\n", received.size());
  return 0;
}

int run_list(storysync::cli_flags &flags) {
  auto peer = take_peer(flags);
  auto previews = storysync::client::connect(peer, flags.client);
  for (const auto &p : previews) {
    std::printf("%s\t%s\t%s\t%lld\t%zu\n", p.id.c_str(), p.title.c_str(),
                p.genre ? p.genre->c_str() : "-",
                static_cast<long long>(p.updated_at), p.entry_count);
  }
  return 0;
}

int run_pull(storysync::cli_flags &flags) {
  auto peer = take_peer(flags);
  if (flags.positional.empty())
    throw usage_error("expected STORY_ID");
  auto data = storysync::client::pull(peer, flags.positional[0], flags.client);
  if (flags.positional.size() > 1) {
    write_file(flags.positional[1], data);
  } else {
    std::fwrite(data.data(), 1, data.size(), stdout);
    std::printf("\n");
  }
  return 0;
}

int run_push(storysync::cli_flags &flags) {
  auto peer = take_peer(flags);
  if (flags.positional.empty())
    throw usage_error("expected FILE");
  storysync::client::push(peer, read_file(flags.positional[0]), flags.client);
  std::printf("pushed %s\n", flags.positional[0].c_str());
  return 0;
}

} // namespace

int main(int argc, char **argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  if (args.empty()) {
    std::fputs(kUsage, stderr);
    return 2;
  }

  std::string command = args[0];
  args.erase(args.begin());

  try {
    auto flags = storysync::parse_flags(args);
    if (flags.log_level)
      storysync::set_log_level(spdlog::level::from_str(*flags.log_level));

    if (command == "serve")
      return run_serve(flags);
    if (command == "list")
      return run_list(flags);
    if (command == "pull")
      return run_pull(flags);
    if (command == "push")
      return run_push(flags);
    throw usage_error("unknown command: " + command);
  } catch (const usage_error &e) {
    std::fprintf(stderr, "%s\n%s", e.what(), kUsage);
    return 2;
  } catch (const storysync::sync_error &e) {
    std::string kind(storysync::to_string(e.kind()));
    std::fprintf(stderr, "%s: %s\n", kind.c_str(), e.what());
    return 1;
  } catch (const std::exception &e) {
    std::fprintf(stderr, "error: %s\n", e.what());
    return 2;
  }
}
