#pragma once

#include "storysync/error.hpp"
#include "storysync/protocol.hpp"

#include <array>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <random>
#include <string>
#include <string_view>

namespace storysync {

/// What a client needs to reach and authenticate to one session.
/// This is exactly what a pairing code embeds.
struct pairing_payload {
  std::string ip;
  std::uint16_t port = 0;
  std::string token;
};

/// Returned by sync_server::start().
struct server_info {
  std::string ip;
  std::uint16_t port = 0;
  std::string token;
  /// Rendered pairing code; empty when no renderer is configured.
  std::string qr_code_base64;
};

/// Turns the pairing JSON into an encoded image. May throw.
using pairing_renderer = std::function<std::string(const std::string &)>;

/// Returns this host's address as reachable by peers. May throw.
using address_resolver = std::function<std::string()>;

inline void to_json(json &j, const pairing_payload &p) {
  j = json{{"ip", p.ip}, {"port", p.port}, {"token", p.token}};
}

inline void from_json(const json &j, pairing_payload &p) {
  j.at("ip").get_to(p.ip);
  j.at("port").get_to(p.port);
  j.at("token").get_to(p.token);
}

inline void to_json(json &j, const server_info &s) {
  j = json{{"ip", s.ip},
           {"port", s.port},
           {"token", s.token},
           {"qrCodeBase64", s.qr_code_base64}};
}

inline std::string serialize_pairing(const pairing_payload &p) {
  return json(p).dump();
}

/// Decode a scanned pairing code.
inline pairing_payload parse_pairing(std::string_view text) {
  try {
    return json::parse(text.begin(), text.end()).get<pairing_payload>();
  } catch (const json::exception &e) {
    throw sync_error(error_kind::malformed_payload,
                     std::string("invalid pairing payload: ") + e.what());
  }
}

/// Random (version 4) UUID in its canonical text form.
inline std::string generate_token() {
  static thread_local std::mt19937_64 rng = [] {
    std::random_device rd;
    std::seed_seq seq{rd(), rd(), rd(), rd()};
    return std::mt19937_64(seq);
  }();
  std::uniform_int_distribution<std::uint64_t> dist;

  std::array<std::uint8_t, 16> bytes{};
  for (size_t i = 0; i < bytes.size(); i += 8) {
    auto word = dist(rng);
    for (size_t b = 0; b < 8; ++b)
      bytes[i + b] = static_cast<std::uint8_t>(word >> (b * 8));
  }
  bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40);
  bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);

  char text[37] = {0};
  std::snprintf(text, sizeof(text),
                "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-"
                "%02x%02x%02x%02x%02x%02x",
                bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5],
                bytes[6], bytes[7], bytes[8], bytes[9], bytes[10], bytes[11],
                bytes[12], bytes[13], bytes[14], bytes[15]);
  return std::string(text);
}

} // namespace storysync
