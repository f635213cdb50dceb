#pragma once

#include <nlohmann/json.hpp>

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// Datagram layout: "PKMS" | version (1 byte) | payload length (u16 BE) | MessagePack payload
inline constexpr std::array<std::uint8_t, 4> kEnvelopeMagic = {'P', 'K', 'M', 'S'};
inline constexpr std::uint8_t kProtocolVersion = 1;
inline constexpr std::size_t kEnvelopeHeaderSize = 7;
inline constexpr std::size_t kMaxDatagramSize = 4096;

inline constexpr char kShortCodeAlphabet[] = "ABCDEFGHJKLMNPQRSTUVWXYZ23456789";
inline constexpr std::size_t kShortCodeLength = 8;
inline constexpr char kPeerCodePrefix[] = "PKM";

enum class PeerStatus {
  Online,
  InGame,
  Away
};

const char* to_string(PeerStatus status);
std::optional<PeerStatus> peer_status_from_string(const std::string& text);

struct PeerInfo {
  std::string id;
  std::optional<std::string> nickname;
  std::string address;
  std::uint16_t port = 0;   // TCP transfer port
  std::string app_version;
  std::chrono::steady_clock::time_point last_seen{};
  PeerStatus status = PeerStatus::Online;
  std::optional<std::vector<std::string>> modpacks;
  std::optional<std::string> current_server;

  std::string display_name() const { return nickname.value_or(id); }
};

// last_seen is local bookkeeping and never leaves the process.
nlohmann::json peer_to_json(const PeerInfo& peer);
PeerInfo peer_from_json(const nlohmann::json& j);

namespace wire {

struct Discovery {
  std::string sender_id;
  std::uint32_t protocol_version = kProtocolVersion;
  std::string app_version;
  std::uint16_t listen_port = 0;
};

struct DiscoveryResponse {
  std::string peer_id;
  std::optional<std::string> nickname;
  std::string app_version;
  PeerStatus status = PeerStatus::Online;
  std::uint16_t listen_port = 0;
};

struct Ping {
  std::uint64_t timestamp = 0;
};

struct Pong {
  std::uint64_t timestamp = 0;
  std::string peer_id;
};

struct ConnectByCode {
  std::string code;
  std::string requester_id;
  std::optional<std::string> requester_nickname;
  std::uint16_t listen_port = 0;
};

struct ConnectByCodeResponse {
  std::string code;
  bool success = false;
  std::optional<PeerInfo> peer;
  std::optional<std::string> error;
};

// Carried between peers without interpretation.
struct FriendRequest {
  nlohmann::json raw;
};

using Message = std::variant<Discovery,
                             DiscoveryResponse,
                             Ping,
                             Pong,
                             ConnectByCode,
                             ConnectByCodeResponse,
                             FriendRequest>;

} // namespace wire

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

const char* message_name(const wire::Message& message);

// Throws std::length_error if the encoded datagram would not fit kMaxDatagramSize.
std::vector<std::uint8_t> encode_message(const wire::Message& message);

// Returns std::nullopt for anything that is not a well formed datagram of the
// current protocol version. Never throws.
std::optional<wire::Message> decode_message(const std::uint8_t* data, std::size_t size);
inline std::optional<wire::Message> decode_message(const std::vector<std::uint8_t>& bytes) {
  return decode_message(bytes.data(), bytes.size());
}

// Short codes: PREFIX-XXXX-XXXX over a 32 symbol alphabet without 0/O/1/I.
std::string generate_short_code(const std::string& prefix);

// Uppercases and removes spaces and dashes.
std::string normalize_code(const std::string& code);

// The 8 symbol body of a code, with or without prefix and separators.
std::optional<std::string> code_body(const std::string& code, const std::string& prefix);

// PREFIX-XXXX-XXXX form of any accepted spelling.
std::optional<std::string> canonical_code(const std::string& code, const std::string& prefix);
