#include "protocol.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "utils.hpp"

using json = nlohmann::json;

namespace {

template<typename T>
void put_optional(json& j, const char* key, const std::optional<T>& value) {
  if(value) {
    j[key] = *value;
  } else {
    j[key] = nullptr;
  }
}

template<typename T>
std::optional<T> get_optional(const json& j, const char* key) {
  auto it = j.find(key);
  if(it == j.end() || it->is_null()) return std::nullopt;
  return it->get<T>();
}

PeerStatus status_field(const json& j, const char* key) {
  auto status = peer_status_from_string(j.at(key).get<std::string>());
  if(!status) throw std::invalid_argument("unknown peer status");
  return *status;
}

json to_json_payload(const wire::Message& message) {
  return std::visit(overloaded{
    [](const wire::Discovery& m) {
      return json{{"type", "discovery"},
                  {"sender_id", m.sender_id},
                  {"protocol_version", m.protocol_version},
                  {"app_version", m.app_version},
                  {"listen_port", m.listen_port}};
    },
    [](const wire::DiscoveryResponse& m) {
      json j{{"type", "discovery_response"},
             {"peer_id", m.peer_id},
             {"app_version", m.app_version},
             {"status", to_string(m.status)},
             {"listen_port", m.listen_port}};
      put_optional(j, "nickname", m.nickname);
      return j;
    },
    [](const wire::Ping& m) {
      return json{{"type", "ping"}, {"timestamp", m.timestamp}};
    },
    [](const wire::Pong& m) {
      return json{{"type", "pong"}, {"timestamp", m.timestamp}, {"peer_id", m.peer_id}};
    },
    [](const wire::ConnectByCode& m) {
      json j{{"type", "connect_by_code"},
             {"code", m.code},
             {"requester_id", m.requester_id},
             {"listen_port", m.listen_port}};
      put_optional(j, "requester_nickname", m.requester_nickname);
      return j;
    },
    [](const wire::ConnectByCodeResponse& m) {
      json j{{"type", "connect_by_code_response"},
             {"code", m.code},
             {"success", m.success}};
      j["peer_info"] = m.peer ? peer_to_json(*m.peer) : json(nullptr);
      put_optional(j, "error", m.error);
      return j;
    },
    [](const wire::FriendRequest& m) {
      return json{{"type", "friend_request"}, {"payload", m.raw}};
    }
  }, message);
}

// Throws json exceptions or std::invalid_argument on missing or mistyped fields.
std::optional<wire::Message> from_json_payload(const json& j) {
  const auto type = j.at("type").get<std::string>();
  if(type == "discovery") {
    wire::Discovery m;
    m.sender_id = j.at("sender_id").get<std::string>();
    m.protocol_version = j.at("protocol_version").get<std::uint32_t>();
    m.app_version = j.at("app_version").get<std::string>();
    m.listen_port = j.at("listen_port").get<std::uint16_t>();
    return m;
  }
  if(type == "discovery_response") {
    wire::DiscoveryResponse m;
    m.peer_id = j.at("peer_id").get<std::string>();
    m.nickname = get_optional<std::string>(j, "nickname");
    m.app_version = j.at("app_version").get<std::string>();
    m.status = status_field(j, "status");
    m.listen_port = j.at("listen_port").get<std::uint16_t>();
    return m;
  }
  if(type == "ping") {
    return wire::Ping{j.at("timestamp").get<std::uint64_t>()};
  }
  if(type == "pong") {
    return wire::Pong{j.at("timestamp").get<std::uint64_t>(), j.at("peer_id").get<std::string>()};
  }
  if(type == "connect_by_code") {
    wire::ConnectByCode m;
    m.code = j.at("code").get<std::string>();
    m.requester_id = j.at("requester_id").get<std::string>();
    m.requester_nickname = get_optional<std::string>(j, "requester_nickname");
    m.listen_port = j.value("listen_port", static_cast<std::uint16_t>(0));
    return m;
  }
  if(type == "connect_by_code_response") {
    wire::ConnectByCodeResponse m;
    m.code = j.at("code").get<std::string>();
    m.success = j.at("success").get<bool>();
    auto peer = j.find("peer_info");
    if(peer != j.end() && !peer->is_null()) m.peer = peer_from_json(*peer);
    m.error = get_optional<std::string>(j, "error");
    return m;
  }
  if(type == "friend_request") {
    return wire::FriendRequest{j.at("payload")};
  }
  return std::nullopt;
}

bool all_alnum(const std::string& text) {
  return std::all_of(text.begin(), text.end(),
                     [](unsigned char ch){ return std::isalnum(ch) != 0; });
}

} // namespace

const char* to_string(PeerStatus status) {
  switch(status) {
    case PeerStatus::Online: return "online";
    case PeerStatus::InGame: return "in_game";
    case PeerStatus::Away:   return "away";
  }
  return "online";
}

std::optional<PeerStatus> peer_status_from_string(const std::string& text) {
  if(text == "online") return PeerStatus::Online;
  if(text == "in_game") return PeerStatus::InGame;
  if(text == "away") return PeerStatus::Away;
  return std::nullopt;
}

json peer_to_json(const PeerInfo& peer) {
  json j{{"id", peer.id},
         {"address", peer.address},
         {"port", peer.port},
         {"app_version", peer.app_version},
         {"status", to_string(peer.status)}};
  put_optional(j, "nickname", peer.nickname);
  put_optional(j, "modpacks", peer.modpacks);
  put_optional(j, "current_server", peer.current_server);
  return j;
}

PeerInfo peer_from_json(const json& j) {
  PeerInfo peer;
  peer.id = j.at("id").get<std::string>();
  peer.nickname = get_optional<std::string>(j, "nickname");
  peer.address = j.value("address", std::string());
  peer.port = j.at("port").get<std::uint16_t>();
  peer.app_version = j.value("app_version", std::string());
  peer.status = status_field(j, "status");
  peer.modpacks = get_optional<std::vector<std::string>>(j, "modpacks");
  peer.current_server = get_optional<std::string>(j, "current_server");
  return peer;
}

const char* message_name(const wire::Message& message) {
  return std::visit(overloaded{
    [](const wire::Discovery&)             { return "Discovery"; },
    [](const wire::DiscoveryResponse&)     { return "DiscoveryResponse"; },
    [](const wire::Ping&)                  { return "Ping"; },
    [](const wire::Pong&)                  { return "Pong"; },
    [](const wire::ConnectByCode&)         { return "ConnectByCode"; },
    [](const wire::ConnectByCodeResponse&) { return "ConnectByCodeResponse"; },
    [](const wire::FriendRequest&)         { return "FriendRequest"; }
  }, message);
}

std::vector<std::uint8_t> encode_message(const wire::Message& message) {
  auto payload = json::to_msgpack(to_json_payload(message));
  if(payload.size() > kMaxDatagramSize - kEnvelopeHeaderSize) {
    throw std::length_error("Encoded message exceeds datagram limit");
  }
  std::vector<std::uint8_t> out;
  out.reserve(kEnvelopeHeaderSize + payload.size());
  out.insert(out.end(), kEnvelopeMagic.begin(), kEnvelopeMagic.end());
  out.push_back(kProtocolVersion);
  out.push_back(static_cast<std::uint8_t>((payload.size() >> 8) & 0xff));
  out.push_back(static_cast<std::uint8_t>(payload.size() & 0xff));
  out.insert(out.end(), payload.begin(), payload.end());
  return out;
}

std::optional<wire::Message> decode_message(const std::uint8_t* data, std::size_t size) {
  if(!data || size < kEnvelopeHeaderSize) return std::nullopt;
  if(!std::equal(kEnvelopeMagic.begin(), kEnvelopeMagic.end(), data)) return std::nullopt;
  if(data[4] != kProtocolVersion) return std::nullopt;

  std::size_t length = (static_cast<std::size_t>(data[5]) << 8) | data[6];
  if(size - kEnvelopeHeaderSize != length) return std::nullopt;

  try {
    auto payload = json::from_msgpack(data + kEnvelopeHeaderSize,
                                      data + kEnvelopeHeaderSize + length);
    if(!payload.is_object()) return std::nullopt;
    return from_json_payload(payload);
  } catch(const json::exception&) {
    return std::nullopt;
  } catch(const std::invalid_argument&) {
    return std::nullopt;
  }
}

std::string generate_short_code(const std::string& prefix) {
  constexpr std::size_t alphabet_size = sizeof(kShortCodeAlphabet) - 1;
  static_assert(256 % alphabet_size == 0, "alphabet size must divide 256 to avoid bias");
  auto bytes = random_bytes(kShortCodeLength);
  std::string body;
  body.reserve(kShortCodeLength);
  for(auto b : bytes) body.push_back(kShortCodeAlphabet[b % alphabet_size]);
  return prefix + "-" + body.substr(0, 4) + "-" + body.substr(4, 4);
}

std::string normalize_code(const std::string& code) {
  std::string out;
  out.reserve(code.size());
  for(unsigned char ch : code) {
    if(ch == '-' || std::isspace(ch)) continue;
    out.push_back(static_cast<char>(std::toupper(ch)));
  }
  return out;
}

std::optional<std::string> code_body(const std::string& code, const std::string& prefix) {
  auto normalized = normalize_code(code);
  auto upper_prefix = normalize_code(prefix);
  if(normalized.size() == kShortCodeLength + upper_prefix.size() &&
     normalized.compare(0, upper_prefix.size(), upper_prefix) == 0) {
    normalized.erase(0, upper_prefix.size());
  }
  if(normalized.size() != kShortCodeLength || !all_alnum(normalized)) return std::nullopt;
  return normalized;
}

std::optional<std::string> canonical_code(const std::string& code, const std::string& prefix) {
  auto body = code_body(code, prefix);
  if(!body) return std::nullopt;
  return normalize_code(prefix) + "-" + body->substr(0, 4) + "-" + body->substr(4, 4);
}
