/*
 * 설명: WS 엔벨로프를 타입별 메시지로 해석하고 송신 엔벨로프를 직렬화한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/protocol_codec_test.cpp
 */
#include "chessrelay/protocol.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace chessrelay {
namespace {
std::string CurrentTimestamp() {
  using clock = std::chrono::system_clock;
  auto now = clock::now();
  auto itt = clock::to_time_t(now);
  std::ostringstream ss;
  ss << std::put_time(std::gmtime(&itt), "%FT%TZ");
  return ss.str();
}

DecodeResult Malformed(std::string type, std::string reason) {
  DecodeResult result;
  result.status = DecodeStatus::kMalformed;
  result.type = std::move(type);
  result.reason = std::move(reason);
  return result;
}

DecodeResult Decoded(std::string type, InboundMessage message) {
  DecodeResult result;
  result.status = DecodeStatus::kOk;
  result.type = std::move(type);
  result.message = std::move(message);
  return result;
}

bool ReadString(const nlohmann::json& payload, const char* key, std::string& out) {
  auto it = payload.find(key);
  if (it == payload.end() || !it->is_string()) {
    return false;
  }
  out = it->get<std::string>();
  return true;
}

bool ReadGameId(const nlohmann::json& payload, std::string& out) { return ReadString(payload, "gameId", out) && !out.empty(); }
}  // namespace

DecodeResult DecodeInbound(std::string_view text) {
  nlohmann::json message = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);
  if (message.is_discarded() || !message.is_object()) {
    return Malformed("", "JSON 파싱 오류");
  }
  auto type_it = message.find("type");
  if (type_it == message.end() || !type_it->is_string()) {
    return Malformed("", "type 필드가 필요합니다");
  }
  std::string type = type_it->get<std::string>();

  nlohmann::json payload = nlohmann::json::object();
  auto payload_it = message.find("payload");
  if (payload_it != message.end() && !payload_it->is_null()) {
    if (!payload_it->is_object()) {
      return Malformed(type, "payload는 객체여야 합니다");
    }
    payload = *payload_it;
  }

  if (type == "join") {
    return Decoded(type, JoinRequest{});
  }
  if (type == "ping") {
    return Decoded(type, PingRequest{});
  }

  std::string game_id;
  if (type == "move" || type == "resign" || type == "draw_offer" || type == "draw_response" ||
      type == "time_update" || type == "chat" || type == "reconnect") {
    if (!ReadGameId(payload, game_id)) {
      return Malformed(type, "gameId가 필요합니다");
    }
  } else {
    DecodeResult result;
    result.status = DecodeStatus::kUnknownType;
    result.type = type;
    result.reason = "알 수 없는 메시지 유형";
    return result;
  }

  if (type == "move") {
    std::string move;
    if (!ReadString(payload, "move", move) || move.empty()) {
      return Malformed(type, "move 필드가 필요합니다");
    }
    return Decoded(type, MoveRequest{game_id, move});
  }
  if (type == "resign") {
    return Decoded(type, ResignRequest{game_id});
  }
  if (type == "draw_offer") {
    return Decoded(type, DrawOfferRequest{game_id});
  }
  if (type == "draw_response") {
    auto accept_it = payload.find("accept");
    if (accept_it == payload.end() || !accept_it->is_boolean()) {
      return Malformed(type, "accept 필드가 필요합니다");
    }
    return Decoded(type, DrawResponseRequest{game_id, accept_it->get<bool>()});
  }
  if (type == "time_update") {
    auto time_it = payload.find("timeLeft");
    if (time_it == payload.end() || !time_it->is_number()) {
      return Malformed(type, "timeLeft 필드가 필요합니다");
    }
    return Decoded(type, TimeUpdateRequest{game_id, time_it->get<double>()});
  }
  if (type == "chat") {
    std::string text;
    if (!ReadString(payload, "message", text)) {
      return Malformed(type, "message 필드가 필요합니다");
    }
    return Decoded(type, ChatRequest{game_id, text});
  }
  return Decoded(type, ReconnectRequest{game_id});
}

std::string_view InboundTypeName(const InboundMessage& message) {
  struct Namer {
    std::string_view operator()(const JoinRequest&) const { return "join"; }
    std::string_view operator()(const MoveRequest&) const { return "move"; }
    std::string_view operator()(const ResignRequest&) const { return "resign"; }
    std::string_view operator()(const DrawOfferRequest&) const { return "draw_offer"; }
    std::string_view operator()(const DrawResponseRequest&) const { return "draw_response"; }
    std::string_view operator()(const TimeUpdateRequest&) const { return "time_update"; }
    std::string_view operator()(const ChatRequest&) const { return "chat"; }
    std::string_view operator()(const ReconnectRequest&) const { return "reconnect"; }
    std::string_view operator()(const PingRequest&) const { return "ping"; }
  };
  return std::visit(Namer{}, message);
}

nlohmann::json ToWsJson(const OutboundEnvelope& env) {
  nlohmann::json j;
  j["type"] = env.type;
  if (!env.payload.is_null()) {
    j["payload"] = env.payload;
  }
  return j;
}

std::string EncodeOutbound(const OutboundEnvelope& env) { return ToWsJson(env).dump(); }

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  nlohmann::json envelope;
  envelope["success"] = true;
  envelope["data"] = data;
  envelope["error"] = nullptr;
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", code}, {"message", message}};
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

namespace outbound {

OutboundEnvelope Waiting() { return {"waiting", "Waiting for opponent..."}; }

OutboundEnvelope GameStart(const std::string& game_id, std::string_view color, const std::string& opponent) {
  return {"gameStart", {{"gameId", game_id}, {"color", color}, {"opponent", opponent}}};
}

OutboundEnvelope Move(const std::string& move, const std::string& position, std::string_view turn) {
  return {"move", {{"move", move}, {"position", position}, {"turn", turn}}};
}

OutboundEnvelope GameOver(std::string_view outcome, std::string_view method, std::string_view winner) {
  return {"gameOver", {{"outcome", outcome}, {"method", method}, {"winner", winner}}};
}

OutboundEnvelope DrawOffer(std::string_view offered_by) { return {"drawOffer", {{"offeredBy", offered_by}}}; }

OutboundEnvelope DrawResponse(bool accepted) { return {"drawResponse", {{"accepted", accepted}}}; }

OutboundEnvelope TimeUpdate(std::string_view color, double time_left) {
  return {"timeUpdate", {{"color", color}, {"timeLeft", time_left}}};
}

OutboundEnvelope Chat(const std::string& sender, const std::string& message) {
  return {"chat", {{"sender", sender}, {"message", message}}};
}

OutboundEnvelope GameState(const std::string& position, std::string_view turn, const std::string& white_player,
                           const std::string& black_player, double white_time, double black_time) {
  return {"gameState",
          {{"position", position},
           {"turn", turn},
           {"whitePlayer", white_player},
           {"blackPlayer", black_player},
           {"whiteTime", white_time},
           {"blackTime", black_time}}};
}

OutboundEnvelope Error(std::string_view code, std::string_view message) {
  return {"error", {{"code", code}, {"message", message}}};
}

OutboundEnvelope Pong() { return {"pong", nullptr}; }

}  // namespace outbound

}  // namespace chessrelay
