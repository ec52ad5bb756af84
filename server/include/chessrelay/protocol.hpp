/*
 * 설명: WS 엔벨로프({type, payload}) 디코딩/인코딩과 타입별 메시지 정의를 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/protocol_codec_test.cpp
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

namespace chessrelay {

struct JoinRequest {};

struct MoveRequest {
  std::string game_id;
  std::string move;
};

struct ResignRequest {
  std::string game_id;
};

struct DrawOfferRequest {
  std::string game_id;
};

struct DrawResponseRequest {
  std::string game_id;
  bool accept{false};
};

struct TimeUpdateRequest {
  std::string game_id;
  double time_left{0.0};
};

struct ChatRequest {
  std::string game_id;
  std::string message;
};

struct ReconnectRequest {
  std::string game_id;
};

struct PingRequest {};

using InboundMessage = std::variant<JoinRequest, MoveRequest, ResignRequest, DrawOfferRequest, DrawResponseRequest,
                                    TimeUpdateRequest, ChatRequest, ReconnectRequest, PingRequest>;

enum class DecodeStatus { kOk, kMalformed, kUnknownType };

struct DecodeResult {
  DecodeStatus status{DecodeStatus::kMalformed};
  std::optional<InboundMessage> message;
  std::string type;
  std::string reason;
};

// 텍스트 프레임 하나를 해석한다. 타입별 필수 필드는 여기서 검증되며 실패 시 message는 비어 있다.
DecodeResult DecodeInbound(std::string_view text);

std::string_view InboundTypeName(const InboundMessage& message);

struct OutboundEnvelope {
  std::string type;
  nlohmann::json payload;
};

nlohmann::json ToWsJson(const OutboundEnvelope& env);
std::string EncodeOutbound(const OutboundEnvelope& env);

// HTTP 응답용 엔벨로프.
nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message);

namespace outbound {

OutboundEnvelope Waiting();
OutboundEnvelope GameStart(const std::string& game_id, std::string_view color, const std::string& opponent);
OutboundEnvelope Move(const std::string& move, const std::string& position, std::string_view turn);
OutboundEnvelope GameOver(std::string_view outcome, std::string_view method, std::string_view winner);
OutboundEnvelope DrawOffer(std::string_view offered_by);
OutboundEnvelope DrawResponse(bool accepted);
OutboundEnvelope TimeUpdate(std::string_view color, double time_left);
OutboundEnvelope Chat(const std::string& sender, const std::string& message);
OutboundEnvelope GameState(const std::string& position, std::string_view turn, const std::string& white_player,
                           const std::string& black_player, double white_time, double black_time);
OutboundEnvelope Error(std::string_view code, std::string_view message);
OutboundEnvelope Pong();

}  // namespace outbound

}  // namespace chessrelay
