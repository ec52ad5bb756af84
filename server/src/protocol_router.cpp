/*
 * 설명: 디코딩된 메시지를 매칭 큐 또는 gameId로 찾은 세션 연산에 연결하고, 실패는 송신자에게만 알린다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/protocol_router_test.cpp
 */
#include "chessrelay/protocol_router.hpp"

#include <variant>

namespace chessrelay {

ProtocolRouter::ProtocolRouter(std::shared_ptr<ConnectionRegistry> registry, std::shared_ptr<SessionStore> store,
                               std::shared_ptr<MatchQueue> match_queue, std::shared_ptr<Observability> observability)
    : registry_(std::move(registry)),
      store_(std::move(store)),
      match_queue_(std::move(match_queue)),
      observability_(std::move(observability)) {}

void ProtocolRouter::HandleFrame(const Principal& principal, ConnectionHandle handle, std::string_view text) {
  auto decoded = DecodeInbound(text);
  if (decoded.status != DecodeStatus::kOk || !decoded.message) {
    // 해석할 수 없는 프레임은 로그만 남기고 버린다. 연결은 유지한다.
    if (observability_) {
      if (decoded.status == DecodeStatus::kMalformed) {
        observability_->IncrementDecodeError();
      }
      LogContext ctx;
      ctx.name = decoded.status == DecodeStatus::kUnknownType ? "ws.unknown_type" : "ws.decode_error";
      ctx.user_id = principal.id;
      ctx.connection = handle.value();
      ctx.detail = decoded.type.empty() ? decoded.reason : decoded.type + ": " + decoded.reason;
      observability_->Warn(ctx);
    }
    return;
  }
  Dispatch(principal, handle, *decoded.message);
}

void ProtocolRouter::Dispatch(const Principal& principal, ConnectionHandle handle, const InboundMessage& message) {
  if (observability_ && observability_->Enabled(LogLevel::kDebug)) {
    LogContext ctx;
    ctx.name = "ws.dispatch";
    ctx.user_id = principal.id;
    ctx.connection = handle.value();
    ctx.detail = std::string(InboundTypeName(message));
    observability_->Debug(ctx);
  }
  std::visit([&](const auto& request) { Handle(principal, handle, request); }, message);
}

void ProtocolRouter::OnDisconnect(ConnectionHandle handle) {
  bool was_waiting = match_queue_->Cancel(handle);
  auto detached = store_->DetachConnection(handle);
  if (observability_) {
    LogContext ctx;
    ctx.name = "ws.disconnect";
    ctx.connection = handle.value();
    ctx.detail = "waiting=" + std::string(was_waiting ? "true" : "false") + ", detached=" + std::to_string(detached);
    observability_->Info(ctx);
  }
}

void ProtocolRouter::Handle(const Principal& principal, ConnectionHandle handle, const JoinRequest&) {
  auto outcome = match_queue_->Join(principal, handle);
  if (outcome.waiting) {
    registry_->Send(handle, outbound::Waiting());
    return;
  }
  registry_->Send(handle, outbound::GameStart(outcome.session_id, ColorName(outcome.color), outcome.opponent_name));
}

void ProtocolRouter::Handle(const Principal& principal, ConnectionHandle handle, const MoveRequest& request) {
  Target target;
  if (!Resolve(handle, request.game_id, target)) {
    return;
  }
  std::string error_code;
  std::string error_message;
  if (!target.session->Move(target.color, request.move, error_code, error_message)) {
    SendError(handle, error_code, error_message);
    LogFailure(principal, handle, request.game_id, error_code, error_message);
  }
}

void ProtocolRouter::Handle(const Principal& principal, ConnectionHandle handle, const ResignRequest& request) {
  Target target;
  if (!Resolve(handle, request.game_id, target)) {
    return;
  }
  std::string error_code;
  std::string error_message;
  if (!target.session->Resign(target.color, error_code, error_message)) {
    SendError(handle, error_code, error_message);
    LogFailure(principal, handle, request.game_id, error_code, error_message);
  }
}

void ProtocolRouter::Handle(const Principal& principal, ConnectionHandle handle, const DrawOfferRequest& request) {
  Target target;
  if (!Resolve(handle, request.game_id, target)) {
    return;
  }
  std::string error_code;
  std::string error_message;
  if (!target.session->OfferDraw(target.color, error_code, error_message)) {
    SendError(handle, error_code, error_message);
    LogFailure(principal, handle, request.game_id, error_code, error_message);
  }
}

void ProtocolRouter::Handle(const Principal& principal, ConnectionHandle handle, const DrawResponseRequest& request) {
  Target target;
  if (!Resolve(handle, request.game_id, target)) {
    return;
  }
  std::string error_code;
  std::string error_message;
  if (!target.session->RespondDraw(request.accept, error_code, error_message)) {
    SendError(handle, error_code, error_message);
    LogFailure(principal, handle, request.game_id, error_code, error_message);
  }
}

void ProtocolRouter::Handle(const Principal& principal, ConnectionHandle handle, const TimeUpdateRequest& request) {
  Target target;
  if (!Resolve(handle, request.game_id, target)) {
    return;
  }
  std::string error_code;
  std::string error_message;
  if (!target.session->UpdateClock(target.color, request.time_left, error_code, error_message)) {
    SendError(handle, error_code, error_message);
    LogFailure(principal, handle, request.game_id, error_code, error_message);
  }
}

void ProtocolRouter::Handle(const Principal& principal, ConnectionHandle handle, const ChatRequest& request) {
  Target target;
  if (!Resolve(handle, request.game_id, target)) {
    return;
  }
  std::string error_code;
  std::string error_message;
  if (!target.session->AppendChat(principal.display_name, request.message, error_code, error_message)) {
    SendError(handle, error_code, error_message);
    LogFailure(principal, handle, request.game_id, error_code, error_message);
  }
}

void ProtocolRouter::Handle(const Principal& principal, ConnectionHandle handle, const ReconnectRequest& request) {
  auto session = store_->Find(request.game_id);
  if (!session) {
    SendError(handle, "game_not_found", "게임을 찾을 수 없습니다");
    LogFailure(principal, handle, request.game_id, "game_not_found", "게임을 찾을 수 없습니다");
    return;
  }
  std::string error_code;
  std::string error_message;
  if (!session->BindConnection(principal.display_name, handle, error_code, error_message)) {
    SendError(handle, error_code, error_message);
    LogFailure(principal, handle, request.game_id, error_code, error_message);
    return;
  }
  store_->TrackBinding(handle, request.game_id);
}

void ProtocolRouter::Handle(const Principal&, ConnectionHandle handle, const PingRequest&) {
  registry_->Send(handle, outbound::Pong());
}

bool ProtocolRouter::Resolve(ConnectionHandle handle, const std::string& game_id, Target& target) {
  auto session = store_->Find(game_id);
  if (!session) {
    SendError(handle, "game_not_found", "게임을 찾을 수 없습니다");
    return false;
  }
  auto color = session->ColorOf(handle);
  if (!color) {
    SendError(handle, "player_not_in_game", "이 게임의 플레이어가 아닙니다");
    return false;
  }
  target.session = std::move(session);
  target.color = *color;
  return true;
}

void ProtocolRouter::SendError(ConnectionHandle handle, std::string_view code, std::string_view message) {
  registry_->Send(handle, outbound::Error(code, message));
}

void ProtocolRouter::LogFailure(const Principal& principal, ConnectionHandle handle, const std::string& game_id,
                                const std::string& code, const std::string& message) {
  if (!observability_) {
    return;
  }
  LogContext ctx;
  ctx.name = "ws.request_rejected";
  ctx.user_id = principal.id;
  ctx.session_id = game_id;
  ctx.connection = handle.value();
  ctx.detail = code + ": " + message;
  observability_->Info(ctx);
}

}  // namespace chessrelay
