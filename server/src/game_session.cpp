/*
 * 설명: 한 판의 상태 기계를 세션 단위 락 아래에서 실행하고 결과를 바인딩된 두 연결로 방송한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/game_session_test.cpp, server/tests/unit/protocol_router_test.cpp
 */
#include "chessrelay/game_session.hpp"

#include <utility>

namespace chessrelay {

std::string_view ResultOutcomeText(GameResult result) {
  switch (result) {
    case GameResult::kWhiteWon:
      return "white won";
    case GameResult::kBlackWon:
      return "black won";
    case GameResult::kDraw:
      return "draw";
    case GameResult::kNone:
      break;
  }
  return "";
}

std::string_view ResultWinnerText(GameResult result) {
  switch (result) {
    case GameResult::kWhiteWon:
      return "white";
    case GameResult::kBlackWon:
      return "black";
    case GameResult::kDraw:
      return "draw";
    case GameResult::kNone:
      break;
  }
  return "";
}

GameSession::GameSession(std::string id, const Principal& white, ConnectionHandle white_connection,
                         const Principal& black, ConnectionHandle black_connection, double clock_seconds,
                         SessionServices services)
    : id_(std::move(id)),
      services_(std::move(services)),
      white_{white, Color::kWhite, white_connection},
      black_{black, Color::kBlack, black_connection},
      position_(services_.oracle->NewGame()),
      white_seconds_(clock_seconds),
      black_seconds_(clock_seconds) {}

bool GameSession::Move(Color acting, const std::string& move_text, std::string& error_code,
                       std::string& error_message) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!RequireActive(error_code, error_message)) {
    return false;
  }
  if (acting != current_turn_) {
    error_code = "not_your_turn";
    error_message = "자신의 차례가 아닙니다";
    return false;
  }
  auto applied = services_.oracle->ApplyMove(position_, move_text);
  if (!applied.accepted) {
    error_code = "invalid_move";
    error_message = applied.error;
    return false;
  }

  position_ = std::move(applied.position);
  current_turn_ = Opposite(current_turn_);
  draw_offered_ = false;
  Broadcast(outbound::Move(move_text, services_.oracle->RenderPosition(position_), ColorName(current_turn_)));
  LogEvent("session.move", move_text);

  auto outcome = services_.oracle->Outcome(position_);
  if (outcome.terminal) {
    Complete(outcome.result, outcome.method);
  }
  return true;
}

bool GameSession::Resign(Color acting, std::string& error_code, std::string& error_message) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!RequireActive(error_code, error_message)) {
    return false;
  }
  Complete(acting == Color::kWhite ? GameResult::kBlackWon : GameResult::kWhiteWon, "resignation");
  return true;
}

bool GameSession::OfferDraw(Color acting, std::string& error_code, std::string& error_message) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!RequireActive(error_code, error_message)) {
    return false;
  }
  draw_offered_ = true;
  SendTo(Opposite(acting), outbound::DrawOffer(ColorName(acting)));
  LogEvent("session.draw_offer", std::string(ColorName(acting)));
  return true;
}

bool GameSession::RespondDraw(bool accept, std::string& error_code, std::string& error_message) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!RequireActive(error_code, error_message)) {
    return false;
  }
  if (!draw_offered_) {
    error_code = "no_draw_pending";
    error_message = "대기 중인 무승부 제안이 없습니다";
    return false;
  }
  if (accept) {
    Complete(GameResult::kDraw, "draw agreement");
    return true;
  }
  draw_offered_ = false;
  Broadcast(outbound::DrawResponse(false));
  LogEvent("session.draw_declined", "");
  return true;
}

bool GameSession::UpdateClock(Color color, double seconds_remaining, std::string& error_code,
                              std::string& error_message) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!RequireActive(error_code, error_message)) {
    return false;
  }
  // 클라이언트가 보고한 잔여 시간을 그대로 신뢰한다.
  (color == Color::kWhite ? white_seconds_ : black_seconds_) = seconds_remaining;
  Broadcast(outbound::TimeUpdate(ColorName(color), seconds_remaining));
  return true;
}

bool GameSession::AppendChat(const std::string& sender, const std::string& text, std::string& error_code,
                             std::string& error_message) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!RequireActive(error_code, error_message)) {
    return false;
  }
  chat_log_.push_back(ChatEntry{sender, text});
  Broadcast(outbound::Chat(sender, text));
  return true;
}

bool GameSession::BindConnection(const std::string& display_name, ConnectionHandle handle, std::string& error_code,
                                 std::string& error_message) {
  std::lock_guard<std::mutex> lock(mutex_);
  PlayerBinding* binding = nullptr;
  if (white_.principal.display_name == display_name) {
    binding = &white_;
  } else if (black_.principal.display_name == display_name) {
    binding = &black_;
  }
  if (binding == nullptr) {
    error_code = "player_not_in_game";
    error_message = "이 게임의 플레이어가 아닙니다";
    return false;
  }
  binding->connection = handle;

  auto snapshot = SnapshotLocked();
  services_.registry->Send(handle, outbound::GameState(snapshot.position, ColorName(snapshot.turn),
                                                       snapshot.white_name, snapshot.black_name,
                                                       snapshot.white_seconds, snapshot.black_seconds));
  LogEvent("session.rebind", std::string(ColorName(binding->color)));
  return true;
}

bool GameSession::UnbindConnection(ConnectionHandle handle) {
  std::lock_guard<std::mutex> lock(mutex_);
  bool changed = false;
  for (auto* binding : {&white_, &black_}) {
    if (binding->connection && *binding->connection == handle) {
      binding->connection.reset();
      changed = true;
    }
  }
  return changed;
}

std::optional<Color> GameSession::ColorOf(ConnectionHandle handle) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (white_.connection && *white_.connection == handle) {
    return Color::kWhite;
  }
  if (black_.connection && *black_.connection == handle) {
    return Color::kBlack;
  }
  return std::nullopt;
}

SessionSnapshot GameSession::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return SnapshotLocked();
}

SessionStatus GameSession::Status() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return status_;
}

bool GameSession::DrawOffered() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return draw_offered_;
}

std::vector<ChatEntry> GameSession::ChatLog() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chat_log_;
}

PlayerBinding GameSession::Binding(Color color) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return BindingFor(color);
}

std::optional<std::chrono::steady_clock::time_point> GameSession::CompletedAt() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return completed_at_;
}

bool GameSession::RequireActive(std::string& error_code, std::string& error_message) const {
  if (status_ == SessionStatus::kCompleted) {
    error_code = "game_over";
    error_message = "이미 종료된 게임입니다";
    return false;
  }
  return true;
}

void GameSession::Complete(GameResult result, const std::string& method) {
  status_ = SessionStatus::kCompleted;
  draw_offered_ = false;
  completed_at_ = std::chrono::steady_clock::now();
  Broadcast(outbound::GameOver(ResultOutcomeText(result), method, ResultWinnerText(result)));
  LogEvent("session.completed", std::string(ResultOutcomeText(result)) + " by " + method);
  if (services_.rating_updater) {
    services_.rating_updater->OnGameCompleted(id_, white_.principal, black_.principal, result);
  }
}

void GameSession::SendTo(Color color, const OutboundEnvelope& env) const {
  const auto& binding = BindingFor(color);
  if (!binding.connection) {
    return;
  }
  services_.registry->Send(*binding.connection, env);
}

void GameSession::Broadcast(const OutboundEnvelope& env) const {
  SendTo(Color::kWhite, env);
  SendTo(Color::kBlack, env);
}

SessionSnapshot GameSession::SnapshotLocked() const {
  SessionSnapshot snapshot;
  snapshot.position = services_.oracle->RenderPosition(position_);
  snapshot.turn = current_turn_;
  snapshot.white_name = white_.principal.display_name;
  snapshot.black_name = black_.principal.display_name;
  snapshot.white_seconds = white_seconds_;
  snapshot.black_seconds = black_seconds_;
  return snapshot;
}

void GameSession::LogEvent(const std::string& name, const std::string& detail) const {
  if (!services_.observability) {
    return;
  }
  LogContext ctx;
  ctx.name = name;
  ctx.session_id = id_;
  ctx.detail = detail;
  services_.observability->Info(ctx);
}

}  // namespace chessrelay
