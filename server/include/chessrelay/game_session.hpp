/*
 * 설명: 한 판의 상태 기계(착수/기권/무승부/시계/채팅/재연결)를 세션 단위 락으로 보호하며 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/game_session_test.cpp, server/tests/unit/protocol_router_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "chessrelay/connection_registry.hpp"
#include "chessrelay/observability.hpp"
#include "chessrelay/rating.hpp"
#include "chessrelay/rules_oracle.hpp"
#include "chessrelay/types.hpp"

namespace chessrelay {

enum class SessionStatus { kActive, kCompleted };

struct PlayerBinding {
  Principal principal;
  Color color;
  std::optional<ConnectionHandle> connection;
};

struct ChatEntry {
  std::string sender;
  std::string text;
};

struct SessionSnapshot {
  std::string position;
  Color turn{Color::kWhite};
  std::string white_name;
  std::string black_name;
  double white_seconds{0.0};
  double black_seconds{0.0};

  bool operator==(const SessionSnapshot& other) const {
    return position == other.position && turn == other.turn && white_name == other.white_name &&
           black_name == other.black_name && white_seconds == other.white_seconds &&
           black_seconds == other.black_seconds;
  }
};

struct SessionServices {
  std::shared_ptr<const RulesOracle> oracle;
  std::shared_ptr<ConnectionRegistry> registry;
  std::shared_ptr<RatingUpdater> rating_updater;
  std::shared_ptr<Observability> observability;
};

class GameSession {
 public:
  GameSession(std::string id, const Principal& white, ConnectionHandle white_connection, const Principal& black,
              ConnectionHandle black_connection, double clock_seconds, SessionServices services);

  const std::string& Id() const { return id_; }

  bool Move(Color acting, const std::string& move_text, std::string& error_code, std::string& error_message);
  bool Resign(Color acting, std::string& error_code, std::string& error_message);
  bool OfferDraw(Color acting, std::string& error_code, std::string& error_message);
  bool RespondDraw(bool accept, std::string& error_code, std::string& error_message);
  bool UpdateClock(Color color, double seconds_remaining, std::string& error_code, std::string& error_message);
  bool AppendChat(const std::string& sender, const std::string& text, std::string& error_code,
                  std::string& error_message);

  // 재연결: 표시 이름이 맞는 진영의 연결 핸들을 교체하고 새 연결에 gameState를 보낸다.
  bool BindConnection(const std::string& display_name, ConnectionHandle handle, std::string& error_code,
                      std::string& error_message);
  bool UnbindConnection(ConnectionHandle handle);

  std::optional<Color> ColorOf(ConnectionHandle handle) const;
  SessionSnapshot Snapshot() const;
  SessionStatus Status() const;
  bool DrawOffered() const;
  std::vector<ChatEntry> ChatLog() const;
  PlayerBinding Binding(Color color) const;
  std::optional<std::chrono::steady_clock::time_point> CompletedAt() const;

 private:
  PlayerBinding& BindingFor(Color color) { return color == Color::kWhite ? white_ : black_; }
  const PlayerBinding& BindingFor(Color color) const { return color == Color::kWhite ? white_ : black_; }
  bool RequireActive(std::string& error_code, std::string& error_message) const;
  void Complete(GameResult result, const std::string& method);
  void SendTo(Color color, const OutboundEnvelope& env) const;
  void Broadcast(const OutboundEnvelope& env) const;
  SessionSnapshot SnapshotLocked() const;
  void LogEvent(const std::string& name, const std::string& detail) const;

  const std::string id_;
  SessionServices services_;
  PlayerBinding white_;
  PlayerBinding black_;
  std::string position_;
  Color current_turn_{Color::kWhite};
  bool draw_offered_{false};
  double white_seconds_;
  double black_seconds_;
  std::vector<ChatEntry> chat_log_;
  SessionStatus status_{SessionStatus::kActive};
  std::optional<std::chrono::steady_clock::time_point> completed_at_;
  mutable std::mutex mutex_;
};

std::string_view ResultOutcomeText(GameResult result);
std::string_view ResultWinnerText(GameResult result);

}  // namespace chessrelay
