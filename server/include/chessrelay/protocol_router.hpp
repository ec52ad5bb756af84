/*
 * 설명: 수신 엔벨로프를 해석해 매칭 큐나 해당 게임 세션 연산으로 분배하고 오류를 송신자에게만 돌려준다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/protocol_router_test.cpp
 */
#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "chessrelay/connection_registry.hpp"
#include "chessrelay/game_session.hpp"
#include "chessrelay/match_queue.hpp"
#include "chessrelay/observability.hpp"
#include "chessrelay/protocol.hpp"
#include "chessrelay/session_store.hpp"

namespace chessrelay {

class ProtocolRouter {
 public:
  ProtocolRouter(std::shared_ptr<ConnectionRegistry> registry, std::shared_ptr<SessionStore> store,
                 std::shared_ptr<MatchQueue> match_queue, std::shared_ptr<Observability> observability);

  void HandleFrame(const Principal& principal, ConnectionHandle handle, std::string_view text);
  void Dispatch(const Principal& principal, ConnectionHandle handle, const InboundMessage& message);
  void OnDisconnect(ConnectionHandle handle);

 private:
  struct Target {
    std::shared_ptr<GameSession> session;
    Color color{Color::kWhite};
  };

  void Handle(const Principal& principal, ConnectionHandle handle, const JoinRequest& request);
  void Handle(const Principal& principal, ConnectionHandle handle, const MoveRequest& request);
  void Handle(const Principal& principal, ConnectionHandle handle, const ResignRequest& request);
  void Handle(const Principal& principal, ConnectionHandle handle, const DrawOfferRequest& request);
  void Handle(const Principal& principal, ConnectionHandle handle, const DrawResponseRequest& request);
  void Handle(const Principal& principal, ConnectionHandle handle, const TimeUpdateRequest& request);
  void Handle(const Principal& principal, ConnectionHandle handle, const ChatRequest& request);
  void Handle(const Principal& principal, ConnectionHandle handle, const ReconnectRequest& request);
  void Handle(const Principal& principal, ConnectionHandle handle, const PingRequest& request);

  // 세션 조회와 보낸 연결의 진영 확인. 실패하면 송신자에게 오류를 보내고 false.
  bool Resolve(ConnectionHandle handle, const std::string& game_id, Target& target);
  void SendError(ConnectionHandle handle, std::string_view code, std::string_view message);
  void LogFailure(const Principal& principal, ConnectionHandle handle, const std::string& game_id,
                  const std::string& code, const std::string& message);

  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<SessionStore> store_;
  std::shared_ptr<MatchQueue> match_queue_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace chessrelay
