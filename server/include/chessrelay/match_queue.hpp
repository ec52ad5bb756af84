/*
 * 설명: 단일 대기 슬롯으로 도착 순서대로 두 명을 짝지어 새 게임 세션을 만든다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/match_queue_test.cpp
 */
#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <boost/uuid/random_generator.hpp>

#include "chessrelay/game_session.hpp"
#include "chessrelay/session_store.hpp"
#include "chessrelay/types.hpp"

namespace chessrelay {

struct JoinOutcome {
  bool waiting{true};
  std::string session_id;
  Color color{Color::kWhite};
  std::string opponent_name;
};

class MatchQueue {
 public:
  MatchQueue(std::shared_ptr<SessionStore> store, SessionServices services, double default_clock_seconds);

  // 슬롯이 비어 있으면 대기, 차 있으면 대기자를 백으로 하여 세션을 만들고 대기자에게 gameStart를 보낸다.
  JoinOutcome Join(const Principal& principal, ConnectionHandle handle);
  bool Cancel(ConnectionHandle handle);
  bool HasWaiting() const;

 private:
  struct WaitingEntry {
    Principal principal;
    ConnectionHandle handle;
  };

  std::string NextSessionId();

  std::shared_ptr<SessionStore> store_;
  SessionServices services_;
  double default_clock_seconds_;
  std::optional<WaitingEntry> slot_;
  boost::uuids::random_generator uuid_generator_;
  mutable std::mutex mutex_;
};

}  // namespace chessrelay
