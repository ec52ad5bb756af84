/*
 * 설명: 세션 ID → GameSession 동시성 레지스트리와 연결별 바인딩 색인, 종료 세션 정리 타이머를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_store_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "chessrelay/game_session.hpp"
#include "chessrelay/observability.hpp"
#include "chessrelay/types.hpp"

namespace chessrelay {

class SessionStore {
 public:
  void Insert(const std::shared_ptr<GameSession>& session);
  std::shared_ptr<GameSession> Find(const std::string& session_id) const;

  void TrackBinding(ConnectionHandle handle, const std::string& session_id);
  // 연결이 끊겼을 때 이 핸들을 가리키는 모든 바인딩을 nil로 만든다. 세션 상태는 바꾸지 않는다.
  std::size_t DetachConnection(ConnectionHandle handle);

  // 완료 후 retention 이상 지난 세션만 제거한다. 진행 중인 세션은 건드리지 않는다.
  std::size_t ReapCompleted(std::chrono::steady_clock::time_point now, std::chrono::seconds retention);

  std::size_t Size() const;
  std::size_t ActiveCount() const;
  std::size_t CompletedCount() const;

 private:
  std::unordered_map<std::string, std::shared_ptr<GameSession>> sessions_;
  std::unordered_map<ConnectionHandle, std::unordered_set<std::string>> bindings_;
  mutable std::mutex mutex_;
};

class SessionReaper : public std::enable_shared_from_this<SessionReaper> {
 public:
  SessionReaper(boost::asio::io_context& ioc, std::shared_ptr<SessionStore> store,
                std::shared_ptr<Observability> observability, std::chrono::seconds interval,
                std::chrono::seconds retention);

  void Start();
  void Stop();

 private:
  void Schedule();
  void OnTick(const boost::system::error_code& ec);

  boost::asio::steady_timer timer_;
  std::shared_ptr<SessionStore> store_;
  std::shared_ptr<Observability> observability_;
  std::chrono::seconds interval_;
  std::chrono::seconds retention_;
};

}  // namespace chessrelay
