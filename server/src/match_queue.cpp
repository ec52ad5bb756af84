/*
 * 설명: 단일 대기 슬롯 매칭을 구현한다. 슬롯 확인/비우기와 세션 등록은 한 임계 구역에서 일어난다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/match_queue_test.cpp
 */
#include "chessrelay/match_queue.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace chessrelay {

MatchQueue::MatchQueue(std::shared_ptr<SessionStore> store, SessionServices services, double default_clock_seconds)
    : store_(std::move(store)), services_(std::move(services)), default_clock_seconds_(default_clock_seconds) {}

JoinOutcome MatchQueue::Join(const Principal& principal, ConnectionHandle handle) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!slot_) {
    slot_ = WaitingEntry{principal, handle};
    return JoinOutcome{};
  }
  if (slot_->principal.id == principal.id) {
    // 같은 주체가 다시 들어오면 자기 자신과 짝짓지 않고 최신 연결로 대기를 이어간다.
    slot_->handle = handle;
    return JoinOutcome{};
  }

  WaitingEntry waiting = *slot_;
  slot_.reset();

  auto session = std::make_shared<GameSession>(NextSessionId(), waiting.principal, waiting.handle, principal, handle,
                                               default_clock_seconds_, services_);
  store_->Insert(session);
  services_.registry->Send(waiting.handle,
                           outbound::GameStart(session->Id(), ColorName(Color::kWhite), principal.display_name));

  if (services_.observability) {
    LogContext ctx;
    ctx.name = "match.paired";
    ctx.session_id = session->Id();
    ctx.detail = waiting.principal.display_name + " vs " + principal.display_name;
    services_.observability->Info(ctx);
  }

  JoinOutcome outcome;
  outcome.waiting = false;
  outcome.session_id = session->Id();
  outcome.color = Color::kBlack;
  outcome.opponent_name = waiting.principal.display_name;
  return outcome;
}

bool MatchQueue::Cancel(ConnectionHandle handle) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!slot_ || slot_->handle != handle) {
    return false;
  }
  slot_.reset();
  return true;
}

bool MatchQueue::HasWaiting() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return slot_.has_value();
}

std::string MatchQueue::NextSessionId() { return boost::uuids::to_string(uuid_generator_()); }

}  // namespace chessrelay
