/*
 * 설명: 세션 레지스트리, 연결별 바인딩 색인, 종료 세션 정리 타이머를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_store_test.cpp
 */
#include "chessrelay/session_store.hpp"

namespace chessrelay {

void SessionStore::Insert(const std::shared_ptr<GameSession>& session) {
  std::lock_guard<std::mutex> lock(mutex_);
  sessions_[session->Id()] = session;
  for (auto color : {Color::kWhite, Color::kBlack}) {
    auto binding = session->Binding(color);
    if (binding.connection) {
      bindings_[*binding.connection].insert(session->Id());
    }
  }
}

std::shared_ptr<GameSession> SessionStore::Find(const std::string& session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    return nullptr;
  }
  return it->second;
}

void SessionStore::TrackBinding(ConnectionHandle handle, const std::string& session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (sessions_.count(session_id) == 0) {
    return;
  }
  bindings_[handle].insert(session_id);
}

std::size_t SessionStore::DetachConnection(ConnectionHandle handle) {
  std::vector<std::shared_ptr<GameSession>> affected;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = bindings_.find(handle);
    if (it == bindings_.end()) {
      return 0;
    }
    for (const auto& session_id : it->second) {
      auto session_it = sessions_.find(session_id);
      if (session_it != sessions_.end()) {
        affected.push_back(session_it->second);
      }
    }
    bindings_.erase(it);
  }
  std::size_t detached = 0;
  for (const auto& session : affected) {
    if (session->UnbindConnection(handle)) {
      ++detached;
    }
  }
  return detached;
}

std::size_t SessionStore::ReapCompleted(std::chrono::steady_clock::time_point now, std::chrono::seconds retention) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t reaped = 0;
  for (auto it = sessions_.begin(); it != sessions_.end();) {
    auto completed_at = it->second->CompletedAt();
    if (!completed_at || *completed_at + retention > now) {
      ++it;
      continue;
    }
    for (auto binding_it = bindings_.begin(); binding_it != bindings_.end();) {
      binding_it->second.erase(it->first);
      if (binding_it->second.empty()) {
        binding_it = bindings_.erase(binding_it);
      } else {
        ++binding_it;
      }
    }
    it = sessions_.erase(it);
    ++reaped;
  }
  return reaped;
}

std::size_t SessionStore::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

std::size_t SessionStore::ActiveCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t active = 0;
  for (const auto& [id, session] : sessions_) {
    if (session->Status() == SessionStatus::kActive) {
      ++active;
    }
  }
  return active;
}

std::size_t SessionStore::CompletedCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t completed = 0;
  for (const auto& [id, session] : sessions_) {
    if (session->Status() == SessionStatus::kCompleted) {
      ++completed;
    }
  }
  return completed;
}

SessionReaper::SessionReaper(boost::asio::io_context& ioc, std::shared_ptr<SessionStore> store,
                             std::shared_ptr<Observability> observability, std::chrono::seconds interval,
                             std::chrono::seconds retention)
    : timer_(ioc), store_(std::move(store)), observability_(std::move(observability)), interval_(interval),
      retention_(retention) {}

void SessionReaper::Start() { Schedule(); }

void SessionReaper::Stop() { timer_.cancel(); }

void SessionReaper::Schedule() {
  timer_.expires_after(interval_);
  auto self = shared_from_this();
  timer_.async_wait([self](const boost::system::error_code& ec) { self->OnTick(ec); });
}

void SessionReaper::OnTick(const boost::system::error_code& ec) {
  if (ec) {
    return;
  }
  auto reaped = store_->ReapCompleted(std::chrono::steady_clock::now(), retention_);
  if (reaped > 0 && observability_) {
    LogContext ctx;
    ctx.name = "session.reaped";
    ctx.detail = std::to_string(reaped);
    observability_->Info(ctx);
  }
  Schedule();
}

}  // namespace chessrelay
