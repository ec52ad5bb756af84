/*
 * 설명: 서버 전체 수명주기(컴포넌트 조립, 리스너, 워커 스레드)를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/session_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "chessrelay/account_store.hpp"
#include "chessrelay/auth.hpp"
#include "chessrelay/config.hpp"
#include "chessrelay/connection_registry.hpp"
#include "chessrelay/db_client.hpp"
#include "chessrelay/match_queue.hpp"
#include "chessrelay/observability.hpp"
#include "chessrelay/protocol_router.hpp"
#include "chessrelay/rating.hpp"
#include "chessrelay/rules_oracle.hpp"
#include "chessrelay/session_store.hpp"

namespace chessrelay {

class Listener;

class ServerApp {
 public:
  explicit ServerApp(const AppConfig& config, std::shared_ptr<AccountStore> accounts = nullptr);
  ~ServerApp();

  // 종료 요청(Stop 또는 SIGINT/SIGTERM) 후 모든 워커가 끝나야 반환한다.
  void Run();
  // 어느 스레드에서든 호출할 수 있고 join하지 않는다. 실제 정리는 io_context 위에서 일어난다.
  void Stop();

  std::shared_ptr<RatingUpdater> GetRatingUpdater() { return rating_updater_; }

 private:
  void RunWorkers();
  void Shutdown();
  void JoinWorkers();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<MariaDbClient> db_client_;
  std::shared_ptr<AccountStore> accounts_;
  std::shared_ptr<RatingUpdater> rating_updater_;
  std::shared_ptr<const RulesOracle> oracle_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<SessionStore> store_;
  std::shared_ptr<SessionReaper> reaper_;
  std::shared_ptr<MatchQueue> match_queue_;
  std::shared_ptr<ProtocolRouter> router_;
  std::shared_ptr<TokenVerifier> verifier_;
  std::shared_ptr<RateLimiter> rate_limiter_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace chessrelay
