/*
 * 설명: 종국 시 두 플레이어의 Elo 레이팅 변화를 계산하고 계정 저장소에 비동기로 반영한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/rating_update_test.cpp
 */
#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

#include <boost/asio/thread_pool.hpp>

#include "chessrelay/account_store.hpp"
#include "chessrelay/observability.hpp"
#include "chessrelay/rules_oracle.hpp"
#include "chessrelay/types.hpp"

namespace chessrelay {

struct RatingChange {
  int white_before{0};
  int black_before{0};
  int white_delta{0};
  int black_delta{0};
};

class RatingUpdater {
 public:
  RatingUpdater(std::shared_ptr<AccountStore> accounts, std::shared_ptr<Observability> observability,
                int k_factor = 32, std::size_t threads = 1);
  ~RatingUpdater();

  RatingUpdater(const RatingUpdater&) = delete;
  RatingUpdater& operator=(const RatingUpdater&) = delete;

  // 워커 풀에 작업을 넘기고 즉시 반환한다. 실패는 로그로만 남는다.
  void OnGameCompleted(const std::string& session_id, const Principal& white, const Principal& black,
                       GameResult result);

  // 동기 버전. 저장까지 성공하면 true.
  bool Apply(const std::string& session_id, const Principal& white, const Principal& black, GameResult result,
             RatingChange* change = nullptr);

  // 이미 넘겨진 작업이 모두 끝날 때까지 기다린다.
  void Drain();
  void Stop();

  static double ExpectedScore(int player_rating, int opponent_rating);
  static int ComputeDelta(int player_rating, int opponent_rating, double actual_score, int k_factor);

 private:
  void Finish();

  std::shared_ptr<AccountStore> accounts_;
  std::shared_ptr<Observability> observability_;
  const int k_factor_;
  boost::asio::thread_pool pool_;
  std::mutex mutex_;
  std::condition_variable idle_;
  std::size_t pending_{0};
  bool stopped_{false};
};

}  // namespace chessrelay
