/*
 * 설명: Elo 기대 승률 공식으로 레이팅 변화를 계산하고 워커 풀에서 계정 저장소에 반영한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/rating_update_test.cpp
 */
#include "chessrelay/rating.hpp"

#include <algorithm>
#include <cmath>
#include <exception>

#include <boost/asio/post.hpp>

namespace chessrelay {

RatingUpdater::RatingUpdater(std::shared_ptr<AccountStore> accounts, std::shared_ptr<Observability> observability,
                             int k_factor, std::size_t threads)
    : accounts_(std::move(accounts)),
      observability_(std::move(observability)),
      k_factor_(k_factor),
      pool_(std::max<std::size_t>(1, threads)) {}

RatingUpdater::~RatingUpdater() { Stop(); }

void RatingUpdater::OnGameCompleted(const std::string& session_id, const Principal& white, const Principal& black,
                                    GameResult result) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_) {
      return;
    }
    ++pending_;
  }
  boost::asio::post(pool_, [this, session_id, white, black, result]() {
    Apply(session_id, white, black, result);
    Finish();
  });
}

bool RatingUpdater::Apply(const std::string& session_id, const Principal& white, const Principal& black,
                          GameResult result, RatingChange* change) {
  if (result == GameResult::kNone) {
    return false;
  }
  auto log = [&](LogLevel level, const std::string& name, const std::string& detail) {
    if (!observability_) {
      return;
    }
    LogContext ctx;
    ctx.name = name;
    ctx.session_id = session_id;
    ctx.detail = detail;
    observability_->Log(level, ctx);
  };
  if (!accounts_) {
    log(LogLevel::kWarn, "rating.store_unavailable", "계정 저장소가 설정되지 않았습니다");
    if (observability_) {
      observability_->IncrementRatingFailure();
    }
    return false;
  }

  try {
    auto white_account = accounts_->GetById(white.id);
    auto black_account = accounts_->GetById(black.id);
    if (!white_account || !black_account) {
      log(LogLevel::kWarn, "rating.principal_missing", !white_account ? white.id : black.id);
      if (observability_) {
        observability_->IncrementRatingFailure();
      }
      return false;
    }

    double white_score = result == GameResult::kWhiteWon ? 1.0 : result == GameResult::kDraw ? 0.5 : 0.0;
    int white_delta = ComputeDelta(white_account->elo_rating, black_account->elo_rating, white_score, k_factor_);
    int black_delta = ComputeDelta(black_account->elo_rating, white_account->elo_rating, 1.0 - white_score, k_factor_);

    RatingChange computed{white_account->elo_rating, black_account->elo_rating, white_delta, black_delta};
    white_account->elo_rating += white_delta;
    black_account->elo_rating += black_delta;
    accounts_->Update(*white_account);
    accounts_->Update(*black_account);

    if (change) {
      *change = computed;
    }
    log(LogLevel::kInfo, "rating.updated",
        "white " + std::to_string(computed.white_before) + "->" + std::to_string(white_account->elo_rating) +
            ", black " + std::to_string(computed.black_before) + "->" + std::to_string(black_account->elo_rating));
    return true;
  } catch (const std::exception& ex) {
    // 레이팅 저장 실패는 게임 결과에 영향을 주지 않는다.
    log(LogLevel::kError, "rating.failed", ex.what());
    if (observability_) {
      observability_->IncrementRatingFailure();
    }
    return false;
  }
}

void RatingUpdater::Drain() {
  std::unique_lock<std::mutex> lock(mutex_);
  idle_.wait(lock, [this]() { return pending_ == 0; });
}

void RatingUpdater::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopped_ = true;
  }
  pool_.join();
}

void RatingUpdater::Finish() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (--pending_ == 0) {
    idle_.notify_all();
  }
}

double RatingUpdater::ExpectedScore(int player_rating, int opponent_rating) {
  double exponent = static_cast<double>(opponent_rating - player_rating) / 400.0;
  return 1.0 / (1.0 + std::pow(10.0, exponent));
}

int RatingUpdater::ComputeDelta(int player_rating, int opponent_rating, double actual_score, int k_factor) {
  double delta = static_cast<double>(k_factor) * (actual_score - ExpectedScore(player_rating, opponent_rating));
  return static_cast<int>(std::round(delta));
}

}  // namespace chessrelay
