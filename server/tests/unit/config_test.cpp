#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "chessrelay/config.hpp"
#include "chessrelay/observability.hpp"

namespace {

const std::vector<std::string> kConfigKeys = {
    "SERVER_PORT", "DB_HOST", "DB_PORT", "DB_USER", "DB_PASSWORD", "DB_NAME", "LOG_LEVEL", "JWT_SECRET_KEY",
    "DEFAULT_CLOCK_SECONDS", "WS_QUEUE_LIMIT_MESSAGES", "WS_QUEUE_LIMIT_BYTES", "RATING_K_FACTOR",
    "COMPLETED_SESSION_RETENTION_SECONDS", "SESSION_REAP_INTERVAL_SECONDS", "AUTH_RATE_WINDOW_SECONDS",
    "AUTH_RATE_LIMIT_MAX", "REGISTRY_SHARDS", "WORKER_THREADS"};

class ConfigTest : public ::testing::Test {
 protected:
  void SetUp() override { ClearAll(); }
  void TearDown() override { ClearAll(); }

  static void ClearAll() {
    for (const auto& key : kConfigKeys) {
      unsetenv(key.c_str());
    }
  }
};

}  // namespace

TEST_F(ConfigTest, DefaultsApplyWhenEnvironmentIsEmpty) {
  auto cfg = chessrelay::LoadConfigFromEnv();
  EXPECT_EQ(cfg.port, 8080);
  EXPECT_EQ(cfg.db_host, "127.0.0.1");
  EXPECT_EQ(cfg.db_port, 3306);
  EXPECT_EQ(cfg.log_level, "info");
  EXPECT_TRUE(cfg.jwt_secret.empty());
  EXPECT_DOUBLE_EQ(cfg.default_clock_seconds, 600.0);
  EXPECT_EQ(cfg.ws_queue_limit_messages, 64u);
  EXPECT_EQ(cfg.ws_queue_limit_bytes, 262144u);
  EXPECT_EQ(cfg.rating_k_factor, 32);
  EXPECT_EQ(cfg.completed_retention_seconds, 300u);
  EXPECT_EQ(cfg.reap_interval_seconds, 30u);
  EXPECT_EQ(cfg.auth_rate_limit_max, 5u);
  EXPECT_EQ(cfg.registry_shards, 16u);
  EXPECT_EQ(cfg.worker_threads, 0u);
}

TEST_F(ConfigTest, EnvironmentOverridesDefaults) {
  setenv("SERVER_PORT", "9191", 1);
  setenv("JWT_SECRET_KEY", "s3cret", 1);
  setenv("DEFAULT_CLOCK_SECONDS", "180.5", 1);
  setenv("RATING_K_FACTOR", "16", 1);
  setenv("WORKER_THREADS", "3", 1);

  auto cfg = chessrelay::LoadConfigFromEnv();
  EXPECT_EQ(cfg.port, 9191);
  EXPECT_EQ(cfg.jwt_secret, "s3cret");
  EXPECT_DOUBLE_EQ(cfg.default_clock_seconds, 180.5);
  EXPECT_EQ(cfg.rating_k_factor, 16);
  EXPECT_EQ(cfg.worker_threads, 3u);
}

TEST_F(ConfigTest, ZeroIntervalsAreClampedToOne) {
  setenv("SESSION_REAP_INTERVAL_SECONDS", "0", 1);
  setenv("REGISTRY_SHARDS", "0", 1);
  auto cfg = chessrelay::LoadConfigFromEnv();
  EXPECT_EQ(cfg.reap_interval_seconds, 1u);
  EXPECT_EQ(cfg.registry_shards, 1u);
}

TEST_F(ConfigTest, MalformedNumberIsRejected) {
  setenv("WS_QUEUE_LIMIT_MESSAGES", "64abc", 1);
  EXPECT_THROW(chessrelay::LoadConfigFromEnv(), std::invalid_argument);

  setenv("WS_QUEUE_LIMIT_MESSAGES", "many", 1);
  EXPECT_THROW(chessrelay::LoadConfigFromEnv(), std::invalid_argument);
}

TEST_F(ConfigTest, TrailingCharactersInClockAreRejected) {
  setenv("DEFAULT_CLOCK_SECONDS", "600abc", 1);
  EXPECT_THROW(chessrelay::LoadConfigFromEnv(), std::invalid_argument);

  setenv("DEFAULT_CLOCK_SECONDS", "-30", 1);
  EXPECT_THROW(chessrelay::LoadConfigFromEnv(), std::invalid_argument);

  setenv("DEFAULT_CLOCK_SECONDS", "inf", 1);
  EXPECT_THROW(chessrelay::LoadConfigFromEnv(), std::invalid_argument);
}

TEST_F(ConfigTest, NegativeCountIsRejectedInsteadOfWrapping) {
  setenv("WORKER_THREADS", "-1", 1);
  EXPECT_THROW(chessrelay::LoadConfigFromEnv(), std::invalid_argument);

  setenv("WORKER_THREADS", "+2", 1);
  EXPECT_THROW(chessrelay::LoadConfigFromEnv(), std::invalid_argument);

  setenv("WORKER_THREADS", " 2", 1);
  EXPECT_THROW(chessrelay::LoadConfigFromEnv(), std::invalid_argument);
}

TEST_F(ConfigTest, PortOutsideTcpRangeIsRejected) {
  setenv("SERVER_PORT", "70000", 1);
  EXPECT_THROW(chessrelay::LoadConfigFromEnv(), std::invalid_argument);

  setenv("SERVER_PORT", "0", 1);
  EXPECT_THROW(chessrelay::LoadConfigFromEnv(), std::invalid_argument);

  setenv("SERVER_PORT", "65535", 1);
  setenv("DB_PORT", "65536", 1);
  EXPECT_THROW(chessrelay::LoadConfigFromEnv(), std::invalid_argument);

  setenv("DB_PORT", "3307", 1);
  auto cfg = chessrelay::LoadConfigFromEnv();
  EXPECT_EQ(cfg.port, 65535);
  EXPECT_EQ(cfg.db_port, 3307);
}

TEST_F(ConfigTest, KFactorMustStayInRange) {
  setenv("RATING_K_FACTOR", "0", 1);
  EXPECT_THROW(chessrelay::LoadConfigFromEnv(), std::invalid_argument);

  setenv("RATING_K_FACTOR", "4294967296", 1);
  EXPECT_THROW(chessrelay::LoadConfigFromEnv(), std::invalid_argument);

  setenv("RATING_K_FACTOR", "99999999999999999999999", 1);
  EXPECT_THROW(chessrelay::LoadConfigFromEnv(), std::invalid_argument);
}

TEST(LogLevelTest, ParsesNamesCaseInsensitively) {
  EXPECT_EQ(chessrelay::ParseLogLevel("DEBUG"), chessrelay::LogLevel::kDebug);
  EXPECT_EQ(chessrelay::ParseLogLevel("warning"), chessrelay::LogLevel::kWarn);
  EXPECT_EQ(chessrelay::ParseLogLevel("error"), chessrelay::LogLevel::kError);
  EXPECT_EQ(chessrelay::ParseLogLevel("verbose"), chessrelay::LogLevel::kInfo);
  EXPECT_EQ(chessrelay::LogLevelName(chessrelay::LogLevel::kWarn), "warn");
}

TEST(LogLevelTest, ThresholdFiltersLowerLevels) {
  chessrelay::Observability obs(chessrelay::LogLevel::kWarn);
  EXPECT_FALSE(obs.Enabled(chessrelay::LogLevel::kDebug));
  EXPECT_FALSE(obs.Enabled(chessrelay::LogLevel::kInfo));
  EXPECT_TRUE(obs.Enabled(chessrelay::LogLevel::kWarn));
  EXPECT_TRUE(obs.Enabled(chessrelay::LogLevel::kError));
}

TEST(ObservabilityTest, CountersFeedSnapshot) {
  chessrelay::Observability obs;
  obs.IncrementDecodeError();
  obs.IncrementDecodeError();
  obs.IncrementRatingFailure();
  obs.SetWebsocketActive(4);
  auto snapshot = obs.Snapshot(3, 1);
  EXPECT_EQ(snapshot.websocket_active, 4u);
  EXPECT_EQ(snapshot.active_sessions, 3u);
  EXPECT_EQ(snapshot.completed_sessions, 1u);
  EXPECT_EQ(snapshot.decode_errors, 2u);
  EXPECT_EQ(snapshot.rating_failures, 1u);
  EXPECT_NE(obs.NextTraceId(), obs.NextTraceId());
}
