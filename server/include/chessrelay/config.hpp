/*
 * 설명: 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace chessrelay {

struct AppConfig {
  unsigned short port;
  std::string db_host;
  unsigned short db_port;
  std::string db_user;
  std::string db_password;
  std::string db_name;
  std::string log_level;
  std::string jwt_secret;
  double default_clock_seconds;
  std::size_t ws_queue_limit_messages;
  std::size_t ws_queue_limit_bytes;
  int rating_k_factor;
  std::size_t completed_retention_seconds;
  std::size_t reap_interval_seconds;
  std::size_t auth_rate_window_seconds;
  std::size_t auth_rate_limit_max;
  std::size_t registry_shards;
  std::size_t worker_threads;
};

AppConfig LoadConfigFromEnv();

}  // namespace chessrelay
