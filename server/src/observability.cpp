/*
 * 설명: 구조화 로그와 서버 상태 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#include "chessrelay/observability.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace chessrelay {

LogLevel ParseLogLevel(std::string_view text) {
  std::string lowered(text);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lowered == "debug") {
    return LogLevel::kDebug;
  }
  if (lowered == "warn" || lowered == "warning") {
    return LogLevel::kWarn;
  }
  if (lowered == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

std::string_view LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

MetricsSnapshot Observability::Snapshot(std::uint64_t active_sessions, std::uint64_t completed_sessions) const {
  MetricsSnapshot snapshot;
  snapshot.websocket_active = websocket_active_.load();
  snapshot.active_sessions = active_sessions;
  snapshot.completed_sessions = completed_sessions;
  snapshot.decode_errors = decode_errors_.load();
  snapshot.rating_failures = rating_failures_.load();
  return snapshot;
}

void Observability::Log(LogLevel level, const LogContext& ctx) const {
  if (!Enabled(level)) {
    return;
  }
  nlohmann::json log_json;
  log_json["level"] = std::string(LogLevelName(level));
  log_json["eventName"] = ctx.name;
  if (!ctx.trace_id.empty()) {
    log_json["traceId"] = ctx.trace_id;
  }
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.user_id) {
    log_json["userId"] = *ctx.user_id;
  }
  if (ctx.session_id) {
    log_json["sessionId"] = *ctx.session_id;
  }
  if (ctx.connection) {
    log_json["connection"] = *ctx.connection;
  }
  if (!ctx.detail.empty()) {
    log_json["detail"] = ctx.detail;
  }
  // 여러 워커가 동시에 찍어도 한 줄이 섞이지 않도록 출력만 직렬화한다.
  std::lock_guard<std::mutex> lock(out_mutex_);
  std::cout << log_json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

}  // namespace chessrelay
