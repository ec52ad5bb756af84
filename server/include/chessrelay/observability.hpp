/*
 * 설명: 구조화 로그(JSON 한 줄)와 서버 상태 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace chessrelay {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

LogLevel ParseLogLevel(std::string_view text);
std::string_view LogLevelName(LogLevel level);

struct LogContext {
  std::string name;
  std::string trace_id;
  std::optional<std::string> user_id;
  std::optional<std::string> session_id;
  std::optional<std::uint64_t> connection;
  std::string detail;
  long latency_ms{0};
};

struct MetricsSnapshot {
  std::uint64_t websocket_active{0};
  std::uint64_t active_sessions{0};
  std::uint64_t completed_sessions{0};
  std::uint64_t decode_errors{0};
  std::uint64_t rating_failures{0};
};

class Observability {
 public:
  explicit Observability(LogLevel threshold = LogLevel::kInfo) : threshold_(threshold) {}

  std::string NextTraceId();
  void SetWebsocketActive(std::uint64_t count) { websocket_active_.store(count); }
  void IncrementDecodeError() { decode_errors_.fetch_add(1); }
  void IncrementRatingFailure() { rating_failures_.fetch_add(1); }
  MetricsSnapshot Snapshot(std::uint64_t active_sessions, std::uint64_t completed_sessions) const;

  bool Enabled(LogLevel level) const { return level >= threshold_; }
  void Log(LogLevel level, const LogContext& ctx) const;
  void Debug(const LogContext& ctx) const { Log(LogLevel::kDebug, ctx); }
  void Info(const LogContext& ctx) const { Log(LogLevel::kInfo, ctx); }
  void Warn(const LogContext& ctx) const { Log(LogLevel::kWarn, ctx); }
  void Error(const LogContext& ctx) const { Log(LogLevel::kError, ctx); }

 private:
  LogLevel threshold_;
  std::atomic<std::uint64_t> websocket_active_{0};
  std::atomic<std::uint64_t> decode_errors_{0};
  std::atomic<std::uint64_t> rating_failures_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
  mutable std::mutex out_mutex_;
};

}  // namespace chessrelay
