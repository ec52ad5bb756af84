/*
 * 설명: WS 업그레이드 전에 HS256 토큰을 검증해 인증 주체를 만들고, 실패 시도를 IP별로 제한한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/token_verifier_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "chessrelay/types.hpp"

namespace chessrelay {

class RateLimiter {
 public:
  RateLimiter(std::size_t max_attempts, std::chrono::seconds window);
  bool Allow(const std::string& key, std::chrono::system_clock::time_point now);
  void RecordFailure(const std::string& key, std::chrono::system_clock::time_point now);
  // 아직 창이 끝나지 않은 실패 기록을 가진 키 수.
  std::size_t TrackedKeys() const;

 private:
  struct Bucket {
    std::size_t count{0};
    std::chrono::system_clock::time_point window_start{};
  };
  bool Expired(const Bucket& bucket, std::chrono::system_clock::time_point now) const;

  std::unordered_map<std::string, Bucket> buckets_;
  std::size_t max_attempts_;
  std::chrono::seconds window_;
  mutable std::mutex mutex_;
};

class TokenVerifier {
 public:
  explicit TokenVerifier(std::string secret);

  std::optional<Principal> Verify(std::string_view token, std::chrono::system_clock::time_point now,
                                  std::string& error_code, std::string& error_message) const;

  static std::string Base64UrlEncode(std::string_view data);
  static std::optional<std::string> Base64UrlDecode(std::string_view data);
  static std::string HmacSha256(std::string_view key, std::string_view data);

 private:
  std::string secret_;
};

}  // namespace chessrelay
