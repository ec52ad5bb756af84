/*
 * 설명: HS256 토큰 검증과 IP별 실패 시도 제한을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/token_verifier_test.cpp
 */
#include "chessrelay/auth.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <vector>

#include <nlohmann/json.hpp>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace chessrelay {

namespace {
std::optional<std::int64_t> NumericClaim(const nlohmann::json& claims, const char* name) {
  auto it = claims.find(name);
  if (it == claims.end() || !it->is_number()) {
    return std::nullopt;
  }
  if (it->is_number_unsigned()) {
    auto value = it->get<std::uint64_t>();
    if (value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
      return std::nullopt;
    }
    return static_cast<std::int64_t>(value);
  }
  if (it->is_number_integer()) {
    return it->get<std::int64_t>();
  }
  // 2^63 밖의 실수는 int64로 변환할 수 없으므로 클레임이 없는 것으로 본다.
  constexpr double kInt64Bound = 9223372036854775808.0;
  const double value = std::floor(it->get<double>());
  if (!std::isfinite(value) || value < -kInt64Bound || value >= kInt64Bound) {
    return std::nullopt;
  }
  return static_cast<std::int64_t>(value);
}

void Fail(std::string& error_code, std::string& error_message, const char* code, const char* message) {
  error_code = code;
  error_message = message;
}
}  // namespace

RateLimiter::RateLimiter(std::size_t max_attempts, std::chrono::seconds window)
    : max_attempts_(max_attempts), window_(window) {}

bool RateLimiter::Allow(const std::string& key, std::chrono::system_clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = buckets_.find(key);
  if (it == buckets_.end()) {
    return true;
  }
  if (Expired(it->second, now)) {
    buckets_.erase(it);
    return true;
  }
  return it->second.count < max_attempts_;
}

void RateLimiter::RecordFailure(const std::string& key, std::chrono::system_clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  // 창이 지난 버킷은 새 실패가 기록될 때 함께 정리한다.
  for (auto it = buckets_.begin(); it != buckets_.end();) {
    if (Expired(it->second, now)) {
      it = buckets_.erase(it);
    } else {
      ++it;
    }
  }
  auto inserted = buckets_.try_emplace(key, Bucket{0, now});
  ++inserted.first->second.count;
}

std::size_t RateLimiter::TrackedKeys() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return buckets_.size();
}

bool RateLimiter::Expired(const Bucket& bucket, std::chrono::system_clock::time_point now) const {
  return now - bucket.window_start > window_;
}

TokenVerifier::TokenVerifier(std::string secret) : secret_(std::move(secret)) {}

std::optional<Principal> TokenVerifier::Verify(std::string_view token, std::chrono::system_clock::time_point now,
                                               std::string& error_code, std::string& error_message) const {
  if (secret_.empty()) {
    Fail(error_code, error_message, "unauthorized", "토큰 검증 키가 설정되지 않았습니다");
    return std::nullopt;
  }
  if (token.empty()) {
    Fail(error_code, error_message, "unauthorized", "토큰이 필요합니다");
    return std::nullopt;
  }
  auto first_dot = token.find('.');
  auto second_dot = first_dot == std::string_view::npos ? std::string_view::npos : token.find('.', first_dot + 1);
  if (second_dot == std::string_view::npos || token.find('.', second_dot + 1) != std::string_view::npos) {
    Fail(error_code, error_message, "unauthorized", "토큰 형식이 올바르지 않습니다");
    return std::nullopt;
  }
  auto header_part = token.substr(0, first_dot);
  auto claims_part = token.substr(first_dot + 1, second_dot - first_dot - 1);
  auto signature_part = token.substr(second_dot + 1);

  auto header_text = Base64UrlDecode(header_part);
  auto claims_text = Base64UrlDecode(claims_part);
  auto signature = Base64UrlDecode(signature_part);
  if (!header_text || !claims_text || !signature) {
    Fail(error_code, error_message, "unauthorized", "토큰 인코딩이 올바르지 않습니다");
    return std::nullopt;
  }

  auto header = nlohmann::json::parse(*header_text, nullptr, false);
  if (header.is_discarded() || !header.is_object() || header.value("alg", "") != "HS256") {
    Fail(error_code, error_message, "unauthorized", "지원하지 않는 토큰 알고리즘입니다");
    return std::nullopt;
  }

  auto expected = HmacSha256(secret_, token.substr(0, second_dot));
  if (expected.size() != signature->size() ||
      CRYPTO_memcmp(expected.data(), signature->data(), expected.size()) != 0) {
    Fail(error_code, error_message, "unauthorized", "토큰 서명이 올바르지 않습니다");
    return std::nullopt;
  }

  auto claims = nlohmann::json::parse(*claims_text, nullptr, false);
  if (claims.is_discarded() || !claims.is_object()) {
    Fail(error_code, error_message, "unauthorized", "토큰 클레임이 올바르지 않습니다");
    return std::nullopt;
  }

  const auto now_seconds = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
  auto exp = NumericClaim(claims, "exp");
  if (!exp) {
    Fail(error_code, error_message, "unauthorized", "만료 시각이 없는 토큰입니다");
    return std::nullopt;
  }
  if (now_seconds >= *exp) {
    Fail(error_code, error_message, "token_expired", "토큰이 만료되었습니다");
    return std::nullopt;
  }
  auto nbf = NumericClaim(claims, "nbf");
  if (nbf && now_seconds < *nbf) {
    Fail(error_code, error_message, "unauthorized", "아직 유효하지 않은 토큰입니다");
    return std::nullopt;
  }

  Principal principal;
  auto user_id = claims.find("user_id");
  if (user_id != claims.end() && user_id->is_string()) {
    principal.id = user_id->get<std::string>();
  } else if (user_id != claims.end() && user_id->is_number_integer()) {
    principal.id = std::to_string(user_id->get<std::int64_t>());
  }
  auto username = claims.find("username");
  if (username != claims.end() && username->is_string()) {
    principal.display_name = username->get<std::string>();
  }
  if (principal.id.empty() || principal.display_name.empty()) {
    Fail(error_code, error_message, "unauthorized", "토큰에 사용자 정보가 없습니다");
    return std::nullopt;
  }
  return principal;
}

std::string TokenVerifier::Base64UrlEncode(std::string_view data) {
  std::vector<unsigned char> buffer(4 * ((data.size() + 2) / 3) + 1);
  int len = EVP_EncodeBlock(buffer.data(), reinterpret_cast<const unsigned char*>(data.data()),
                            static_cast<int>(data.size()));
  std::string encoded(reinterpret_cast<const char*>(buffer.data()), static_cast<std::size_t>(len));
  for (auto& c : encoded) {
    if (c == '+') {
      c = '-';
    } else if (c == '/') {
      c = '_';
    }
  }
  while (!encoded.empty() && encoded.back() == '=') {
    encoded.pop_back();
  }
  return encoded;
}

std::optional<std::string> TokenVerifier::Base64UrlDecode(std::string_view data) {
  if (data.size() % 4 == 1) {
    return std::nullopt;
  }
  std::string standard(data);
  for (auto& c : standard) {
    if (c == '-') {
      c = '+';
    } else if (c == '_') {
      c = '/';
    } else if (c == '+' || c == '/' || c == '=') {
      return std::nullopt;
    }
  }
  std::size_t padding = (4 - standard.size() % 4) % 4;
  standard.append(padding, '=');
  if (standard.empty()) {
    return std::string{};
  }
  std::vector<unsigned char> buffer(standard.size() / 4 * 3);
  int len = EVP_DecodeBlock(buffer.data(), reinterpret_cast<const unsigned char*>(standard.data()),
                            static_cast<int>(standard.size()));
  if (len < 0 || static_cast<std::size_t>(len) < padding) {
    return std::nullopt;
  }
  return std::string(reinterpret_cast<const char*>(buffer.data()), static_cast<std::size_t>(len) - padding);
}

std::string TokenVerifier::HmacSha256(std::string_view key, std::string_view data) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()), reinterpret_cast<const unsigned char*>(data.data()),
       data.size(), digest, &digest_len);
  return std::string(reinterpret_cast<const char*>(digest), digest_len);
}

}  // namespace chessrelay
