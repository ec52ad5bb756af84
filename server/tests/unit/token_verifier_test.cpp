#include <chrono>
#include <string>

#include <gtest/gtest.h>

#include "chessrelay/auth.hpp"
#include "support/test_support.hpp"

using chessrelay::RateLimiter;
using chessrelay::TokenVerifier;
using chessrelay::testing::EpochSeconds;
using chessrelay::testing::MintToken;
using chessrelay::testing::SignToken;

namespace {

constexpr const char* kSecret = "unit-test-secret";

std::string ToHex(const std::string& bytes) {
  static const char* digits = "0123456789abcdef";
  std::string hex;
  for (unsigned char c : bytes) {
    hex.push_back(digits[c >> 4]);
    hex.push_back(digits[c & 0x0f]);
  }
  return hex;
}

}  // namespace

TEST(TokenCodecTest, HmacMatchesRfc4231Vector) {
  EXPECT_EQ(ToHex(TokenVerifier::HmacSha256("Jefe", "what do ya want for nothing?")),
            "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST(TokenCodecTest, Base64UrlOmitsPadding) {
  EXPECT_EQ(TokenVerifier::Base64UrlEncode("hello"), "aGVsbG8");
  auto decoded = TokenVerifier::Base64UrlDecode("aGVsbG8");
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, "hello");
  EXPECT_FALSE(TokenVerifier::Base64UrlDecode("a$b").has_value());
}

TEST(TokenVerifierTest, AcceptsValidToken) {
  TokenVerifier verifier(kSecret);
  std::string code;
  std::string message;
  auto principal = verifier.Verify(MintToken(kSecret, "42", "alice"), std::chrono::system_clock::now(), code, message);
  ASSERT_TRUE(principal.has_value()) << message;
  EXPECT_EQ(principal->id, "42");
  EXPECT_EQ(principal->display_name, "alice");
}

TEST(TokenVerifierTest, AcceptsNumericUserId) {
  TokenVerifier verifier(kSecret);
  auto now = std::chrono::system_clock::now();
  nlohmann::json header{{"alg", "HS256"}, {"typ", "JWT"}};
  nlohmann::json claims{{"user_id", 7}, {"username", "bob"}, {"exp", EpochSeconds(now) + 60}};
  std::string code;
  std::string message;
  auto principal = verifier.Verify(SignToken(kSecret, header, claims), now, code, message);
  ASSERT_TRUE(principal.has_value()) << message;
  EXPECT_EQ(principal->id, "7");
}

TEST(TokenVerifierTest, RejectsWrongSecret) {
  TokenVerifier verifier(kSecret);
  std::string code;
  std::string message;
  EXPECT_FALSE(verifier.Verify(MintToken("other-secret", "42", "alice"), std::chrono::system_clock::now(), code,
                               message));
  EXPECT_EQ(code, "unauthorized");
}

TEST(TokenVerifierTest, RejectsTamperedClaims) {
  TokenVerifier verifier(kSecret);
  auto token = MintToken(kSecret, "42", "alice");
  auto first_dot = token.find('.');
  auto second_dot = token.find('.', first_dot + 1);
  nlohmann::json forged{{"user_id", "1"}, {"username", "admin"}, {"exp", 4102444800}};
  auto tampered = token.substr(0, first_dot + 1) + TokenVerifier::Base64UrlEncode(forged.dump()) +
                  token.substr(second_dot);
  std::string code;
  std::string message;
  EXPECT_FALSE(verifier.Verify(tampered, std::chrono::system_clock::now(), code, message));
  EXPECT_EQ(code, "unauthorized");
}

TEST(TokenVerifierTest, ExpiredTokenHasDistinctCode) {
  TokenVerifier verifier(kSecret);
  std::string code;
  std::string message;
  auto token = MintToken(kSecret, "42", "alice", std::chrono::seconds(60));
  EXPECT_FALSE(verifier.Verify(token, std::chrono::system_clock::now() + std::chrono::seconds(120), code, message));
  EXPECT_EQ(code, "token_expired");
}

TEST(TokenVerifierTest, RejectsNoneAlgorithm) {
  TokenVerifier verifier(kSecret);
  auto now = std::chrono::system_clock::now();
  nlohmann::json header{{"alg", "none"}};
  nlohmann::json claims{{"user_id", "42"}, {"username", "alice"}, {"exp", EpochSeconds(now) + 60}};
  auto token = TokenVerifier::Base64UrlEncode(header.dump()) + "." + TokenVerifier::Base64UrlEncode(claims.dump()) +
               ".";
  std::string code;
  std::string message;
  EXPECT_FALSE(verifier.Verify(token, now, code, message));
  EXPECT_EQ(code, "unauthorized");
}

TEST(TokenVerifierTest, RejectsMissingIdentityClaims) {
  TokenVerifier verifier(kSecret);
  auto now = std::chrono::system_clock::now();
  nlohmann::json header{{"alg", "HS256"}};
  nlohmann::json claims{{"user_id", "42"}, {"exp", EpochSeconds(now) + 60}};
  std::string code;
  std::string message;
  EXPECT_FALSE(verifier.Verify(SignToken(kSecret, header, claims), now, code, message));
  EXPECT_EQ(code, "unauthorized");

  nlohmann::json no_exp{{"user_id", "42"}, {"username", "alice"}};
  EXPECT_FALSE(verifier.Verify(SignToken(kSecret, header, no_exp), now, code, message));
}

TEST(TokenVerifierTest, RejectsNotYetValidToken) {
  TokenVerifier verifier(kSecret);
  auto now = std::chrono::system_clock::now();
  nlohmann::json header{{"alg", "HS256"}};
  nlohmann::json claims{
      {"user_id", "42"}, {"username", "alice"}, {"exp", EpochSeconds(now) + 600}, {"nbf", EpochSeconds(now) + 300}};
  std::string code;
  std::string message;
  EXPECT_FALSE(verifier.Verify(SignToken(kSecret, header, claims), now, code, message));
  EXPECT_EQ(code, "unauthorized");
}

TEST(TokenVerifierTest, OutOfRangeExpiryIsTreatedAsMissing) {
  TokenVerifier verifier(kSecret);
  auto now = std::chrono::system_clock::now();
  nlohmann::json header{{"alg", "HS256"}};
  std::string code;
  std::string message;

  nlohmann::json huge_float{{"user_id", "42"}, {"username", "alice"}, {"exp", 1e300}};
  EXPECT_FALSE(verifier.Verify(SignToken(kSecret, header, huge_float), now, code, message));
  EXPECT_EQ(code, "unauthorized");

  nlohmann::json huge_unsigned{{"user_id", "42"}, {"username", "alice"}, {"exp", 18446744073709551615ULL}};
  code.clear();
  EXPECT_FALSE(verifier.Verify(SignToken(kSecret, header, huge_unsigned), now, code, message));
  EXPECT_EQ(code, "unauthorized");
}

TEST(TokenVerifierTest, FractionalExpiryIsFloored) {
  TokenVerifier verifier(kSecret);
  auto now = std::chrono::system_clock::now();
  nlohmann::json header{{"alg", "HS256"}};
  nlohmann::json claims{
      {"user_id", "42"}, {"username", "alice"}, {"exp", static_cast<double>(EpochSeconds(now)) + 120.75}};
  std::string code;
  std::string message;
  EXPECT_TRUE(verifier.Verify(SignToken(kSecret, header, claims), now, code, message).has_value()) << message;
}

TEST(TokenVerifierTest, EmptySecretRejectsEverything) {
  TokenVerifier verifier("");
  std::string code;
  std::string message;
  EXPECT_FALSE(verifier.Verify(MintToken("", "42", "alice"), std::chrono::system_clock::now(), code, message));
  EXPECT_EQ(code, "unauthorized");
}

TEST(TokenVerifierTest, RejectsMalformedStructure) {
  TokenVerifier verifier(kSecret);
  std::string code;
  std::string message;
  auto now = std::chrono::system_clock::now();
  EXPECT_FALSE(verifier.Verify("", now, code, message));
  EXPECT_FALSE(verifier.Verify("abc.def", now, code, message));
  EXPECT_FALSE(verifier.Verify("a.b.c.d", now, code, message));
}

TEST(RateLimiterTest, BlocksAfterMaxFailuresWithinWindow) {
  RateLimiter limiter(3, std::chrono::seconds(60));
  auto now = std::chrono::system_clock::now();
  for (int i = 0; i < 3; ++i) {
    EXPECT_TRUE(limiter.Allow("10.0.0.1", now));
    limiter.RecordFailure("10.0.0.1", now);
  }
  EXPECT_FALSE(limiter.Allow("10.0.0.1", now));
  EXPECT_TRUE(limiter.Allow("10.0.0.2", now));
  EXPECT_TRUE(limiter.Allow("10.0.0.1", now + std::chrono::seconds(61)));
}

TEST(RateLimiterTest, ExpiredBucketsAreDropped) {
  RateLimiter limiter(3, std::chrono::seconds(60));
  auto now = std::chrono::system_clock::now();
  limiter.RecordFailure("10.0.0.1", now);
  limiter.RecordFailure("10.0.0.2", now);
  limiter.RecordFailure("10.0.0.3", now);
  EXPECT_EQ(limiter.TrackedKeys(), 3u);

  auto later = now + std::chrono::seconds(61);
  EXPECT_TRUE(limiter.Allow("10.0.0.1", later));
  EXPECT_EQ(limiter.TrackedKeys(), 2u);

  limiter.RecordFailure("10.0.0.4", later);
  EXPECT_EQ(limiter.TrackedKeys(), 1u);
  EXPECT_TRUE(limiter.Allow("10.0.0.2", later));
}

TEST(RateLimiterTest, FailureAfterExpiryStartsFreshWindow) {
  RateLimiter limiter(2, std::chrono::seconds(60));
  auto now = std::chrono::system_clock::now();
  limiter.RecordFailure("10.0.0.1", now);
  limiter.RecordFailure("10.0.0.1", now);
  EXPECT_FALSE(limiter.Allow("10.0.0.1", now));

  auto later = now + std::chrono::seconds(61);
  limiter.RecordFailure("10.0.0.1", later);
  EXPECT_TRUE(limiter.Allow("10.0.0.1", later));
  limiter.RecordFailure("10.0.0.1", later);
  EXPECT_FALSE(limiter.Allow("10.0.0.1", later));
}
