/*
 * 설명: 계정/레이팅 저장소 인터페이스를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/rating_update_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <string>

namespace chessrelay {

struct Account {
  std::string id;
  std::string username;
  std::string email;
  std::string display_name;
  int elo_rating{1200};
};

class AccountStore {
 public:
  virtual ~AccountStore() = default;

  virtual std::optional<Account> GetById(const std::string& id) = 0;
  virtual std::optional<Account> GetByUsername(const std::string& username) = 0;
  virtual std::optional<Account> GetByEmail(const std::string& email) = 0;
  virtual void Update(const Account& account) = 0;
};

}  // namespace chessrelay
