/*
 * 설명: users 테이블 위에서 AccountStore를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/account_store_it_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <string>

#include <mariadb/mysql.h>

#include "chessrelay/account_store.hpp"
#include "chessrelay/db_client.hpp"

namespace chessrelay {

class MariaDbAccountStore : public AccountStore {
 public:
  explicit MariaDbAccountStore(std::shared_ptr<MariaDbClient> db_client);

  // users 테이블이 없으면 이 저장소가 쓰는 컬럼만으로 만든다.
  void EnsureSchema();

  std::optional<Account> GetById(const std::string& id) override;
  std::optional<Account> GetByUsername(const std::string& username) override;
  std::optional<Account> GetByEmail(const std::string& email) override;
  void Update(const Account& account) override;

 private:
  std::optional<Account> FindBy(const char* column, const std::string& value);
  Account BuildAccount(MYSQL_ROW row) const;

  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace chessrelay
