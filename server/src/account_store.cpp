/*
 * 설명: users 테이블 조회/갱신으로 AccountStore를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/account_store_it_test.cpp
 */
#include "chessrelay/mariadb_account_store.hpp"

#include <sstream>

namespace chessrelay {
namespace {
int ToInt(const char* value) { return value ? std::stoi(value) : 0; }
}  // namespace

MariaDbAccountStore::MariaDbAccountStore(std::shared_ptr<MariaDbClient> db_client)
    : db_client_(std::move(db_client)) {}

void MariaDbAccountStore::EnsureSchema() {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    db_client_->Execute(conn,
                        "CREATE TABLE IF NOT EXISTS users ("
                        "id VARCHAR(36) PRIMARY KEY, "
                        "username VARCHAR(30) UNIQUE NOT NULL, "
                        "email VARCHAR(255) UNIQUE NOT NULL, "
                        "display_name VARCHAR(50) NOT NULL, "
                        "elo_rating INTEGER NOT NULL DEFAULT 1200, "
                        "created_at TIMESTAMP NOT NULL DEFAULT CURRENT_TIMESTAMP, "
                        "updated_at TIMESTAMP NOT NULL DEFAULT CURRENT_TIMESTAMP);",
                        "users 테이블 생성 실패");
  });
}

std::optional<Account> MariaDbAccountStore::GetById(const std::string& id) { return FindBy("id", id); }

std::optional<Account> MariaDbAccountStore::GetByUsername(const std::string& username) {
  return FindBy("username", username);
}

std::optional<Account> MariaDbAccountStore::GetByEmail(const std::string& email) { return FindBy("email", email); }

void MariaDbAccountStore::Update(const Account& account) {
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "UPDATE users SET username='" << db_client_->Escape(conn, account.username) << "', email='"
        << db_client_->Escape(conn, account.email) << "', display_name='"
        << db_client_->Escape(conn, account.display_name) << "', elo_rating=" << account.elo_rating
        << ", updated_at=NOW() WHERE id='" << db_client_->Escape(conn, account.id) << "';";
    db_client_->Execute(conn, oss.str(), "계정 갱신 실패");
    if (mysql_affected_rows(conn) == 0) {
      // 값이 같아 변경 행이 0일 수도 있으므로 존재 여부를 다시 확인한다.
      std::ostringstream check;
      check << "SELECT id FROM users WHERE id='" << db_client_->Escape(conn, account.id) << "';";
      auto res = db_client_->Query(conn, check.str(), "계정 확인 실패");
      if (mysql_fetch_row(res.get()) == nullptr) {
        throw DbException("갱신할 계정이 없습니다: " + account.id, 0, false);
      }
    }
    return true;
  });
}

std::optional<Account> MariaDbAccountStore::FindBy(const char* column, const std::string& value) {
  std::optional<Account> result;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT id, username, email, display_name, elo_rating FROM users WHERE " << column << "='"
        << db_client_->Escape(conn, value) << "';";
    auto res = db_client_->Query(conn, oss.str(), "계정 조회 실패");
    MYSQL_ROW row = mysql_fetch_row(res.get());
    if (row) {
      result = BuildAccount(row);
    }
  });
  return result;
}

Account MariaDbAccountStore::BuildAccount(MYSQL_ROW row) const {
  Account account;
  account.id = row[0] ? row[0] : "";
  account.username = row[1] ? row[1] : "";
  account.email = row[2] ? row[2] : "";
  account.display_name = row[3] ? row[3] : "";
  account.elo_rating = ToInt(row[4]);
  return account;
}

}  // namespace chessrelay
