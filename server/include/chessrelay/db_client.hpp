/*
 * 설명: MariaDB 연결과 트랜잭션 재시도 정책을 캡슐화한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/account_store_it_test.cpp
 */
#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

#include <mariadb/mysql.h>

namespace chessrelay {

struct DbConfig {
  std::string host;
  unsigned short port;
  std::string user;
  std::string password;
  std::string database;
};

class DbException : public std::runtime_error {
 public:
  DbException(const std::string& message, unsigned int code, bool retryable)
      : std::runtime_error(message), code(code), retryable(retryable) {}
  unsigned int code;
  bool retryable;
};

struct MysqlCloser {
  void operator()(MYSQL* conn) const {
    if (conn) {
      mysql_close(conn);
    }
  }
};

struct MysqlResultFree {
  void operator()(MYSQL_RES* res) const {
    if (res) {
      mysql_free_result(res);
    }
  }
};

using MysqlConnection = std::unique_ptr<MYSQL, MysqlCloser>;
using MysqlResult = std::unique_ptr<MYSQL_RES, MysqlResultFree>;

class MariaDbClient {
 public:
  explicit MariaDbClient(const DbConfig& config);

  bool ExecuteTransactionWithRetry(const std::function<bool(MYSQL*)>& work) const;
  void WithConnectionRetry(const std::function<void(MYSQL*)>& work) const;

  void Execute(MYSQL* conn, const std::string& sql, const std::string& ctx) const;
  MysqlResult Query(MYSQL* conn, const std::string& sql, const std::string& ctx) const;
  std::string Escape(MYSQL* conn, const std::string& value) const;

  [[noreturn]] void RaiseError(MYSQL* conn, const std::string& ctx) const;

 private:
  MysqlConnection Connect() const;
  bool IsRetryable(unsigned int code) const;
  void Backoff(std::size_t attempt) const;

  DbConfig config_;
  unsigned int connect_timeout_seconds_ = 2;
  unsigned int query_timeout_seconds_ = 2;
};

}  // namespace chessrelay
