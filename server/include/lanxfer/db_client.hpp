/*
 * 설명: MariaDB 연결과 트랜잭션 재시도 정책을 캡슐화한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/history_log_it_test.cpp
 */
#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>

#include <mariadb/mysql.h>

namespace lanxfer {

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

class MariaDbClient {
 public:
  explicit MariaDbClient(const DbConfig& config);

  void WithConnectionRetry(const std::function<void(MYSQL*)>& work) const;

  // 실패 시 DbException을 던진다.
  void Execute(MYSQL* conn, const std::string& sql, const std::string& ctx) const;
  [[noreturn]] void RaiseError(MYSQL* conn, const std::string& ctx) const;

  void SetTransientInjector(const std::function<bool(std::size_t)>& injector);
  // 작업이 커밋된 뒤 응답이 유실된 상황(CR_SERVER_LOST)을 흉내 낸다. 통합 테스트 전용.
  void SetLostReplyInjector(const std::function<bool(std::size_t)>& injector);

  std::string Escape(MYSQL* conn, const std::string& value) const;

 private:
  MYSQL* Connect() const;
  bool IsRetryable(unsigned int code) const;
  void Backoff(std::size_t attempt) const;

  DbConfig config_;
  unsigned int connect_timeout_seconds_ = 2;
  unsigned int query_timeout_seconds_ = 5;
  std::function<bool(std::size_t)> transient_injector_;
  std::function<bool(std::size_t)> lost_reply_injector_;
};

}  // namespace lanxfer
