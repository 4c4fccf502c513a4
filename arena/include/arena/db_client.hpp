/*
 * 설명: 원장 영속화를 위한 MariaDB 연결, 트랜잭션 재시도, 쿼리 보조 함수를 캡슐화한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/it/ledger_persistence_it_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>

#include <mariadb/mysql.h>

namespace arena {

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

inline constexpr unsigned int kDuplicateEntry = 1062;

// 일시 오류(교착, 락 대기 초과, 연결 끊김)에만 적용된다.
struct RetryPolicy {
  std::size_t max_attempts{3};
  std::chrono::milliseconds base_delay{50};
  unsigned int jitter_ms{25};
};

class MariaDbClient {
 public:
  explicit MariaDbClient(const DbConfig& config);

  bool ExecuteTransactionWithRetry(const std::function<bool(MYSQL*)>& work) const;
  void WithConnectionRetry(const std::function<void(MYSQL*)>& work) const;

  // 실패 시 DbException. 중복 키는 false로 돌려준다.
  bool Execute(MYSQL* conn, const std::string& sql, const std::string& ctx) const;
  void Query(MYSQL* conn, const std::string& sql, const std::string& ctx,
             const std::function<void(MYSQL_ROW)>& on_row) const;

  [[noreturn]] void RaiseError(MYSQL* conn, const std::string& ctx) const;

  void SetTransientInjector(const std::function<bool(std::size_t)>& injector);
  void SetRetryPolicy(const RetryPolicy& policy);
  // 일시 오류로 다시 시도한 누적 횟수.
  std::size_t RetryCount() const { return retries_.load(); }

  std::string Escape(MYSQL* conn, const std::string& value) const;

 private:
  MYSQL* Connect() const;
  // transactional이면 work가 true를 돌려줄 때 커밋하고, 그 밖에는 롤백한다.
  bool RunWithRetry(const std::function<bool(MYSQL*)>& work, bool transactional) const;
  bool IsRetryable(unsigned int code) const;
  void Backoff(std::size_t attempt) const;

  DbConfig config_;
  unsigned int connect_timeout_seconds_ = 2;
  unsigned int query_timeout_seconds_ = 2;
  std::function<bool(std::size_t)> transient_injector_;
  RetryPolicy retry_policy_;
  mutable std::atomic<std::size_t> retries_{0};
};

}  // namespace arena
