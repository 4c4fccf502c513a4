/*
 * 설명: MariaDB 연결과 재시도 로직, 단순 실행/조회 보조 함수를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/it/ledger_persistence_it_test.cpp
 */
#include "arena/db_client.hpp"

#include <chrono>
#include <thread>

#include <mariadb/errmsg.h>

namespace arena {
namespace {
constexpr unsigned int kDeadlock = 1213;
constexpr unsigned int kLockWaitTimeout = 1205;

// 시도 하나가 쓰는 연결. 커밋되지 않은 트랜잭션은 닫기 전에 롤백한다.
class ScopedConnection {
 public:
  ScopedConnection(MYSQL* conn, bool transactional) : conn_(conn), open_tx_(transactional) {
    if (open_tx_) {
      mysql_autocommit(conn_, 0);
    }
  }
  ~ScopedConnection() {
    if (open_tx_) {
      mysql_rollback(conn_);
    }
    mysql_close(conn_);
  }
  ScopedConnection(const ScopedConnection&) = delete;
  ScopedConnection& operator=(const ScopedConnection&) = delete;

  MYSQL* get() const { return conn_; }
  void Finish() { open_tx_ = false; }

 private:
  MYSQL* conn_;
  bool open_tx_;
};
}  // namespace

MariaDbClient::MariaDbClient(const DbConfig& config) : config_(config) {}

MYSQL* MariaDbClient::Connect() const {
  MYSQL* conn = mysql_init(nullptr);
  if (!conn) {
    throw DbException("MariaDB 초기화 실패", 0, true);
  }
  mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &connect_timeout_seconds_);
  mysql_options(conn, MYSQL_OPT_READ_TIMEOUT, &query_timeout_seconds_);
  mysql_options(conn, MYSQL_OPT_WRITE_TIMEOUT, &query_timeout_seconds_);
  const char* failed_step = nullptr;
  if (!mysql_real_connect(conn, config_.host.c_str(), config_.user.c_str(), config_.password.c_str(),
                          config_.database.c_str(), config_.port, nullptr, 0)) {
    failed_step = "연결 실패";
  } else if (mysql_query(conn, "SET SESSION innodb_lock_wait_timeout=2;") != 0) {
    failed_step = "락 대기 타임아웃 설정 실패";
  }
  if (failed_step) {
    unsigned int code = mysql_errno(conn);
    std::string message = std::string(failed_step) + ": " + mysql_error(conn);
    mysql_close(conn);
    throw DbException(message, code, IsRetryable(code));
  }
  return conn;
}

bool MariaDbClient::ExecuteTransactionWithRetry(const std::function<bool(MYSQL*)>& work) const {
  return RunWithRetry(work, true);
}

void MariaDbClient::WithConnectionRetry(const std::function<void(MYSQL*)>& work) const {
  RunWithRetry(
      [&work](MYSQL* conn) {
        work(conn);
        return true;
      },
      false);
}

bool MariaDbClient::RunWithRetry(const std::function<bool(MYSQL*)>& work, bool transactional) const {
  for (std::size_t attempt = 1;; ++attempt) {
    try {
      ScopedConnection conn(Connect(), transactional);
      if (transient_injector_ && transient_injector_(attempt)) {
        throw DbException("주입된 일시 오류", kDeadlock, true);
      }
      bool commit = work(conn.get());
      if (transactional && commit && mysql_commit(conn.get()) != 0) {
        RaiseError(conn.get(), "커밋 실패");
      }
      if (commit) {
        conn.Finish();
      }
      return commit;
    } catch (const DbException& ex) {
      if (!ex.retryable || attempt >= retry_policy_.max_attempts) {
        throw;
      }
      retries_.fetch_add(1);
      Backoff(attempt);
    }
  }
}

bool MariaDbClient::Execute(MYSQL* conn, const std::string& sql, const std::string& ctx) const {
  if (mysql_query(conn, sql.c_str()) != 0) {
    if (mysql_errno(conn) == kDuplicateEntry) {
      return false;
    }
    RaiseError(conn, ctx);
  }
  return true;
}

void MariaDbClient::Query(MYSQL* conn, const std::string& sql, const std::string& ctx,
                          const std::function<void(MYSQL_ROW)>& on_row) const {
  if (mysql_query(conn, sql.c_str()) != 0) {
    RaiseError(conn, ctx);
  }
  std::unique_ptr<MYSQL_RES, decltype(&mysql_free_result)> res(mysql_store_result(conn), &mysql_free_result);
  if (!res) {
    RaiseError(conn, ctx + " 결과 없음");
  }
  MYSQL_ROW row;
  while ((row = mysql_fetch_row(res.get())) != nullptr) {
    on_row(row);
  }
}

std::string MariaDbClient::Escape(MYSQL* conn, const std::string& value) const {
  std::string escaped;
  escaped.resize(value.size() * 2 + 1);
  auto len = mysql_real_escape_string(conn, escaped.data(), value.c_str(), value.size());
  escaped.resize(len);
  return escaped;
}

void MariaDbClient::RaiseError(MYSQL* conn, const std::string& ctx) const {
  unsigned int code = mysql_errno(conn);
  bool retryable = IsRetryable(code);
  std::string message = ctx + ": " + mysql_error(conn);
  throw DbException(message, code, retryable);
}

bool MariaDbClient::IsRetryable(unsigned int code) const {
  return code == kDeadlock || code == kLockWaitTimeout || code == CR_SERVER_LOST || code == CR_SERVER_GONE_ERROR ||
         code == CR_CONN_HOST_ERROR || code == CR_SERVER_LOST_EXTENDED;
}

void MariaDbClient::Backoff(std::size_t attempt) const {
  thread_local std::mt19937 gen(std::random_device{}());
  std::uniform_int_distribution<unsigned int> jitter(0, retry_policy_.jitter_ms);
  auto delay = retry_policy_.base_delay * (1u << (attempt - 1)) + std::chrono::milliseconds(jitter(gen));
  std::this_thread::sleep_for(delay);
}

void MariaDbClient::SetRetryPolicy(const RetryPolicy& policy) { retry_policy_ = policy; }

void MariaDbClient::SetTransientInjector(const std::function<bool(std::size_t)>& injector) {
  transient_injector_ = injector;
}

}  // namespace arena
