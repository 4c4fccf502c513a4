/*
 * 설명: entrants / rating_events 테이블 스키마와 저장/적재 쿼리를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/it/ledger_persistence_it_test.cpp
 */
#include "arena/ledger_repository.hpp"

#include <sstream>

namespace arena {
namespace {
int ToInt(const char* value) { return value ? std::stoi(value) : 0; }
std::int64_t ToInt64(const char* value) { return value ? std::stoll(value) : 0; }
std::uint64_t ToUint64(const char* value) { return value ? std::stoull(value) : 0; }
std::string ToStr(const char* value) { return value ? std::string(value) : std::string(); }

constexpr const char* kCreateEntrants =
    "CREATE TABLE IF NOT EXISTS entrants ("
    " entrant_id VARCHAR(64) NOT NULL PRIMARY KEY,"
    " name VARCHAR(100) NOT NULL,"
    " provider VARCHAR(50) NOT NULL,"
    " slug VARCHAR(200) NOT NULL,"
    " active TINYINT(1) NOT NULL DEFAULT 1,"
    " created_at_us BIGINT NOT NULL,"
    " UNIQUE KEY uq_entrants_slug (slug)"
    ") ENGINE=InnoDB;";

// 일반 이벤트는 reverses_event_id=0이므로 (debate_id, 0)이 토론당 한 번만 들어간다.
// 보정 이벤트는 (debate_id, 원 이벤트 ID)라 이벤트당 보정도 한 번뿐이다.
constexpr const char* kCreateEvents =
    "CREATE TABLE IF NOT EXISTS rating_events ("
    " event_id BIGINT UNSIGNED NOT NULL PRIMARY KEY,"
    " debate_id VARCHAR(64) NOT NULL,"
    " entrant_a VARCHAR(64) NOT NULL,"
    " entrant_b VARCHAR(64) NOT NULL,"
    " outcome VARCHAR(8) NOT NULL,"
    " a_before INT NOT NULL,"
    " b_before INT NOT NULL,"
    " a_after INT NOT NULL,"
    " b_after INT NOT NULL,"
    " occurred_at_us BIGINT NOT NULL,"
    " reverses_event_id BIGINT UNSIGNED NOT NULL DEFAULT 0,"
    " k_factor INT NOT NULL,"
    " UNIQUE KEY uq_rating_events_debate (debate_id, reverses_event_id),"
    " KEY idx_rating_events_order (occurred_at_us, event_id),"
    " CONSTRAINT fk_rating_events_a FOREIGN KEY (entrant_a) REFERENCES entrants(entrant_id),"
    " CONSTRAINT fk_rating_events_b FOREIGN KEY (entrant_b) REFERENCES entrants(entrant_id)"
    ") ENGINE=InnoDB;";
}  // namespace

LedgerRepository::LedgerRepository(std::shared_ptr<MariaDbClient> db_client) : db_client_(std::move(db_client)) {}

void LedgerRepository::EnsureSchema() {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    db_client_->Execute(conn, kCreateEntrants, "entrants 스키마 생성 실패");
    db_client_->Execute(conn, kCreateEvents, "rating_events 스키마 생성 실패");
  });
}

bool LedgerRepository::SaveEntrant(const Entrant& entrant) {
  return db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) { return InsertEntrantInTx(conn, entrant); });
}

void LedgerRepository::UpdateEntrantActive(const std::string& entrant_id, bool active) {
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "UPDATE entrants SET active=" << (active ? 1 : 0) << " WHERE entrant_id='"
        << db_client_->Escape(conn, entrant_id) << "';";
    db_client_->Execute(conn, oss.str(), "참가자 활성 상태 갱신 실패");
    return true;
  });
}

bool LedgerRepository::SaveEvent(const RatingEvent& event) {
  return db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) { return InsertEventInTx(conn, event); });
}

bool LedgerRepository::InsertEntrantInTx(MYSQL* conn, const Entrant& entrant) {
  std::ostringstream oss;
  oss << "INSERT INTO entrants(entrant_id, name, provider, slug, active, created_at_us) VALUES('"
      << db_client_->Escape(conn, entrant.id) << "', '" << db_client_->Escape(conn, entrant.name) << "', '"
      << db_client_->Escape(conn, entrant.provider) << "', '" << db_client_->Escape(conn, entrant.slug) << "', "
      << (entrant.active ? 1 : 0) << ", " << ToEpochMicros(entrant.created_at) << ");";
  return db_client_->Execute(conn, oss.str(), "참가자 저장 실패");
}

bool LedgerRepository::InsertEventInTx(MYSQL* conn, const RatingEvent& event) {
  std::ostringstream oss;
  oss << "INSERT INTO rating_events(event_id, debate_id, entrant_a, entrant_b, outcome, a_before, b_before, a_after, "
         "b_after, occurred_at_us, reverses_event_id, k_factor) VALUES("
      << event.event_id << ", '" << db_client_->Escape(conn, event.debate_id) << "', '"
      << db_client_->Escape(conn, event.entrant_a) << "', '" << db_client_->Escape(conn, event.entrant_b) << "', '"
      << ToString(event.outcome) << "', " << event.a_before << ", " << event.b_before << ", " << event.a_after << ", "
      << event.b_after << ", " << ToEpochMicros(event.occurred_at) << ", " << event.reverses_event_id << ", "
      << event.k_factor << ");";
  return db_client_->Execute(conn, oss.str(), "레이팅 이벤트 저장 실패");
}

void LedgerRepository::RewriteEvents(const std::vector<RatingEvent>& events) {
  if (events.empty()) {
    return;
  }
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    for (const auto& event : events) {
      std::ostringstream oss;
      oss << "UPDATE rating_events SET a_before=" << event.a_before << ", b_before=" << event.b_before
          << ", a_after=" << event.a_after << ", b_after=" << event.b_after << ", k_factor=" << event.k_factor
          << " WHERE event_id=" << event.event_id << ";";
      db_client_->Execute(conn, oss.str(), "레이팅 이벤트 재계산 반영 실패");
    }
    return true;
  });
}

std::vector<Entrant> LedgerRepository::LoadEntrants() const {
  std::vector<Entrant> entrants;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    entrants.clear();
    db_client_->Query(conn,
                      "SELECT entrant_id, name, provider, slug, active, created_at_us FROM entrants ORDER BY entrant_id;",
                      "참가자 조회 실패", [&](MYSQL_ROW row) { entrants.push_back(BuildEntrant(row)); });
  });
  return entrants;
}

std::vector<RatingEvent> LedgerRepository::LoadEvents() const {
  std::vector<RatingEvent> events;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    events.clear();
    db_client_->Query(conn,
                      "SELECT event_id, debate_id, entrant_a, entrant_b, outcome, a_before, b_before, a_after, b_after, "
                      "occurred_at_us, reverses_event_id, k_factor FROM rating_events "
                      "ORDER BY occurred_at_us ASC, event_id ASC;",
                      "원장 조회 실패", [&](MYSQL_ROW row) { events.push_back(BuildEvent(row)); });
  });
  return events;
}

std::size_t LedgerRepository::CountEvents() const {
  std::size_t count = 0;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    db_client_->Query(conn, "SELECT COUNT(*) FROM rating_events;", "원장 카운트 실패", [&](MYSQL_ROW row) {
      count = static_cast<std::size_t>(ToUint64(row[0]));
    });
  });
  return count;
}

void LedgerRepository::ClearAll() const {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    db_client_->Execute(conn, "DELETE FROM rating_events;", "원장 삭제 실패");
    db_client_->Execute(conn, "DELETE FROM entrants;", "참가자 삭제 실패");
  });
}

Entrant LedgerRepository::BuildEntrant(MYSQL_ROW row) const {
  return Entrant{ToStr(row[0]), ToStr(row[1]), ToStr(row[2]), ToStr(row[3]), ToInt(row[4]) != 0,
                 FromEpochMicros(ToInt64(row[5]))};
}

RatingEvent LedgerRepository::BuildEvent(MYSQL_ROW row) const {
  RatingEvent event;
  event.event_id = ToUint64(row[0]);
  event.debate_id = ToStr(row[1]);
  event.entrant_a = ToStr(row[2]);
  event.entrant_b = ToStr(row[3]);
  auto outcome = ParseOutcome(ToStr(row[4]));
  if (!outcome) {
    throw DbException("알 수 없는 outcome 값: " + ToStr(row[4]), 0, false);
  }
  event.outcome = *outcome;
  event.a_before = ToInt(row[5]);
  event.b_before = ToInt(row[6]);
  event.a_after = ToInt(row[7]);
  event.b_after = ToInt(row[8]);
  event.occurred_at = FromEpochMicros(ToInt64(row[9]));
  event.reverses_event_id = ToUint64(row[10]);
  event.k_factor = ToInt(row[11]);
  return event;
}

}  // namespace arena
