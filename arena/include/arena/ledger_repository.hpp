/*
 * 설명: 참가자와 레이팅 원장(append-only)을 MariaDB에 저장하고 시작 시 다시 읽어온다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/it/ledger_persistence_it_test.cpp
 */
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <mariadb/mysql.h>

#include "arena/db_client.hpp"
#include "arena/entrant_registry.hpp"
#include "arena/rating_event.hpp"

namespace arena {

class LedgerRepository {
 public:
  explicit LedgerRepository(std::shared_ptr<MariaDbClient> db_client);

  void EnsureSchema();

  // 중복 키면 false를 돌려주고 트랜잭션은 롤백된다.
  bool SaveEntrant(const Entrant& entrant);
  void UpdateEntrantActive(const std::string& entrant_id, bool active);
  bool SaveEvent(const RatingEvent& event);
  // k가 바뀌어 다시 계산된 이벤트의 전/후 레이팅과 k를 한 트랜잭션으로 덮어쓴다.
  // 결과, 참가자, 순서는 바뀌지 않는다.
  void RewriteEvents(const std::vector<RatingEvent>& events);

  std::vector<Entrant> LoadEntrants() const;
  std::vector<RatingEvent> LoadEvents() const;
  std::size_t CountEvents() const;
  void ClearAll() const;

 private:
  bool InsertEntrantInTx(MYSQL* conn, const Entrant& entrant);
  bool InsertEventInTx(MYSQL* conn, const RatingEvent& event);
  Entrant BuildEntrant(MYSQL_ROW row) const;
  RatingEvent BuildEvent(MYSQL_ROW row) const;

  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace arena
