/*
 * 설명: 참가자별 레이팅 변화 시계열(차트용)을 지연 평가 뷰로 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/unit/history_series_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

#include "arena/entrant_registry.hpp"
#include "arena/rating_ledger.hpp"
#include "arena/rating_service.hpp"

namespace arena {

struct SeriesPoint {
  Clock::time_point at;
  int rating;
  // 0이면 등록 시점의 기준점.
  std::uint64_t event_id;
};

// 등록 시점 기준점 하나 + 참가자를 건드린 이벤트마다 한 점. 순회는 재시작 가능하다.
class SeriesRange {
 public:
  class Iterator {
   public:
    using iterator_category = std::input_iterator_tag;
    using value_type = SeriesPoint;
    using difference_type = std::ptrdiff_t;
    using pointer = void;
    using reference = SeriesPoint;

    Iterator(const SeriesRange* range, bool at_origin, EventRange::Iterator current);
    SeriesPoint operator*() const;
    Iterator& operator++();
    bool operator==(const Iterator& other) const {
      return at_origin_ == other.at_origin_ && current_ == other.current_;
    }
    bool operator!=(const Iterator& other) const { return !(*this == other); }

   private:
    const SeriesRange* range_;
    bool at_origin_;
    EventRange::Iterator current_;
  };

  // include_origin이 false면 기준점 없이 이벤트만 돌려준다 (미등록 참가자).
  SeriesRange(std::string entrant_id, EventRange events, Clock::time_point origin, int base_rating,
              bool include_origin);

  Iterator begin() const;
  Iterator end() const;
  bool empty() const { return begin() == end(); }
  std::vector<SeriesPoint> ToVector() const;
  const std::string& EntrantId() const { return entrant_id_; }

 private:
  std::string entrant_id_;
  EventRange events_;
  Clock::time_point origin_;
  int base_rating_;
  bool include_origin_;
};

struct EntrantSeries {
  Entrant entrant;
  std::vector<SeriesPoint> points;
};

class HistorySeries {
 public:
  explicit HistorySeries(std::shared_ptr<const RatingService> service);

  SeriesRange Series(const std::string& entrant_id) const;
  // 이벤트가 하나 이상 있는 참가자만 포함한다.
  std::vector<EntrantSeries> AllSeries(bool active_only = true) const;

 private:
  std::shared_ptr<const RatingService> service_;
};

}  // namespace arena
