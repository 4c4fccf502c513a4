/*
 * 설명: 원장 스냅샷 위에서 (시각, 레이팅) 시계열을 만든다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/unit/history_series_test.cpp
 */
#include "arena/history_series.hpp"

#include <algorithm>
#include <utility>

namespace arena {

namespace {
SeriesRange MakeSeries(const std::shared_ptr<const EventLog>& events, const EntrantRegistry& registry,
                       const std::string& entrant_id, int base_rating) {
  EventRange range(events, entrant_id);
  auto entrant = registry.Find(entrant_id);
  if (!entrant) {
    return SeriesRange(entrant_id, std::move(range), Clock::time_point{}, base_rating, false);
  }
  // 기준점이 첫 이벤트보다 늦으면 시계열이 단조롭지 않으므로 첫 이벤트 시각으로 당긴다.
  Clock::time_point origin = entrant->created_at;
  if (!range.empty() && range.begin()->occurred_at < origin) {
    origin = range.begin()->occurred_at;
  }
  return SeriesRange(entrant_id, std::move(range), origin, base_rating, true);
}
}  // namespace

SeriesRange::Iterator::Iterator(const SeriesRange* range, bool at_origin, EventRange::Iterator current)
    : range_(range), at_origin_(at_origin), current_(current) {}

SeriesPoint SeriesRange::Iterator::operator*() const {
  if (at_origin_) {
    return SeriesPoint{range_->origin_, range_->base_rating_, 0};
  }
  const RatingEvent& event = *current_;
  return SeriesPoint{event.occurred_at, event.RatingAfter(range_->entrant_id_), event.event_id};
}

SeriesRange::Iterator& SeriesRange::Iterator::operator++() {
  if (at_origin_) {
    at_origin_ = false;
  } else {
    ++current_;
  }
  return *this;
}

SeriesRange::SeriesRange(std::string entrant_id, EventRange events, Clock::time_point origin, int base_rating,
                         bool include_origin)
    : entrant_id_(std::move(entrant_id)),
      events_(std::move(events)),
      origin_(origin),
      base_rating_(base_rating),
      include_origin_(include_origin) {}

SeriesRange::Iterator SeriesRange::begin() const { return Iterator(this, include_origin_, events_.begin()); }

SeriesRange::Iterator SeriesRange::end() const { return Iterator(this, false, events_.end()); }

std::vector<SeriesPoint> SeriesRange::ToVector() const {
  std::vector<SeriesPoint> points;
  for (auto it = begin(); it != end(); ++it) {
    points.push_back(*it);
  }
  return points;
}

HistorySeries::HistorySeries(std::shared_ptr<const RatingService> service) : service_(std::move(service)) {}

SeriesRange HistorySeries::Series(const std::string& entrant_id) const {
  LedgerView view = service_->View();
  return MakeSeries(view.events, *service_->Registry(), entrant_id, view.base_rating);
}

std::vector<EntrantSeries> HistorySeries::AllSeries(bool active_only) const {
  LedgerView view = service_->View();
  const EntrantRegistry& registry = *service_->Registry();
  std::vector<EntrantSeries> all;
  for (auto& entrant : registry.List(active_only)) {
    SeriesRange series = MakeSeries(view.events, registry, entrant.id, view.base_rating);
    std::vector<SeriesPoint> points = series.ToVector();
    // 기준점만 있는 참가자는 차트에서 뺀다.
    if (points.size() <= 1) {
      continue;
    }
    all.push_back(EntrantSeries{std::move(entrant), std::move(points)});
  }
  return all;
}

}  // namespace arena
